#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace unisrv::observability {

enum class LogLevel { Debug, Info, Warn, Error };

[[nodiscard]] LogLevel parse_log_level(const std::string &value);
[[nodiscard]] std::string_view log_level_label(LogLevel level);

struct RolloutPhaseEvent {
  std::string phase;
  std::string detail;
};

struct ReplicaEvent {
  std::size_t index = 0;
  std::string instance_id;
  std::string stage;
};

struct BootProgressEvent {
  std::string instance_id;
  std::string phase;
  std::string line;
};

struct DebugEvent {
  std::string component;
  std::string message;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<RolloutPhaseEvent, ReplicaEvent, BootProgressEvent,
                                   DebugEvent, WarningEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::string operation;
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<RequestLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace unisrv::observability
