#include "unisrv/observability/log_observer.hpp"

#include "unisrv/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace unisrv::observability {

LogLevel parse_log_level(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

std::string_view log_level_label(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  out_ << "[" << log_level_label(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, RolloutPhaseEvent>) {
          log_line(LogLevel::Info, evt.detail.empty() ? evt.phase : evt.phase + ": " + evt.detail);
        } else if constexpr (std::is_same_v<T, ReplicaEvent>) {
          log_line(LogLevel::Info, "replica " + std::to_string(evt.index) + " " + evt.stage +
                                       " (" + evt.instance_id + ")");
        } else if constexpr (std::is_same_v<T, BootProgressEvent>) {
          log_line(LogLevel::Debug, evt.instance_id + " [" + evt.phase + "] " + evt.line);
        } else if constexpr (std::is_same_v<T, DebugEvent>) {
          log_line(LogLevel::Debug, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line(LogLevel::Warn, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.request_latency_ms op=" + m.operation + " " +
                                        std::to_string(m.latency.count()));
        }
      },
      metric);
}

void LogObserver::flush() { out_.flush(); }

} // namespace unisrv::observability
