#pragma once

#include "unisrv/boot/event.hpp"
#include "unisrv/boot/transport.hpp"
#include "unisrv/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <string>

namespace unisrv::boot {

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

[[nodiscard]] std::chrono::steady_clock::time_point steady_now();

struct BootProgress {
  std::string phase = "Waiting for instance";
  /// Most recent log lines, oldest first.
  std::deque<std::string> recent_lines;
  bool running = false;
};

using ProgressCallback = std::function<void(const BootProgress &)>;

struct BootMonitorOptions {
  /// Receive slice while waiting for the container to start.
  std::chrono::milliseconds poll_interval{250};
  std::size_t progress_lines = 5;
};

/// Watches one instance's event stream until it is healthy or has failed.
///
/// Healthy means `executing_container` was seen and the stream then stayed
/// open for the full health window. The window starts once and is never
/// extended by later messages. A stream that closes before
/// `executing_container`, or before the window ends, is a failure.
class BootMonitor {
public:
  explicit BootMonitor(EventStreamTransport &transport, SteadyClock clock = steady_now,
                       BootMonitorOptions options = {});

  void on_progress(ProgressCallback callback) { on_progress_ = std::move(callback); }

  [[nodiscard]] common::Status await_healthy(const std::string &instance_id,
                                             const std::string &url,
                                             const http::Headers &headers,
                                             std::chrono::milliseconds health_window);

  [[nodiscard]] const BootProgress &progress() const { return progress_; }

private:
  [[nodiscard]] common::Status wait_for_running(const std::string &instance_id);
  [[nodiscard]] common::Status confirm_health(const std::string &instance_id,
                                              std::chrono::milliseconds health_window);
  void apply(const std::string &instance_id, const BootEvent &event);
  void push_line(std::string line);
  void notify();

  EventStreamTransport &transport_;
  SteadyClock clock_;
  BootMonitorOptions options_;
  BootProgress progress_;
  ProgressCallback on_progress_;
};

} // namespace unisrv::boot
