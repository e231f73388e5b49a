#include "unisrv/boot/monitor.hpp"

#include "unisrv/common/uuid.hpp"
#include "unisrv/observability/global.hpp"

namespace unisrv::boot {

namespace {

class CloseOnExit {
public:
  explicit CloseOnExit(EventStreamTransport &transport) : transport_(transport) {}
  ~CloseOnExit() { transport_.close(); }

  CloseOnExit(const CloseOnExit &) = delete;
  CloseOnExit &operator=(const CloseOnExit &) = delete;

private:
  EventStreamTransport &transport_;
};

} // namespace

std::chrono::steady_clock::time_point steady_now() { return std::chrono::steady_clock::now(); }

BootMonitor::BootMonitor(EventStreamTransport &transport, SteadyClock clock,
                         BootMonitorOptions options)
    : transport_(transport), clock_(std::move(clock)), options_(options) {}

common::Status BootMonitor::await_healthy(const std::string &instance_id, const std::string &url,
                                          const http::Headers &headers,
                                          const std::chrono::milliseconds health_window) {
  progress_ = BootProgress{};
  if (const auto connected = transport_.connect(url, headers); !connected.ok()) {
    return common::Status::error("Failed to open event stream for instance " +
                                 common::short_id(instance_id) + ": " + connected.error());
  }
  CloseOnExit guard(transport_);

  if (const auto running = wait_for_running(instance_id); !running.ok()) {
    return running;
  }
  return confirm_health(instance_id, health_window);
}

common::Status BootMonitor::wait_for_running(const std::string &instance_id) {
  while (true) {
    const StreamFrame frame = transport_.receive(options_.poll_interval);
    switch (frame.kind) {
    case FrameKind::Idle:
    case FrameKind::Control:
      continue;
    case FrameKind::Closed:
      return common::Status::error("Event stream for instance " + common::short_id(instance_id) +
                                   " closed before reaching running state (" + frame.payload +
                                   ")");
    case FrameKind::Text:
      break;
    }

    const auto event = parse_boot_event(frame.payload);
    if (!event.ok()) {
      return common::Status::error("Instance " + common::short_id(instance_id) + ": " +
                                   event.error());
    }
    apply(instance_id, event.value());
    if (progress_.running) {
      return common::Status::success();
    }
  }
}

common::Status BootMonitor::confirm_health(const std::string &instance_id,
                                           const std::chrono::milliseconds health_window) {
  const auto deadline = clock_() + health_window;
  while (true) {
    const auto now = clock_();
    if (now >= deadline) {
      return common::Status::success();
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    const StreamFrame frame =
        transport_.receive(remaining.count() > 0 ? remaining : std::chrono::milliseconds(1));

    if (frame.kind == FrameKind::Closed) {
      if (clock_() >= deadline) {
        return common::Status::success();
      }
      return common::Status::error("Event stream for instance " + common::short_id(instance_id) +
                                   " closed unexpectedly during health check (" + frame.payload +
                                   ")");
    }
    if (frame.kind != FrameKind::Text) {
      continue;
    }
    if (const auto event = parse_boot_event(frame.payload); event.ok()) {
      apply(instance_id, event.value());
    } else {
      observability::record_debug("boot", event.error());
    }
  }
}

void BootMonitor::apply(const std::string &instance_id, const BootEvent &event) {
  if (event.type == LogType::State) {
    progress_.phase = std::string(boot_state_label(*event.state));
    if (*event.state == BootState::ExecutingContainer) {
      progress_.running = true;
    }
    observability::record_boot_progress(instance_id, progress_.phase, "");
    notify();
    return;
  }

  std::string line = event.message.value_or("");
  if (event.type == LogType::System) {
    line = "[Instance] " + format_timestamp(event.timestamp_ms) + " - " + line;
  }
  observability::record_boot_progress(instance_id, progress_.phase, line);
  push_line(std::move(line));
  notify();
}

void BootMonitor::push_line(std::string line) {
  if (options_.progress_lines == 0) {
    return;
  }
  progress_.recent_lines.push_back(std::move(line));
  while (progress_.recent_lines.size() > options_.progress_lines) {
    progress_.recent_lines.pop_front();
  }
}

void BootMonitor::notify() {
  if (on_progress_) {
    on_progress_(progress_);
  }
}

} // namespace unisrv::boot
