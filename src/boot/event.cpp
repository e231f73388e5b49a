#include "unisrv/boot/event.hpp"

#include "unisrv/common/json_util.hpp"

#include <charconv>
#include <ctime>

namespace unisrv::boot {

namespace {

common::Result<LogType> parse_log_type(const std::string &value) {
  if (value == "state") {
    return common::Result<LogType>::success(LogType::State);
  }
  if (value == "system") {
    return common::Result<LogType>::success(LogType::System);
  }
  if (value == "stdout") {
    return common::Result<LogType>::success(LogType::Stdout);
  }
  if (value == "stderr") {
    return common::Result<LogType>::success(LogType::Stderr);
  }
  return common::Result<LogType>::failure("unknown log_type '" + value + "'");
}

common::Result<BootState> parse_state(const std::string &value) {
  if (value == "online") {
    return common::Result<BootState>::success(BootState::Online);
  }
  if (value == "pulling_container_image") {
    return common::Result<BootState>::success(BootState::PullingContainerImage);
  }
  if (value == "executing_container") {
    return common::Result<BootState>::success(BootState::ExecutingContainer);
  }
  return common::Result<BootState>::failure("unknown state '" + value + "'");
}

} // namespace

common::Result<BootEvent> parse_boot_event(const std::string &json) {
  using R = common::Result<BootEvent>;
  const auto flat = common::json_parse_flat(json);
  const auto raw_type = common::json_flat_get(flat, "log_type");
  if (!raw_type.has_value()) {
    return R::failure("Failed to parse log message: missing log_type");
  }
  const auto type = parse_log_type(*raw_type);
  if (!type.ok()) {
    return R::failure("Failed to parse log message: " + type.error());
  }

  BootEvent event;
  event.type = type.value();
  event.message = common::json_flat_get(flat, "message");
  if (const auto ts = common::json_flat_get(flat, "timestamp_ms"); ts.has_value()) {
    const auto *first = ts->data();
    const auto *last = first + ts->size();
    auto [ptr, ec] = std::from_chars(first, last, event.timestamp_ms);
    if (ec != std::errc() || ptr != last) {
      return R::failure("Failed to parse log message: invalid timestamp_ms");
    }
  }

  if (const auto raw_state = common::json_flat_get(flat, "state"); raw_state.has_value()) {
    const auto state = parse_state(*raw_state);
    if (!state.ok()) {
      return R::failure("Failed to parse log message: " + state.error());
    }
    event.state = state.value();
  }
  if (event.type == LogType::State && !event.state.has_value()) {
    return R::failure("Failed to parse log message: state event without state");
  }
  return R::success(std::move(event));
}

std::string_view boot_state_label(const BootState state) {
  switch (state) {
  case BootState::Online:
    return "Instance is online";
  case BootState::PullingContainerImage:
    return "Pulling container image";
  case BootState::ExecutingContainer:
    return "Executing container";
  }
  return "";
}

std::string format_timestamp(const std::uint64_t timestamp_ms) {
  const auto seconds = static_cast<std::time_t>(timestamp_ms / 1000);
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  char buffer[32] = {};
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
  return buffer;
}

} // namespace unisrv::boot
