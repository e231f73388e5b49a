#pragma once

#include "unisrv/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace unisrv::boot {

enum class LogType { State, System, Stdout, Stderr };

enum class BootState { Online, PullingContainerImage, ExecutingContainer };

/// One message of `/instance/{id}/logs/stream`.
struct BootEvent {
  LogType type = LogType::System;
  std::uint64_t timestamp_ms = 0;
  std::optional<std::string> message;
  std::optional<BootState> state;
};

/// Unknown `log_type` or `state` values, and state events without a state, are errors.
[[nodiscard]] common::Result<BootEvent> parse_boot_event(const std::string &json);

[[nodiscard]] std::string_view boot_state_label(BootState state);

/// `2025-01-31 12:00:00` in UTC.
[[nodiscard]] std::string format_timestamp(std::uint64_t timestamp_ms);

} // namespace unisrv::boot
