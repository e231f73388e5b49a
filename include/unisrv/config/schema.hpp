#pragma once

#include <cstdint>
#include <string>

namespace unisrv::config {

struct ApiConfig {
  std::string host = "https://api.unisrv.io";
};

struct HttpConfig {
  std::uint64_t timeout_ms = 30'000;
};

struct RolloutConfig {
  std::uint64_t health_window_ms = 1'000;
  std::uint64_t stop_timeout_ms = 5'000;
  std::string default_group = "default";
  std::uint32_t progress_log_lines = 5;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "info";
};

struct Config {
  ApiConfig api;
  HttpConfig http;
  RolloutConfig rollout;
  ObservabilityConfig observability;
};

} // namespace unisrv::config
