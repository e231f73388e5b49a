#pragma once

#include "unisrv/common/result.hpp"
#include "unisrv/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace unisrv::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);
[[nodiscard]] common::Status save_config(const Config &config);

/// Sets a dotted key such as `rollout.default_group`.
[[nodiscard]] common::Status set_config_value(Config &config, const std::string &key,
                                              const std::string &value);

/// Applies one key to the file on disk. Environment overrides are not written
/// back; an invalid result leaves the file untouched.
[[nodiscard]] common::Result<Config> update_config_value(const std::string &key,
                                                         const std::string &value);

/// Hard errors fail; the returned vector carries soft warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// `https://api.unisrv.io` splits into host `api.unisrv.io` with TLS on; a bare
/// host keeps TLS on.
struct ApiEndpoint {
  std::string host;
  bool use_tls = true;
};

[[nodiscard]] ApiEndpoint parse_api_host(const std::string &value);

[[nodiscard]] bool is_known_log_level(const std::string &level);

} // namespace unisrv::config
