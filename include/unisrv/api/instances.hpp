#pragma once

#include "unisrv/api/context.hpp"
#include "unisrv/api/types.hpp"
#include "unisrv/common/result.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace unisrv::api {

[[nodiscard]] common::Result<std::vector<Instance>> list_instances(ApiContext &ctx);

/// POST /instance; `pull_token` is forwarded so the platform can fetch private images.
[[nodiscard]] common::Result<std::string> create_instance(ApiContext &ctx,
                                                          const InstanceSpec &spec,
                                                          const std::optional<std::string> &pull_token);
[[nodiscard]] common::Status stop_instance(ApiContext &ctx, const std::string &instance_id,
                                           std::uint64_t timeout_ms);

[[nodiscard]] common::Result<std::vector<Instance>> parse_instance_list(const std::string &json);
[[nodiscard]] std::string instance_create_payload(const InstanceSpec &spec,
                                                  const std::optional<std::string> &pull_token);

/// Resolution over instances that are currently serving.
[[nodiscard]] common::Result<std::string> resolve_active_instance(const std::string &input,
                                                                  const std::vector<Instance> &all);

[[nodiscard]] common::Result<std::pair<std::string, std::string>>
parse_env_pair(const std::string &value);

/// `512`, `512M`, `2G`; limited to 128M..128G.
[[nodiscard]] common::Result<std::uint32_t> parse_memory_mb(const std::string &value);

/// 1..32
[[nodiscard]] common::Result<std::uint32_t> parse_vcpus(const std::string &value);

} // namespace unisrv::api
