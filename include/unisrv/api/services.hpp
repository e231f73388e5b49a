#pragma once

#include "unisrv/api/context.hpp"
#include "unisrv/api/types.hpp"
#include "unisrv/common/result.hpp"

#include <string>
#include <vector>

namespace unisrv::api {

[[nodiscard]] common::Result<std::vector<ServiceSummary>> list_services(ApiContext &ctx);
[[nodiscard]] common::Result<ServiceInfo> get_service(ApiContext &ctx,
                                                      const std::string &service_id);

/// Registers `instance_id:port` in `group`; returns the new target id.
[[nodiscard]] common::Result<std::string> create_target(ApiContext &ctx,
                                                        const std::string &service_id,
                                                        const std::string &instance_id,
                                                        std::uint16_t port,
                                                        const std::string &group);
[[nodiscard]] common::Status remove_target(ApiContext &ctx, const std::string &service_id,
                                           const std::string &target_id);

[[nodiscard]] common::Result<std::vector<ServiceSummary>>
parse_service_list(const std::string &json);
[[nodiscard]] common::Result<ServiceInfo> parse_service_info(const std::string &json);

/// Splits `<instance>:<port>`.
struct TargetSpec {
  std::string instance;
  std::uint16_t port = 0;
};
[[nodiscard]] common::Result<TargetSpec> parse_target_spec(const std::string &value);

[[nodiscard]] common::Result<std::uint16_t> parse_port(const std::string &value);

} // namespace unisrv::api
