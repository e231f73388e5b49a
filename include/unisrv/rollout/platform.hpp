#pragma once

#include "unisrv/api/types.hpp"
#include "unisrv/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace unisrv::rollout {

/// Remote operations a rollout is composed from.
class Platform {
public:
  virtual ~Platform() = default;

  [[nodiscard]] virtual common::Result<std::vector<api::ServiceSummary>> list_services() = 0;
  [[nodiscard]] virtual common::Result<api::ServiceInfo> get_service(const std::string &service_id) = 0;
  [[nodiscard]] virtual common::Result<std::vector<api::Instance>> list_instances() = 0;
  [[nodiscard]] virtual common::Result<std::vector<api::Network>> list_networks() = 0;

  /// Next unused address in `network_id`. Addresses handed out earlier by
  /// this platform object count as used.
  [[nodiscard]] virtual common::Result<std::string> allocate_ip(const std::string &network_id) = 0;

  /// Checks the image exists and returns a pull token when the registry needs one.
  [[nodiscard]] virtual common::Result<std::optional<std::string>>
  verify_image(const std::string &image) = 0;

  [[nodiscard]] virtual common::Result<std::string>
  create_instance(const api::InstanceSpec &spec, const std::optional<std::string> &pull_token) = 0;
  [[nodiscard]] virtual common::Status stop_instance(const std::string &instance_id,
                                                     std::uint64_t timeout_ms) = 0;

  /// Blocks until the instance boots and survives `health_window`, or fails.
  [[nodiscard]] virtual common::Status await_healthy(const std::string &instance_id,
                                                     std::chrono::milliseconds health_window) = 0;

  [[nodiscard]] virtual common::Result<std::string> create_target(const std::string &service_id,
                                                                  const std::string &instance_id,
                                                                  std::uint16_t port,
                                                                  const std::string &group) = 0;
  [[nodiscard]] virtual common::Status remove_target(const std::string &service_id,
                                                     const std::string &target_id) = 0;
};

} // namespace unisrv::rollout
