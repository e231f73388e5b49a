#pragma once

#include "unisrv/api/context.hpp"
#include "unisrv/boot/monitor.hpp"
#include "unisrv/rollout/platform.hpp"

#include <map>
#include <set>

namespace unisrv::rollout {

/// Platform backed by the control-plane API, the image registry and the
/// instance event stream.
class ApiPlatform final : public Platform {
public:
  explicit ApiPlatform(api::ApiContext &ctx, boot::ProgressCallback on_progress = {});

  common::Result<std::vector<api::ServiceSummary>> list_services() override;
  common::Result<api::ServiceInfo> get_service(const std::string &service_id) override;
  common::Result<std::vector<api::Instance>> list_instances() override;
  common::Result<std::vector<api::Network>> list_networks() override;
  common::Result<std::string> allocate_ip(const std::string &network_id) override;
  common::Result<std::optional<std::string>> verify_image(const std::string &image) override;
  common::Result<std::string> create_instance(const api::InstanceSpec &spec,
                                              const std::optional<std::string> &pull_token) override;
  common::Status stop_instance(const std::string &instance_id, std::uint64_t timeout_ms) override;
  common::Status await_healthy(const std::string &instance_id,
                               std::chrono::milliseconds health_window) override;
  common::Result<std::string> create_target(const std::string &service_id,
                                            const std::string &instance_id, std::uint16_t port,
                                            const std::string &group) override;
  common::Status remove_target(const std::string &service_id,
                               const std::string &target_id) override;

private:
  api::ApiContext &ctx_;
  boot::ProgressCallback on_progress_;
  std::map<std::string, std::set<std::string>> allocated_;
};

} // namespace unisrv::rollout
