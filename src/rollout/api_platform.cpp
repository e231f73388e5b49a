#include "unisrv/rollout/api_platform.hpp"

#include "unisrv/api/instances.hpp"
#include "unisrv/api/networks.hpp"
#include "unisrv/api/services.hpp"
#include "unisrv/boot/websocket_transport.hpp"
#include "unisrv/registry/client.hpp"

namespace unisrv::rollout {

ApiPlatform::ApiPlatform(api::ApiContext &ctx, boot::ProgressCallback on_progress)
    : ctx_(ctx), on_progress_(std::move(on_progress)) {}

common::Result<std::vector<api::ServiceSummary>> ApiPlatform::list_services() {
  return api::list_services(ctx_);
}

common::Result<api::ServiceInfo> ApiPlatform::get_service(const std::string &service_id) {
  return api::get_service(ctx_, service_id);
}

common::Result<std::vector<api::Instance>> ApiPlatform::list_instances() {
  return api::list_instances(ctx_);
}

common::Result<std::vector<api::Network>> ApiPlatform::list_networks() {
  return api::list_networks(ctx_);
}

common::Result<std::string> ApiPlatform::allocate_ip(const std::string &network_id) {
  auto details = api::get_network(ctx_, network_id);
  if (!details.ok()) {
    return common::Result<std::string>::failure(details.error());
  }

  auto &mine = allocated_[network_id];
  std::vector<std::string> used = details.value().used_ips;
  used.insert(used.end(), mine.begin(), mine.end());

  auto ip = api::next_free_ip(details.value().ipv4_cidr, used);
  if (ip.ok()) {
    mine.insert(ip.value());
  }
  return ip;
}

common::Result<std::optional<std::string>> ApiPlatform::verify_image(const std::string &image) {
  return registry::verify_and_get_pull_token(ctx_.http(), ctx_.session(), image,
                                             ctx_.timeout_ms());
}

common::Result<std::string>
ApiPlatform::create_instance(const api::InstanceSpec &spec,
                             const std::optional<std::string> &pull_token) {
  return api::create_instance(ctx_, spec, pull_token);
}

common::Status ApiPlatform::stop_instance(const std::string &instance_id,
                                          const std::uint64_t timeout_ms) {
  return api::stop_instance(ctx_, instance_id, timeout_ms);
}

common::Status ApiPlatform::await_healthy(const std::string &instance_id,
                                          const std::chrono::milliseconds health_window) {
  auto headers = ctx_.auth_headers();
  if (!headers.ok()) {
    return headers.status();
  }

  boot::WebSocketTransport transport;
  boot::BootMonitorOptions options;
  options.progress_lines = ctx_.config().rollout.progress_log_lines;
  boot::BootMonitor monitor(transport, boot::steady_now, options);
  if (on_progress_) {
    monitor.on_progress(on_progress_);
  }
  const std::string url = ctx_.ws_url("/instance/" + instance_id + "/logs/stream");
  return monitor.await_healthy(instance_id, url, headers.value(), health_window);
}

common::Result<std::string> ApiPlatform::create_target(const std::string &service_id,
                                                       const std::string &instance_id,
                                                       const std::uint16_t port,
                                                       const std::string &group) {
  return api::create_target(ctx_, service_id, instance_id, port, group);
}

common::Status ApiPlatform::remove_target(const std::string &service_id,
                                          const std::string &target_id) {
  return api::remove_target(ctx_, service_id, target_id);
}

} // namespace unisrv::rollout
