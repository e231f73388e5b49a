#include "unisrv/api/services.hpp"

#include "unisrv/common/fs.hpp"
#include "unisrv/common/json_util.hpp"

#include <charconv>

namespace unisrv::api {

namespace {

std::string field(const common::JsonFlatMap &flat, const std::string &key) {
  return common::json_flat_get(flat, key).value_or("");
}

} // namespace

common::Result<std::uint16_t> parse_port(const std::string &value) {
  const std::string text = common::trim(value);
  unsigned int parsed = 0;
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (text.empty() || ec != std::errc() || ptr != last || parsed == 0 || parsed > 65535) {
    return common::Result<std::uint16_t>::failure("Invalid port: '" + value +
                                                  "' (expected 1-65535)");
  }
  return common::Result<std::uint16_t>::success(static_cast<std::uint16_t>(parsed));
}

common::Result<std::vector<ServiceSummary>> parse_service_list(const std::string &json) {
  const auto array = common::json_get_array(json, "services");
  if (array.empty()) {
    return common::Result<std::vector<ServiceSummary>>::failure(
        "Invalid service list response: missing 'services'");
  }
  std::vector<ServiceSummary> services;
  for (const auto &object : common::json_split_top_level_objects(array)) {
    const auto flat = common::json_parse_flat(object);
    services.push_back(ServiceSummary{
        .id = field(flat, "id"), .name = field(flat, "name"), .type = field(flat, "type")});
  }
  return common::Result<std::vector<ServiceSummary>>::success(std::move(services));
}

common::Result<ServiceInfo> parse_service_info(const std::string &json) {
  const auto flat = common::json_parse_flat(json);
  ServiceInfo info;
  info.id = field(flat, "id");
  info.name = field(flat, "name");
  if (info.id.empty()) {
    return common::Result<ServiceInfo>::failure("Invalid service response: missing 'id'");
  }

  const auto targets = common::json_flat_get(flat, "targets");
  if (!targets.has_value()) {
    return common::Result<ServiceInfo>::success(std::move(info));
  }
  for (const auto &object : common::json_split_top_level_objects(*targets)) {
    const auto target_flat = common::json_parse_flat(object);
    ServiceTarget target;
    target.id = field(target_flat, "id");
    target.instance_id = field(target_flat, "instance_id");
    const auto port = parse_port(field(target_flat, "instance_port"));
    if (!port.ok()) {
      return common::Result<ServiceInfo>::failure("Invalid target " + target.id + ": " +
                                                  port.error());
    }
    target.instance_port = port.value();
    if (const auto group = common::json_flat_get(target_flat, "target_group");
        group.has_value() && !group->empty()) {
      target.group = *group;
    }
    info.targets.push_back(std::move(target));
  }
  return common::Result<ServiceInfo>::success(std::move(info));
}

common::Result<std::vector<ServiceSummary>> list_services(ApiContext &ctx) {
  const auto body = ctx.get("/services", "list services");
  if (!body.ok()) {
    return common::Result<std::vector<ServiceSummary>>::failure(body.error());
  }
  return parse_service_list(body.value());
}

common::Result<ServiceInfo> get_service(ApiContext &ctx, const std::string &service_id) {
  const auto body = ctx.get("/service/" + service_id, "fetch service");
  if (!body.ok()) {
    return common::Result<ServiceInfo>::failure(body.error());
  }
  return parse_service_info(body.value());
}

common::Result<std::string> create_target(ApiContext &ctx, const std::string &service_id,
                                          const std::string &instance_id,
                                          const std::uint16_t port, const std::string &group) {
  common::JsonWriter body;
  body.begin_object()
      .key("instance_id")
      .value(instance_id)
      .key("instance_port")
      .value(static_cast<std::int64_t>(port))
      .key("group")
      .value(group)
      .end_object();

  const auto response = ctx.post("/service/" + service_id + "/target", body.str(), "add target");
  if (!response.ok()) {
    return common::Result<std::string>::failure(response.error());
  }
  const auto target_id =
      common::json_flat_get(common::json_parse_flat(response.value()), "target_id");
  if (!target_id.has_value() || target_id->empty()) {
    return common::Result<std::string>::failure("add target: response contained no target_id");
  }
  return common::Result<std::string>::success(*target_id);
}

common::Status remove_target(ApiContext &ctx, const std::string &service_id,
                             const std::string &target_id) {
  return ctx.remove("/service/" + service_id + "/target/" + target_id, "", "delete target");
}

common::Result<TargetSpec> parse_target_spec(const std::string &value) {
  const auto colon = value.rfind(':');
  if (colon == std::string::npos || colon == 0) {
    return common::Result<TargetSpec>::failure("Invalid target format: '" + value +
                                               "'. Expected <instance>:<port>");
  }
  const auto port = parse_port(value.substr(colon + 1));
  if (!port.ok()) {
    return common::Result<TargetSpec>::failure(port.error());
  }
  return common::Result<TargetSpec>::success(
      TargetSpec{.instance = value.substr(0, colon), .port = port.value()});
}

} // namespace unisrv::api
