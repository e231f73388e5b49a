#include "unisrv/api/instances.hpp"

#include "unisrv/api/resolve.hpp"
#include "unisrv/common/fs.hpp"
#include "unisrv/common/json_util.hpp"

#include <cctype>
#include <charconv>

namespace unisrv::api {

namespace {

constexpr const char *ACTIVE_STATE = "active";
constexpr const char *DEFAULT_REGION = "dev";
constexpr std::uint32_t MIN_MEMORY_MB = 128;
constexpr std::uint32_t MAX_MEMORY_MB = 131'072;

bool parse_digits(const std::string &text, std::uint64_t &out) {
  if (text.empty()) {
    return false;
  }
  for (const char ch : text) {
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
      return false;
    }
  }
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

} // namespace

InstanceState instance_state_from(const std::string &raw) {
  const std::string normalized = common::to_lower(raw);
  if (normalized == ACTIVE_STATE) {
    return InstanceState::Active;
  }
  if (normalized == "stopped" || normalized == "terminated") {
    return InstanceState::Stopped;
  }
  return InstanceState::Unknown;
}

common::Result<std::vector<Instance>> parse_instance_list(const std::string &json) {
  const auto flat = common::json_parse_flat(json);
  const auto array = common::json_flat_get(flat, "instances");
  if (!array.has_value()) {
    return common::Result<std::vector<Instance>>::failure(
        "Invalid instance list response: missing 'instances'");
  }

  std::vector<Instance> instances;
  for (const auto &object : common::json_split_top_level_objects(*array)) {
    const auto item = common::json_parse_flat(object);
    Instance instance;
    instance.id = common::json_flat_get(item, "id").value_or("");
    instance.name = common::json_flat_get(item, "name");
    instance.raw_state = common::json_flat_get(item, "state").value_or("");
    instance.state = instance_state_from(instance.raw_state);
    instance.created_at = common::json_flat_get(item, "created_at").value_or("");
    if (const auto configuration = common::json_flat_get(item, "configuration");
        configuration.has_value()) {
      instance.image = common::json_flat_get(common::json_parse_flat(*configuration),
                                             "container_image")
                           .value_or("");
    }
    instances.push_back(std::move(instance));
  }
  return common::Result<std::vector<Instance>>::success(std::move(instances));
}

common::Result<std::vector<Instance>> list_instances(ApiContext &ctx) {
  const auto body = ctx.get("/instance/list", "list instances");
  if (!body.ok()) {
    return common::Result<std::vector<Instance>>::failure(body.error());
  }
  return parse_instance_list(body.value());
}

std::string instance_create_payload(const InstanceSpec &spec,
                                    const std::optional<std::string> &pull_token) {
  common::JsonWriter writer;
  writer.begin_object();
  writer.key("region").value(DEFAULT_REGION);
  writer.key("vcpu_ratio").value(1.0);
  writer.key("vcpu_count").value(static_cast<std::int64_t>(spec.vcpu_count));
  writer.key("memory_mb").value(static_cast<std::int64_t>(spec.memory_mb));
  writer.key("name");
  if (spec.name.empty()) {
    writer.null();
  } else {
    writer.value(spec.name);
  }

  writer.key("configuration").begin_object();
  writer.key("container_image").value(spec.image);
  writer.key("args");
  if (spec.args.empty()) {
    writer.null();
  } else {
    writer.string_array(spec.args);
  }
  writer.key("env");
  if (spec.env.empty()) {
    writer.null();
  } else {
    writer.string_map(spec.env);
  }
  if (pull_token.has_value()) {
    writer.key("registry_token").value(*pull_token);
  }
  writer.end_object();

  if (spec.network.has_value()) {
    writer.key("network")
        .begin_object()
        .key("network_id")
        .value(spec.network->network_id)
        .key("instance_ip")
        .value(spec.network->instance_ip)
        .end_object();
  }
  writer.end_object();
  return writer.str();
}

common::Result<std::string> create_instance(ApiContext &ctx, const InstanceSpec &spec,
                                            const std::optional<std::string> &pull_token) {
  const auto body =
      ctx.post("/instance", instance_create_payload(spec, pull_token), "start instance");
  if (!body.ok()) {
    return common::Result<std::string>::failure(body.error());
  }
  const auto id = common::json_flat_get(common::json_parse_flat(body.value()), "id");
  if (!id.has_value() || id->empty()) {
    return common::Result<std::string>::failure("start instance: response contained no id");
  }
  return common::Result<std::string>::success(*id);
}

common::Status stop_instance(ApiContext &ctx, const std::string &instance_id,
                             const std::uint64_t timeout_ms) {
  common::JsonWriter body;
  body.begin_object().key("timeout_ms").value(static_cast<std::int64_t>(timeout_ms)).end_object();
  return ctx.remove("/instance/" + instance_id, body.str(), "stop instance");
}

common::Result<std::string> resolve_active_instance(const std::string &input,
                                                    const std::vector<Instance> &all) {
  std::vector<Instance> active;
  for (const auto &instance : all) {
    if (instance.state == InstanceState::Active) {
      active.push_back(instance);
    }
  }
  return resolve_id(input, active, "instance");
}

common::Result<std::pair<std::string, std::string>> parse_env_pair(const std::string &value) {
  const auto eq = value.find('=');
  if (eq == std::string::npos) {
    return common::Result<std::pair<std::string, std::string>>::failure(
        "Invalid environment variable format: " + value + ". Expected KEY=VALUE format.");
  }
  return common::Result<std::pair<std::string, std::string>>::success(
      {value.substr(0, eq), value.substr(eq + 1)});
}

common::Result<std::uint32_t> parse_memory_mb(const std::string &value) {
  using R = common::Result<std::uint32_t>;
  const std::string text = common::trim(value);
  if (text.empty()) {
    return R::failure("Memory value cannot be empty");
  }

  std::string number = text;
  char unit = 'M';
  if (std::isdigit(static_cast<unsigned char>(text.back())) == 0) {
    unit = static_cast<char>(std::toupper(static_cast<unsigned char>(text.back())));
    number = text.substr(0, text.size() - 1);
  }

  std::uint64_t parsed = 0;
  if (!parse_digits(number, parsed)) {
    return R::failure("Memory value must be a number followed by an optional unit (M/G)");
  }
  std::uint64_t mb = 0;
  if (unit == 'M') {
    mb = parsed;
  } else if (unit == 'G') {
    mb = parsed * 1024;
  } else {
    return R::failure(std::string("Invalid memory unit: ") + unit);
  }
  if (mb < MIN_MEMORY_MB || mb > MAX_MEMORY_MB) {
    return R::failure("Memory must be between 128M and 128G (" + std::to_string(mb) + " MB)");
  }
  return R::success(static_cast<std::uint32_t>(mb));
}

common::Result<std::uint32_t> parse_vcpus(const std::string &value) {
  std::uint64_t parsed = 0;
  if (!parse_digits(common::trim(value), parsed) || parsed < 1 || parsed > 32) {
    return common::Result<std::uint32_t>::failure("--vcpus must be between 1 and 32");
  }
  return common::Result<std::uint32_t>::success(static_cast<std::uint32_t>(parsed));
}

} // namespace unisrv::api
