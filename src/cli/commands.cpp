#include "unisrv/cli/commands.hpp"

#include "unisrv/api/context.hpp"
#include "unisrv/api/instances.hpp"
#include "unisrv/api/networks.hpp"
#include "unisrv/api/resolve.hpp"
#include "unisrv/api/services.hpp"
#include "unisrv/auth/session.hpp"
#include "unisrv/boot/log_stream.hpp"
#include "unisrv/boot/websocket_transport.hpp"
#include "unisrv/common/fs.hpp"
#include "unisrv/common/toml.hpp"
#include "unisrv/common/uuid.hpp"
#include "unisrv/config/config.hpp"
#include "unisrv/http/client.hpp"
#include "unisrv/observability/factory.hpp"
#include "unisrv/observability/global.hpp"
#include "unisrv/registry/client.hpp"
#include "unisrv/rollout/api_platform.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace unisrv::cli {

namespace {

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

/// Removes `--name VALUE` (or the short form, or `--name=VALUE`). A trailing
/// option with no value is reported through `missing`.
bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value, bool &missing) {
  const std::string inline_prefix = long_name + "=";
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (common::starts_with(args[i], inline_prefix)) {
      out_value = args[i].substr(inline_prefix.size());
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        missing = true;
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--") {
      break;
    }
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

int fail(const std::string &message) {
  std::cerr << "error: " << message << "\n";
  return 1;
}

common::Result<std::uint64_t> parse_unsigned(const std::string &value) {
  try {
    std::size_t consumed = 0;
    const unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size() || value.find('-') != std::string::npos) {
      throw std::invalid_argument(value);
    }
    return common::Result<std::uint64_t>::success(parsed);
  } catch (const std::exception &) {
    return common::Result<std::uint64_t>::failure(value);
  }
}

common::Result<std::uint64_t> parse_millis(const std::string &flag, const std::string &value) {
  auto parsed = parse_unsigned(value);
  if (!parsed.ok()) {
    return common::Result<std::uint64_t>::failure("invalid value '" + value + "' for " + flag +
                                                  ": expected milliseconds");
  }
  return parsed;
}

common::Result<std::size_t> parse_count(const std::string &flag, const std::string &value) {
  auto parsed = parse_unsigned(value);
  if (!parsed.ok() || parsed.value() == 0) {
    return common::Result<std::size_t>::failure("invalid value '" + value + "' for " + flag +
                                                ": expected an integer >= 1");
  }
  return common::Result<std::size_t>::success(static_cast<std::size_t>(parsed.value()));
}

common::Result<config::Config> load_checked_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    return common::Result<config::Config>::failure(validated.error());
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  for (const auto &warning : validated.value()) {
    observability::record_warning("config", warning);
  }
  return cfg;
}

common::Result<std::unique_ptr<api::ApiContext>> open_context(const config::Config &cfg) {
  using R = common::Result<std::unique_ptr<api::ApiContext>>;
  auto session = auth::Session::load_default();
  if (!session.ok()) {
    return R::failure(session.error());
  }
  if (const auto status = session.value().ensure_auth(); !status.ok()) {
    return R::failure(status.error());
  }
  auto http = std::make_shared<http::CurlHttpClient>();
  return R::success(
      std::make_unique<api::ApiContext>(cfg, http, std::move(session.value())));
}

int run_rollout(std::vector<std::string> args) {
  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    return fail(cfg.error());
  }
  auto request = parse_rollout_args(std::move(args), cfg.value());
  if (!request.ok()) {
    return fail(request.error());
  }

  auto ctx = open_context(cfg.value());
  if (!ctx.ok()) {
    return fail(ctx.error());
  }

  std::string last_phase;
  rollout::ApiPlatform platform(*ctx.value(), [&last_phase](const boot::BootProgress &progress) {
    if (progress.phase != last_phase) {
      last_phase = progress.phase;
      std::cerr << "  " << progress.phase << "\n";
    }
  });
  rollout::RolloutOrchestrator orchestrator(platform);
  const auto outcome = orchestrator.run(request.value());
  if (!outcome.ok()) {
    return fail(outcome.summary());
  }
  std::cout << outcome.summary() << "\n";
  return 0;
}

int run_instance_logs(api::ApiContext &ctx, const std::string &input) {
  auto instances = api::list_instances(ctx);
  if (!instances.ok()) {
    return fail(instances.error());
  }
  auto instance_id = api::resolve_active_instance(input, instances.value());
  if (!instance_id.ok()) {
    return fail(instance_id.error());
  }
  auto headers = ctx.auth_headers();
  if (!headers.ok()) {
    return fail(headers.error());
  }
  boot::WebSocketTransport transport;
  const auto status =
      boot::follow_logs(transport, ctx.ws_url("/instance/" + instance_id.value() + "/logs/stream"),
                        headers.value(), std::cout, std::cerr);
  return status.ok() ? 0 : fail(status.error());
}

int run_instance_stop(api::ApiContext &ctx, std::vector<std::string> args) {
  std::uint64_t timeout_ms = ctx.config().rollout.stop_timeout_ms;
  std::string value;
  bool missing = false;
  if (take_option(args, "--timeout", "-t", value, missing)) {
    auto parsed = parse_millis("--timeout", value);
    if (!parsed.ok()) {
      return fail(parsed.error());
    }
    if (parsed.value() > 600'000) {
      return fail("--timeout must be between 0 and 600000");
    }
    timeout_ms = parsed.value();
  }
  if (missing) {
    return fail("missing value for --timeout");
  }
  if (args.size() != 1) {
    return fail("usage: unisrv instance stop <id|name|prefix> [--timeout MS]");
  }

  auto instances = api::list_instances(ctx);
  if (!instances.ok()) {
    return fail(instances.error());
  }
  auto instance_id = api::resolve_active_instance(args[0], instances.value());
  if (!instance_id.ok()) {
    return fail(instance_id.error());
  }
  if (const auto status = api::stop_instance(ctx, instance_id.value(), timeout_ms); !status.ok()) {
    return fail(status.error());
  }
  std::cout << "Successfully stopped instance with UUID: " << instance_id.value() << "\n";
  return 0;
}

int run_instance_list(api::ApiContext &ctx, std::vector<std::string> args) {
  bool include_stopped = false;
  for (const auto &arg : args) {
    if (arg == "--include-stopped" || arg == "-a") {
      include_stopped = true;
      continue;
    }
    return fail("unknown option for instance list: " + arg);
  }
  auto instances = api::list_instances(ctx);
  if (!instances.ok()) {
    return fail(instances.error());
  }
  print_instances(instances.value(), include_stopped, std::cout);
  return 0;
}

int run_instance_run(api::ApiContext &ctx, std::vector<std::string> args) {
  auto request = parse_instance_run_args(std::move(args));
  if (!request.ok()) {
    return fail(request.error());
  }
  rollout::ApiPlatform platform(ctx);
  auto instance_id = launch_instance(platform, request.value());
  if (!instance_id.ok()) {
    return fail(instance_id.error());
  }
  std::cout << "Instance " << instance_id.value() << " started\n";
  std::cout << "Follow its boot with: unisrv instance logs "
            << common::short_id(instance_id.value()) << "\n";
  return 0;
}

int run_instance(std::vector<std::string> args) {
  if (args.empty()) {
    return fail("usage: unisrv instance <list|run|logs|stop> ...");
  }
  std::string action = args[0];
  args.erase(args.begin());
  if (action == "ls") {
    action = "list";
  }
  if (action != "list" && action != "run" && action != "logs" && action != "stop" &&
      action != "rm") {
    return fail("unknown instance command: " + action);
  }

  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    return fail(cfg.error());
  }
  auto ctx = open_context(cfg.value());
  if (!ctx.ok()) {
    return fail(ctx.error());
  }
  if (action == "list") {
    return run_instance_list(*ctx.value(), std::move(args));
  }
  if (action == "run") {
    return run_instance_run(*ctx.value(), std::move(args));
  }
  if (action == "logs") {
    if (args.size() != 1) {
      return fail("usage: unisrv instance logs <id|name|prefix>");
    }
    return run_instance_logs(*ctx.value(), args[0]);
  }
  return run_instance_stop(*ctx.value(), std::move(args));
}

common::Result<std::string> resolve_service(api::ApiContext &ctx, const std::string &input) {
  auto services = api::list_services(ctx);
  if (!services.ok()) {
    return common::Result<std::string>::failure(services.error());
  }
  return api::resolve_id(input, services.value(), "service");
}

int run_service_show(api::ApiContext &ctx, const std::string &input) {
  auto service_id = resolve_service(ctx, input);
  if (!service_id.ok()) {
    return fail(service_id.error());
  }
  auto service = api::get_service(ctx, service_id.value());
  if (!service.ok()) {
    return fail(service.error());
  }

  const auto &info = service.value();
  const std::string header = "Service " + info.id;
  std::cout << header << "\n";
  std::cout << std::string(header.size(), '=') << "\n";
  std::cout << "Name:         " << info.name << "\n";
  std::cout << "ID:           " << info.id << "\n\n";
  if (info.targets.empty()) {
    std::cout << "No targets configured\n";
    return 0;
  }
  std::cout << "Targets (" << info.targets.size() << ")\n";
  for (const auto &target : info.targets) {
    std::cout << "  " << target.id << "  " << target.instance_id << ":" << target.instance_port
              << "  [" << target.group << "]\n";
  }
  return 0;
}

int run_service_target(api::ApiContext &ctx, std::vector<std::string> args) {
  if (args.empty()) {
    return fail("usage: unisrv service target <add|rm> ...");
  }
  const std::string action = args[0];
  args.erase(args.begin());

  if (action == "add") {
    std::string group = ctx.config().rollout.default_group;
    bool missing = false;
    take_option(args, "--group", "-g", group, missing);
    if (missing) {
      return fail("missing value for --group");
    }
    if (args.size() != 2) {
      return fail("usage: unisrv service target add <service> <instance>:<port> [--group G]");
    }
    auto service_id = resolve_service(ctx, args[0]);
    if (!service_id.ok()) {
      return fail(service_id.error());
    }
    auto spec = api::parse_target_spec(args[1]);
    if (!spec.ok()) {
      return fail(spec.error());
    }
    auto instances = api::list_instances(ctx);
    if (!instances.ok()) {
      return fail(instances.error());
    }
    auto instance_id = api::resolve_active_instance(spec.value().instance, instances.value());
    if (!instance_id.ok()) {
      return fail(instance_id.error());
    }
    auto target_id = api::create_target(ctx, service_id.value(), instance_id.value(),
                                        spec.value().port, group);
    if (!target_id.ok()) {
      return fail(target_id.error());
    }
    std::cout << "Target " << common::short_id(target_id.value()) << " added to service "
              << common::short_id(service_id.value()) << " ("
              << common::short_id(instance_id.value()) << ":" << spec.value().port
              << ") [group: " << group << "]\n";
    return 0;
  }

  if (action == "rm" || action == "delete") {
    if (args.size() != 2) {
      return fail("usage: unisrv service target rm <service> <target>");
    }
    auto service_id = resolve_service(ctx, args[0]);
    if (!service_id.ok()) {
      return fail(service_id.error());
    }
    auto service = api::get_service(ctx, service_id.value());
    if (!service.ok()) {
      return fail(service.error());
    }
    auto target_id = api::resolve_id(args[1], service.value().targets, "target");
    if (!target_id.ok()) {
      return fail(target_id.error());
    }
    if (const auto status = api::remove_target(ctx, service_id.value(), target_id.value());
        !status.ok()) {
      return fail(status.error());
    }
    std::cout << "Target " << common::short_id(target_id.value()) << " deleted from service "
              << common::short_id(service_id.value()) << "\n";
    return 0;
  }

  return fail("unknown service target command: " + action);
}

int run_service(std::vector<std::string> args) {
  if (args.empty()) {
    return fail("usage: unisrv service <list|show|target> ...");
  }
  std::string action = args[0];
  args.erase(args.begin());
  if (action == "ls") {
    action = "list";
  }
  if (action != "list" && action != "show" && action != "target") {
    return fail("unknown service command: " + action);
  }

  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    return fail(cfg.error());
  }
  auto ctx = open_context(cfg.value());
  if (!ctx.ok()) {
    return fail(ctx.error());
  }
  if (action == "list") {
    auto services = api::list_services(*ctx.value());
    if (!services.ok()) {
      return fail(services.error());
    }
    print_services(services.value(), std::cout);
    return 0;
  }
  if (action == "show") {
    if (args.size() != 1) {
      return fail("usage: unisrv service show <id|name|prefix>");
    }
    return run_service_show(*ctx.value(), args[0]);
  }
  return run_service_target(*ctx.value(), std::move(args));
}

int run_network(std::vector<std::string> args) {
  if (args.empty()) {
    return fail("usage: unisrv network <list|show> ...");
  }
  std::string action = args[0];
  args.erase(args.begin());
  if (action == "ls") {
    action = "list";
  }
  if (action == "get") {
    action = "show";
  }
  if (action != "list" && action != "show") {
    return fail("unknown network command: " + action);
  }
  if (action == "show" && args.size() != 1) {
    return fail("usage: unisrv network show <id|name|prefix>");
  }

  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    return fail(cfg.error());
  }
  auto ctx = open_context(cfg.value());
  if (!ctx.ok()) {
    return fail(ctx.error());
  }
  auto networks = api::list_networks(*ctx.value());
  if (!networks.ok()) {
    return fail(networks.error());
  }
  if (action == "list") {
    print_networks(networks.value(), std::cout);
    return 0;
  }

  auto network_id = api::resolve_id(args[0], networks.value(), "network");
  if (!network_id.ok()) {
    return fail(network_id.error());
  }
  auto details = api::get_network(*ctx.value(), network_id.value());
  if (!details.ok()) {
    return fail(details.error());
  }
  print_network_details(details.value(), std::cout);
  return 0;
}

int run_registry(std::vector<std::string> args) {
  if (args.empty()) {
    return fail("usage: unisrv registry <login|list> ...");
  }
  std::string action = args[0];
  args.erase(args.begin());
  if (action == "ls") {
    action = "list";
  }
  if (action != "login" && action != "list") {
    return fail("unknown registry command: " + action);
  }

  auto session = auth::Session::load_default();
  if (!session.ok()) {
    return fail(session.error());
  }
  if (action == "list") {
    print_registries(session.value(), std::cout);
    return 0;
  }

  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    return fail(cfg.error());
  }
  auto login = parse_registry_login_args(std::move(args), std::cin);
  if (!login.ok()) {
    return fail(login.error());
  }
  http::CurlHttpClient http;
  const auto status = registry_login(http, session.value(), login.value(),
                                     cfg.value().http.timeout_ms, std::cout);
  return status.ok() ? 0 : fail(status.error());
}

int run_config_set(const std::vector<std::string> &args) {
  if (args.size() != 2) {
    return fail("usage: unisrv config set <section.key> <value>");
  }
  auto updated = config::update_config_value(args[0], args[1]);
  if (!updated.ok()) {
    return fail(updated.error());
  }
  auto path = config::config_path();
  std::cout << "Set " << args[0] << " in " << (path.ok() ? path.value().string() : "config")
            << "\n";
  return 0;
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "set") {
    return run_config_set(std::vector<std::string>(args.begin() + 1, args.end()));
  }
  if (!args.empty() && args[0] != "show") {
    return fail("unknown config command: " + args[0]);
  }
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return fail(cfg.error());
  }
  const auto &c = cfg.value();
  auto path = config::config_path();
  if (path.ok()) {
    std::cout << "# " << path.value().string() << (config::config_exists() ? "" : " (defaults)")
              << "\n";
  }
  std::cout << "[api]\nhost = " << common::quote_toml_string(c.api.host) << "\n\n";
  std::cout << "[http]\ntimeout_ms = " << c.http.timeout_ms << "\n\n";
  std::cout << "[rollout]\nhealth_window_ms = " << c.rollout.health_window_ms
            << "\nstop_timeout_ms = " << c.rollout.stop_timeout_ms
            << "\ndefault_group = " << common::quote_toml_string(c.rollout.default_group)
            << "\nprogress_log_lines = " << c.rollout.progress_log_lines << "\n\n";
  std::cout << "[observability]\nbackend = " << common::quote_toml_string(c.observability.backend)
            << "\nlevel = " << common::quote_toml_string(c.observability.level) << "\n";

  auto validated = config::validate_config(c);
  if (!validated.ok()) {
    return fail(validated.error());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return 0;
}

} // namespace

std::string version_string() {
#ifdef UNISRV_VERSION
  return std::string("unisrv ") + UNISRV_VERSION;
#else
  return "unisrv 0.1.0";
#endif
}

common::Result<rollout::RolloutRequest> parse_rollout_args(std::vector<std::string> args,
                                                           const config::Config &config) {
  using R = common::Result<rollout::RolloutRequest>;
  rollout::RolloutRequest request;
  request.group = config.rollout.default_group;
  request.health_window = std::chrono::milliseconds(config.rollout.health_window_ms);
  request.stop_timeout_ms = config.rollout.stop_timeout_ms;

  std::vector<std::string> trailing;
  if (const auto dash = std::find(args.begin(), args.end(), "--"); dash != args.end()) {
    trailing.assign(dash + 1, args.end());
    args.erase(dash, args.end());
  }

  std::string value;
  bool missing = false;
  const auto missing_value = [](const std::string &flag) {
    return R::failure("missing value for " + flag);
  };

  if (take_option(args, "--group", "-g", value, missing)) {
    if (common::trim(value).empty()) {
      return R::failure("--group must not be empty");
    }
    request.group = value;
  }
  if (missing) {
    return missing_value("--group");
  }
  if (take_option(args, "--port", "-p", value, missing)) {
    auto port = api::parse_port(value);
    if (!port.ok()) {
      return R::failure(port.error());
    }
    request.port = port.value();
  }
  if (missing) {
    return missing_value("--port");
  }
  if (take_option(args, "--replicas", "-r", value, missing)) {
    auto replicas = parse_count("--replicas", value);
    if (!replicas.ok()) {
      return R::failure(replicas.error());
    }
    request.replicas = replicas.value();
  }
  if (missing) {
    return missing_value("--replicas");
  }
  if (take_option(args, "--vcpus", "-c", value, missing)) {
    auto vcpus = api::parse_vcpus(value);
    if (!vcpus.ok()) {
      return R::failure(vcpus.error());
    }
    request.vcpu_count = vcpus.value();
  }
  if (missing) {
    return missing_value("--vcpus");
  }
  if (take_option(args, "--memory", "-m", value, missing)) {
    auto memory = api::parse_memory_mb(value);
    if (!memory.ok()) {
      return R::failure(memory.error());
    }
    request.memory_mb = memory.value();
  }
  if (missing) {
    return missing_value("--memory");
  }
  while (take_option(args, "--env", "-e", value, missing)) {
    auto pair = api::parse_env_pair(value);
    if (!pair.ok()) {
      return R::failure(pair.error());
    }
    request.env[pair.value().first] = pair.value().second;
  }
  if (missing) {
    return missing_value("--env");
  }
  if (take_option(args, "--network", "", value, missing)) {
    auto network = api::parse_network_spec(value);
    if (!network.ok()) {
      return R::failure(network.error());
    }
    request.network = network.value();
  }
  if (missing) {
    return missing_value("--network");
  }
  if (take_option(args, "--leave-behind", "", value, missing)) {
    auto leave_behind = rollout::parse_leave_behind(value);
    if (!leave_behind.ok()) {
      return R::failure(leave_behind.error());
    }
    request.leave_behind = leave_behind.value();
  }
  if (missing) {
    return missing_value("--leave-behind");
  }
  if (take_option(args, "--health-window", "", value, missing)) {
    auto window = parse_millis("--health-window", value);
    if (!window.ok()) {
      return R::failure(window.error());
    }
    if (window.value() == 0) {
      return R::failure("--health-window must be greater than 0");
    }
    request.health_window = std::chrono::milliseconds(window.value());
  }
  if (missing) {
    return missing_value("--health-window");
  }

  for (const auto &arg : args) {
    if (arg.size() > 1 && arg.front() == '-') {
      return R::failure("unknown option for rollout: " + arg);
    }
  }
  if (args.size() < 2) {
    return R::failure("usage: unisrv rollout <service> <container-image> [options] [-- args...]");
  }
  request.service = args[0];
  request.image = args[1];
  request.args.assign(args.begin() + 2, args.end());
  request.args.insert(request.args.end(), trailing.begin(), trailing.end());
  return R::success(std::move(request));
}

common::Result<InstanceRunRequest> parse_instance_run_args(std::vector<std::string> args) {
  using R = common::Result<InstanceRunRequest>;
  InstanceRunRequest request;

  std::vector<std::string> trailing;
  if (const auto dash = std::find(args.begin(), args.end(), "--"); dash != args.end()) {
    trailing.assign(dash + 1, args.end());
    args.erase(dash, args.end());
  }

  std::string value;
  bool missing = false;
  const auto missing_value = [](const std::string &flag) {
    return R::failure("missing value for " + flag);
  };

  if (take_option(args, "--name", "-n", value, missing)) {
    if (common::trim(value).empty()) {
      return R::failure("--name must not be empty");
    }
    request.spec.name = value;
  }
  if (missing) {
    return missing_value("--name");
  }
  if (take_option(args, "--vcpus", "-c", value, missing)) {
    auto vcpus = api::parse_vcpus(value);
    if (!vcpus.ok()) {
      return R::failure(vcpus.error());
    }
    request.spec.vcpu_count = vcpus.value();
  }
  if (missing) {
    return missing_value("--vcpus");
  }
  if (take_option(args, "--memory", "-m", value, missing)) {
    auto memory = api::parse_memory_mb(value);
    if (!memory.ok()) {
      return R::failure(memory.error());
    }
    request.spec.memory_mb = memory.value();
  }
  if (missing) {
    return missing_value("--memory");
  }
  while (take_option(args, "--env", "-e", value, missing)) {
    auto pair = api::parse_env_pair(value);
    if (!pair.ok()) {
      return R::failure(pair.error());
    }
    request.spec.env[pair.value().first] = pair.value().second;
  }
  if (missing) {
    return missing_value("--env");
  }
  if (take_option(args, "--network", "", value, missing)) {
    auto network = api::parse_network_spec(value);
    if (!network.ok()) {
      return R::failure(network.error());
    }
    request.network = network.value();
  }
  if (missing) {
    return missing_value("--network");
  }

  for (const auto &arg : args) {
    if (arg.size() > 1 && arg.front() == '-') {
      return R::failure("unknown option for instance run: " + arg);
    }
  }
  if (args.empty()) {
    return R::failure("usage: unisrv instance run <container-image> [options] [-- args...]");
  }
  request.spec.image = args[0];
  request.spec.args.assign(args.begin() + 1, args.end());
  request.spec.args.insert(request.spec.args.end(), trailing.begin(), trailing.end());
  return R::success(std::move(request));
}

common::Result<std::string> launch_instance(rollout::Platform &platform,
                                            const InstanceRunRequest &request) {
  using R = common::Result<std::string>;
  auto pull_token = platform.verify_image(request.spec.image);
  if (!pull_token.ok()) {
    return R::failure(pull_token.error());
  }

  api::InstanceSpec spec = request.spec;
  if (request.network.has_value()) {
    auto networks = platform.list_networks();
    if (!networks.ok()) {
      return R::failure(networks.error());
    }
    auto network_id = api::resolve_id(request.network->network, networks.value(), "network");
    if (!network_id.ok()) {
      return R::failure(network_id.error());
    }
    std::string ip;
    if (request.network->ip.has_value()) {
      ip = *request.network->ip;
    } else {
      auto allocated = platform.allocate_ip(network_id.value());
      if (!allocated.ok()) {
        return R::failure(allocated.error());
      }
      ip = allocated.value();
    }
    spec.network = api::NetworkJoin{network_id.value(), ip};
  }

  observability::record_debug("cli", "creating instance from " + spec.image);
  return platform.create_instance(spec, pull_token.value());
}

common::Result<RegistryLogin> parse_registry_login_args(std::vector<std::string> args,
                                                        std::istream &input) {
  using R = common::Result<RegistryLogin>;
  RegistryLogin login;

  std::string value;
  bool missing = false;
  if (take_option(args, "--username", "-u", value, missing)) {
    login.username = value;
  }
  if (missing) {
    return R::failure("missing value for --username");
  }
  if (take_option(args, "--password", "-p", value, missing)) {
    login.password = value;
  }
  if (missing) {
    return R::failure("missing value for --password");
  }
  if (const auto it = std::find(args.begin(), args.end(), "--password-stdin"); it != args.end()) {
    if (login.password.has_value()) {
      return R::failure("--password and --password-stdin are mutually exclusive");
    }
    args.erase(it);
    const std::string raw{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    login.password = common::trim(raw);
  }

  for (const auto &arg : args) {
    if (arg.size() > 1 && arg.front() == '-') {
      return R::failure("unknown option for registry login: " + arg);
    }
  }
  if (args.size() != 1) {
    return R::failure(
        "usage: unisrv registry login <registry> [-u USER] [-p PASSWORD | --password-stdin]");
  }
  login.registry = registry::registry_host(args[0]);
  if (login.registry.empty()) {
    return R::failure("registry must not be empty");
  }
  if (login.password.has_value() && !login.username.has_value()) {
    return R::failure("a password requires --username");
  }
  if (login.username.has_value() && (!login.password.has_value() || login.password->empty())) {
    return R::failure("--username requires a password (--password or --password-stdin)");
  }
  return R::success(std::move(login));
}

common::Status registry_login(http::HttpClient &http, auth::Session &session,
                              const RegistryLogin &login, const std::uint64_t timeout_ms,
                              std::ostream &out) {
  if (!session.present()) {
    return common::Status::error(
        "No authentication session found. Please log in with unisrv login first.");
  }

  auth::RegistryCredential credential;
  credential.username = login.username;
  credential.password = login.password;
  auto token = registry::login_registry(http, login.registry, credential, timeout_ms);
  if (!token.ok()) {
    return common::Status::error("Registry login failed: " + token.error());
  }
  credential.token = token.value();

  if (const auto saved = session.store_registry_credential(login.registry, credential);
      !saved.ok()) {
    return common::Status::error("Failed to save credentials: " + saved.error());
  }

  out << "Registry login successful\n";
  out << "Registry: " << login.registry << "\n";
  if (login.username.has_value()) {
    out << "Username: " << *login.username << "\n";
  }
  if (!token.value().has_value()) {
    out << "No authentication required (anonymous access)\n";
  }
  out << "Credentials saved\n";
  return common::Status::success();
}

void print_registries(const auth::Session &session, std::ostream &out) {
  if (!session.present() || session.data()->registries.empty()) {
    out << "No registries configured. Login with: unisrv registry login <registry>\n";
    return;
  }
  out << "Configured registries:\n";
  for (const auto &[registry, credential] : session.data()->registries) {
    out << "  " << registry << " | " << credential.username.value_or("(anonymous)") << "\n";
  }
}

void print_instances(const std::vector<api::Instance> &instances, const bool include_stopped,
                     std::ostream &out) {
  std::size_t shown = 0;
  for (const auto &instance : instances) {
    if (!include_stopped && instance.state != api::InstanceState::Active) {
      continue;
    }
    out << common::short_id(instance.id) << " | " << instance.name.value_or("-") << " | "
        << instance.raw_state << " | " << (instance.image.empty() ? "Unknown" : instance.image)
        << " | " << instance.created_at << "\n";
    ++shown;
  }
  if (shown == 0) {
    out << (include_stopped ? "No instances found. How about running one?"
                            : "No running instances found.")
        << "\n";
  }
}

void print_services(const std::vector<api::ServiceSummary> &services, std::ostream &out) {
  if (services.empty()) {
    out << "No services found.\n";
    return;
  }
  for (const auto &service : services) {
    out << common::short_id(service.id) << " | " << service.name << " | " << service.type << "\n";
  }
}

void print_networks(const std::vector<api::Network> &networks, std::ostream &out) {
  if (networks.empty()) {
    out << "No networks found.\n";
    return;
  }
  for (const auto &network : networks) {
    out << common::short_id(network.id) << " | " << network.name << " | " << network.ipv4_cidr
        << "\n";
  }
}

void print_network_details(const api::NetworkDetails &network, std::ostream &out) {
  const std::string header = "Network " + network.id;
  out << header << "\n";
  out << std::string(header.size(), '=') << "\n";
  out << "Name:         " << network.name << "\n";
  out << "ID:           " << network.id << "\n";
  out << "CIDR:         " << network.ipv4_cidr << "\n";
  if (!network.created_at.empty()) {
    out << "Created:      " << network.created_at << "\n";
  }
  out << "\n";
  if (network.members.empty()) {
    out << "No attached instances\n";
    return;
  }
  out << "Attached Instances (" << network.members.size() << ")\n";
  for (const auto &member : network.members) {
    out << "  " << member.instance_id << "  " << member.ip << "\n";
  }
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << "  unisrv" << RESET << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "unisrv [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  DEPLOY" << RESET << "\n";
  std::cout << "  " << GREEN << "rollout" << RESET << " SERVICE IMAGE" << DIM
            << "   Rolling update of a service target group" << RESET << "\n";
  std::cout << DIM
            << "      --group G  --port P  --replicas N  --vcpus N  --memory 1024M\n"
               "      --env K=V  --network [ip]@net  --leave-behind instances|targets\n"
               "      --health-window MS  [-- container args]"
            << RESET << "\n\n";

  std::cout << BOLD << "  INSTANCES" << RESET << "\n";
  std::cout << "  " << GREEN << "instance list" << RESET << DIM
            << "           List running instances (-a includes stopped)" << RESET << "\n";
  std::cout << "  " << GREEN << "instance run" << RESET << " IMAGE" << DIM
            << "      Start one instance (--name --vcpus --memory --env --network)" << RESET
            << "\n";
  std::cout << "  " << GREEN << "instance logs" << RESET << " ID" << DIM
            << "        Stream boot and log events" << RESET << "\n";
  std::cout << "  " << GREEN << "instance stop" << RESET << " ID" << DIM
            << "        Stop a running instance (--timeout MS)" << RESET << "\n\n";

  std::cout << BOLD << "  SERVICES" << RESET << "\n";
  std::cout << "  " << GREEN << "service list" << RESET << DIM << "            List services"
            << RESET << "\n";
  std::cout << "  " << GREEN << "service show" << RESET << " ID" << DIM
            << "         Show a service and its targets" << RESET << "\n";
  std::cout << "  " << GREEN << "service target add" << RESET << " SVC INST:PORT" << DIM
            << "  Register a target (--group G)" << RESET << "\n";
  std::cout << "  " << GREEN << "service target rm" << RESET << " SVC TARGET" << DIM
            << "     Remove a target" << RESET << "\n\n";

  std::cout << BOLD << "  NETWORKS" << RESET << "\n";
  std::cout << "  " << GREEN << "network list" << RESET << DIM << "            List networks"
            << RESET << "\n";
  std::cout << "  " << GREEN << "network show" << RESET << " ID" << DIM
            << "         Show a network and its attached instances" << RESET << "\n\n";

  std::cout << BOLD << "  REGISTRIES" << RESET << "\n";
  std::cout << "  " << GREEN << "registry login" << RESET << " REGISTRY" << DIM
            << "  Store credentials (-u USER --password-stdin)" << RESET << "\n";
  std::cout << "  " << GREEN << "registry list" << RESET << DIM
            << "           Show registries with stored credentials" << RESET << "\n\n";

  std::cout << BOLD << "  OTHER" << RESET << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM << "             Display configuration"
            << RESET << "\n";
  std::cout << "  " << GREEN << "config set" << RESET << " KEY VALUE" << DIM
            << "    Update one setting, e.g. rollout.default_group" << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM << "             Print config file path"
            << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "                 Show version" << RESET
            << "\n\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    return fail(global_error);
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      return fail(path_result.error());
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }
  if (subcommand == "rollout") {
    return run_rollout(std::move(args));
  }
  if (subcommand == "instance") {
    return run_instance(std::move(args));
  }
  if (subcommand == "service") {
    return run_service(std::move(args));
  }
  if (subcommand == "network") {
    return run_network(std::move(args));
  }
  if (subcommand == "registry") {
    return run_registry(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace unisrv::cli
