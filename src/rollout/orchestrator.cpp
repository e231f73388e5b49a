#include "unisrv/rollout/orchestrator.hpp"

#include "unisrv/api/resolve.hpp"
#include "unisrv/common/uuid.hpp"
#include "unisrv/observability/global.hpp"
#include "unisrv/rollout/best_effort.hpp"

#include <algorithm>
#include <set>

namespace unisrv::rollout {

namespace {

constexpr const char *COMPONENT = "rollout";

RolloutError make_error(RolloutErrorCode code, std::string message) {
  return RolloutError{code, std::move(message)};
}

} // namespace

common::Result<LeaveBehind> parse_leave_behind(const std::string &value) {
  if (value == "instances") {
    return common::Result<LeaveBehind>::success(LeaveBehind::Instances);
  }
  if (value == "targets") {
    return common::Result<LeaveBehind>::success(LeaveBehind::Targets);
  }
  return common::Result<LeaveBehind>::failure("Invalid --leave-behind value '" + value +
                                              "' (expected 'instances' or 'targets')");
}

std::string_view rollout_state_label(const RolloutState state) {
  switch (state) {
  case RolloutState::Resolving:
    return "resolving";
  case RolloutState::ProvisioningReplica:
    return "provisioning_replica";
  case RolloutState::AwaitingHealth:
    return "awaiting_health";
  case RolloutState::RegisteringTargets:
    return "registering_targets";
  case RolloutState::RetiringOldGeneration:
    return "retiring_old_generation";
  case RolloutState::Complete:
    return "complete";
  case RolloutState::RolledBack:
    return "rolled_back";
  }
  return "unknown";
}

std::string_view rollout_error_label(const RolloutErrorCode code) {
  switch (code) {
  case RolloutErrorCode::Resolution:
    return "resolution";
  case RolloutErrorCode::Validation:
    return "validation";
  case RolloutErrorCode::Provision:
    return "provision";
  case RolloutErrorCode::HealthCheck:
    return "health_check";
  case RolloutErrorCode::Registration:
    return "registration";
  }
  return "unknown";
}

std::string RolloutOutcome::summary() const {
  if (error.has_value()) {
    return error->message;
  }
  return "✅ Rolled out " + std::to_string(report.replicas) + " replica(s) of group '" +
         report.group + "' on service '" + report.service_name + "'.";
}

RolloutOrchestrator::RolloutOrchestrator(Platform &platform, RandomFill random)
    : platform_(platform), random_(std::move(random)) {}

RolloutOutcome RolloutOrchestrator::run(const RolloutRequest &request) {
  history_.clear();
  enter(RolloutState::Resolving, request.service);

  RolloutReport report;
  report.group = request.group;

  Plan plan;
  if (auto error = resolve(request, plan); error.has_value()) {
    // Nothing exists yet, so there is nothing to roll back.
    RolloutOutcome outcome;
    outcome.state = state_;
    outcome.error = std::move(error);
    outcome.report = std::move(report);
    observability::record_error(COMPONENT, outcome.error->message);
    return outcome;
  }
  report.service_id = plan.service_id;
  report.service_name = plan.service_name;
  report.port = plan.port;
  report.replicas = plan.replicas;
  report.deploy_hex = plan.deploy_hex;
  for (const auto &target : plan.old_targets) {
    report.old_target_ids.push_back(target.id);
  }

  enter(RolloutState::ProvisioningReplica, "verifying " + request.image);
  auto pull_token = platform_.verify_image(request.image);
  if (!pull_token.ok()) {
    return fail(make_error(RolloutErrorCode::Provision, pull_token.error()), std::move(report));
  }

  if (auto error = provision(request, plan, pull_token.value(), report); error.has_value()) {
    roll_back(request, report);
    return fail(std::move(*error), std::move(report));
  }

  if (auto error = register_targets(request, plan, report); error.has_value()) {
    roll_back(request, report);
    return fail(std::move(*error), std::move(report));
  }

  retire(request, plan, report);

  enter(RolloutState::Complete);
  RolloutOutcome outcome;
  outcome.state = RolloutState::Complete;
  outcome.report = std::move(report);
  return outcome;
}

std::optional<RolloutError> RolloutOrchestrator::resolve(const RolloutRequest &request,
                                                         Plan &plan) {
  if (request.replicas.has_value() && *request.replicas == 0) {
    return make_error(RolloutErrorCode::Validation, "--replicas must be at least 1");
  }

  auto services = platform_.list_services();
  if (!services.ok()) {
    return make_error(RolloutErrorCode::Resolution, services.error());
  }
  auto service_id = api::resolve_id(request.service, services.value(), "service");
  if (!service_id.ok()) {
    return make_error(RolloutErrorCode::Resolution, service_id.error());
  }
  plan.service_id = service_id.value();

  auto service = platform_.get_service(plan.service_id);
  if (!service.ok()) {
    return make_error(RolloutErrorCode::Resolution, service.error());
  }
  plan.service_name = service.value().name;
  for (const auto &target : service.value().targets) {
    if (target.group == request.group) {
      plan.old_targets.push_back(target);
    }
  }

  plan.replicas = request.replicas.value_or(std::max<std::size_t>(1, plan.old_targets.size()));

  if (request.port.has_value()) {
    plan.port = *request.port;
  } else if (!plan.old_targets.empty()) {
    std::set<std::uint16_t> ports;
    for (const auto &target : plan.old_targets) {
      ports.insert(target.instance_port);
    }
    if (ports.size() != 1) {
      return make_error(RolloutErrorCode::Validation,
                        "--port required: existing targets in group '" + request.group +
                            "' have different ports");
    }
    plan.port = *ports.begin();
  } else {
    return make_error(RolloutErrorCode::Validation,
                      "--port required when no existing targets exist for group '" +
                          request.group + "'");
  }

  if (request.network.has_value()) {
    if (request.network->ip.has_value() && plan.replicas > 1) {
      return make_error(RolloutErrorCode::Validation,
                        "A fixed network IP cannot be shared by " +
                            std::to_string(plan.replicas) +
                            " replicas; omit the IP to allocate one per instance");
    }
    auto networks = platform_.list_networks();
    if (!networks.ok()) {
      return make_error(RolloutErrorCode::Resolution, networks.error());
    }
    auto network_id = api::resolve_id(request.network->network, networks.value(), "network");
    if (!network_id.ok()) {
      return make_error(RolloutErrorCode::Resolution, network_id.error());
    }
    plan.network_id = network_id.value();
    plan.fixed_ip = request.network->ip;
  }

  auto instances = platform_.list_instances();
  if (!instances.ok()) {
    return make_error(RolloutErrorCode::Resolution, instances.error());
  }
  std::vector<std::string> existing_names;
  for (const auto &instance : instances.value()) {
    if (instance.name.has_value()) {
      existing_names.push_back(*instance.name);
    }
  }
  auto hex = generate_deploy_hex(plan.service_name + "_" + request.group + "_", existing_names,
                                 random_);
  if (!hex.ok()) {
    return make_error(RolloutErrorCode::Validation, hex.error());
  }
  plan.deploy_hex = hex.value();

  observability::record_debug(COMPONENT, "service " + plan.service_name + " (" +
                                             common::short_id(plan.service_id) + "), " +
                                             std::to_string(plan.old_targets.size()) +
                                             " old target(s), port " + std::to_string(plan.port));
  return std::nullopt;
}

std::optional<RolloutError>
RolloutOrchestrator::provision(const RolloutRequest &request, const Plan &plan,
                               const std::optional<std::string> &pull_token,
                               RolloutReport &report) {
  for (std::size_t i = 0; i < plan.replicas; ++i) {
    api::InstanceSpec spec;
    spec.name = replica_name(plan.service_name, request.group, plan.deploy_hex, i);
    spec.image = request.image;
    spec.vcpu_count = request.vcpu_count;
    spec.memory_mb = request.memory_mb;
    spec.args = request.args;
    spec.env = request.env;

    const std::string progress = "[" + std::to_string(i + 1) + "/" +
                                 std::to_string(plan.replicas) + "] " + spec.name;
    enter(RolloutState::ProvisioningReplica, progress);

    if (plan.network_id.has_value()) {
      std::string ip;
      if (plan.fixed_ip.has_value()) {
        ip = *plan.fixed_ip;
      } else {
        auto allocated = platform_.allocate_ip(*plan.network_id);
        if (!allocated.ok()) {
          return make_error(RolloutErrorCode::Provision, allocated.error());
        }
        ip = allocated.value();
      }
      spec.network = api::NetworkJoin{*plan.network_id, ip};
    }

    auto instance_id = platform_.create_instance(spec, pull_token);
    if (!instance_id.ok()) {
      return make_error(RolloutErrorCode::Provision, instance_id.error());
    }
    // Tracked before the health check so a replica that never becomes
    // healthy is stopped with the rest.
    report.new_instance_ids.push_back(instance_id.value());
    observability::record_replica(i, instance_id.value(), "created");

    enter(RolloutState::AwaitingHealth, progress + " " + common::short_id(instance_id.value()));
    if (const auto healthy = platform_.await_healthy(instance_id.value(), request.health_window);
        !healthy.ok()) {
      return make_error(RolloutErrorCode::HealthCheck, healthy.error());
    }
    observability::record_replica(i, instance_id.value(), "healthy");
  }
  return std::nullopt;
}

std::optional<RolloutError> RolloutOrchestrator::register_targets(const RolloutRequest &request,
                                                                  const Plan &plan,
                                                                  RolloutReport &report) {
  enter(RolloutState::RegisteringTargets, "adding " + std::to_string(plan.replicas) +
                                              " target(s) to group " + request.group);
  for (const auto &instance_id : report.new_instance_ids) {
    auto target_id = platform_.create_target(plan.service_id, instance_id, plan.port,
                                             request.group);
    if (!target_id.ok()) {
      return make_error(RolloutErrorCode::Registration, target_id.error());
    }
    report.new_target_ids.push_back(target_id.value());
  }
  return std::nullopt;
}

void RolloutOrchestrator::retire(const RolloutRequest &request, const Plan &plan,
                                 RolloutReport &report) {
  enter(RolloutState::RetiringOldGeneration,
        std::to_string(plan.old_targets.size()) + " old target(s)");
  if (plan.old_targets.empty() || request.leave_behind == LeaveBehind::Targets) {
    return;
  }

  BestEffort cleanup(COMPONENT);
  for (const auto &target : plan.old_targets) {
    cleanup.run("remove old target " + target.id,
                [&] { return platform_.remove_target(plan.service_id, target.id); });
  }
  if (request.leave_behind == LeaveBehind::None) {
    for (const auto &target : plan.old_targets) {
      cleanup.run("stop old instance " + target.instance_id, [&] {
        return platform_.stop_instance(target.instance_id, request.stop_timeout_ms);
      });
    }
  }
  report.warnings = cleanup.failures();
}

void RolloutOrchestrator::roll_back(const RolloutRequest &request, const RolloutReport &report) {
  BestEffort cleanup(COMPONENT);
  for (const auto &instance_id : report.new_instance_ids) {
    cleanup.run("stop instance " + instance_id + " during cleanup", [&] {
      return platform_.stop_instance(instance_id, request.stop_timeout_ms);
    });
  }
}

void RolloutOrchestrator::enter(const RolloutState state, const std::string &detail) {
  state_ = state;
  history_.push_back(state);
  observability::record_phase(std::string(rollout_state_label(state)), detail);
}

RolloutOutcome RolloutOrchestrator::fail(RolloutError error, RolloutReport report) {
  enter(RolloutState::RolledBack, std::string(rollout_error_label(error.code)));
  observability::record_error(COMPONENT, error.message);
  RolloutOutcome outcome;
  outcome.state = RolloutState::RolledBack;
  outcome.error = std::move(error);
  outcome.report = std::move(report);
  return outcome;
}

} // namespace unisrv::rollout
