#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "unisrv/rollout/orchestrator.hpp"

#include <algorithm>
#include <cstring>

namespace {

using unisrv::testing::FakePlatform;
namespace r = unisrv::rollout;
namespace api = unisrv::api;

constexpr const char *SERVICE_ID = "5e5e5e5e-0000-4000-8000-000000000001";
constexpr const char *OLD_A = "01d01d01-0000-4000-8000-00000000000a";
constexpr const char *OLD_B = "01d01d01-0000-4000-8000-00000000000b";
constexpr const char *OTHER = "01d01d01-0000-4000-8000-00000000000c";

api::ServiceTarget target(const std::string &id, const std::string &instance, std::uint16_t port,
                          const std::string &group = "default") {
  api::ServiceTarget t;
  t.id = id;
  t.instance_id = instance;
  t.instance_port = port;
  t.group = group;
  return t;
}

/// Service "web" with two default-group targets on 8080 and one in "canary".
void seed(FakePlatform &platform, std::uint16_t second_port = 8080) {
  platform.add_service(SERVICE_ID, "web",
                       {target("7a000000-0000-4000-8000-000000000001", OLD_A, 8080),
                        target("7a000000-0000-4000-8000-000000000002", OLD_B, second_port),
                        target("7a000000-0000-4000-8000-000000000003", OTHER, 9000, "canary")});
}

r::RandomFill fixed_random(unsigned char first, unsigned char second) {
  return [first, second](unsigned char *out, std::size_t size) {
    std::memset(out, 0, size);
    out[0] = first;
    if (size > 1) {
      out[1] = second;
    }
    return true;
  };
}

r::RolloutRequest request_for(const std::string &service = "web") {
  r::RolloutRequest request;
  request.service = service;
  request.image = "nginx:1.27";
  request.health_window = std::chrono::milliseconds(1000);
  return request;
}

bool instance_active(const FakePlatform &platform, const std::string &id) {
  return std::any_of(platform.instances.begin(), platform.instances.end(), [&](const auto &i) {
    return i.id == id && i.state == api::InstanceState::Active;
  });
}

bool has_target(FakePlatform &platform, const std::string &instance_id) {
  const auto &targets = platform.service_details[SERVICE_ID].targets;
  return std::any_of(targets.begin(), targets.end(),
                     [&](const auto &t) { return t.instance_id == instance_id; });
}

void require_old_generation_untouched(FakePlatform &platform) {
  using unisrv::tests::require;
  require(platform.removed_targets.empty(), "old targets must not be removed");
  require(!platform.was_stopped(OLD_A) && !platform.was_stopped(OLD_B),
          "old instances must not be stopped");
  require(has_target(platform, OLD_A) && has_target(platform, OLD_B), "old targets must remain");
}

} // namespace

void register_rollout_tests(std::vector<unisrv::tests::TestCase> &tests) {
  using unisrv::tests::require;

  tests.push_back({"rollout_registers_exactly_requested_replicas", [] {
                     for (std::size_t replicas = 1; replicas <= 4; ++replicas) {
                       FakePlatform platform;
                       seed(platform);
                       r::RolloutOrchestrator orchestrator(platform, fixed_random(0xab, 0x12));
                       auto request = request_for();
                       request.replicas = replicas;
                       const auto outcome = orchestrator.run(request);
                       require(outcome.ok(), outcome.summary());
                       require(outcome.state == r::RolloutState::Complete, "state should be complete");
                       require(platform.created.size() == replicas, "one instance per replica");
                       require(platform.created_targets.size() == replicas,
                               "one target per replica");
                       require(outcome.report.new_target_ids.size() == replicas,
                               "report should list new targets");
                       for (const auto &t : platform.created_targets) {
                         require(t.instance_port == 8080, "port from old generation");
                         require(t.group == "default", "group should be default");
                       }
                     }
                   }});

  tests.push_back({"rollout_names_replicas_with_deploy_hex", [] {
                     FakePlatform platform;
                     seed(platform);
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(0xab, 0x12));
                     const auto outcome = orchestrator.run(request_for());
                     require(outcome.ok(), outcome.summary());
                     require(platform.created.size() == 2, "replicas default to old target count");
                     require(platform.created[0].spec.name == "web_default_ab12_0", "first name");
                     require(platform.created[1].spec.name == "web_default_ab12_1", "second name");
                     require(platform.created[0].pull_token == std::optional<std::string>("pull-token"),
                             "pull token should be forwarded");
                     require(platform.created[0].spec.image == "nginx:1.27", "image forwarded");
                   }});

  tests.push_back({"rollout_success_message", [] {
                     FakePlatform platform;
                     seed(platform);
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     const auto outcome = orchestrator.run(request_for());
                     require(outcome.summary() ==
                                 "✅ Rolled out 2 replica(s) of group 'default' on service 'web'.",
                             outcome.summary());
                   }});

  tests.push_back({"rollout_state_history_is_ordered", [] {
                     FakePlatform platform;
                     seed(platform);
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     auto request = request_for();
                     request.replicas = 1;
                     const auto outcome = orchestrator.run(request);
                     require(outcome.ok(), outcome.summary());
                     const std::vector<r::RolloutState> expected = {
                         r::RolloutState::Resolving,
                         r::RolloutState::ProvisioningReplica,
                         r::RolloutState::ProvisioningReplica,
                         r::RolloutState::AwaitingHealth,
                         r::RolloutState::RegisteringTargets,
                         r::RolloutState::RetiringOldGeneration,
                         r::RolloutState::Complete};
                     require(orchestrator.history() == expected, "unexpected state sequence");
                   }});

  tests.push_back({"rollout_defaults_to_one_replica_without_old_targets", [] {
                     FakePlatform platform;
                     platform.add_service(SERVICE_ID, "web", {});
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     auto request = request_for();
                     request.port = 3000;
                     const auto outcome = orchestrator.run(request);
                     require(outcome.ok(), outcome.summary());
                     require(platform.created.size() == 1, "minimum one replica");
                     require(platform.created_targets[0].instance_port == 3000, "requested port");
                     require(platform.removed_targets.empty() && platform.stopped.empty(),
                             "nothing to retire");
                   }});

  tests.push_back({"rollout_creation_failure_stops_earlier_replicas", [] {
                     FakePlatform platform;
                     seed(platform);
                     platform.fail_create_at = 2;
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     auto request = request_for();
                     request.replicas = 4;
                     const auto outcome = orchestrator.run(request);
                     require(!outcome.ok(), "rollout should fail");
                     require(outcome.state == r::RolloutState::RolledBack, "rolled back");
                     require(outcome.error->code == r::RolloutErrorCode::Provision, "provision error");
                     require(platform.created.size() == 2, "two replicas were created");
                     require(platform.was_stopped(platform.created[0].id) &&
                                 platform.was_stopped(platform.created[1].id),
                             "created replicas must be stopped");
                     require(platform.stopped.size() == 2, "only this attempt's replicas stop");
                     require(platform.created_targets.empty(), "no targets registered");
                     require_old_generation_untouched(platform);
                   }});

  tests.push_back({"rollout_health_failure_stops_replicas_including_failed_one", [] {
                     FakePlatform platform;
                     seed(platform);
                     platform.fail_health_at = 1;
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     auto request = request_for();
                     request.replicas = 3;
                     const auto outcome = orchestrator.run(request);
                     require(outcome.state == r::RolloutState::RolledBack, "rolled back");
                     require(outcome.error->code == r::RolloutErrorCode::HealthCheck,
                             "health check error");
                     require(outcome.summary().find("during health check") != std::string::npos,
                             "original error should be returned");
                     require(platform.created.size() == 2, "third replica never created");
                     require(platform.was_stopped(platform.created[0].id), "replica 1 stopped");
                     require(platform.was_stopped(platform.created[1].id), "failed replica stopped");
                     require(platform.created_targets.empty(), "no targets registered");
                     require_old_generation_untouched(platform);
                     require(orchestrator.history().back() == r::RolloutState::RolledBack,
                             "history should end rolled back");
                   }});

  tests.push_back({"rollout_first_replica_failure_stops_only_itself", [] {
                     FakePlatform platform;
                     seed(platform);
                     platform.fail_create_at = 0;
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     const auto outcome = orchestrator.run(request_for());
                     require(outcome.state == r::RolloutState::RolledBack, "rolled back");
                     require(platform.stopped.empty(), "nothing was created");
                     require_old_generation_untouched(platform);
                   }});

  tests.push_back({"rollout_registration_failure_stops_whole_new_generation", [] {
                     FakePlatform platform;
                     seed(platform);
                     platform.fail_target_at = 1;
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     auto request = request_for();
                     request.replicas = 3;
                     const auto outcome = orchestrator.run(request);
                     require(outcome.state == r::RolloutState::RolledBack, "rolled back");
                     require(outcome.error->code == r::RolloutErrorCode::Registration,
                             "registration error");
                     require(platform.created.size() == 3, "all replicas were created");
                     for (const auto &created : platform.created) {
                       require(platform.was_stopped(created.id), "every new replica stopped");
                     }
                     require_old_generation_untouched(platform);
                   }});

  tests.push_back({"rollout_cleanup_continues_past_stop_failures", [] {
                     FakePlatform platform;
                     seed(platform);
                     platform.fail_target_at = 0;
                     platform.fail_stop_ids.insert("c0ffee00-0000-4000-8000-000000000000");
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     auto request = request_for();
                     request.replicas = 2;
                     const auto outcome = orchestrator.run(request);
                     require(outcome.state == r::RolloutState::RolledBack, "rolled back");
                     require(platform.stopped.size() == 2, "second stop attempted after failure");
                     require(outcome.error->message == "add target: instance not reachable",
                             "original error returned, not the cleanup error");
                   }});

  tests.push_back({"rollout_port_resolved_from_agreeing_targets", [] {
                     FakePlatform platform;
                     seed(platform, 8080);
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     const auto outcome = orchestrator.run(request_for());
                     require(outcome.ok(), outcome.summary());
                     require(outcome.report.port == 8080, "port should be 8080");
                   }});

  tests.push_back({"rollout_port_disagreement_is_validation_error", [] {
                     FakePlatform platform;
                     seed(platform, 9090);
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     const auto outcome = orchestrator.run(request_for());
                     require(!outcome.ok(), "should fail");
                     require(outcome.error->code == r::RolloutErrorCode::Validation,
                             "validation error");
                     require(outcome.error->message ==
                                 "--port required: existing targets in group 'default' have "
                                 "different ports",
                             outcome.error->message);
                     require(platform.mutations == 0, "no side effects");
                     require(platform.created.empty(), "no instance created");
                   }});

  tests.push_back({"rollout_explicit_port_overrides_disagreement", [] {
                     FakePlatform platform;
                     seed(platform, 9090);
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     auto request = request_for();
                     request.port = 7000;
                     const auto outcome = orchestrator.run(request);
                     require(outcome.ok(), outcome.summary());
                     require(platform.created_targets[0].instance_port == 7000, "explicit port");
                   }});

  tests.push_back({"rollout_missing_port_without_targets_is_validation_error", [] {
                     FakePlatform platform;
                     seed(platform);
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     auto request = request_for();
                     request.group = "blue";
                     const auto outcome = orchestrator.run(request);
                     require(outcome.error.has_value(), "should fail");
                     require(outcome.error->message ==
                                 "--port required when no existing targets exist for group 'blue'",
                             outcome.error->message);
                     require(platform.mutations == 0, "no side effects");
                   }});

  tests.push_back({"rollout_unknown_service_is_resolution_error", [] {
                     FakePlatform platform;
                     seed(platform);
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     const auto outcome = orchestrator.run(request_for("nope"));
                     require(outcome.error.has_value(), "should fail");
                     require(outcome.error->code == r::RolloutErrorCode::Resolution,
                             "resolution error");
                     require(outcome.state == r::RolloutState::Resolving,
                             "resolution failure never reaches rollback");
                     require(platform.mutations == 0, "no side effects");
                   }});

  tests.push_back({"rollout_resolves_service_by_prefix", [] {
                     FakePlatform platform;
                     seed(platform);
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     const auto outcome = orchestrator.run(request_for("5e5e"));
                     require(outcome.ok(), outcome.summary());
                     require(outcome.report.service_id == SERVICE_ID, "service resolved by prefix");
                   }});

  tests.push_back({"rollout_image_verification_failure_creates_nothing", [] {
                     FakePlatform platform;
                     seed(platform);
                     platform.verify_error = "Image nginx:1.27 could not be verified: not found";
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     const auto outcome = orchestrator.run(request_for());
                     require(outcome.error->code == r::RolloutErrorCode::Provision, "provision");
                     require(platform.mutations == 0, "nothing created or stopped");
                   }});

  tests.push_back({"rollout_leave_behind_none_retires_everything", [] {
                     FakePlatform platform;
                     seed(platform);
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     const auto outcome = orchestrator.run(request_for());
                     require(outcome.ok(), outcome.summary());
                     require(!has_target(platform, OLD_A) && !has_target(platform, OLD_B),
                             "old targets removed");
                     require(!instance_active(platform, OLD_A) && !instance_active(platform, OLD_B),
                             "old instances stopped");
                     require(has_target(platform, OTHER) && instance_active(platform, OTHER),
                             "other groups untouched");
                     require(std::all_of(platform.stop_timeouts.begin(),
                                         platform.stop_timeouts.end(),
                                         [](std::uint64_t t) { return t == 5000; }),
                             "stop timeout defaults to 5000ms");
                   }});

  tests.push_back({"rollout_leave_behind_instances_keeps_old_instances", [] {
                     FakePlatform platform;
                     seed(platform);
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     auto request = request_for();
                     request.leave_behind = r::LeaveBehind::Instances;
                     const auto outcome = orchestrator.run(request);
                     require(outcome.ok(), outcome.summary());
                     require(!has_target(platform, OLD_A) && !has_target(platform, OLD_B),
                             "old targets removed");
                     require(instance_active(platform, OLD_A) && instance_active(platform, OLD_B),
                             "old instances still running");
                     require(platform.stopped.empty(), "no stop calls");
                   }});

  tests.push_back({"rollout_leave_behind_targets_touches_nothing_old", [] {
                     FakePlatform platform;
                     seed(platform);
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     auto request = request_for();
                     request.leave_behind = r::LeaveBehind::Targets;
                     const auto outcome = orchestrator.run(request);
                     require(outcome.ok(), outcome.summary());
                     require_old_generation_untouched(platform);
                     require(instance_active(platform, OLD_A) && instance_active(platform, OLD_B),
                             "old instances still running");
                   }});

  tests.push_back({"rollout_decommission_failures_are_warnings", [] {
                     FakePlatform platform;
                     seed(platform);
                     platform.fail_remove_target_ids.insert("7a000000-0000-4000-8000-000000000001");
                     platform.fail_stop_ids.insert(OLD_A);
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     const auto outcome = orchestrator.run(request_for());
                     require(outcome.ok(), "decommission failures must not fail the rollout");
                     require(outcome.report.warnings.size() == 2, "two warnings expected");
                     require(platform.removed_targets.size() == 2, "second removal still attempted");
                     require(platform.was_stopped(OLD_B), "second stop still attempted");
                   }});

  tests.push_back({"rollout_allocates_network_ip_per_replica", [] {
                     FakePlatform platform;
                     seed(platform);
                     platform.networks.push_back(
                         {"ae000000-0000-4000-8000-000000000001", "backend", "10.0.0.0/24"});
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     auto request = request_for();
                     request.network = api::NetworkSpec{std::nullopt, "backend"};
                     const auto outcome = orchestrator.run(request);
                     require(outcome.ok(), outcome.summary());
                     require(platform.created[0].spec.network.has_value(), "network joined");
                     require(platform.created[0].spec.network->instance_ip == "10.0.0.2", "ip 1");
                     require(platform.created[1].spec.network->instance_ip == "10.0.0.3", "ip 2");
                     require(platform.created[1].spec.network->network_id ==
                                 "ae000000-0000-4000-8000-000000000001",
                             "network resolved by name");
                   }});

  tests.push_back({"rollout_fixed_ip_with_many_replicas_is_validation_error", [] {
                     FakePlatform platform;
                     seed(platform);
                     platform.networks.push_back(
                         {"ae000000-0000-4000-8000-000000000001", "backend", "10.0.0.0/24"});
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     auto request = request_for();
                     request.network = api::NetworkSpec{std::string("10.0.0.9"), "backend"};
                     const auto outcome = orchestrator.run(request);
                     require(outcome.error->code == r::RolloutErrorCode::Validation, "validation");
                     require(platform.mutations == 0, "no side effects");
                   }});

  tests.push_back({"rollout_forwards_health_window", [] {
                     FakePlatform platform;
                     seed(platform);
                     r::RolloutOrchestrator orchestrator(platform, fixed_random(1, 2));
                     auto request = request_for();
                     request.health_window = std::chrono::milliseconds(2500);
                     const auto outcome = orchestrator.run(request);
                     require(outcome.ok(), outcome.summary());
                     require(platform.health_windows.size() == 2, "each replica health checked");
                     require(platform.health_windows[0].count() == 2500, "window forwarded");
                   }});

  tests.push_back({"parse_leave_behind_values", [] {
                     require(r::parse_leave_behind("instances").value() == r::LeaveBehind::Instances,
                             "instances");
                     require(r::parse_leave_behind("targets").value() == r::LeaveBehind::Targets,
                             "targets");
                     require(!r::parse_leave_behind("none").ok(), "none is not a flag value");
                   }});
}
