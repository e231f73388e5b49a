#pragma once

#include "unisrv/api/networks.hpp"
#include "unisrv/api/types.hpp"
#include "unisrv/rollout/deploy_hex.hpp"
#include "unisrv/rollout/platform.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace unisrv::rollout {

/// What survives from the previous generation after a successful rollout.
enum class LeaveBehind { None, Instances, Targets };

[[nodiscard]] common::Result<LeaveBehind> parse_leave_behind(const std::string &value);

struct RolloutRequest {
  std::string service;
  std::string image;
  std::string group = api::DEFAULT_TARGET_GROUP;
  std::optional<std::uint16_t> port;
  std::optional<std::size_t> replicas;
  std::uint32_t vcpu_count = 1;
  std::uint32_t memory_mb = 1024;
  std::map<std::string, std::string> env;
  std::vector<std::string> args;
  std::optional<api::NetworkSpec> network;
  LeaveBehind leave_behind = LeaveBehind::None;
  std::chrono::milliseconds health_window{1000};
  std::uint64_t stop_timeout_ms = 5000;
};

enum class RolloutState {
  Resolving,
  ProvisioningReplica,
  AwaitingHealth,
  RegisteringTargets,
  RetiringOldGeneration,
  Complete,
  RolledBack,
};

[[nodiscard]] std::string_view rollout_state_label(RolloutState state);

enum class RolloutErrorCode {
  Resolution,
  Validation,
  Provision,
  HealthCheck,
  Registration,
};

[[nodiscard]] std::string_view rollout_error_label(RolloutErrorCode code);

struct RolloutError {
  RolloutErrorCode code = RolloutErrorCode::Validation;
  std::string message;
};

struct RolloutReport {
  std::string service_id;
  std::string service_name;
  std::string group;
  std::uint16_t port = 0;
  std::size_t replicas = 0;
  std::string deploy_hex;
  std::vector<std::string> new_instance_ids;
  std::vector<std::string> new_target_ids;
  std::vector<std::string> old_target_ids;
  /// Decommission failures; they never change the verdict.
  std::vector<std::string> warnings;
};

struct RolloutOutcome {
  RolloutState state = RolloutState::Resolving;
  std::optional<RolloutError> error;
  RolloutReport report;

  [[nodiscard]] bool ok() const { return state == RolloutState::Complete; }
  /// One line for the terminal: the success banner or the fatal error.
  [[nodiscard]] std::string summary() const;
};

/// Replaces the targets of one service group with freshly booted instances,
/// one replica at a time. Any fatal error stops every instance this attempt
/// created; the previous generation is only touched after all new targets
/// are registered.
class RolloutOrchestrator {
public:
  explicit RolloutOrchestrator(Platform &platform, RandomFill random = openssl_random_fill);

  [[nodiscard]] RolloutOutcome run(const RolloutRequest &request);

  /// Every state entered by the last run, in order.
  [[nodiscard]] const std::vector<RolloutState> &history() const { return history_; }

private:
  struct Plan {
    std::string service_id;
    std::string service_name;
    std::vector<api::ServiceTarget> old_targets;
    std::size_t replicas = 0;
    std::uint16_t port = 0;
    std::optional<std::string> network_id;
    std::optional<std::string> fixed_ip;
    std::string deploy_hex;
  };

  [[nodiscard]] std::optional<RolloutError> resolve(const RolloutRequest &request, Plan &plan);
  [[nodiscard]] std::optional<RolloutError> provision(const RolloutRequest &request,
                                                      const Plan &plan,
                                                      const std::optional<std::string> &pull_token,
                                                      RolloutReport &report);
  [[nodiscard]] std::optional<RolloutError> register_targets(const RolloutRequest &request,
                                                             const Plan &plan,
                                                             RolloutReport &report);
  void retire(const RolloutRequest &request, const Plan &plan, RolloutReport &report);
  void roll_back(const RolloutRequest &request, const RolloutReport &report);

  void enter(RolloutState state, const std::string &detail = "");
  [[nodiscard]] RolloutOutcome fail(RolloutError error, RolloutReport report);

  Platform &platform_;
  RandomFill random_;
  RolloutState state_ = RolloutState::Resolving;
  std::vector<RolloutState> history_;
};

} // namespace unisrv::rollout
