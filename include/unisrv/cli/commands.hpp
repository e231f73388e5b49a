#pragma once

#include "unisrv/api/networks.hpp"
#include "unisrv/api/types.hpp"
#include "unisrv/auth/session.hpp"
#include "unisrv/common/result.hpp"
#include "unisrv/config/schema.hpp"
#include "unisrv/http/client.hpp"
#include "unisrv/rollout/orchestrator.hpp"
#include "unisrv/rollout/platform.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace unisrv::cli {

[[nodiscard]] std::string version_string();
void print_help();

/// Parses `rollout` arguments (without the command word). Everything after
/// `--` is passed to the container; so are positionals after the image.
[[nodiscard]] common::Result<rollout::RolloutRequest>
parse_rollout_args(std::vector<std::string> args, const config::Config &config);

struct InstanceRunRequest {
  api::InstanceSpec spec;
  std::optional<api::NetworkSpec> network;
};

/// `instance run IMAGE [options] [-- args...]`; without `--name` the platform picks one.
[[nodiscard]] common::Result<InstanceRunRequest>
parse_instance_run_args(std::vector<std::string> args);

/// Verifies the image, joins the requested network and creates the instance.
/// Returns the new instance id.
[[nodiscard]] common::Result<std::string> launch_instance(rollout::Platform &platform,
                                                          const InstanceRunRequest &request);

struct RegistryLogin {
  std::string registry;
  std::optional<std::string> username;
  std::optional<std::string> password;
};

/// `registry login REGISTRY [-u USER] [-p PASS | --password-stdin]`. The
/// password is read from `input` and trimmed when `--password-stdin` is given.
[[nodiscard]] common::Result<RegistryLogin> parse_registry_login_args(std::vector<std::string> args,
                                                                      std::istream &input);

/// Authenticates against the registry and stores the credential in `session`.
[[nodiscard]] common::Status registry_login(http::HttpClient &http, auth::Session &session,
                                            const RegistryLogin &login, std::uint64_t timeout_ms,
                                            std::ostream &out);

void print_registries(const auth::Session &session, std::ostream &out);
void print_instances(const std::vector<api::Instance> &instances, bool include_stopped,
                     std::ostream &out);
void print_services(const std::vector<api::ServiceSummary> &services, std::ostream &out);
void print_networks(const std::vector<api::Network> &networks, std::ostream &out);
void print_network_details(const api::NetworkDetails &network, std::ostream &out);

int run_cli(int argc, char **argv);

} // namespace unisrv::cli
