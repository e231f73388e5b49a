#pragma once

#include "unisrv/api/context.hpp"
#include "unisrv/api/types.hpp"
#include "unisrv/common/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace unisrv::api {

[[nodiscard]] common::Result<std::vector<Network>> list_networks(ApiContext &ctx);
[[nodiscard]] common::Result<NetworkDetails> get_network(ApiContext &ctx,
                                                         const std::string &network_id);

[[nodiscard]] common::Result<std::vector<Network>> parse_network_list(const std::string &json);
[[nodiscard]] common::Result<NetworkDetails> parse_network_details(const std::string &json);

/// Lowest host address of `cidr` not in `used`. The network address, the first
/// host (gateway) and the broadcast address are never returned.
[[nodiscard]] common::Result<std::string> next_free_ip(const std::string &cidr,
                                                       const std::vector<std::string> &used);

/// `[ip]@<network id or name>`; a bare value names the network.
struct NetworkSpec {
  std::optional<std::string> ip;
  std::string network;
};
[[nodiscard]] common::Result<NetworkSpec> parse_network_spec(const std::string &value);

} // namespace unisrv::api
