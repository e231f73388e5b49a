#include "unisrv/api/networks.hpp"

#include "unisrv/common/fs.hpp"
#include "unisrv/common/json_util.hpp"

#include <arpa/inet.h>

#include <charconv>
#include <unordered_set>

namespace unisrv::api {

namespace {

bool parse_ipv4(const std::string &text, std::uint32_t &out) {
  in_addr addr{};
  if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
    return false;
  }
  out = ntohl(addr.s_addr);
  return true;
}

std::string format_ipv4(const std::uint32_t value) {
  in_addr addr{};
  addr.s_addr = htonl(value);
  char buffer[INET_ADDRSTRLEN] = {};
  if (inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)) == nullptr) {
    return "";
  }
  return buffer;
}

} // namespace

common::Result<std::vector<Network>> parse_network_list(const std::string &json) {
  const auto array = common::json_flat_get(common::json_parse_flat(json), "networks");
  if (!array.has_value()) {
    return common::Result<std::vector<Network>>::failure(
        "Invalid network list response: missing 'networks'");
  }
  std::vector<Network> networks;
  for (const auto &object : common::json_split_top_level_objects(*array)) {
    const auto flat = common::json_parse_flat(object);
    networks.push_back(Network{.id = common::json_flat_get(flat, "id").value_or(""),
                               .name = common::json_flat_get(flat, "name").value_or(""),
                               .ipv4_cidr = common::json_flat_get(flat, "ipv4_cidr").value_or("")});
  }
  return common::Result<std::vector<Network>>::success(std::move(networks));
}

common::Result<NetworkDetails> parse_network_details(const std::string &json) {
  const auto flat = common::json_parse_flat(json);
  NetworkDetails details;
  details.id = common::json_flat_get(flat, "id").value_or("");
  details.name = common::json_flat_get(flat, "name").value_or("");
  details.ipv4_cidr = common::json_flat_get(flat, "ipv4_cidr").value_or("");
  details.created_at = common::json_flat_get(flat, "created_at").value_or("");
  if (details.ipv4_cidr.empty()) {
    return common::Result<NetworkDetails>::failure("Invalid network response: missing 'ipv4_cidr'");
  }
  if (const auto instances = common::json_flat_get(flat, "instances"); instances.has_value()) {
    for (const auto &object : common::json_split_top_level_objects(*instances)) {
      const auto member = common::json_parse_flat(object);
      if (const auto ip = common::json_flat_get(member, "internal_ip");
          ip.has_value() && !ip->empty()) {
        details.used_ips.push_back(*ip);
        details.members.push_back(
            NetworkMember{.instance_id = common::json_flat_get(member, "id").value_or(""),
                          .ip = *ip});
      }
    }
  }
  return common::Result<NetworkDetails>::success(std::move(details));
}

common::Result<std::vector<Network>> list_networks(ApiContext &ctx) {
  const auto body = ctx.get("/networks", "list networks");
  if (!body.ok()) {
    return common::Result<std::vector<Network>>::failure(body.error());
  }
  return parse_network_list(body.value());
}

common::Result<NetworkDetails> get_network(ApiContext &ctx, const std::string &network_id) {
  const auto body = ctx.get("/network/" + network_id, "fetch network details");
  if (!body.ok()) {
    return common::Result<NetworkDetails>::failure(body.error());
  }
  auto details = parse_network_details(body.value());
  if (details.ok() && details.value().id.empty()) {
    details.value().id = network_id;
  }
  return details;
}

common::Result<std::string> next_free_ip(const std::string &cidr,
                                         const std::vector<std::string> &used) {
  using R = common::Result<std::string>;
  const auto slash = cidr.find('/');
  if (slash == std::string::npos) {
    return R::failure("Invalid CIDR format: " + cidr);
  }
  std::uint32_t base = 0;
  unsigned int prefix = 0;
  const std::string prefix_text = cidr.substr(slash + 1);
  const auto *first = prefix_text.data();
  const auto *last = first + prefix_text.size();
  auto [ptr, ec] = std::from_chars(first, last, prefix);
  if (!parse_ipv4(cidr.substr(0, slash), base) || ec != std::errc() || ptr != last ||
      prefix > 32) {
    return R::failure("Invalid CIDR format: " + cidr);
  }
  if (prefix > 29) {
    return R::failure("Network " + cidr + " is too small to assign instance addresses");
  }

  const std::uint32_t mask = prefix == 0 ? 0 : (~std::uint32_t{0} << (32 - prefix));
  const std::uint32_t network = base & mask;
  const std::uint32_t broadcast = network | ~mask;

  std::unordered_set<std::uint32_t> taken;
  for (const auto &ip : used) {
    std::uint32_t value = 0;
    if (parse_ipv4(common::trim(ip), value)) {
      taken.insert(value);
    }
  }

  for (std::uint32_t candidate = network + 2; candidate < broadcast; ++candidate) {
    if (!taken.contains(candidate)) {
      return R::success(format_ipv4(candidate));
    }
  }
  return R::failure("No available IP addresses in network " + cidr);
}

common::Result<NetworkSpec> parse_network_spec(const std::string &value) {
  const std::string text = common::trim(value);
  const auto at = text.find('@');
  NetworkSpec spec;
  if (at == std::string::npos) {
    spec.network = text;
  } else {
    if (at > 0) {
      spec.ip = text.substr(0, at);
    }
    spec.network = text.substr(at + 1);
  }
  if (spec.network.empty()) {
    return common::Result<NetworkSpec>::failure(
        "Invalid network format: '" + value + "'. Expected format: [ip]@<network_id/name>");
  }
  if (spec.ip.has_value()) {
    std::uint32_t unused = 0;
    if (!parse_ipv4(*spec.ip, unused)) {
      return common::Result<NetworkSpec>::failure("Invalid IP address in network spec: '" +
                                                  *spec.ip + "'");
    }
  }
  return common::Result<NetworkSpec>::success(std::move(spec));
}

} // namespace unisrv::api
