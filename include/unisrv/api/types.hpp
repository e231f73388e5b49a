#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace unisrv::api {

inline constexpr const char *DEFAULT_TARGET_GROUP = "default";

struct ServiceSummary {
  std::string id;
  std::string name;
  std::string type;
};

struct ServiceTarget {
  std::string id;
  std::string instance_id;
  std::uint16_t instance_port = 0;
  std::string group = DEFAULT_TARGET_GROUP;
};

struct ServiceInfo {
  std::string id;
  std::string name;
  std::vector<ServiceTarget> targets;
};

/// Only `active` drives behavior; everything else is kept verbatim.
enum class InstanceState { Active, Stopped, Unknown };

[[nodiscard]] InstanceState instance_state_from(const std::string &raw);

struct Instance {
  std::string id;
  std::optional<std::string> name;
  InstanceState state = InstanceState::Unknown;
  std::string raw_state;
  std::string image;
  std::string created_at;
};

struct Network {
  std::string id;
  std::string name;
  std::string ipv4_cidr;
};

struct NetworkMember {
  std::string instance_id;
  std::string ip;
};

struct NetworkDetails {
  std::string id;
  std::string name;
  std::string ipv4_cidr;
  std::string created_at;
  std::vector<std::string> used_ips;
  std::vector<NetworkMember> members;
};

struct NetworkJoin {
  std::string network_id;
  std::string instance_ip;
};

struct InstanceSpec {
  std::string name;
  std::string image;
  std::uint32_t vcpu_count = 1;
  std::uint32_t memory_mb = 1024;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
  std::optional<NetworkJoin> network;
};

/// Names used by the identifier resolver; targets have none.
[[nodiscard]] inline std::optional<std::string> display_name(const ServiceSummary &item) {
  return item.name;
}
[[nodiscard]] inline std::optional<std::string> display_name(const Instance &item) {
  return item.name;
}
[[nodiscard]] inline std::optional<std::string> display_name(const Network &item) {
  return item.name;
}
[[nodiscard]] inline std::optional<std::string> display_name(const ServiceTarget &) {
  return std::nullopt;
}

} // namespace unisrv::api
