#pragma once

#include "unisrv/common/result.hpp"

#include <optional>
#include <string>

namespace unisrv::registry {

inline constexpr const char *DOCKER_HUB_REGISTRY = "index.docker.io";

/// A parsed container image reference such as `ghcr.io/acme/api:1.2` or `nginx`.
struct ImageReference {
  std::string registry;
  std::string repository;
  std::optional<std::string> tag;
  std::optional<std::string> digest;

  [[nodiscard]] static common::Result<ImageReference> parse(const std::string &value);

  /// Digest when pinned, else the tag, else `latest`.
  [[nodiscard]] std::string manifest_reference() const;
  [[nodiscard]] bool is_docker_hub() const { return registry == DOCKER_HUB_REGISTRY; }
  [[nodiscard]] std::string to_string() const;
};

} // namespace unisrv::registry
