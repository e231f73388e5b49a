#pragma once

#include "unisrv/auth/session.hpp"
#include "unisrv/common/result.hpp"
#include "unisrv/http/client.hpp"
#include "unisrv/registry/image_reference.hpp"

#include <optional>
#include <string>

namespace unisrv::registry {

/// Parsed `WWW-Authenticate: Bearer realm="..",service="..",scope=".."`.
struct BearerChallenge {
  std::string realm;
  std::optional<std::string> service;
  std::optional<std::string> scope;
};

[[nodiscard]] common::Result<BearerChallenge> parse_www_authenticate(const std::string &header);

/// Token scoped to `repository:<repo>:pull`, or nullopt when the registry is anonymous.
[[nodiscard]] common::Result<std::optional<std::string>>
get_scoped_token(http::HttpClient &http, const ImageReference &image,
                 const std::optional<auth::RegistryCredential> &credential,
                 std::uint64_t timeout_ms);

/// `https://ghcr.io/` and `ghcr.io` both name `ghcr.io`; the host keys stored credentials.
[[nodiscard]] std::string registry_host(const std::string &registry);

/// Authenticates against `registry` without a repository scope. Returns the
/// issued token, or nullopt when the registry is anonymous.
[[nodiscard]] common::Result<std::optional<std::string>>
login_registry(http::HttpClient &http, const std::string &registry,
               const auth::RegistryCredential &credential, std::uint64_t timeout_ms);

/// Confirms the manifest exists; an index must carry a linux/amd64 entry.
[[nodiscard]] common::Status verify_manifest(http::HttpClient &http, const ImageReference &image,
                                             const std::optional<std::string> &token,
                                             std::uint64_t timeout_ms);

/// Validates `image`, authenticates against its registry with the stored
/// credentials (Docker Hub may be anonymous) and checks the image exists.
[[nodiscard]] common::Result<std::optional<std::string>>
verify_and_get_pull_token(http::HttpClient &http, const auth::Session &session,
                          const std::string &image, std::uint64_t timeout_ms);

} // namespace unisrv::registry
