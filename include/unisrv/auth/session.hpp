#pragma once

#include "unisrv/common/result.hpp"
#include "unisrv/http/client.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace unisrv::auth {

struct RegistryCredential {
  std::optional<std::string> username;
  std::optional<std::string> password;
  std::optional<std::string> token;
};

/// Tokens issued by the control plane. Expiries are Unix seconds.
struct SessionData {
  std::string user_id;
  std::string access_token;
  std::int64_t access_token_expiry = 0;
  std::string refresh_session_id;
  std::string refresh_token;
  std::int64_t refresh_token_expiry = 0;
  std::map<std::string, RegistryCredential> registries;
};

[[nodiscard]] std::int64_t now_unix();

/// Accepts `2025-01-31T12:00:00Z`, fractional seconds and `+hh:mm` offsets, or a
/// plain integer.
[[nodiscard]] common::Result<std::int64_t> parse_timestamp(const std::string &value);

[[nodiscard]] common::Result<SessionData> parse_session_json(const std::string &json);
[[nodiscard]] std::string session_to_json(const SessionData &data);

/// The authentication handle threaded through every API call.
class Session {
public:
  Session() = default;
  Session(std::optional<SessionData> data, std::filesystem::path storage_path);

  /// Reads `<config dir>/auth.json`; a missing file yields an empty session.
  [[nodiscard]] static common::Result<Session> load_default();

  [[nodiscard]] bool present() const { return data_.has_value(); }
  [[nodiscard]] const std::optional<SessionData> &data() const { return data_; }

  [[nodiscard]] common::Status ensure_auth(std::int64_t now = now_unix()) const;

  /// Current bearer token, refreshed through `refresh_url` when it has expired.
  [[nodiscard]] common::Result<std::string> access_token(http::HttpClient &http,
                                                         const std::string &refresh_url,
                                                         std::uint64_t timeout_ms,
                                                         std::int64_t now = now_unix());

  [[nodiscard]] std::optional<RegistryCredential>
  registry_credential(const std::string &registry) const;

  /// Replaces the credential kept for `registry` and writes the session back.
  [[nodiscard]] common::Status store_registry_credential(const std::string &registry,
                                                         RegistryCredential credential);

  [[nodiscard]] common::Status save() const;

private:
  std::optional<SessionData> data_;
  std::filesystem::path storage_path_;
};

} // namespace unisrv::auth
