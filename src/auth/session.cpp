#include "unisrv/auth/session.hpp"

#include "unisrv/common/fs.hpp"
#include "unisrv/common/json_util.hpp"
#include "unisrv/config/config.hpp"
#include "unisrv/http/api_error.hpp"
#include "unisrv/observability/global.hpp"

#include <chrono>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <fstream>
#include <sstream>

#include <sys/stat.h>

namespace unisrv::auth {

namespace {

constexpr const char *AUTH_FILENAME = "auth.json";

void set_file_permissions_0600(const std::filesystem::path &path) { chmod(path.c_str(), 0600); }

bool parse_int(const std::string &text, std::int64_t &out) {
  if (text.empty()) {
    return false;
  }
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

std::int64_t read_expiry(const common::JsonFlatMap &flat, const std::string &key) {
  const auto raw = common::json_flat_get(flat, key);
  if (!raw.has_value()) {
    return 0;
  }
  const auto parsed = parse_timestamp(*raw);
  return parsed.ok() ? parsed.value() : 0;
}

RegistryCredential parse_credential(const std::string &json) {
  const auto flat = common::json_parse_flat(json);
  RegistryCredential credential;
  credential.username = common::json_flat_get(flat, "username");
  credential.password = common::json_flat_get(flat, "password");
  credential.token = common::json_flat_get(flat, "token");
  return credential;
}

void write_optional(common::JsonWriter &writer, const std::string &key,
                    const std::optional<std::string> &value) {
  writer.key(key);
  if (value.has_value()) {
    writer.value(*value);
  } else {
    writer.null();
  }
}

} // namespace

std::int64_t now_unix() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

common::Result<std::int64_t> parse_timestamp(const std::string &value) {
  const std::string text = common::trim(value);
  if (std::int64_t plain = 0; parse_int(text, plain)) {
    return common::Result<std::int64_t>::success(plain);
  }

  std::tm tm{};
  std::istringstream stream(text.substr(0, 19));
  stream >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (stream.fail() || text.size() < 19) {
    return common::Result<std::int64_t>::failure("invalid timestamp: " + value);
  }
  std::int64_t seconds = static_cast<std::int64_t>(timegm(&tm));

  std::size_t pos = 19;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      ++pos;
    }
  }
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    const int sign = text[pos] == '+' ? 1 : -1;
    std::int64_t hours = 0;
    std::int64_t minutes = 0;
    if (text.size() < pos + 6 || !parse_int(text.substr(pos + 1, 2), hours) ||
        !parse_int(text.substr(pos + 4, 2), minutes)) {
      return common::Result<std::int64_t>::failure("invalid timestamp offset: " + value);
    }
    seconds -= sign * (hours * 3600 + minutes * 60);
  }
  return common::Result<std::int64_t>::success(seconds);
}

common::Result<SessionData> parse_session_json(const std::string &json) {
  const auto flat = common::json_parse_flat(json);
  SessionData data;
  data.user_id = common::json_flat_get(flat, "user_id").value_or("");
  data.access_token = common::json_flat_get(flat, "access_token").value_or("");
  data.access_token_expiry = read_expiry(flat, "access_token_expiry");
  data.refresh_session_id = common::json_flat_get(flat, "refresh_session_id").value_or("");
  data.refresh_token = common::json_flat_get(flat, "refresh_token").value_or("");
  data.refresh_token_expiry = read_expiry(flat, "refresh_token_expiry");

  if (const auto registries = common::json_flat_get(flat, "container_registry_auth");
      registries.has_value()) {
    for (const auto &[registry, raw] : common::json_parse_flat(*registries)) {
      data.registries[registry] = parse_credential(raw);
    }
  }

  if (data.access_token.empty() && data.refresh_token.empty()) {
    return common::Result<SessionData>::failure("auth.json contains no tokens");
  }
  return common::Result<SessionData>::success(std::move(data));
}

std::string session_to_json(const SessionData &data) {
  common::JsonWriter writer;
  writer.begin_object();
  writer.key("user_id").value(data.user_id);
  writer.key("access_token").value(data.access_token);
  writer.key("access_token_expiry").value(data.access_token_expiry);
  writer.key("refresh_session_id").value(data.refresh_session_id);
  writer.key("refresh_token").value(data.refresh_token);
  writer.key("refresh_token_expiry").value(data.refresh_token_expiry);
  writer.key("container_registry_auth").begin_object();
  for (const auto &[registry, credential] : data.registries) {
    writer.key(registry).begin_object();
    write_optional(writer, "username", credential.username);
    write_optional(writer, "password", credential.password);
    write_optional(writer, "token", credential.token);
    writer.end_object();
  }
  writer.end_object();
  writer.end_object();
  return writer.str();
}

Session::Session(std::optional<SessionData> data, std::filesystem::path storage_path)
    : data_(std::move(data)), storage_path_(std::move(storage_path)) {}

common::Result<Session> Session::load_default() {
  const auto dir = config::config_dir();
  if (!dir.ok()) {
    return common::Result<Session>::failure(dir.error());
  }
  const auto path = dir.value() / AUTH_FILENAME;
  if (!std::filesystem::exists(path)) {
    return common::Result<Session>::success(Session(std::nullopt, path));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Session>::failure("unable to open " + path.string());
  }
  std::ostringstream buf;
  buf << file.rdbuf();

  auto parsed = parse_session_json(buf.str());
  if (!parsed.ok()) {
    observability::record_warning("auth", parsed.error());
    return common::Result<Session>::success(Session(std::nullopt, path));
  }
  return common::Result<Session>::success(Session(std::move(parsed.value()), path));
}

common::Status Session::ensure_auth(const std::int64_t now) const {
  if (!present()) {
    return common::Status::error(
        "No authentication session found. Please log in with unisrv login.");
  }
  if (now > data_->access_token_expiry && now > data_->refresh_token_expiry) {
    return common::Status::error(
        "Authentication session expired. Please log in again with unisrv login.");
  }
  return common::Status::success();
}

common::Result<std::string> Session::access_token(http::HttpClient &http,
                                                  const std::string &refresh_url,
                                                  const std::uint64_t timeout_ms,
                                                  const std::int64_t now) {
  if (const auto status = ensure_auth(now); !status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }
  if (data_->access_token_expiry > now) {
    return common::Result<std::string>::success(data_->access_token);
  }
  if (data_->refresh_token_expiry < now) {
    return common::Result<std::string>::failure(
        "Refresh token has expired. Please log in again.");
  }

  common::JsonWriter body;
  body.begin_object()
      .key("id")
      .value(data_->refresh_session_id)
      .key("token")
      .value(data_->refresh_token)
      .end_object();
  const http::Headers headers = {{"Authorization", "Bearer " + data_->refresh_token}};
  const auto response = http.post_json(refresh_url, headers, body.str(), timeout_ms);
  if (!response.success()) {
    const auto flat = common::json_parse_flat(response.body);
    if (const auto reason = common::json_flat_get(flat, "reason"); reason.has_value()) {
      return common::Result<std::string>::failure("Failed to refresh tokens: " + *reason +
                                                  ". Please login again.");
    }
    return common::Result<std::string>::failure(
        "Failed to refresh tokens. You need to log in again.");
  }

  const auto flat = common::json_parse_flat(response.body);
  const auto token = common::json_flat_get(flat, "token");
  if (!token.has_value() || token->empty()) {
    return common::Result<std::string>::failure("refresh response contained no token");
  }
  data_->access_token = *token;
  data_->access_token_expiry = read_expiry(flat, "expires_at");
  data_->refresh_session_id =
      common::json_flat_get(flat, "refresh_session_id").value_or(data_->refresh_session_id);
  data_->refresh_token = common::json_flat_get(flat, "refresh_token").value_or(data_->refresh_token);
  if (const auto expiry = read_expiry(flat, "refresh_expires_at"); expiry != 0) {
    data_->refresh_token_expiry = expiry;
  }

  observability::record_debug("auth", "session refreshed");
  if (const auto saved = save(); !saved.ok()) {
    observability::record_warning("auth", "could not persist refreshed session: " + saved.error());
  }
  return common::Result<std::string>::success(data_->access_token);
}

std::optional<RegistryCredential> Session::registry_credential(const std::string &registry) const {
  if (!data_.has_value()) {
    return std::nullopt;
  }
  const auto it = data_->registries.find(registry);
  if (it == data_->registries.end()) {
    return std::nullopt;
  }
  return it->second;
}

common::Status Session::store_registry_credential(const std::string &registry,
                                                  RegistryCredential credential) {
  if (!present()) {
    return common::Status::error(
        "No authentication session found. Please log in with unisrv login first.");
  }
  data_->registries[registry] = std::move(credential);
  return save();
}

common::Status Session::save() const {
  if (!data_.has_value()) {
    return common::Status::error("no session to save");
  }
  if (storage_path_.empty()) {
    return common::Status::error("unable to determine config directory");
  }

  const std::filesystem::path tmp_path = storage_path_.string() + ".tmp";
  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("unable to write auth.json.tmp");
  }
  file << session_to_json(*data_) << "\n";
  file.close();
  if (!file) {
    return common::Status::error("failed writing auth.json.tmp");
  }

  set_file_permissions_0600(tmp_path);

  std::error_code ec;
  std::filesystem::rename(tmp_path, storage_path_, ec);
  if (ec) {
    return common::Status::error("failed to atomically replace auth.json: " + ec.message());
  }
  return common::Status::success();
}

} // namespace unisrv::auth
