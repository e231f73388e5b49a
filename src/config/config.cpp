#include "unisrv/config/config.hpp"

#include "unisrv/common/fs.hpp"
#include "unisrv/common/toml.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

namespace unisrv::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".unisrv";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("UNISRV_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  // Config dir .env first so set_env_if_missing keeps its values
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

bool parse_u64(const char *raw, std::uint64_t &out) {
  const std::string value = common::trim(raw);
  if (value.empty()) {
    return false;
  }
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

bool is_valid_host(const std::string &host) {
  static const std::regex host_re(
      R"(^[a-zA-Z0-9]([a-zA-Z0-9\-.]*[a-zA-Z0-9])?(:[0-9]{1,5})?$)");
  return !host.empty() && std::regex_match(host, host_re);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const char *host = std::getenv("API_HOST"); host != nullptr && *host != '\0') {
    config.api.host = host;
  }

  if (const char *window = std::getenv("UNISRV_HEALTH_WINDOW_MS");
      window != nullptr && *window != '\0') {
    std::uint64_t parsed = 0;
    if (parse_u64(window, parsed)) {
      config.rollout.health_window_ms = parsed;
    }
  }

  if (const char *level = std::getenv("UNISRV_LOG_LEVEL"); level != nullptr && *level != '\0') {
    config.observability.level = common::to_lower(common::trim(level));
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.api.host = doc.get_string("api.host", config.api.host);
  config.http.timeout_ms = doc.get_u64("http.timeout_ms", config.http.timeout_ms);
  config.rollout.health_window_ms =
      doc.get_u64("rollout.health_window_ms", config.rollout.health_window_ms);
  config.rollout.stop_timeout_ms =
      doc.get_u64("rollout.stop_timeout_ms", config.rollout.stop_timeout_ms);
  config.rollout.default_group = doc.get_string("rollout.default_group", config.rollout.default_group);
  config.rollout.progress_log_lines = static_cast<std::uint32_t>(
      doc.get_u64("rollout.progress_log_lines", config.rollout.progress_log_lines));
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.level =
      common::to_lower(doc.get_string("observability.level", config.observability.level));

  return common::Result<Config>::success(std::move(config));
}

namespace {

/// The file as written, without environment overrides; defaults when absent.
common::Result<Config> read_config_file() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    return common::Result<Config>::success(Config{});
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  return parsed;
}

common::Status set_u64(const std::string &key, const std::string &value, std::uint64_t &out) {
  std::uint64_t parsed = 0;
  if (!parse_u64(value.c_str(), parsed)) {
    return common::Status::error("invalid value '" + value + "' for " + key +
                                 ": expected a non-negative integer");
  }
  out = parsed;
  return common::Status::success();
}

} // namespace

common::Result<Config> load_config() {
  load_dotenv_files();

  auto loaded = read_config_file();
  if (!loaded.ok()) {
    return loaded;
  }
  Config config = std::move(loaded.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status set_config_value(Config &config, const std::string &key, const std::string &value) {
  if (key == "api.host") {
    config.api.host = common::trim(value);
    return common::Status::success();
  }
  if (key == "http.timeout_ms") {
    return set_u64(key, value, config.http.timeout_ms);
  }
  if (key == "rollout.health_window_ms") {
    return set_u64(key, value, config.rollout.health_window_ms);
  }
  if (key == "rollout.stop_timeout_ms") {
    return set_u64(key, value, config.rollout.stop_timeout_ms);
  }
  if (key == "rollout.default_group") {
    config.rollout.default_group = value;
    return common::Status::success();
  }
  if (key == "rollout.progress_log_lines") {
    std::uint64_t lines = 0;
    if (const auto status = set_u64(key, value, lines); !status.ok()) {
      return status;
    }
    config.rollout.progress_log_lines = static_cast<std::uint32_t>(lines);
    return common::Status::success();
  }
  if (key == "observability.backend") {
    config.observability.backend = value;
    return common::Status::success();
  }
  if (key == "observability.level") {
    config.observability.level = common::to_lower(common::trim(value));
    return common::Status::success();
  }
  return common::Status::error("unknown config key: " + key);
}

common::Result<Config> update_config_value(const std::string &key, const std::string &value) {
  auto loaded = read_config_file();
  if (!loaded.ok()) {
    return loaded;
  }
  Config config = std::move(loaded.value());
  if (const auto status = set_config_value(config, key, value); !status.ok()) {
    return common::Result<Config>::failure(status.error());
  }
  if (const auto validated = validate_config(config); !validated.ok()) {
    return common::Result<Config>::failure(validated.error());
  }
  if (const auto saved = save_config(config); !saved.ok()) {
    return common::Result<Config>::failure(saved.error());
  }
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  file << "[api]\n";
  file << "host = " << common::quote_toml_string(config.api.host) << "\n";

  file << "\n[http]\n";
  file << "timeout_ms = " << config.http.timeout_ms << "\n";

  file << "\n[rollout]\n";
  file << "health_window_ms = " << config.rollout.health_window_ms << "\n";
  file << "stop_timeout_ms = " << config.rollout.stop_timeout_ms << "\n";
  file << "default_group = " << common::quote_toml_string(config.rollout.default_group) << "\n";
  file << "progress_log_lines = " << config.rollout.progress_log_lines << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  file << "level = " << common::quote_toml_string(config.observability.level) << "\n";

  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (!is_valid_host(parse_api_host(config.api.host).host)) {
    return common::Result<std::vector<std::string>>::failure("api.host is invalid: " +
                                                              config.api.host);
  }

  if (config.http.timeout_ms == 0) {
    return common::Result<std::vector<std::string>>::failure("http.timeout_ms must be positive");
  }

  if (config.rollout.health_window_ms == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "rollout.health_window_ms must be positive");
  }
  if (config.rollout.stop_timeout_ms == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "rollout.stop_timeout_ms must be positive");
  }
  if (common::trim(config.rollout.default_group).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "rollout.default_group must not be empty");
  }

  if (!is_known_log_level(config.observability.level)) {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.level: " +
                                                              config.observability.level);
  }

  if (common::starts_with(config.api.host, "http://")) {
    warnings.push_back("api.host uses plain http; credentials are sent unencrypted");
  }
  if (config.rollout.health_window_ms > 60'000) {
    warnings.push_back("rollout.health_window_ms above 60s slows every replica");
  }
  if (config.rollout.progress_log_lines == 0) {
    warnings.push_back("rollout.progress_log_lines is 0; boot logs will not be shown");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

ApiEndpoint parse_api_host(const std::string &value) {
  ApiEndpoint endpoint;
  std::string host = common::trim(value);
  if (common::starts_with(host, "http://")) {
    host = host.substr(7);
    endpoint.use_tls = false;
  } else if (common::starts_with(host, "https://")) {
    host = host.substr(8);
  }
  while (!host.empty() && host.back() == '/') {
    host.pop_back();
  }
  endpoint.host = host;
  return endpoint;
}

bool is_known_log_level(const std::string &level) {
  return level == "debug" || level == "info" || level == "warn" || level == "error";
}

} // namespace unisrv::config
