#include "unisrv/registry/client.hpp"

#include "unisrv/common/fs.hpp"
#include "unisrv/common/json_util.hpp"
#include "unisrv/observability/global.hpp"

#include <unordered_map>
#include <vector>

namespace unisrv::registry {

namespace {

constexpr const char *INDEX_ACCEPT =
    "application/vnd.oci.image.index.v1+json, application/vnd.oci.image.manifest.v1+json, "
    "application/vnd.docker.distribution.manifest.list.v2+json, "
    "application/vnd.docker.distribution.manifest.v2+json";
constexpr const char *MANIFEST_ACCEPT =
    "application/vnd.oci.image.manifest.v1+json, "
    "application/vnd.docker.distribution.manifest.v2+json";

std::string registry_url(const ImageReference &image) { return "https://" + image.registry; }

http::Headers bearer(const std::optional<std::string> &token, const char *accept) {
  http::Headers headers = {{"Accept", accept}};
  if (token.has_value()) {
    headers["Authorization"] = "Bearer " + *token;
  }
  return headers;
}

std::string describe(const http::HttpResponse &response) {
  if (response.network_error || response.timeout) {
    return response.network_error_message.empty() ? "request timed out"
                                                  : response.network_error_message;
  }
  return "HTTP " + std::to_string(response.status);
}

bool platform_matches(const std::string &descriptor) {
  const std::string platform = common::json_get_object(descriptor, "platform");
  if (platform.empty()) {
    return false;
  }
  const auto flat = common::json_parse_flat(platform);
  return common::json_flat_get(flat, "architecture").value_or("") == "amd64" &&
         common::json_flat_get(flat, "os").value_or("") == "linux";
}

} // namespace

common::Result<BearerChallenge> parse_www_authenticate(const std::string &header) {
  const std::string text = common::trim(header);
  if (!common::starts_with(text, "Bearer ")) {
    return common::Result<BearerChallenge>::failure(
        "Unsupported authentication scheme, expected Bearer auth");
  }

  std::unordered_map<std::string, std::string> params;
  for (const auto &part : common::split(text.substr(7), ',')) {
    const auto eq = part.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    std::string value = common::trim(part.substr(eq + 1));
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
      value = value.substr(1, value.size() - 2);
    }
    params[common::trim(part.substr(0, eq))] = value;
  }

  const auto realm = params.find("realm");
  if (realm == params.end() || realm->second.empty()) {
    return common::Result<BearerChallenge>::failure("No realm found in WWW-Authenticate header");
  }
  BearerChallenge challenge;
  challenge.realm = realm->second;
  if (const auto it = params.find("service"); it != params.end()) {
    challenge.service = it->second;
  }
  if (const auto it = params.find("scope"); it != params.end()) {
    challenge.scope = it->second;
  }
  return common::Result<BearerChallenge>::success(std::move(challenge));
}

namespace {

/// Follows the registry's Bearer challenge. `scope` overrides the scope the
/// challenge asks for; with neither the realm is queried unscoped.
common::Result<std::optional<std::string>>
request_token(http::HttpClient &http, const std::string &base_url,
              const std::optional<auth::RegistryCredential> &credential,
              const std::optional<std::string> &scope, const std::string &action,
              const std::uint64_t timeout_ms) {
  using R = common::Result<std::optional<std::string>>;
  const std::string v2_url = base_url + "/v2/";
  observability::record_debug("registry", "checking registry endpoint " + v2_url);

  const auto v2_response = http.get(v2_url, {}, timeout_ms);
  if (v2_response.network_error || v2_response.timeout) {
    return R::failure(describe(v2_response));
  }
  if (v2_response.success()) {
    observability::record_debug("registry", "registry allows anonymous access");
    return R::success(std::nullopt);
  }

  const auto header = v2_response.headers.find("www-authenticate");
  if (header == v2_response.headers.end()) {
    return R::failure("No WWW-Authenticate header found");
  }
  const auto challenge = parse_www_authenticate(header->second);
  if (!challenge.ok()) {
    return R::failure(challenge.error());
  }

  std::vector<std::string> query;
  if (challenge.value().service.has_value()) {
    query.push_back("service=" + *challenge.value().service);
  }
  if (const auto wanted = scope.has_value() ? scope : challenge.value().scope;
      wanted.has_value()) {
    query.push_back("scope=" + *wanted);
  }
  std::string auth_url = challenge.value().realm;
  for (std::size_t i = 0; i < query.size(); ++i) {
    auth_url += (i == 0 ? "?" : "&") + query[i];
  }

  http::Headers headers;
  if (credential.has_value() && credential->username.has_value() &&
      credential->password.has_value()) {
    headers["Authorization"] =
        http::basic_auth_header(*credential->username, *credential->password);
  }

  const auto response = http.get(auth_url, headers, timeout_ms);
  if (!response.success()) {
    return R::failure("Failed to " + action + ": " + describe(response));
  }

  const auto flat = common::json_parse_flat(response.body);
  auto token = common::json_flat_get(flat, "token");
  if (!token.has_value() || token->empty()) {
    token = common::json_flat_get(flat, "access_token");
  }
  if (!token.has_value() || token->empty()) {
    return R::failure("Token response contained neither token nor access_token");
  }
  return R::success(token);
}

} // namespace

common::Result<std::optional<std::string>>
get_scoped_token(http::HttpClient &http, const ImageReference &image,
                 const std::optional<auth::RegistryCredential> &credential,
                 const std::uint64_t timeout_ms) {
  return request_token(http, registry_url(image), credential,
                       "repository:" + image.repository + ":pull", "get scoped token",
                       timeout_ms);
}

std::string registry_host(const std::string &registry) {
  std::string host = common::trim(registry);
  for (const char *scheme : {"https://", "http://"}) {
    if (common::starts_with(host, scheme)) {
      host = host.substr(std::string(scheme).size());
      break;
    }
  }
  while (!host.empty() && host.back() == '/') {
    host.pop_back();
  }
  return host;
}

common::Result<std::optional<std::string>>
login_registry(http::HttpClient &http, const std::string &registry,
               const auth::RegistryCredential &credential, const std::uint64_t timeout_ms) {
  const std::string host = registry_host(registry);
  if (host.empty()) {
    return common::Result<std::optional<std::string>>::failure("registry must not be empty");
  }
  const std::string base_url =
      common::starts_with(common::trim(registry), "http://") ? "http://" + host : "https://" + host;
  observability::record_debug("registry", "logging in to " + base_url);
  return request_token(http, base_url, credential, std::nullopt, "authenticate with " + host,
                       timeout_ms);
}

common::Status verify_manifest(http::HttpClient &http, const ImageReference &image,
                               const std::optional<std::string> &token,
                               const std::uint64_t timeout_ms) {
  const std::string base = registry_url(image) + "/v2/" + image.repository + "/manifests/";
  const auto response =
      http.get(base + image.manifest_reference(), bearer(token, INDEX_ACCEPT), timeout_ms);
  if (!response.success()) {
    return common::Status::error("Failed to fetch manifest: " + describe(response));
  }

  const auto flat = common::json_parse_flat(response.body);
  const auto schema = common::json_flat_get(flat, "schemaVersion");
  if (!schema.has_value()) {
    return common::Status::error("No schema version found in image manifest");
  }
  if (*schema != "2") {
    return common::Status::error("Unsupported image manifest schema version: " + *schema);
  }

  const auto manifests = common::json_flat_get(flat, "manifests");
  if (!manifests.has_value()) {
    if (!common::json_flat_get(flat, "layers").has_value()) {
      return common::Status::error("Failed to parse image manifest: missing layers");
    }
    return common::Status::success();
  }

  std::string digest;
  for (const auto &descriptor : common::json_split_top_level_objects(*manifests)) {
    if (platform_matches(descriptor)) {
      digest = common::json_flat_get(common::json_parse_flat(descriptor), "digest").value_or("");
      break;
    }
  }
  if (digest.empty()) {
    return common::Status::error("No compatible linux/amd64 image found");
  }

  const auto platform_response = http.get(base + digest, bearer(token, MANIFEST_ACCEPT), timeout_ms);
  if (!platform_response.success()) {
    return common::Status::error("Failed to fetch image platform manifest: " +
                                 describe(platform_response));
  }
  if (!common::json_flat_get(common::json_parse_flat(platform_response.body), "layers")
           .has_value()) {
    return common::Status::error("Failed to parse image manifest: missing layers");
  }
  return common::Status::success();
}

common::Result<std::optional<std::string>>
verify_and_get_pull_token(http::HttpClient &http, const auth::Session &session,
                          const std::string &image, const std::uint64_t timeout_ms) {
  using R = common::Result<std::optional<std::string>>;
  const auto reference = ImageReference::parse(image);
  if (!reference.ok()) {
    return R::failure(reference.error());
  }
  const auto &ref = reference.value();

  const auto credential = session.registry_credential(ref.registry);
  const bool has_username = credential.has_value() && credential->username.has_value();
  if (!has_username && !ref.is_docker_hub()) {
    return R::failure("No credentials found for registry '" + ref.registry +
                      "'. Please login first with: unisrv registry login " + ref.registry +
                      " -u <username> --password-stdin");
  }

  auto token = get_scoped_token(http, ref, credential, timeout_ms);
  if (!token.ok()) {
    return R::failure("Failed to authenticate with registry '" + ref.registry +
                      "': " + token.error());
  }

  if (const auto status = verify_manifest(http, ref, token.value(), timeout_ms); !status.ok()) {
    return R::failure("Image " + ref.to_string() + " could not be verified: " + status.error());
  }
  return token;
}

} // namespace unisrv::registry
