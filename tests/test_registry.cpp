#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "unisrv/registry/client.hpp"

namespace {

using unisrv::testing::json_response;
using unisrv::testing::MockHttpClient;
namespace reg = unisrv::registry;

unisrv::http::HttpResponse challenge(const std::string &header) {
  auto response = json_response(401, R"({"errors":[]})");
  response.headers["www-authenticate"] = header;
  return response;
}

unisrv::auth::Session session_with_ghcr() {
  return unisrv::auth::Session(unisrv::testing::valid_session_data(), std::filesystem::path());
}

} // namespace

void register_registry_tests(std::vector<unisrv::tests::TestCase> &tests) {
  using unisrv::tests::require;

  tests.push_back({"image_reference_docker_hub_shorthand", [] {
                     const auto ref = reg::ImageReference::parse("nginx");
                     require(ref.ok(), ref.error());
                     require(ref.value().registry == "index.docker.io", ref.value().registry);
                     require(ref.value().repository == "library/nginx", ref.value().repository);
                     require(ref.value().manifest_reference() == "latest", "default tag");
                     require(ref.value().is_docker_hub(), "docker hub");
                   }});

  tests.push_back({"image_reference_registry_port_and_tag", [] {
                     const auto ref = reg::ImageReference::parse("localhost:5000/team/app:1.2");
                     require(ref.ok(), ref.error());
                     require(ref.value().registry == "localhost:5000", ref.value().registry);
                     require(ref.value().repository == "team/app", ref.value().repository);
                     require(ref.value().tag == std::optional<std::string>("1.2"), "tag");
                     require(ref.value().to_string() == "localhost:5000/team/app:1.2",
                             ref.value().to_string());
                   }});

  tests.push_back({"image_reference_digest_wins", [] {
                     const auto ref = reg::ImageReference::parse("ghcr.io/acme/api:2@sha256:abc");
                     require(ref.ok(), ref.error());
                     require(ref.value().manifest_reference() == "sha256:abc",
                             ref.value().manifest_reference());
                     require(ref.value().tag == std::optional<std::string>("2"), "tag kept");
                   }});

  tests.push_back({"image_reference_rejects_invalid", [] {
                     require(!reg::ImageReference::parse("").ok(), "empty");
                     require(!reg::ImageReference::parse("Acme/App").ok(), "upper case");
                     require(!reg::ImageReference::parse("nginx:").ok(), "empty tag");
                     require(!reg::ImageReference::parse("nginx latest").ok(), "whitespace");
                     require(!reg::ImageReference::parse("nginx@nodigest").ok(), "digest");
                   }});

  tests.push_back({"www_authenticate_parsing", [] {
                     const auto parsed = reg::parse_www_authenticate(
                         R"(Bearer realm="https://ghcr.io/token",service="ghcr.io",scope="repository:acme/api:pull")");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().realm == "https://ghcr.io/token", parsed.value().realm);
                     require(parsed.value().service == std::optional<std::string>("ghcr.io"),
                             "service");
                     require(parsed.value().scope.has_value(), "scope");

                     require(!reg::parse_www_authenticate("Basic realm=\"x\"").ok(), "basic");
                     const auto no_realm = reg::parse_www_authenticate("Bearer service=\"x\"");
                     require(!no_realm.ok(), "realm required");
                     require(no_realm.error() == "No realm found in WWW-Authenticate header",
                             no_realm.error());
                   }});

  tests.push_back({"registry_private_image_flow", [] {
                     MockHttpClient http;
                     http.on("GET", "https://ghcr.io/v2/",
                             challenge(R"(Bearer realm="https://ghcr.io/token",service="ghcr.io")"));
                     http.on("GET",
                             "https://ghcr.io/token?service=ghcr.io&scope=repository:acme/api:pull",
                             json_response(200, R"({"token":"scoped-1"})"));
                     http.on("GET", "https://ghcr.io/v2/acme/api/manifests/1.0",
                             json_response(200, R"({"schemaVersion":2,"manifests":[
                               {"digest":"sha256:arm","platform":{"architecture":"arm64","os":"linux"}},
                               {"digest":"sha256:amd","platform":{"architecture":"amd64","os":"linux"}}]})"));
                     http.on("GET", "https://ghcr.io/v2/acme/api/manifests/sha256:amd",
                             json_response(200, R"({"schemaVersion":2,"layers":[]})"));

                     const auto token = reg::verify_and_get_pull_token(
                         http, session_with_ghcr(), "ghcr.io/acme/api:1.0", 1000);
                     require(token.ok(), token.error());
                     require(token.value() == std::optional<std::string>("scoped-1"), "token");

                     const auto token_call = http.last(
                         "GET", "https://ghcr.io/token?service=ghcr.io&scope=repository:acme/api:pull");
                     require(token_call.has_value(), "token requested");
                     require(token_call->headers.at("Authorization") == "Basic b2N0bzpzZWNyZXQ=",
                             "basic credentials sent");
                     const auto manifest =
                         http.last("GET", "https://ghcr.io/v2/acme/api/manifests/sha256:amd");
                     require(manifest.has_value() &&
                                 manifest->headers.at("Authorization") == "Bearer scoped-1",
                             "platform manifest fetched with token");
                   }});

  tests.push_back({"registry_anonymous_access_has_no_token", [] {
                     MockHttpClient http;
                     http.on("GET", "https://index.docker.io/v2/", json_response(200, "{}"));
                     http.on("GET", "https://index.docker.io/v2/library/nginx/manifests/latest",
                             json_response(200, R"({"schemaVersion":2,"layers":[{}]})"));
                     const auto token =
                         reg::verify_and_get_pull_token(http, session_with_ghcr(), "nginx", 1000);
                     require(token.ok(), token.error());
                     require(!token.value().has_value(), "anonymous");
                   }});

  tests.push_back({"registry_missing_credentials", [] {
                     MockHttpClient http;
                     const auto token = reg::verify_and_get_pull_token(
                         http, session_with_ghcr(), "quay.io/acme/api:1", 1000);
                     require(!token.ok(), "no login for quay.io");
                     require(token.error().find("No credentials found for registry 'quay.io'") == 0,
                             token.error());
                     require(http.calls().empty(), "no network traffic");
                   }});

  tests.push_back({"registry_index_without_amd64", [] {
                     MockHttpClient http;
                     http.on("GET", "https://index.docker.io/v2/", json_response(200, "{}"));
                     http.on("GET", "https://index.docker.io/v2/acme/tool/manifests/2",
                             json_response(200, R"({"schemaVersion":2,"manifests":[
                               {"digest":"sha256:arm","platform":{"architecture":"arm64","os":"linux"}}]})"));
                     const auto token =
                         reg::verify_and_get_pull_token(http, session_with_ghcr(), "acme/tool:2", 1000);
                     require(!token.ok(), "no amd64 entry");
                     require(token.error() == "Image index.docker.io/acme/tool:2 could not be "
                                              "verified: No compatible linux/amd64 image found",
                             token.error());
                   }});

  tests.push_back({"registry_missing_manifest", [] {
                     MockHttpClient http;
                     http.on("GET", "https://index.docker.io/v2/", json_response(200, "{}"));
                     const auto token = reg::verify_and_get_pull_token(http, session_with_ghcr(),
                                                                       "nginx:nope", 1000);
                     require(!token.ok(), "unscripted manifest is a 404");
                     require(token.error().find("Failed to fetch manifest: HTTP 404") !=
                                 std::string::npos,
                             token.error());
                   }});

  tests.push_back({"registry_host_strips_scheme_and_slash", [] {
                     require(reg::registry_host("https://ghcr.io/") == "ghcr.io", "https");
                     require(reg::registry_host(" http://localhost:5000 ") == "localhost:5000",
                             "http with port");
                     require(reg::registry_host("quay.io") == "quay.io", "bare host");
                   }});

  tests.push_back({"login_registry_anonymous_returns_no_token", [] {
                     MockHttpClient http;
                     http.on("GET", "http://localhost:5000/v2/", json_response(200, "{}"));
                     const auto token =
                         reg::login_registry(http, "http://localhost:5000", {}, 1000);
                     require(token.ok(), token.error());
                     require(!token.value().has_value(), "anonymous registry");
                     require(http.calls().size() == 1, "no realm request");
                   }});
}
