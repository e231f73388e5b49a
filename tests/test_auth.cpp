#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "unisrv/auth/session.hpp"
#include "unisrv/config/config.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <sys/stat.h>

void register_auth_tests(std::vector<unisrv::tests::TestCase> &tests) {
  using unisrv::tests::require;
  using unisrv::testing::json_response;
  using unisrv::testing::MockHttpClient;
  namespace a = unisrv::auth;

  constexpr const char *REFRESH_URL = "https://api.test.local/auth/refresh";

  tests.push_back({"parse_timestamp_forms", [] {
                     require(a::parse_timestamp("1700000000").value() == 1700000000, "integer");
                     require(a::parse_timestamp("2023-11-14T22:13:20Z").value() == 1700000000,
                             "rfc3339 utc");
                     require(a::parse_timestamp("2023-11-14T22:13:20.123456Z").value() == 1700000000,
                             "fractional seconds");
                     require(a::parse_timestamp("2023-11-15T00:13:20+02:00").value() == 1700000000,
                             "offset");
                     require(!a::parse_timestamp("yesterday").ok(), "garbage rejected");
                   }});

  tests.push_back({"session_json_roundtrip_keeps_registries", [] {
                     const auto data = unisrv::testing::valid_session_data();
                     auto parsed = a::parse_session_json(a::session_to_json(data));
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().access_token == "access-1", "access token");
                     require(parsed.value().refresh_token_expiry == data.refresh_token_expiry,
                             "expiry");
                     const auto &cred = parsed.value().registries.at("ghcr.io");
                     require(cred.username == std::optional<std::string>("octo"), "username");
                     require(!cred.token.has_value(), "null token stays empty");
                   }});

  tests.push_back({"session_without_tokens_is_rejected", [] {
                     require(!a::parse_session_json(R"({"user_id":"u"})").ok(),
                             "no tokens must fail");
                   }});

  tests.push_back({"load_default_reads_auth_file_beside_config", [] {
                     unisrv::testing::TempWorkspace workspace;
                     unisrv::config::set_config_path_override(workspace.path() / "config.toml");

                     const auto empty = a::Session::load_default();
                     require(empty.ok(), empty.error());
                     require(!empty.value().present(), "no auth.json yet");

                     workspace.create_file(
                         "auth.json", a::session_to_json(unisrv::testing::valid_session_data()));
                     const auto loaded = a::Session::load_default();
                     unisrv::config::clear_config_path_override();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().present(), "session loaded");
                     require(loaded.value().data()->refresh_session_id == "rs-1", "refresh id");
                   }});

  tests.push_back({"ensure_auth_messages", [] {
                     a::Session empty;
                     const auto missing = empty.ensure_auth(100);
                     require(!missing.ok() && missing.error().find("No authentication session found") !=
                                                  std::string::npos,
                             missing.error());

                     a::SessionData data;
                     data.access_token = "a";
                     data.access_token_expiry = 50;
                     data.refresh_token = "r";
                     data.refresh_token_expiry = 60;
                     a::Session expired(data, {});
                     const auto status = expired.ensure_auth(100);
                     require(!status.ok() && status.error().find("Authentication session expired") !=
                                                 std::string::npos,
                             status.error());
                     require(expired.ensure_auth(55).ok(), "refresh token still valid");
                   }});

  tests.push_back({"access_token_uses_valid_token_without_refresh", [] {
                     MockHttpClient http;
                     a::Session session(unisrv::testing::valid_session_data(), {});
                     auto token = session.access_token(http, REFRESH_URL, 1000);
                     require(token.ok(), token.error());
                     require(token.value() == "access-1", "existing token");
                     require(http.calls().empty(), "no refresh call");
                   }});

  tests.push_back({"access_token_refreshes_and_persists", [] {
                     unisrv::testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "auth.json";
                     auto data = unisrv::testing::valid_session_data();
                     data.access_token_expiry = 10;
                     a::Session session(data, path);

                     MockHttpClient http;
                     http.on("POST", REFRESH_URL,
                             json_response(200, R"({"token":"access-2","expires_at":"2999-01-01T00:00:00Z","refresh_session_id":"rs-2","refresh_token":"refresh-2"})"));
                     auto token = session.access_token(http, REFRESH_URL, 1000, 1000);
                     require(token.ok(), token.error());
                     require(token.value() == "access-2", "refreshed token");

                     const auto call = http.last("POST", REFRESH_URL);
                     require(call.has_value(), "refresh posted");
                     require(call->headers.at("Authorization") == "Bearer refresh-1",
                             "refresh token as bearer");
                     require(call->body == R"({"id":"rs-1","token":"refresh-1"})", call->body);

                     std::ifstream file(path);
                     std::stringstream saved;
                     saved << file.rdbuf();
                     require(saved.str().find("access-2") != std::string::npos, "session persisted");
                     struct stat info {};
                     require(stat(path.c_str(), &info) == 0 && (info.st_mode & 0777) == 0600,
                             "auth.json should be 0600");
                   }});

  tests.push_back({"access_token_refresh_failure_reports_reason", [] {
                     auto data = unisrv::testing::valid_session_data();
                     data.access_token_expiry = 10;
                     a::Session session(data, {});
                     MockHttpClient http;
                     http.on("POST", REFRESH_URL, json_response(401, R"({"reason":"revoked"})"));
                     auto token = session.access_token(http, REFRESH_URL, 1000, 1000);
                     require(!token.ok(), "refresh should fail");
                     require(token.error() == "Failed to refresh tokens: revoked. Please login again.",
                             token.error());
                   }});

  tests.push_back({"store_registry_credential_persists_0600", [] {
                     unisrv::testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "auth.json";
                     a::Session session(unisrv::testing::valid_session_data(), path);
                     const auto stored = session.store_registry_credential(
                         "quay.io", {std::string("robot"), std::string("pw"), std::string("tok")});
                     require(stored.ok(), stored.error());
                     require(session.registry_credential("quay.io")->username ==
                                 std::optional<std::string>("robot"),
                             "kept in memory");

                     struct stat info {};
                     require(stat(path.c_str(), &info) == 0 && (info.st_mode & 0777) == 0600,
                             "auth.json should be 0600");
                     std::ifstream file(path);
                     std::stringstream saved;
                     saved << file.rdbuf();
                     const auto reloaded = a::parse_session_json(saved.str());
                     require(reloaded.ok(), reloaded.error());
                     const auto &registries = reloaded.value().registries;
                     require(registries.size() == 2, "ghcr.io login kept beside the new one");
                     require(registries.at("quay.io").token == std::optional<std::string>("tok"),
                             "token persisted");
                     require(registries.at("ghcr.io").password ==
                                 std::optional<std::string>("secret"),
                             "existing credential untouched");
                   }});

  tests.push_back({"store_registry_credential_needs_session", [] {
                     unisrv::testing::TempWorkspace workspace;
                     a::Session session(std::nullopt, workspace.path() / "auth.json");
                     const auto stored = session.store_registry_credential("quay.io", {});
                     require(!stored.ok(), "no session to attach credentials to");
                     require(stored.error().find("No authentication session found") !=
                                 std::string::npos,
                             stored.error());
                     require(!std::filesystem::exists(workspace.path() / "auth.json"),
                             "nothing written");
                   }});

  tests.push_back({"registry_credential_lookup", [] {
                     a::Session session(unisrv::testing::valid_session_data(), {});
                     require(session.registry_credential("ghcr.io").has_value(), "known registry");
                     require(!session.registry_credential("quay.io").has_value(), "unknown registry");
                   }});
}
