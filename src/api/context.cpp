#include "unisrv/api/context.hpp"

#include "unisrv/http/api_error.hpp"
#include "unisrv/observability/global.hpp"

namespace unisrv::api {

ApiContext::ApiContext(config::Config config, std::shared_ptr<http::HttpClient> http,
                       auth::Session session)
    : config_(std::move(config)), endpoint_(config::parse_api_host(config_.api.host)),
      http_(std::move(http)), session_(std::move(session)) {
  observability::record_debug("api", "using API host " + endpoint_.host);
}

std::string ApiContext::url(const std::string &path) const {
  return std::string(endpoint_.use_tls ? "https" : "http") + "://" + endpoint_.host + path;
}

std::string ApiContext::ws_url(const std::string &path) const {
  return std::string(endpoint_.use_tls ? "wss" : "ws") + "://" + endpoint_.host + path;
}

common::Result<http::Headers> ApiContext::auth_headers() {
  auto token = session_.access_token(*http_, url("/auth/refresh"), timeout_ms());
  if (!token.ok()) {
    return common::Result<http::Headers>::failure(token.error());
  }
  return common::Result<http::Headers>::success(
      http::Headers{{"Authorization", "Bearer " + token.value()}});
}

common::Result<std::string> ApiContext::get(const std::string &path,
                                            const std::string &operation) {
  auto headers = auth_headers();
  if (!headers.ok()) {
    return common::Result<std::string>::failure(headers.error());
  }
  const auto response = http_->get(url(path), headers.value(), timeout_ms());
  if (const auto status = http::check_response(response, operation); !status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }
  return common::Result<std::string>::success(response.body);
}

common::Result<std::string> ApiContext::post(const std::string &path, const std::string &body,
                                             const std::string &operation) {
  auto headers = auth_headers();
  if (!headers.ok()) {
    return common::Result<std::string>::failure(headers.error());
  }
  const auto response = http_->post_json(url(path), headers.value(), body, timeout_ms());
  if (const auto status = http::check_response(response, operation); !status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }
  return common::Result<std::string>::success(response.body);
}

common::Status ApiContext::remove(const std::string &path, const std::string &body,
                                  const std::string &operation) {
  auto headers = auth_headers();
  if (!headers.ok()) {
    return common::Status::error(headers.error());
  }
  const auto response = http_->delete_json(url(path), headers.value(), body, timeout_ms());
  return http::check_response(response, operation);
}

} // namespace unisrv::api
