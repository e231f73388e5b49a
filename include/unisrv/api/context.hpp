#pragma once

#include "unisrv/auth/session.hpp"
#include "unisrv/common/result.hpp"
#include "unisrv/config/config.hpp"
#include "unisrv/http/client.hpp"

#include <memory>
#include <string>

namespace unisrv::api {

/// Everything a control-plane call needs: endpoint, transport and session.
class ApiContext {
public:
  ApiContext(config::Config config, std::shared_ptr<http::HttpClient> http,
             auth::Session session);

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] http::HttpClient &http() { return *http_; }
  [[nodiscard]] auth::Session &session() { return session_; }
  [[nodiscard]] std::uint64_t timeout_ms() const { return config_.http.timeout_ms; }

  [[nodiscard]] std::string url(const std::string &path) const;
  [[nodiscard]] std::string ws_url(const std::string &path) const;

  /// Bearer header for the current (possibly refreshed) access token.
  [[nodiscard]] common::Result<http::Headers> auth_headers();

  /// GET/POST/DELETE on the API with auth attached; failures are described
  /// for `operation`.
  [[nodiscard]] common::Result<std::string> get(const std::string &path,
                                                const std::string &operation);
  [[nodiscard]] common::Result<std::string> post(const std::string &path, const std::string &body,
                                                 const std::string &operation);
  [[nodiscard]] common::Status remove(const std::string &path, const std::string &body,
                                      const std::string &operation);

private:
  config::Config config_;
  config::ApiEndpoint endpoint_;
  std::shared_ptr<http::HttpClient> http_;
  auth::Session session_;
};

} // namespace unisrv::api
