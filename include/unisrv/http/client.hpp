#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace unisrv::http {

using Headers = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  /// Keys are lower-cased.
  Headers headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] bool success() const {
    return !network_error && !timeout && status >= 200 && status < 300;
  }
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse get(const std::string &url, const Headers &headers,
                                         std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const Headers &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
  /// DELETE; an empty body sends no payload.
  [[nodiscard]] virtual HttpResponse delete_json(const std::string &url, const Headers &headers,
                                                 const std::string &body,
                                                 std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse get(const std::string &url, const Headers &headers,
                                 std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse post_json(const std::string &url, const Headers &headers,
                                       const std::string &body,
                                       std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse delete_json(const std::string &url, const Headers &headers,
                                         const std::string &body,
                                         std::uint64_t timeout_ms) override;
};

/// `Basic <base64(user:password)>`
[[nodiscard]] std::string basic_auth_header(const std::string &username,
                                            const std::string &password);
[[nodiscard]] std::string base64_encode(const std::string &input);

} // namespace unisrv::http
