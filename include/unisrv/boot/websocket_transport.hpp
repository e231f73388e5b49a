#pragma once

#include "unisrv/boot/transport.hpp"

#include <openssl/ssl.h>

#include <cstdint>
#include <string>

namespace unisrv::boot {

struct ParsedWsUrl {
  bool tls = false;
  std::string host;
  std::uint16_t port = 0;
  std::string path;
};

/// Accepts `ws://host[:port]/path` and `wss://host[:port]/path`.
[[nodiscard]] common::Result<ParsedWsUrl> parse_ws_url(const std::string &url);

/// RFC 6455 client over a blocking socket, with OpenSSL for `wss://`.
class WebSocketTransport final : public EventStreamTransport {
public:
  WebSocketTransport() = default;
  ~WebSocketTransport() override;

  WebSocketTransport(const WebSocketTransport &) = delete;
  WebSocketTransport &operator=(const WebSocketTransport &) = delete;

  [[nodiscard]] common::Status connect(const std::string &url,
                                       const http::Headers &headers) override;
  void close() override;
  [[nodiscard]] bool is_connected() const override { return fd_ >= 0; }
  [[nodiscard]] StreamFrame receive(std::chrono::milliseconds timeout) override;

private:
  [[nodiscard]] common::Status start_tls(const std::string &host);
  [[nodiscard]] bool send_all(const std::uint8_t *data, std::size_t size);
  [[nodiscard]] bool recv_exact(std::uint8_t *data, std::size_t size);
  [[nodiscard]] bool send_frame(std::uint8_t opcode, const std::string &payload);
  [[nodiscard]] StreamFrame closed(const std::string &reason);

  int fd_ = -1;
  SSL_CTX *tls_ctx_ = nullptr;
  SSL *ssl_ = nullptr;
  /// Bytes read past the handshake response, consumed before the socket.
  std::string pending_;
  std::string fragments_;
};

} // namespace unisrv::boot
