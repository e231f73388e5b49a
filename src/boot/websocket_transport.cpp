#include "unisrv/boot/websocket_transport.hpp"

#include "unisrv/common/fs.hpp"
#include "unisrv/observability/global.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <sstream>
#include <utility>
#include <vector>

#include <netdb.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace unisrv::boot {

namespace {

constexpr std::size_t kMaxHandshakeBytes = 16 * 1024;
constexpr std::size_t kMaxFramePayloadBytes = 4 * 1024 * 1024;

constexpr std::uint8_t kOpContinuation = 0x0;
constexpr std::uint8_t kOpText = 0x1;
constexpr std::uint8_t kOpBinary = 0x2;
constexpr std::uint8_t kOpClose = 0x8;
constexpr std::uint8_t kOpPing = 0x9;
constexpr std::uint8_t kOpPong = 0xA;

std::string openssl_error_string() {
  const auto code = ERR_get_error();
  if (code == 0) {
    return "unknown openssl error";
  }
  std::array<char, 256> buffer{};
  ERR_error_string_n(code, buffer.data(), buffer.size());
  return buffer.data();
}

common::Result<std::string> random_websocket_key() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    return common::Result<std::string>::failure("failed to generate websocket key: " +
                                                openssl_error_string());
  }
  const int out_len = 4 * static_cast<int>((bytes.size() + 2) / 3);
  std::string key(static_cast<std::size_t>(out_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(key.data()), bytes.data(),
                  static_cast<int>(bytes.size()));
  return common::Result<std::string>::success(std::move(key));
}

common::Result<int> open_socket(const std::string &host, const std::uint16_t port) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *results = nullptr;
  const std::string service = std::to_string(port);
  if (const int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &results); rc != 0) {
    return common::Result<int>::failure("failed to resolve " + host + ": " + gai_strerror(rc));
  }

  std::string last_error = "no addresses";
  int fd = -1;
  for (addrinfo *entry = results; entry != nullptr; entry = entry->ai_next) {
    fd = socket(entry->ai_family, entry->ai_socktype, entry->ai_protocol);
    if (fd < 0) {
      last_error = std::strerror(errno);
      continue;
    }
    if (::connect(fd, entry->ai_addr, entry->ai_addrlen) == 0) {
      break;
    }
    last_error = std::strerror(errno);
    ::close(fd);
    fd = -1;
  }
  freeaddrinfo(results);

  if (fd < 0) {
    return common::Result<int>::failure("websocket connect failed: " + last_error);
  }
  return common::Result<int>::success(fd);
}

} // namespace

common::Result<ParsedWsUrl> parse_ws_url(const std::string &url) {
  const std::string trimmed = common::trim(url);
  ParsedWsUrl parsed;
  std::size_t host_start = 0;
  if (common::starts_with(trimmed, "wss://")) {
    parsed.tls = true;
    parsed.port = 443;
    host_start = 6;
  } else if (common::starts_with(trimmed, "ws://")) {
    parsed.port = 80;
    host_start = 5;
  } else {
    return common::Result<ParsedWsUrl>::failure("only ws:// and wss:// URLs are supported");
  }

  std::size_t path_start = trimmed.find('/', host_start);
  const std::string host_port = path_start == std::string::npos
                                    ? trimmed.substr(host_start)
                                    : trimmed.substr(host_start, path_start - host_start);
  parsed.path = path_start == std::string::npos ? "/" : trimmed.substr(path_start);

  const auto colon = host_port.rfind(':');
  if (colon != std::string::npos) {
    parsed.host = host_port.substr(0, colon);
    const std::string port_text = host_port.substr(colon + 1);
    unsigned int port = 0;
    const auto *first = port_text.data();
    const auto *last = first + port_text.size();
    auto [ptr, ec] = std::from_chars(first, last, port);
    if (ec != std::errc() || ptr != last || port == 0 || port > 65535) {
      return common::Result<ParsedWsUrl>::failure("invalid websocket port");
    }
    parsed.port = static_cast<std::uint16_t>(port);
  } else {
    parsed.host = host_port;
  }
  if (parsed.host.empty()) {
    return common::Result<ParsedWsUrl>::failure("missing websocket host");
  }
  return common::Result<ParsedWsUrl>::success(std::move(parsed));
}

WebSocketTransport::~WebSocketTransport() { close(); }

common::Status WebSocketTransport::start_tls(const std::string &host) {
  tls_ctx_ = SSL_CTX_new(TLS_client_method());
  if (tls_ctx_ == nullptr) {
    return common::Status::error("failed to create TLS context: " + openssl_error_string());
  }
  SSL_CTX_set_min_proto_version(tls_ctx_, TLS1_2_VERSION);
  SSL_CTX_set_verify(tls_ctx_, SSL_VERIFY_PEER, nullptr);
  if (SSL_CTX_set_default_verify_paths(tls_ctx_) != 1) {
    return common::Status::error("failed to load CA certificates: " + openssl_error_string());
  }

  ssl_ = SSL_new(tls_ctx_);
  if (ssl_ == nullptr) {
    return common::Status::error("failed to create TLS session: " + openssl_error_string());
  }
  SSL_set_tlsext_host_name(ssl_, host.c_str());
  SSL_set1_host(ssl_, host.c_str());
  SSL_set_fd(ssl_, fd_);
  if (SSL_connect(ssl_) != 1) {
    return common::Status::error("TLS handshake failed: " + openssl_error_string());
  }
  return common::Status::success();
}

common::Status WebSocketTransport::connect(const std::string &url, const http::Headers &headers) {
  if (is_connected()) {
    return common::Status::error("transport already connected");
  }
  const auto parsed = parse_ws_url(url);
  if (!parsed.ok()) {
    return common::Status::error(parsed.error());
  }
  const auto &target = parsed.value();

  const auto fd = open_socket(target.host, target.port);
  if (!fd.ok()) {
    return common::Status::error(fd.error());
  }
  fd_ = fd.value();

  if (target.tls) {
    if (const auto tls = start_tls(target.host); !tls.ok()) {
      close();
      return tls;
    }
  }

  const auto ws_key = random_websocket_key();
  if (!ws_key.ok()) {
    close();
    return common::Status::error(ws_key.error());
  }

  std::ostringstream req;
  req << "GET " << target.path << " HTTP/1.1\r\n";
  req << "Host: " << target.host << ":" << target.port << "\r\n";
  req << "Upgrade: websocket\r\n";
  req << "Connection: Upgrade\r\n";
  req << "Sec-WebSocket-Key: " << ws_key.value() << "\r\n";
  req << "Sec-WebSocket-Version: 13\r\n";
  for (const auto &[key, value] : headers) {
    req << key << ": " << value << "\r\n";
  }
  req << "\r\n";
  const std::string handshake = req.str();
  if (!send_all(reinterpret_cast<const std::uint8_t *>(handshake.data()), handshake.size())) {
    close();
    return common::Status::error("websocket handshake send failed");
  }

  std::string response;
  std::array<std::uint8_t, 1024> buffer{};
  std::size_t header_end = std::string::npos;
  while ((header_end = response.find("\r\n\r\n")) == std::string::npos) {
    const ssize_t n = ssl_ != nullptr
                          ? static_cast<ssize_t>(SSL_read(ssl_, buffer.data(), buffer.size()))
                          : recv(fd_, buffer.data(), buffer.size(), 0);
    if (n <= 0) {
      close();
      return common::Status::error("websocket handshake receive failed");
    }
    response.append(reinterpret_cast<const char *>(buffer.data()), static_cast<std::size_t>(n));
    if (response.size() > kMaxHandshakeBytes) {
      close();
      return common::Status::error("websocket handshake too large");
    }
  }

  const std::string status_line = response.substr(0, response.find("\r\n"));
  if (status_line.find(" 101") == std::string::npos) {
    close();
    return common::Status::error("websocket upgrade rejected: " + status_line);
  }
  pending_ = response.substr(header_end + 4);
  fragments_.clear();
  observability::record_debug("websocket", "connected to " + target.host + target.path);
  return common::Status::success();
}

void WebSocketTransport::close() {
  if (ssl_ != nullptr) {
    SSL_shutdown(ssl_);
    SSL_free(ssl_);
    ssl_ = nullptr;
  }
  if (tls_ctx_ != nullptr) {
    SSL_CTX_free(tls_ctx_);
    tls_ctx_ = nullptr;
  }
  if (fd_ >= 0) {
    shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    fd_ = -1;
  }
  pending_.clear();
}

bool WebSocketTransport::send_all(const std::uint8_t *data, const std::size_t size) {
  std::size_t sent = 0;
  while (sent < size) {
    const auto remaining = size - sent;
    const ssize_t n = ssl_ != nullptr
                          ? static_cast<ssize_t>(SSL_write(ssl_, data + sent, static_cast<int>(remaining)))
                          : send(fd_, data + sent, remaining, MSG_NOSIGNAL);
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

bool WebSocketTransport::recv_exact(std::uint8_t *data, const std::size_t size) {
  std::size_t received = 0;
  if (!pending_.empty()) {
    const std::size_t take = std::min(size, pending_.size());
    std::memcpy(data, pending_.data(), take);
    pending_.erase(0, take);
    received = take;
  }
  while (received < size) {
    const auto remaining = size - received;
    const ssize_t n = ssl_ != nullptr
                          ? static_cast<ssize_t>(SSL_read(ssl_, data + received, static_cast<int>(remaining)))
                          : recv(fd_, data + received, remaining, 0);
    if (n <= 0) {
      return false;
    }
    received += static_cast<std::size_t>(n);
  }
  return true;
}

bool WebSocketTransport::send_frame(const std::uint8_t opcode, const std::string &payload) {
  std::vector<std::uint8_t> frame;
  frame.reserve(payload.size() + 16);
  frame.push_back(static_cast<std::uint8_t>(0x80u | (opcode & 0x0Fu)));

  const std::size_t size = payload.size();
  if (size <= 125u) {
    frame.push_back(static_cast<std::uint8_t>(0x80u | size));
  } else if (size <= 65535u) {
    frame.push_back(0x80u | 126u);
    frame.push_back(static_cast<std::uint8_t>((size >> 8u) & 0xFFu));
    frame.push_back(static_cast<std::uint8_t>(size & 0xFFu));
  } else {
    frame.push_back(0x80u | 127u);
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<std::uint8_t>((size >> static_cast<std::size_t>(shift)) & 0xFFu));
    }
  }

  std::array<std::uint8_t, 4> mask{};
  if (RAND_bytes(mask.data(), static_cast<int>(mask.size())) != 1) {
    return false;
  }
  frame.insert(frame.end(), mask.begin(), mask.end());
  for (std::size_t i = 0; i < payload.size(); ++i) {
    frame.push_back(static_cast<std::uint8_t>(payload[i]) ^ mask[i % mask.size()]);
  }
  return send_all(frame.data(), frame.size());
}

StreamFrame WebSocketTransport::closed(const std::string &reason) {
  close();
  return StreamFrame{.kind = FrameKind::Closed, .payload = reason};
}

StreamFrame WebSocketTransport::receive(const std::chrono::milliseconds timeout) {
  if (!is_connected()) {
    return StreamFrame{.kind = FrameKind::Closed, .payload = "transport not connected"};
  }

  const bool buffered = !pending_.empty() || (ssl_ != nullptr && SSL_pending(ssl_) > 0);
  if (!buffered) {
    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(fd_, &read_fds);
    const auto wait_ms = std::max<std::int64_t>(0, timeout.count());
    timeval tv{};
    tv.tv_sec = static_cast<long>(wait_ms / 1000);
    tv.tv_usec = static_cast<decltype(tv.tv_usec)>((wait_ms % 1000) * 1000);
    const int ready = select(fd_ + 1, &read_fds, nullptr, nullptr, &tv);
    if (ready < 0) {
      if (errno == EINTR) {
        return StreamFrame{.kind = FrameKind::Idle, .payload = ""};
      }
      return closed(std::string("websocket select failed: ") + std::strerror(errno));
    }
    if (ready == 0) {
      return StreamFrame{.kind = FrameKind::Idle, .payload = ""};
    }
  }

  std::array<std::uint8_t, 2> header{};
  if (!recv_exact(header.data(), header.size())) {
    return closed("connection closed");
  }

  const bool fin = (header[0] & 0x80u) != 0;
  const auto opcode = static_cast<std::uint8_t>(header[0] & 0x0Fu);
  const bool masked = (header[1] & 0x80u) != 0;
  std::uint64_t payload_len = static_cast<std::uint64_t>(header[1] & 0x7Fu);
  if (payload_len == 126u) {
    std::array<std::uint8_t, 2> ext{};
    if (!recv_exact(ext.data(), ext.size())) {
      return closed("websocket frame header failed");
    }
    payload_len = (static_cast<std::uint64_t>(ext[0]) << 8u) | static_cast<std::uint64_t>(ext[1]);
  } else if (payload_len == 127u) {
    std::array<std::uint8_t, 8> ext{};
    if (!recv_exact(ext.data(), ext.size())) {
      return closed("websocket frame header failed");
    }
    payload_len = 0;
    for (const auto byte : ext) {
      payload_len = (payload_len << 8u) | static_cast<std::uint64_t>(byte);
    }
  }
  if (payload_len > kMaxFramePayloadBytes) {
    return closed("websocket frame too large");
  }

  std::array<std::uint8_t, 4> mask{};
  if (masked && !recv_exact(mask.data(), mask.size())) {
    return closed("websocket mask read failed");
  }
  std::vector<std::uint8_t> bytes(static_cast<std::size_t>(payload_len));
  if (!bytes.empty() && !recv_exact(bytes.data(), bytes.size())) {
    return closed("websocket payload read failed");
  }
  if (masked) {
    for (std::size_t i = 0; i < bytes.size(); ++i) {
      bytes[i] ^= mask[i % mask.size()];
    }
  }
  std::string payload(reinterpret_cast<const char *>(bytes.data()), bytes.size());

  switch (opcode) {
  case kOpClose:
    (void)send_frame(kOpClose, "");
    return closed("websocket closed by server");
  case kOpPing:
    if (!send_frame(kOpPong, payload)) {
      return closed("websocket pong send failed");
    }
    return StreamFrame{.kind = FrameKind::Control, .payload = ""};
  case kOpPong:
    return StreamFrame{.kind = FrameKind::Control, .payload = ""};
  case kOpText:
  case kOpBinary:
    if (fin) {
      return StreamFrame{.kind = FrameKind::Text, .payload = std::move(payload)};
    }
    fragments_ = std::move(payload);
    return StreamFrame{.kind = FrameKind::Control, .payload = ""};
  case kOpContinuation:
    fragments_ += payload;
    if (fragments_.size() > kMaxFramePayloadBytes) {
      return closed("websocket message too large");
    }
    if (!fin) {
      return StreamFrame{.kind = FrameKind::Control, .payload = ""};
    }
    return StreamFrame{.kind = FrameKind::Text, .payload = std::exchange(fragments_, {})};
  default:
    return closed("unsupported frame opcode " + std::to_string(opcode));
  }
}

} // namespace unisrv::boot
