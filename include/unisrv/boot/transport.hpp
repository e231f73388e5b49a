#pragma once

#include "unisrv/common/result.hpp"
#include "unisrv/http/client.hpp"

#include <chrono>
#include <string>

namespace unisrv::boot {

enum class FrameKind {
  Text,
  /// The receive timeout elapsed with nothing to read.
  Idle,
  /// Ping/pong or another non-data frame that was handled internally.
  Control,
  /// Close frame, EOF or a transport error; `payload` holds the reason.
  Closed,
};

struct StreamFrame {
  FrameKind kind = FrameKind::Idle;
  std::string payload;
};

/// A long-lived, server-push message stream.
class EventStreamTransport {
public:
  virtual ~EventStreamTransport() = default;

  [[nodiscard]] virtual common::Status connect(const std::string &url,
                                               const http::Headers &headers) = 0;
  virtual void close() = 0;
  [[nodiscard]] virtual bool is_connected() const = 0;
  /// Waits at most `timeout`; never fails, errors are reported as Closed.
  [[nodiscard]] virtual StreamFrame receive(std::chrono::milliseconds timeout) = 0;
};

} // namespace unisrv::boot
