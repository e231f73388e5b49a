#include "unisrv/boot/log_stream.hpp"

#include "unisrv/boot/event.hpp"

namespace unisrv::boot {

common::Status follow_logs(EventStreamTransport &transport, const std::string &url,
                           const http::Headers &headers, std::ostream &out, std::ostream &err) {
  if (const auto connected = transport.connect(url, headers); !connected.ok()) {
    return common::Status::error("Failed to upgrade to WebSocket: " + connected.error());
  }

  while (true) {
    const StreamFrame frame = transport.receive(std::chrono::milliseconds(1000));
    if (frame.kind == FrameKind::Closed) {
      transport.close();
      return common::Status::success();
    }
    if (frame.kind != FrameKind::Text) {
      continue;
    }

    const auto event = parse_boot_event(frame.payload);
    if (!event.ok()) {
      transport.close();
      return common::Status::error(event.error());
    }
    const auto &evt = event.value();
    switch (evt.type) {
    case LogType::Stdout:
      out << evt.message.value_or("") << "\n";
      break;
    case LogType::Stderr:
      err << evt.message.value_or("") << "\n";
      break;
    case LogType::System:
      err << "[Instance] " << format_timestamp(evt.timestamp_ms) << " - "
          << evt.message.value_or("") << "\n";
      break;
    case LogType::State:
      err << boot_state_label(*evt.state) << "\n";
      break;
    }
    out.flush();
  }
}

} // namespace unisrv::boot
