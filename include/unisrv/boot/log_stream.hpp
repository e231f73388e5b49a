#pragma once

#include "unisrv/boot/transport.hpp"
#include "unisrv/common/result.hpp"

#include <ostream>
#include <string>

namespace unisrv::boot {

/// Prints every event of an instance stream until the server closes it.
/// stdout lines go to `out`; stderr, system and state lines go to `err`.
[[nodiscard]] common::Status follow_logs(EventStreamTransport &transport, const std::string &url,
                                         const http::Headers &headers, std::ostream &out,
                                         std::ostream &err);

} // namespace unisrv::boot
