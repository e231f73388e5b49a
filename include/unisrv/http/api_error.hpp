#pragma once

#include "unisrv/common/result.hpp"
#include "unisrv/http/client.hpp"

#include <string>

namespace unisrv::http {

/// One-line description of a failed call to `operation` ("create instance", ...).
[[nodiscard]] std::string describe_http_failure(const HttpResponse &response,
                                                const std::string &operation);

/// Success for 2xx, otherwise the described failure.
[[nodiscard]] common::Status check_response(const HttpResponse &response,
                                            const std::string &operation);

[[nodiscard]] std::string canonical_reason(std::uint16_t status);

} // namespace unisrv::http
