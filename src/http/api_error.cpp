#include "unisrv/http/api_error.hpp"

#include "unisrv/common/json_util.hpp"

namespace unisrv::http {

namespace {

std::string reason_from_body(const std::string &body) {
  const auto flat = common::json_parse_flat(body);
  const auto reason = common::json_flat_get(flat, "reason");
  return reason.value_or("");
}

} // namespace

std::string canonical_reason(const std::uint16_t status) {
  switch (status) {
  case 400:
    return "Bad Request";
  case 401:
    return "Unauthorized";
  case 403:
    return "Forbidden";
  case 404:
    return "Not Found";
  case 409:
    return "Conflict";
  case 422:
    return "Unprocessable Entity";
  case 429:
    return "Too Many Requests";
  case 500:
    return "Internal Server Error";
  case 502:
    return "Bad Gateway";
  case 503:
    return "Service Unavailable";
  case 504:
    return "Gateway Timeout";
  default:
    return "Unknown error";
  }
}

std::string describe_http_failure(const HttpResponse &response, const std::string &operation) {
  if (response.network_error || response.timeout) {
    const std::string detail =
        response.network_error_message.empty() ? "request timed out" : response.network_error_message;
    return "Failed to " + operation + ": " + detail;
  }

  const auto status = response.status;
  if (status >= 400 && status < 500) {
    if (const std::string reason = reason_from_body(response.body); !reason.empty()) {
      return operation + ": " + reason;
    }
    if (!response.body.empty()) {
      return "Failed to " + operation + ": client error (" + std::to_string(status) +
             "): " + response.body;
    }
    return "Failed to " + operation + ": " + std::to_string(status) + " - " +
           canonical_reason(status);
  }

  if (status == 503) {
    if (const std::string reason = reason_from_body(response.body); !reason.empty()) {
      return "Service temporarily unavailable: " + reason;
    }
    if (!response.body.empty()) {
      return "Service temporarily unavailable: " + response.body;
    }
    return "Service temporarily unavailable";
  }

  return "Failed to " + operation + ": " + std::to_string(status) + " " +
         canonical_reason(status) + " - " + response.body;
}

common::Status check_response(const HttpResponse &response, const std::string &operation) {
  if (response.success()) {
    return common::Status::success();
  }
  return common::Status::error(describe_http_failure(response, operation));
}

} // namespace unisrv::http
