#include "unisrv/http/client.hpp"

#include "unisrv/common/fs.hpp"
#include "unisrv/observability/global.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>

#include <chrono>
#include <optional>
#include <vector>

#ifndef UNISRV_VERSION
#define UNISRV_VERSION "0.1.0"
#endif

namespace unisrv::http {

namespace {

enum class Method { Get, Post, Delete };

const char *method_name(const Method method) {
  switch (method) {
  case Method::Get:
    return "GET";
  case Method::Post:
    return "POST";
  case Method::Delete:
    return "DELETE";
  }
  return "GET";
}

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<Headers *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    (*headers)[key] = common::trim(header.substr(separator + 1));
  }
  return total;
}

HttpResponse execute_request(const Method method, const std::string &url, const Headers &headers,
                             const std::optional<std::string> &body,
                             const std::uint64_t timeout_ms) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  const auto started = std::chrono::steady_clock::now();
  const std::string user_agent = std::string("unisrv/") + UNISRV_VERSION;

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

  if (method == Method::Post) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
  } else if (method == Method::Delete) {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
  }
  if (body.has_value()) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
  }

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (body.has_value() && !headers.contains("Content-Type")) {
    header_list = curl_slist_append(header_list, "Content-Type: application/json");
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    response.network_error_message = curl_easy_strerror(code);
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);

  observability::record_request_latency(
      method_name(method), std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - started));
  return response;
}

} // namespace

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::get(const std::string &url, const Headers &headers,
                                 const std::uint64_t timeout_ms) {
  return execute_request(Method::Get, url, headers, std::nullopt, timeout_ms);
}

HttpResponse CurlHttpClient::post_json(const std::string &url, const Headers &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  return execute_request(Method::Post, url, headers, body, timeout_ms);
}

HttpResponse CurlHttpClient::delete_json(const std::string &url, const Headers &headers,
                                         const std::string &body,
                                         const std::uint64_t timeout_ms) {
  if (body.empty()) {
    return execute_request(Method::Delete, url, headers, std::nullopt, timeout_ms);
  }
  return execute_request(Method::Delete, url, headers, body, timeout_ms);
}

std::string base64_encode(const std::string &input) {
  std::vector<unsigned char> out(4 * ((input.size() + 2) / 3) + 1);
  const int written = EVP_EncodeBlock(out.data(),
                                      reinterpret_cast<const unsigned char *>(input.data()),
                                      static_cast<int>(input.size()));
  return std::string(reinterpret_cast<const char *>(out.data()),
                     static_cast<std::size_t>(written > 0 ? written : 0));
}

std::string basic_auth_header(const std::string &username, const std::string &password) {
  return "Basic " + base64_encode(username + ":" + password);
}

} // namespace unisrv::http
