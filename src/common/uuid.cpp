#include "unisrv/common/uuid.hpp"

#include "unisrv/common/fs.hpp"

#include <cctype>

namespace unisrv::common {

namespace {

bool all_hex(const std::string &value) {
  for (const char ch : value) {
    if (std::isxdigit(static_cast<unsigned char>(ch)) == 0) {
      return false;
    }
  }
  return true;
}

} // namespace

bool is_uuid(const std::string &value) {
  if (value.size() == 32) {
    return all_hex(value);
  }
  if (value.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (ch != '-') {
        return false;
      }
      continue;
    }
    if (std::isxdigit(static_cast<unsigned char>(ch)) == 0) {
      return false;
    }
  }
  return true;
}

std::string normalize_uuid(const std::string &value) {
  if (!is_uuid(value)) {
    return value;
  }
  const std::string lower = to_lower(value);
  if (lower.size() == 36) {
    return lower;
  }
  return lower.substr(0, 8) + "-" + lower.substr(8, 4) + "-" + lower.substr(12, 4) + "-" +
         lower.substr(16, 4) + "-" + lower.substr(20);
}

std::string short_id(const std::string &id) { return id.size() > 8 ? id.substr(0, 8) : id; }

bool is_hex_or_hyphen(const std::string &value) {
  if (value.empty()) {
    return false;
  }
  for (const char ch : value) {
    if (ch != '-' && std::isxdigit(static_cast<unsigned char>(ch)) == 0) {
      return false;
    }
  }
  return true;
}

} // namespace unisrv::common
