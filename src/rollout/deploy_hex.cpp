#include "unisrv/rollout/deploy_hex.hpp"

#include "unisrv/common/fs.hpp"

#include <openssl/rand.h>

#include <array>
#include <climits>

namespace unisrv::rollout {

namespace {

std::string to_hex(const unsigned char *bytes, const std::size_t size) {
  static constexpr char DIGITS[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(DIGITS[bytes[i] >> 4]);
    out.push_back(DIGITS[bytes[i] & 0x0F]);
  }
  return out;
}

bool collides(const std::string &prefix, const std::string &hex,
              const std::vector<std::string> &existing_names) {
  const std::string taken = prefix + hex + "_";
  for (const auto &name : existing_names) {
    if (common::starts_with(name, taken)) {
      return true;
    }
  }
  return false;
}

} // namespace

bool openssl_random_fill(unsigned char *out, const std::size_t size) {
  if (size > static_cast<std::size_t>(INT_MAX)) {
    return false;
  }
  return RAND_bytes(out, static_cast<int>(size)) == 1;
}

common::Result<std::string> generate_deploy_hex(const std::string &prefix,
                                                const std::vector<std::string> &existing_names,
                                                const RandomFill &fill) {
  for (const std::size_t width : {std::size_t{2}, std::size_t{4}}) {
    for (std::size_t attempt = 0; attempt < DEPLOY_HEX_ATTEMPTS; ++attempt) {
      std::array<unsigned char, 4> bytes{};
      if (!fill(bytes.data(), width)) {
        return common::Result<std::string>::failure(
            "Failed to generate deploy identifier: random source unavailable");
      }
      std::string hex = to_hex(bytes.data(), width);
      if (!collides(prefix, hex, existing_names)) {
        return common::Result<std::string>::success(std::move(hex));
      }
    }
  }
  return common::Result<std::string>::failure("Failed to generate a unique deploy identifier for '" +
                                              prefix + "' after " +
                                              std::to_string(DEPLOY_HEX_ATTEMPTS * 2) +
                                              " attempts");
}

std::string replica_name(const std::string &service_name, const std::string &group,
                         const std::string &hex, const std::size_t index) {
  return service_name + "_" + group + "_" + hex + "_" + std::to_string(index);
}

} // namespace unisrv::rollout
