#pragma once

#include "unisrv/common/result.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace unisrv::rollout {

/// Fills `size` bytes; returns false when no randomness is available.
using RandomFill = std::function<bool(unsigned char *out, std::size_t size)>;

[[nodiscard]] bool openssl_random_fill(unsigned char *out, std::size_t size);

inline constexpr std::size_t DEPLOY_HEX_ATTEMPTS = 1024;

/// Picks a lower-case hex marker such that no name in `existing_names`
/// starts with `{prefix}{hex}_`. `prefix` is `{service}_{group}_`.
/// Tries 4-digit markers first and widens to 8 digits when those keep
/// colliding.
[[nodiscard]] common::Result<std::string>
generate_deploy_hex(const std::string &prefix, const std::vector<std::string> &existing_names,
                    const RandomFill &fill = openssl_random_fill);

/// `{service}_{group}_{hex}_{index}`
[[nodiscard]] std::string replica_name(const std::string &service_name, const std::string &group,
                                       const std::string &hex, std::size_t index);

} // namespace unisrv::rollout
