#pragma once

#include "unisrv/api/types.hpp"
#include "unisrv/common/fs.hpp"
#include "unisrv/common/result.hpp"
#include "unisrv/common/uuid.hpp"

#include <string>
#include <vector>

namespace unisrv::api {

/// Resolves a full id, an exact name or a unique id prefix to an id. A
/// well-formed id is returned without checking that it exists; a name shared
/// by several items falls through to prefix matching. `kind`
/// ("service", "instance", ...) only shapes the error text.
template <typename T>
[[nodiscard]] common::Result<std::string> resolve_id(const std::string &input,
                                                     const std::vector<T> &items,
                                                     const std::string &kind) {
  using R = common::Result<std::string>;
  const std::string trimmed = common::trim(input);
  if (common::is_uuid(trimmed)) {
    return R::success(common::normalize_uuid(trimmed));
  }

  std::vector<const T *> named;
  for (const auto &item : items) {
    const auto name = display_name(item);
    if (name.has_value() && *name == trimmed) {
      named.push_back(&item);
    }
  }
  if (named.size() == 1) {
    return R::success(named.front()->id);
  }

  if (common::is_hex_or_hyphen(trimmed)) {
    const std::string prefix = common::to_lower(trimmed);
    std::vector<const T *> matches;
    for (const auto &item : items) {
      if (common::starts_with(common::to_lower(item.id), prefix)) {
        matches.push_back(&item);
      }
    }
    if (matches.size() == 1) {
      return R::success(matches.front()->id);
    }
    if (matches.empty()) {
      return R::failure("No " + kind + " found matching '" + trimmed + "'");
    }
    return R::failure("Ambiguous: " + std::to_string(matches.size()) + " " + kind +
                      "s match prefix '" + trimmed + "'. Be more specific.");
  }

  return R::failure("No " + kind + " found with name or id '" + trimmed + "'");
}

} // namespace unisrv::api
