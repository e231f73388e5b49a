#pragma once

#include <string>

namespace unisrv::common {

/// True for the hyphenated 8-4-4-4-12 form or the 32-digit simple form.
[[nodiscard]] bool is_uuid(const std::string &value);

/// Lower-case hyphenated form of a value accepted by is_uuid; input unchanged otherwise.
[[nodiscard]] std::string normalize_uuid(const std::string &value);

[[nodiscard]] std::string short_id(const std::string &id);

[[nodiscard]] bool is_hex_or_hyphen(const std::string &value);

} // namespace unisrv::common
