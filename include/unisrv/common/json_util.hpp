#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace unisrv::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string body (no surrounding quotes).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Field lookups search the whole document; use json_parse_flat for top-level-only access.
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Parse a JSON object into a top-level key -> value map. String values are
/// unescaped; objects, arrays and literals are kept as raw JSON text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Value of `key` in a flat map, or nullopt when missing or JSON null.
[[nodiscard]] std::optional<std::string> json_flat_get(const JsonFlatMap &map,
                                                       const std::string &key);

/// Incremental writer for request bodies.
class JsonWriter {
public:
  JsonWriter &begin_object();
  JsonWriter &end_object();
  JsonWriter &key(const std::string &name);
  JsonWriter &value(const std::string &text);
  JsonWriter &value(const char *text);
  JsonWriter &value(std::int64_t number);
  JsonWriter &value(double number);
  JsonWriter &value(bool flag);
  JsonWriter &null();
  JsonWriter &string_array(const std::vector<std::string> &values);
  JsonWriter &string_map(const std::map<std::string, std::string> &values);

  [[nodiscard]] const std::string &str() const { return out_; }

private:
  void separate();

  std::string out_;
  std::vector<bool> first_in_scope_;
  bool after_key_ = false;
};

} // namespace unisrv::common
