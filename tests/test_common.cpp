#include "test_framework.hpp"

#include "unisrv/common/fs.hpp"
#include "unisrv/common/json_util.hpp"
#include "unisrv/common/toml.hpp"
#include "unisrv/common/uuid.hpp"

#include <cstdlib>

void register_common_tests(std::vector<unisrv::tests::TestCase> &tests) {
  using unisrv::tests::require;
  namespace c = unisrv::common;

  tests.push_back({"json_escape_roundtrip_controls_and_quotes", [] {
                     const std::string raw = "line1\nline2\t\"q\" \\ \x01";
                     const std::string escaped = c::json_escape(raw);
                     require(escaped.find("\\u0001") != std::string::npos, "control escaped");
                     require(c::json_unescape(escaped) == raw, "unescape should invert escape");
                   }});

  tests.push_back({"json_unescape_unicode_to_utf8", [] {
                     require(c::json_unescape("caf\\u00e9") == "caf\xc3\xa9", "two-byte utf8");
                     require(c::json_unescape("\\u2705") == "\xe2\x9c\x85", "three-byte utf8");
                   }});

  tests.push_back({"json_unescape_surrogate_pair_is_four_byte_utf8", [] {
                     const auto flat = c::json_parse_flat(R"({"message":"hi \ud83d\ude80"})");
                     require(c::json_flat_get(flat, "message") ==
                                 std::optional<std::string>("hi \xf0\x9f\x9a\x80"),
                             "rocket decoded as one code point");
                     require(c::json_unescape("\\uD83D\\uDE00!") == "\xf0\x9f\x98\x80!",
                             "upper-case hex pair");
                   }});

  tests.push_back({"json_unescape_rejects_malformed_escapes", [] {
                     require(c::json_unescape("a\\u00zzb") == "a\\u00zzb",
                             "partial hex is kept verbatim");
                     require(c::json_unescape("\\u12") == "\\u12", "truncated escape");
                     require(c::json_unescape("\\ud83dx") == "\xef\xbf\xbdx",
                             "lone high surrogate becomes U+FFFD");
                     require(c::json_unescape("\\ude80") == "\xef\xbf\xbd",
                             "lone low surrogate becomes U+FFFD");
                   }});

  tests.push_back({"json_parse_flat_keeps_nested_raw", [] {
                     const auto flat = c::json_parse_flat(
                         R"({"id":"abc","count":3,"nested":{"a":[1,2]},"list":[{"x":1}],"gone":null})");
                     require(flat.at("id") == "abc", "string value");
                     require(flat.at("count") == "3", "number kept as text");
                     require(flat.at("nested") == R"({"a":[1,2]})", "object kept raw");
                     require(flat.at("list") == R"([{"x":1}])", "array kept raw");
                     require(!c::json_flat_get(flat, "gone").has_value(), "null is absent");
                     require(!c::json_flat_get(flat, "missing").has_value(), "missing is absent");
                   }});

  tests.push_back({"json_split_top_level_objects", [] {
                     const auto objects =
                         c::json_split_top_level_objects(R"([{"a":"}"},{"b":{"c":1}}, {}])");
                     require(objects.size() == 3, "three objects expected");
                     require(objects[0] == R"({"a":"}"})", "brace inside string is ignored");
                     require(objects[1] == R"({"b":{"c":1}})", "nested object kept whole");
                   }});

  tests.push_back({"json_getters_find_nested_values", [] {
                     const std::string json = R"({"token":"t1","expires_at":1700,"obj":{"k":"v"},"arr":[1]})";
                     require(c::json_get_object(json, "obj") == R"({"k":"v"})", "object");
                     require(c::json_get_array(json, "arr") == "[1]", "array");
                   }});

  tests.push_back({"json_writer_builds_nested_bodies", [] {
                     c::JsonWriter writer;
                     writer.begin_object();
                     writer.key("name").value("web");
                     writer.key("ratio").value(1.0);
                     writer.key("count").value(static_cast<std::int64_t>(2));
                     writer.key("on").value(true);
                     writer.key("args").string_array({"-c", "x"});
                     writer.key("env").string_map({{"A", "1"}});
                     writer.key("none").null();
                     writer.end_object();
                     require(writer.str() ==
                                 R"({"name":"web","ratio":1.0,"count":2,"on":true,"args":["-c","x"],"env":{"A":"1"},"none":null})",
                             writer.str());
                   }});

  tests.push_back({"toml_sections_and_comments", [] {
                     auto doc = c::parse_toml("# top\n[api]\nhost = \"https://x#y\" # note\n\n[http]\ntimeout_ms = 12\n");
                     require(doc.ok(), doc.error());
                     require(doc.value().get_string("api.host") == "https://x#y",
                             "hash inside quotes kept");
                     require(doc.value().get_u64("http.timeout_ms", 0) == 12, "number value");
                     require(doc.value().get_u64("http.missing", 7) == 7, "fallback");
                   }});

  tests.push_back({"toml_rejects_malformed_lines", [] {
                     require(!c::parse_toml("[api]\njust a line\n").ok(), "missing equals");
                     require(!c::parse_toml("[]\n").ok(), "empty section");
                     require(!c::parse_toml("= 3\n").ok(), "missing key");
                   }});

  tests.push_back({"uuid_forms", [] {
                     require(c::is_uuid("3F2504E0-4F89-11D3-9A0C-0305E82C3301"), "hyphenated");
                     require(c::is_uuid("3f2504e04f8911d39a0c0305e82c3301"), "simple form");
                     require(!c::is_uuid("3f2504e0-4f89"), "too short");
                     require(!c::is_uuid("zf2504e0-4f89-11d3-9a0c-0305e82c3301"), "non-hex");
                     require(c::normalize_uuid("3F2504E04F8911D39A0C0305E82C3301") ==
                                 "3f2504e0-4f89-11d3-9a0c-0305e82c3301",
                             "normalized");
                     require(c::short_id("3f2504e0-4f89-11d3-9a0c-0305e82c3301") == "3f2504e0",
                             "short id");
                     require(c::is_hex_or_hyphen("3f25-04"), "hex prefix");
                     require(!c::is_hex_or_hyphen("web"), "name is not a prefix");
                   }});

  tests.push_back({"string_helpers", [] {
                     require(c::trim("  a b \n") == "a b", "trim");
                     require(c::to_lower("AbC") == "abc", "lower");
                     const auto parts = c::split("a@b@", '@');
                     require(parts.size() >= 2 && parts[0] == "a" && parts[1] == "b", "split");
                     setenv("UNISRV_TEST_DIR", "/tmp/unisrv", 1);
                     require(c::expand_path("$UNISRV_TEST_DIR/x") == "/tmp/unisrv/x",
                             "env expansion");
                     unsetenv("UNISRV_TEST_DIR");
                   }});
}
