#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace leakguard::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string body (\n, \r, \t, \uXXXX and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

struct JsonMember {
  std::string key;
  std::string value;
  bool is_string = false;
};

/// Top-level members of a JSON object, in document order. String values are unescaped; objects
/// and arrays are returned verbatim (including brackets); literals and numbers as written.
using JsonEntries = std::vector<JsonMember>;
[[nodiscard]] JsonEntries json_object_entries(const std::string &json);

/// Member named `field`, or nullptr.
[[nodiscard]] const JsonMember *json_find_member(const JsonEntries &entries,
                                                 const std::string &field);

/// Parse a JSON array of strings like ["a","b"]. Non-string elements are skipped.
[[nodiscard]] std::vector<std::string> json_parse_string_array(const std::string &array_json);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

} // namespace leakguard::common
