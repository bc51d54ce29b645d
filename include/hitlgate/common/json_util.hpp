#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace hitlgate::common {

/// Escape a string for embedding inside a JSON string literal. Control characters other
/// than \n, \r, \t are written as \u00XX.
[[nodiscard]] std::string json_escape(const std::string &value);

/// `"` + json_escape(value) + `"`.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string body (handles the short escapes and \uXXXX as UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Strict syntax check of a complete JSON document (RFC 8259 grammar, any top-level value).
[[nodiscard]] bool json_is_valid(const std::string &json);

/// Parse the top-level members of a JSON object into a key -> raw value text map. Strings keep
/// their quotes so callers can tell "1" from 1.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Raw text of a top-level member ("" when absent). Strings keep their quotes.
[[nodiscard]] std::string json_get_raw(const std::string &json, const std::string &field);

/// Top-level string member, unescaped ("" when absent or not a string).
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Top-level number member as text ("" when absent or not a number).
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

/// Top-level boolean member; `fallback` when absent or not a boolean.
[[nodiscard]] bool json_get_bool(const std::string &json, const std::string &field,
                                 bool fallback = false);

/// Top-level object member including braces ("" when absent).
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

/// Top-level array member including brackets ("" when absent).
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

} // namespace hitlgate::common
