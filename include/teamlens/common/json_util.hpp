#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace teamlens::common {

/// Escape a string for embedding inside a JSON string literal. Invalid UTF-8 becomes U+FFFD.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape the body of a JSON string literal (all RFC 8259 escapes, \u as UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Strict syntax check of a complete JSON document.
[[nodiscard]] bool json_is_valid(const std::string &json);

/// True when the document is a JSON object / array (leading whitespace allowed).
[[nodiscard]] bool json_is_object(const std::string &json);
[[nodiscard]] bool json_is_array(const std::string &json);

/// True for an absent value: empty text or the `null` literal.
[[nodiscard]] bool json_is_null(const std::string &raw);

/// Parse the top level of a JSON object into a key->value map. String values
/// are unescaped; objects, arrays, numbers and literals are kept as raw text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Split a JSON array into raw element texts (strings keep their quotes).
[[nodiscard]] std::vector<std::string> json_split_top_level_values(const std::string &array_json);

/// Turn a raw scalar element into text: quoted strings are unescaped, other
/// tokens are returned trimmed.
[[nodiscard]] std::string json_scalar_text(const std::string &raw);

/// Render a list of strings as a JSON array of strings.
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

} // namespace teamlens::common
