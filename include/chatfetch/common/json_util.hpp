#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chatfetch::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string (handles the short escapes and \uXXXX, including surrogate pairs).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Find the position of a JSON key in a JSON string.
[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Extract a string field value from a JSON document (first occurrence, any depth).
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Extract a numeric field value (as string) from a JSON document.
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

/// Extract a nested JSON object field (including braces) from a JSON document.
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

/// Parse a flat JSON object into a key→value map (top-level only; nested values kept raw).
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Like json_parse_flat, but string values keep their quotes and escapes so a string
/// can be told apart from a literal of the same spelling.
[[nodiscard]] JsonFlatMap json_parse_flat_raw(const std::string &json);

/// Text of a json_parse_flat_raw value: strings unescaped, literals and nested values
/// as written. A JSON null has none.
[[nodiscard]] std::optional<std::string> json_flat_text(const std::string &raw_value);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// True when text (ignoring surrounding whitespace) is one complete {...} object.
[[nodiscard]] bool json_is_complete_object(const std::string &text);

/// Drop insignificant whitespace so the document fits on one line.
[[nodiscard]] std::string json_compact(const std::string &json);

} // namespace chatfetch::common
