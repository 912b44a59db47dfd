#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace vesper::common {

/// Escape a string for inclusion between JSON double quotes.
[[nodiscard]] std::string json_escape(std::string_view value);
[[nodiscard]] std::string json_unescape(std::string_view value);

[[nodiscard]] std::size_t json_skip_ws(std::string_view json, std::size_t pos);

/// Index of the closing quote of the string whose opening quote is at `open`.
[[nodiscard]] std::size_t json_find_string_end(std::string_view json, std::size_t open);

/// Value of a top-level string field in a flat JSON object, or "" when absent.
[[nodiscard]] std::string json_get_string(std::string_view object, std::string_view key);

/// Literal text of a top-level `true`/`false`/number field, or "" when absent.
[[nodiscard]] std::string json_get_literal(std::string_view object, std::string_view key);

/// Split a JSON array of objects into the text of each object.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(std::string_view array);

} // namespace vesper::common
