#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace vesper::common {

/// Trim ASCII whitespace (spaces, tabs, newlines) from both ends.
[[nodiscard]] std::string trim(std::string_view value);

/// Trim spaces, tabs and the UTF-8 no-break space, leaving newlines intact.
[[nodiscard]] std::string trim_horizontal(std::string_view value);

[[nodiscard]] std::string to_lower(std::string_view value);
[[nodiscard]] std::string to_upper(std::string_view value);

[[nodiscard]] bool starts_with(std::string_view value, std::string_view prefix);

/// ASCII case-insensitive substring test.
[[nodiscard]] bool contains_icase(std::string_view haystack, std::string_view needle);

/// Replace every occurrence of `from` in `value`. An empty `from` is a no-op.
void replace_all(std::string &value, std::string_view from, std::string_view to);

[[nodiscard]] bool is_valid_utf8(std::string_view bytes);

/// Number of code points in a UTF-8 string (continuation bytes are not counted).
[[nodiscard]] std::size_t utf8_length(std::string_view value);

} // namespace vesper::common
