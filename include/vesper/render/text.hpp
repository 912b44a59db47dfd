#pragma once

#include "vesper/office/document.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace vesper::render {

inline constexpr const char *EMPTY_OFFICE_TEXT = "No data available";

struct RenderOptions {
  std::size_t width = 72;
  bool color = true;
};

/// Greedy word wrap by code point count. Words wider than `width` get a line
/// of their own.
[[nodiscard]] std::vector<std::string> wrap_words(std::string_view text, std::size_t width);

/// Terminal reading view of an office.
[[nodiscard]] std::string render_text(const office::Document &document,
                                      const RenderOptions &options);

[[nodiscard]] std::string render_json(const office::Document &document);

} // namespace vesper::render
