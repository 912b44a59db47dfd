#pragma once

#include "vesper/office/document.hpp"

#include <string_view>

namespace vesper::office {

/// Build the office held by one page of HTML.
///
/// Pure and total: missing markers, headings or blocks fall back to defaults
/// or skip the affected section, and any input (empty, garbage, a page with
/// none of the expected markup) yields a Document. Sections keep page order;
/// only chunks with a non-empty level-2 heading become sections.
[[nodiscard]] Document extract_office(std::string_view html);

} // namespace vesper::office
