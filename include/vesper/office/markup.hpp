#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vesper::office {

/// Attribute text that opens every section body on the source page.
inline constexpr std::string_view SECTION_MARKER = "class=\"prose max-w-none\"";

struct Header {
  std::string title;
  std::string subtitle;
};

/// Raw pieces recovered from one section chunk, before normalization.
struct SectionFields {
  std::string title;
  std::string subheader;
  std::vector<std::string> content_blocks;
};

/// Narrow a page to its centred main-content region. Returns the whole input
/// when the wrapper (or its closing `</div>`x4 `</main>` run) is not found.
[[nodiscard]] std::string_view isolate_container(std::string_view html);

/// Title is the first `<h1>` text (DEFAULT_TITLE when absent); subtitle is the
/// paragraph directly after it (empty when absent). Both decoded and trimmed.
[[nodiscard]] Header extract_header(std::string_view region);

/// Split on SECTION_MARKER, dropping the preamble before the first marker.
[[nodiscard]] std::vector<std::string_view> split_sections(std::string_view region);

/// First `<name ...>TEXT</name>` where TEXT holds no markup, trimmed but not
/// decoded. nullopt when no such heading exists.
[[nodiscard]] std::optional<std::string> first_heading_text(std::string_view html,
                                                            std::string_view name);

/// nullopt when the chunk has no level-2 heading or the heading decodes to
/// nothing; such chunks are boilerplate and skipped.
[[nodiscard]] std::optional<SectionFields> extract_section_fields(std::string_view chunk);

/// Subheader lead-in (`**sub**` and a blank line) followed by the content
/// blocks joined with blank lines.
[[nodiscard]] std::string compose_raw_content(const SectionFields &fields);

/// Inner markup of every muted-italic citation paragraph, in page order.
[[nodiscard]] std::vector<std::string> find_citation_blocks(std::string_view chunk);

} // namespace vesper::office
