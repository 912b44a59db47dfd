#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace vesper::office {

enum class ReflowPolicy { Prose, Verse };

/// Title phrases that mark a section as continuous prose.
[[nodiscard]] const std::vector<std::string> &prose_section_phrases();

/// Prose when the title contains one of prose_section_phrases() (ASCII
/// case-insensitive), Verse otherwise.
[[nodiscard]] ReflowPolicy reflow_policy_for(std::string_view section_title);
[[nodiscard]] bool is_prose_section(std::string_view section_title);

/// `<br>`, `<br/>`, `<br />` (any case) become newlines.
[[nodiscard]] std::string convert_line_breaks(std::string_view text);

/// Remove every `<...>` tag (at least one character between the brackets).
[[nodiscard]] std::string strip_tags(std::string_view text);

/// Within each run of newlines every pair becomes a paragraph break and a
/// leftover single newline becomes a space: "a\nb\n\nc" -> "a b\n\nc".
[[nodiscard]] std::string reflow_paragraphs(std::string_view text);

/// Trim horizontal whitespace at both ends of every line.
[[nodiscard]] std::string trim_lines(std::string_view text);

/// Collapse runs of three or more newlines down to exactly two.
[[nodiscard]] std::string cap_blank_lines(std::string_view text);

/// Full content pipeline for one section: entities, breaks, tags, reflow,
/// line trim, newline cap, outer trim.
[[nodiscard]] std::string normalize_content(std::string_view raw, std::string_view section_title);

} // namespace vesper::office
