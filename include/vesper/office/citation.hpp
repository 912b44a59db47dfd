#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace vesper::office {

/// Separator between merged citation fragments.
inline constexpr std::string_view CITATION_SEPARATOR = " | ";
/// Prefix added once in front of the merged citation.
inline constexpr std::string_view CITATION_PREFIX = "\xE2\x80\x94 ";

/// Plain text of one citation paragraph: tags, leading dashes and stray
/// `&mdash;` removed, entities decoded, newlines folded to spaces.
[[nodiscard]] std::string clean_citation_fragment(std::string_view raw);

/// Merge every non-empty citation fragment of a section chunk as
/// "— a | b". nullopt when the chunk has none.
[[nodiscard]] std::optional<std::string> extract_citation(std::string_view chunk);

} // namespace vesper::office
