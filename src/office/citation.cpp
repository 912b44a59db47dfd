#include "vesper/office/citation.hpp"

#include "vesper/common/strings.hpp"
#include "vesper/office/entities.hpp"
#include "vesper/office/markup.hpp"
#include "vesper/office/normalize.hpp"

#include <array>
#include <vector>

namespace vesper::office {

namespace {

constexpr std::array<std::string_view, 3> LEADING_DASHES = {
    "\xE2\x80\x94", // em dash
    "\xE2\x80\x93", // en dash
    "-",
};

std::string_view strip_leading_dashes(std::string_view text) {
  bool stripped = false;
  bool progressed = true;
  while (progressed) {
    progressed = false;
    for (const auto dash : LEADING_DASHES) {
      if (common::starts_with(text, dash)) {
        text.remove_prefix(dash.size());
        stripped = true;
        progressed = true;
      }
    }
  }
  if (stripped) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\n' ||
                             text.front() == '\r')) {
      text.remove_prefix(1);
    }
  }
  return text;
}

std::string fold_newlines(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t pos = 0; pos < text.size();) {
    if (text[pos] == '\n' || text[pos] == '\r') {
      while (pos < text.size() && (text[pos] == '\n' || text[pos] == '\r')) {
        ++pos;
      }
      out.push_back(' ');
      continue;
    }
    out.push_back(text[pos++]);
  }
  return out;
}

} // namespace

std::string clean_citation_fragment(std::string_view raw) {
  const std::string plain = common::trim(strip_tags(raw));
  std::string text(strip_leading_dashes(plain));
  common::replace_all(text, "&mdash;", "");
  common::replace_all(text, "<!-- -->", "");
  text = common::trim(decode_entities(common::trim(text)));
  return fold_newlines(text);
}

std::optional<std::string> extract_citation(std::string_view chunk) {
  std::vector<std::string> fragments;
  for (const auto &block : find_citation_blocks(chunk)) {
    auto fragment = clean_citation_fragment(block);
    if (!fragment.empty()) {
      fragments.push_back(std::move(fragment));
    }
  }
  if (fragments.empty()) {
    return std::nullopt;
  }

  std::string citation(CITATION_PREFIX);
  for (std::size_t i = 0; i < fragments.size(); ++i) {
    if (i > 0) {
      citation += CITATION_SEPARATOR;
    }
    citation += fragments[i];
  }
  return citation;
}

} // namespace vesper::office
