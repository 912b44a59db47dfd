#include "vesper/office/normalize.hpp"

#include "vesper/common/strings.hpp"
#include "vesper/office/entities.hpp"

#include <cctype>

namespace vesper::office {

namespace {

bool is_break_tag_at(std::string_view text, std::size_t pos, std::size_t &tag_end) {
  if (pos + 3 > text.size() || text[pos] != '<' ||
      std::tolower(static_cast<unsigned char>(text[pos + 1])) != 'b' ||
      std::tolower(static_cast<unsigned char>(text[pos + 2])) != 'r') {
    return false;
  }
  std::size_t cursor = pos + 3;
  while (cursor < text.size() && std::isspace(static_cast<unsigned char>(text[cursor])) != 0) {
    ++cursor;
  }
  if (cursor < text.size() && text[cursor] == '/') {
    ++cursor;
  }
  if (cursor >= text.size() || text[cursor] != '>') {
    return false;
  }
  tag_end = cursor + 1;
  return true;
}

} // namespace

const std::vector<std::string> &prose_section_phrases() {
  static const std::vector<std::string> phrases = {
      "A Reading",
      "The Prayer Appointed for the Week",
      "The Concluding Prayer of the Church",
      "The Collect",
  };
  return phrases;
}

ReflowPolicy reflow_policy_for(std::string_view section_title) {
  for (const auto &phrase : prose_section_phrases()) {
    if (common::contains_icase(section_title, phrase)) {
      return ReflowPolicy::Prose;
    }
  }
  return ReflowPolicy::Verse;
}

bool is_prose_section(std::string_view section_title) {
  return reflow_policy_for(section_title) == ReflowPolicy::Prose;
}

std::string convert_line_breaks(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t pos = 0; pos < text.size();) {
    std::size_t tag_end = 0;
    if (is_break_tag_at(text, pos, tag_end)) {
      out.push_back('\n');
      pos = tag_end;
      continue;
    }
    out.push_back(text[pos++]);
  }
  return out;
}

std::string strip_tags(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t open = text.find('<', pos);
    if (open == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }
    out.append(text.substr(pos, open - pos));
    const std::size_t close = text.find('>', open + 1);
    if (close == std::string_view::npos || close == open + 1) {
      out.push_back('<');
      pos = open + 1;
      continue;
    }
    pos = close + 1;
  }
  return out;
}

std::string reflow_paragraphs(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t pos = 0; pos < text.size();) {
    if (text[pos] != '\n') {
      out.push_back(text[pos++]);
      continue;
    }
    std::size_t run = 0;
    while (pos < text.size() && text[pos] == '\n') {
      ++run;
      ++pos;
    }
    for (std::size_t pair = 0; pair < run / 2; ++pair) {
      out += "\n\n";
    }
    if (run % 2 == 1) {
      out.push_back(' ');
    }
  }
  return out;
}

std::string trim_lines(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::size_t start = 0;
  while (true) {
    const std::size_t newline = text.find('\n', start);
    const auto line = newline == std::string_view::npos ? text.substr(start)
                                                        : text.substr(start, newline - start);
    out += common::trim_horizontal(line);
    if (newline == std::string_view::npos) {
      break;
    }
    out.push_back('\n');
    start = newline + 1;
  }
  return out;
}

std::string cap_blank_lines(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::size_t run = 0;
  for (const char ch : text) {
    if (ch == '\n') {
      if (++run > 2) {
        continue;
      }
    } else {
      run = 0;
    }
    out.push_back(ch);
  }
  return out;
}

std::string normalize_content(std::string_view raw, std::string_view section_title) {
  std::string text = decode_entities(raw);
  text = convert_line_breaks(text);
  text = decode_entities(text);
  text = strip_tags(text);
  common::replace_all(text, "\r\n", "\n");

  // Verse sections are reflowed exactly like prose: wrapped psalm and hymn
  // lines read as paragraphs on narrow screens.
  // TODO: keep verse line breaks once render_text can wrap hanging indents.
  switch (reflow_policy_for(section_title)) {
  case ReflowPolicy::Prose:
  case ReflowPolicy::Verse:
    text = reflow_paragraphs(text);
    break;
  }

  text = trim_lines(text);
  text = cap_blank_lines(text);
  return common::trim(text);
}

} // namespace vesper::office
