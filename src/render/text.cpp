#include "vesper/render/text.hpp"

#include "vesper/common/json_util.hpp"
#include "vesper/common/strings.hpp"

#include <sstream>

namespace vesper::render {

namespace {

constexpr const char *RESET = "\033[0m";
constexpr const char *BOLD = "\033[1m";
constexpr const char *DIM = "\033[2m";
constexpr const char *ITALIC = "\033[3m";

std::string pad_left(const std::string &text, const std::size_t columns) {
  return std::string(columns, ' ') + text;
}

std::string centered(const std::string &text, const std::size_t width) {
  const std::size_t length = common::utf8_length(text);
  if (length >= width) {
    return text;
  }
  return pad_left(text, (width - length) / 2);
}

std::string right_aligned(const std::string &text, const std::size_t width) {
  const std::size_t length = common::utf8_length(text);
  if (length >= width) {
    return text;
  }
  return pad_left(text, width - length);
}

std::string styled(const std::string &text, const char *style, const bool color) {
  if (!color) {
    return text;
  }
  return std::string(style) + text + RESET;
}

std::vector<std::string> split_paragraphs(const std::string &content) {
  std::vector<std::string> paragraphs;
  std::size_t start = 0;
  while (start <= content.size()) {
    const auto next = content.find("\n\n", start);
    const auto end = next == std::string::npos ? content.size() : next;
    auto paragraph = common::trim(std::string_view(content).substr(start, end - start));
    if (!paragraph.empty()) {
      paragraphs.push_back(std::move(paragraph));
    }
    if (next == std::string::npos) {
      break;
    }
    start = next + 2;
  }
  return paragraphs;
}

bool is_lead_in(const std::string &paragraph) {
  return paragraph.size() > 4 && common::starts_with(paragraph, "**") &&
         paragraph.compare(paragraph.size() - 2, 2, "**") == 0 &&
         paragraph.find('\n') == std::string::npos;
}

void render_paragraph(std::ostringstream &out, const std::string &paragraph,
                      const RenderOptions &options) {
  if (is_lead_in(paragraph)) {
    if (options.color) {
      out << BOLD << paragraph.substr(2, paragraph.size() - 4) << RESET << "\n";
    } else {
      out << paragraph << "\n";
    }
    return;
  }

  std::size_t line_start = 0;
  while (line_start <= paragraph.size()) {
    const auto newline = paragraph.find('\n', line_start);
    const auto line_end = newline == std::string::npos ? paragraph.size() : newline;
    const auto line = std::string_view(paragraph).substr(line_start, line_end - line_start);
    for (const auto &wrapped : wrap_words(line, options.width)) {
      out << wrapped << "\n";
    }
    if (newline == std::string::npos) {
      break;
    }
    line_start = newline + 1;
  }
}

void render_citation(std::ostringstream &out, const std::string &citation,
                     const RenderOptions &options) {
  for (const auto &line : wrap_words(citation, options.width)) {
    out << styled(right_aligned(line, options.width), DIM, options.color) << "\n";
  }
}

} // namespace

std::vector<std::string> wrap_words(std::string_view text, const std::size_t width) {
  std::vector<std::string> lines;
  std::string current;
  std::size_t current_length = 0;

  std::size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
      ++pos;
    }
    const auto word_start = pos;
    while (pos < text.size() && text[pos] != ' ' && text[pos] != '\t') {
      ++pos;
    }
    if (word_start == pos) {
      break;
    }
    const auto word = text.substr(word_start, pos - word_start);
    const auto word_length = common::utf8_length(word);

    if (current.empty()) {
      current.assign(word);
      current_length = word_length;
    } else if (current_length + 1 + word_length <= width) {
      current += ' ';
      current.append(word);
      current_length += 1 + word_length;
    } else {
      lines.push_back(std::move(current));
      current.assign(word);
      current_length = word_length;
    }
  }
  if (!current.empty()) {
    lines.push_back(std::move(current));
  }
  return lines;
}

std::string render_text(const office::Document &document, const RenderOptions &options) {
  std::ostringstream out;

  out << styled(centered(document.title, options.width), BOLD, options.color) << "\n";
  if (!document.subtitle.empty()) {
    out << styled(centered(document.subtitle, options.width), ITALIC, options.color) << "\n";
  }
  out << "\n";

  if (document.empty()) {
    out << centered(EMPTY_OFFICE_TEXT, options.width) << "\n";
    return out.str();
  }

  bool first = true;
  for (const auto &section : document.sections) {
    if (!first) {
      out << "\n";
    }
    first = false;

    out << styled(common::to_upper(section.title), BOLD, options.color) << "\n\n";

    bool first_paragraph = true;
    for (const auto &paragraph : split_paragraphs(section.content)) {
      if (!first_paragraph) {
        out << "\n";
      }
      first_paragraph = false;
      render_paragraph(out, paragraph, options);
    }

    if (section.citation.has_value()) {
      out << "\n";
      render_citation(out, *section.citation, options);
    }
  }
  return out.str();
}

std::string render_json(const office::Document &document) {
  std::ostringstream out;
  out << "{\"title\":\"" << common::json_escape(document.title) << "\",\"subtitle\":\""
      << common::json_escape(document.subtitle) << "\",\"sections\":[";
  for (std::size_t i = 0; i < document.sections.size(); ++i) {
    const auto &section = document.sections[i];
    if (i > 0) {
      out << ",";
    }
    out << "{\"title\":\"" << common::json_escape(section.title) << "\",\"content\":\""
        << common::json_escape(section.content) << "\",\"citation\":";
    if (section.citation.has_value()) {
      out << "\"" << common::json_escape(*section.citation) << "\"";
    } else {
      out << "null";
    }
    out << "}";
  }
  out << "]}";
  return out.str();
}

} // namespace vesper::render
