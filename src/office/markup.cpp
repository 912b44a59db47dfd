#include "vesper/office/markup.hpp"

#include "vesper/common/strings.hpp"
#include "vesper/office/document.hpp"
#include "vesper/office/entities.hpp"

#include <cctype>

namespace vesper::office {

namespace {

struct OpenTag {
  std::size_t begin = 0;
  std::size_t end = 0; // one past the closing '>'
  std::string_view text;
};

using ClassSignature = bool (*)(std::string_view class_value);

std::size_t skip_space(std::string_view html, std::size_t pos) {
  while (pos < html.size() && std::isspace(static_cast<unsigned char>(html[pos])) != 0) {
    ++pos;
  }
  return pos;
}

// `max-w-4xl`, at least one whitespace character, then `mx-auto`.
bool container_signature(std::string_view value) {
  constexpr std::string_view WIDTH = "max-w-4xl";
  constexpr std::string_view CENTRED = "mx-auto";
  std::size_t pos = 0;
  while ((pos = value.find(WIDTH, pos)) != std::string_view::npos) {
    pos += WIDTH.size();
    const std::size_t next = skip_space(value, pos);
    if (next > pos && value.substr(next, CENTRED.size()) == CENTRED) {
      return true;
    }
  }
  return false;
}

bool content_signature(std::string_view value) {
  return value.find("whitespace-pre-line") != std::string_view::npos;
}

// `text-sm`, `text-gray-500` and `italic`, in that order.
bool citation_signature(std::string_view value) {
  std::size_t pos = 0;
  for (const std::string_view token : {std::string_view("text-sm"),
                                       std::string_view("text-gray-500"),
                                       std::string_view("italic")}) {
    pos = value.find(token, pos);
    if (pos == std::string_view::npos) {
      return false;
    }
    pos += token.size();
  }
  return true;
}

// True when any `class="..."` value inside the opening tag satisfies `signature`.
bool tag_has_class(std::string_view tag, ClassSignature signature) {
  constexpr std::string_view ATTRIBUTE = "class=\"";
  std::size_t pos = 0;
  while ((pos = tag.find(ATTRIBUTE, pos)) != std::string_view::npos) {
    pos += ATTRIBUTE.size();
    const std::size_t close = tag.find('"', pos);
    if (close == std::string_view::npos) {
      return false;
    }
    if (signature(tag.substr(pos, close - pos))) {
      return true;
    }
    pos = close + 1;
  }
  return false;
}

// Next `<name` (not a longer tag name such as `<pre` for `p`) at or after `from`.
std::optional<OpenTag> next_open_tag(std::string_view html, std::string_view name,
                                     std::size_t from) {
  const std::string needle = "<" + std::string(name);
  std::size_t pos = from;
  while ((pos = html.find(needle, pos)) != std::string_view::npos) {
    const std::size_t after = pos + needle.size();
    if (after < html.size() && std::isalnum(static_cast<unsigned char>(html[after])) != 0) {
      pos = after;
      continue;
    }
    const std::size_t close = html.find('>', after);
    if (close == std::string_view::npos) {
      return std::nullopt;
    }
    return OpenTag{pos, close + 1, html.substr(pos, close + 1 - pos)};
  }
  return std::nullopt;
}

std::optional<OpenTag> next_tag_with_class(std::string_view html, std::string_view name,
                                           std::size_t from, ClassSignature signature) {
  auto tag = next_open_tag(html, name, from);
  while (tag.has_value() && !tag_has_class(tag->text, signature)) {
    tag = next_open_tag(html, name, tag->end);
  }
  return tag;
}

// Inner markup of every `<name class=...>` matching `signature`, each running
// to the nearest closing tag.
std::vector<std::string> collect_blocks(std::string_view html, std::string_view name,
                                        ClassSignature signature) {
  const std::string closer = "</" + std::string(name) + ">";
  std::vector<std::string> blocks;
  std::size_t from = 0;
  while (auto tag = next_tag_with_class(html, name, from, signature)) {
    const std::size_t end = html.find(closer, tag->end);
    if (end == std::string_view::npos) {
      break;
    }
    blocks.emplace_back(html.substr(tag->end, end - tag->end));
    from = end + closer.size();
  }
  return blocks;
}

bool consume(std::string_view html, std::size_t &pos, std::string_view token) {
  if (html.substr(pos, token.size()) != token) {
    return false;
  }
  pos += token.size();
  return true;
}

// True when `</div>` at `pos` is followed by three more `</div>` and `</main>`.
bool closes_main_region(std::string_view html, std::size_t pos) {
  if (!consume(html, pos, "</div>")) {
    return false;
  }
  for (int i = 0; i < 3; ++i) {
    pos = skip_space(html, pos);
    if (!consume(html, pos, "</div>")) {
      return false;
    }
  }
  pos = skip_space(html, pos);
  return consume(html, pos, "</main>");
}

// Text-only `<p>` sitting directly after one of the `</h1>` tags that follow
// the first `<h1>`.
std::optional<std::string> paragraph_after_title(std::string_view region) {
  const auto heading = next_open_tag(region, "h1", 0);
  if (!heading.has_value()) {
    return std::nullopt;
  }

  constexpr std::string_view HEADING_CLOSE = "</h1>";
  std::size_t pos = heading->end;
  while ((pos = region.find(HEADING_CLOSE, pos)) != std::string_view::npos) {
    pos += HEADING_CLOSE.size();
    const std::size_t start = skip_space(region, pos);
    const auto paragraph = next_open_tag(region, "p", start);
    if (!paragraph.has_value() || paragraph->begin != start) {
      continue;
    }
    const std::size_t text_end = region.find('<', paragraph->end);
    if (text_end == std::string_view::npos || text_end == paragraph->end) {
      continue;
    }
    if (region.substr(text_end, 4) == "</p>") {
      return common::trim(region.substr(paragraph->end, text_end - paragraph->end));
    }
  }
  return std::nullopt;
}

std::string decode_trimmed(std::string_view raw) {
  return common::trim(decode_entities(raw));
}

} // namespace

std::string_view isolate_container(std::string_view html) {
  const auto wrapper = next_tag_with_class(html, "div", 0, container_signature);
  if (!wrapper.has_value()) {
    return html;
  }

  std::size_t pos = wrapper->end;
  while ((pos = html.find("</div>", pos)) != std::string_view::npos) {
    if (closes_main_region(html, pos)) {
      return html.substr(wrapper->end, pos - wrapper->end);
    }
    ++pos;
  }
  return html;
}

Header extract_header(std::string_view region) {
  Header header;
  header.title = decode_trimmed(first_heading_text(region, "h1").value_or(DEFAULT_TITLE));
  header.subtitle = decode_trimmed(paragraph_after_title(region).value_or(""));
  return header;
}

std::vector<std::string_view> split_sections(std::string_view region) {
  std::vector<std::string_view> chunks;
  std::size_t pos = region.find(SECTION_MARKER);
  while (pos != std::string_view::npos) {
    const std::size_t begin = pos + SECTION_MARKER.size();
    const std::size_t next = region.find(SECTION_MARKER, begin);
    chunks.push_back(next == std::string_view::npos ? region.substr(begin)
                                                    : region.substr(begin, next - begin));
    pos = next;
  }
  return chunks;
}

std::optional<std::string> first_heading_text(std::string_view html, std::string_view name) {
  const std::string closer = "</" + std::string(name) + ">";
  std::size_t from = 0;
  while (auto tag = next_open_tag(html, name, from)) {
    const std::size_t text_end = html.find('<', tag->end);
    if (text_end == std::string_view::npos) {
      return std::nullopt;
    }
    if (text_end > tag->end && html.substr(text_end, closer.size()) == closer) {
      return common::trim(html.substr(tag->end, text_end - tag->end));
    }
    from = tag->end;
  }
  return std::nullopt;
}

std::optional<SectionFields> extract_section_fields(std::string_view chunk) {
  const auto heading = first_heading_text(chunk, "h2");
  if (!heading.has_value()) {
    return std::nullopt;
  }

  SectionFields fields;
  fields.title = decode_trimmed(*heading);
  if (fields.title.empty()) {
    return std::nullopt;
  }
  fields.subheader = decode_trimmed(first_heading_text(chunk, "h3").value_or(""));
  fields.content_blocks = collect_blocks(chunk, "div", content_signature);
  return fields;
}

std::string compose_raw_content(const SectionFields &fields) {
  std::string raw;
  if (!fields.subheader.empty()) {
    raw += "**" + fields.subheader + "**\n\n";
  }
  for (std::size_t i = 0; i < fields.content_blocks.size(); ++i) {
    if (i > 0) {
      raw += "\n\n";
    }
    raw += fields.content_blocks[i];
  }
  return raw;
}

std::vector<std::string> find_citation_blocks(std::string_view chunk) {
  return collect_blocks(chunk, "p", citation_signature);
}

} // namespace vesper::office
