#include "vesper/office/entities.hpp"

#include "vesper/common/strings.hpp"

#include <array>
#include <utility>

namespace vesper::office {

namespace {

using EntityMapping = std::pair<std::string_view, std::string_view>;

// Order matters: `&amp;` is decoded after the entities it could otherwise produce.
constexpr std::array<EntityMapping, 11> ENTITY_TABLE = {{
    {"&nbsp;", " "},
    {"&quot;", "\""},
    {"&ldquo;", "\""},
    {"&rdquo;", "\""},
    {"&lsquo;", "'"},
    {"&rsquo;", "'"},
    {"&apos;", "'"},
    {"&amp;", "&"},
    {"&#x27;", "'"},
    {"&#39;", "'"},
    {"&mdash;", "\xE2\x80\x94"},
}};

} // namespace

std::string decode_entities(std::string_view raw) {
  std::string out(raw);
  if (out.find('&') == std::string::npos) {
    return out;
  }
  for (const auto &[entity, literal] : ENTITY_TABLE) {
    common::replace_all(out, entity, literal);
  }
  return out;
}

} // namespace vesper::office
