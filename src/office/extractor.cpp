#include "vesper/office/extractor.hpp"

#include "vesper/observability/global.hpp"
#include "vesper/office/citation.hpp"
#include "vesper/office/markup.hpp"
#include "vesper/office/normalize.hpp"

#include <exception>

namespace vesper::office {

Document extract_office(std::string_view html) {
  Document document;
  document.title = DEFAULT_TITLE;

  try {
    const auto region = isolate_container(html);

    auto header = extract_header(region);
    document.title = std::move(header.title);
    document.subtitle = std::move(header.subtitle);

    for (const auto chunk : split_sections(region)) {
      const auto fields = extract_section_fields(chunk);
      if (!fields.has_value()) {
        continue;
      }
      Section section;
      section.title = fields->title;
      section.content = normalize_content(compose_raw_content(*fields), fields->title);
      section.citation = extract_citation(chunk);
      document.sections.push_back(std::move(section));
    }
  } catch (const std::exception &e) {
    // Keep whatever was assembled before the scan gave up.
    observability::record_error("office", std::string("extraction stopped: ") + e.what());
  }

  return document;
}

} // namespace vesper::office
