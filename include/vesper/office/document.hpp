#pragma once

#include <optional>
#include <string>
#include <vector>

namespace vesper::office {

/// Title used when the page carries no level-1 heading.
inline constexpr const char *DEFAULT_TITLE = "The Divine Hours";

struct Section {
  std::string title;
  std::string content;
  std::optional<std::string> citation;

  bool operator==(const Section &) const = default;
};

/// One office (the prayer document for a time of day). Built once per
/// extraction and never modified afterwards.
struct Document {
  std::string title;
  std::string subtitle;
  std::vector<Section> sections;

  [[nodiscard]] bool empty() const { return sections.empty(); }

  bool operator==(const Document &) const = default;
};

} // namespace vesper::office
