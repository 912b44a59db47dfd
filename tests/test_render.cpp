#include "test_framework.hpp"

#include "vesper/common/strings.hpp"
#include "vesper/render/text.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace {

vesper::office::Document sample_document() {
  vesper::office::Document doc;
  doc.title = "Vespers";
  doc.subtitle = "Tuesday";
  doc.sections.push_back({"The Psalm",
                          "**Antiphon**\n\nThe Lord is my shepherd I shall not want he makes me lie "
                          "down in green pastures\n\nAmen.",
                          std::string("\xE2\x80\x94 Psalm 23")});
  doc.sections.push_back({"The Collect", "Keep us, \"Lord\".", std::nullopt});
  return doc;
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

} // namespace

void register_render_tests(std::vector<vesper::tests::TestCase> &tests) {
  using vesper::tests::require;
  namespace r = vesper::render;

  tests.push_back({"render_wrap_words_counts_code_points", [] {
                     const auto lines = r::wrap_words("aa bb cc dd", 5);
                     require(lines == std::vector<std::string>{"aa bb", "cc dd"}, "wrap mismatch");

                     const auto accented = r::wrap_words("\xC3\xA9\xC3\xA9\xC3\xA9 abc", 7);
                     require(accented.size() == 1, "multi-byte letters count as one column");

                     const auto long_word = r::wrap_words("a supercalifragilistic b", 6);
                     require(long_word.size() == 3 && long_word[1] == "supercalifragilistic",
                             "long words get their own line");
                     require(r::wrap_words("   ", 10).empty(), "blank text has no lines");
                   }});

  tests.push_back({"render_text_plain_layout", [] {
                     r::RenderOptions options;
                     options.width = 30;
                     options.color = false;
                     const auto text = r::render_text(sample_document(), options);
                     const auto lines = split_lines(text);

                     require(lines.size() > 6, "expected several lines");
                     require(lines[0] == std::string(11, ' ') + "Vespers", "title should be centred");
                     require(lines[1] == std::string(11, ' ') + "Tuesday",
                             "subtitle should be centred");
                     require(text.find("THE PSALM\n") != std::string::npos,
                             "section titles are upper-cased");
                     require(text.find("**Antiphon**\n") != std::string::npos,
                             "lead-in kept verbatim without colour");
                     for (const auto &line : lines) {
                       require(vesper::common::utf8_length(line) <= 30, "line too wide: " + line);
                     }
                     const std::string citation = "\xE2\x80\x94 Psalm 23";
                     require(text.find(std::string(30 - 10, ' ') + citation + "\n") !=
                                 std::string::npos,
                             "citation should be right-aligned");
                     require(text.find("\x1b[") == std::string::npos, "no escapes without colour");
                   }});

  tests.push_back({"render_text_colour_marks_lead_in_bold", [] {
                     r::RenderOptions options;
                     options.color = true;
                     const auto text = r::render_text(sample_document(), options);
                     require(text.find("\x1b[1mAntiphon\x1b[0m") != std::string::npos,
                             "lead-in should be bold");
                     require(text.find("**Antiphon**") == std::string::npos,
                             "markers are replaced by styling");
                   }});

  tests.push_back({"render_text_empty_office", [] {
                     vesper::office::Document doc;
                     doc.title = "The Divine Hours";
                     r::RenderOptions options;
                     options.color = false;
                     const auto text = r::render_text(doc, options);
                     require(text.find("No data available") != std::string::npos,
                             "empty office should say so");
                   }});

  tests.push_back({"render_json_shape", [] {
                     const auto json = r::render_json(sample_document());
                     require(json.rfind("{\"title\":\"Vespers\",\"subtitle\":\"Tuesday\",\"sections\":[",
                                        0) == 0,
                             "json prefix mismatch: " + json);
                     require(json.find("\"content\":\"Keep us, \\\"Lord\\\".\",\"citation\":null") !=
                                 std::string::npos,
                             "missing citation should be null and quotes escaped");
                     require(json.find("\\n\\nAmen.") != std::string::npos,
                             "newlines should be escaped");
                     require(json.back() == '}', "json should close the object");
                   }});
}
