#include "test_framework.hpp"

#include "vesper/office/normalize.hpp"

#include <string>
#include <vector>

void register_normalize_tests(std::vector<vesper::tests::TestCase> &tests) {
  using vesper::tests::require;
  namespace o = vesper::office;

  tests.push_back({"normalize_line_break_variants", [] {
                     require(o::convert_line_breaks("a<br>b<BR/>c<br />d<Br  >e") ==
                                 "a\nb\nc\nd\ne",
                             "all break spellings should become newlines");
                     require(o::convert_line_breaks("<b>bold</b><brief>") == "<b>bold</b><brief>",
                             "other tags starting with b are not breaks");
                   }});

  tests.push_back({"normalize_strip_tags", [] {
                     require(o::strip_tags("<b>bold</b> and <i class=\"x\">it</i>") == "bold and it",
                             "tags should be removed");
                     require(o::strip_tags("a <> b") == "a <> b", "empty brackets are not a tag");
                     require(o::strip_tags("1 < 2") == "1 < 2", "unterminated '<' is kept");
                   }});

  tests.push_back({"normalize_reflow_collapses_single_newlines", [] {
                     require(o::reflow_paragraphs("Line one\nLine two\n\nLine three") ==
                                 "Line one Line two\n\nLine three",
                             "single newline should fold, double should stay");
                     require(o::reflow_paragraphs("a\n\n\nb") == "a\n\n b",
                             "odd leftover newline becomes a space");
                     require(o::reflow_paragraphs("no breaks") == "no breaks",
                             "text without newlines is untouched");
                   }});

  tests.push_back({"normalize_trim_lines_and_cap", [] {
                     require(o::trim_lines("  a \t\n\xC2\xA0" "b\xC2\xA0") == "a\nb",
                             "per-line trim should remove spaces, tabs and nbsp");
                     require(o::cap_blank_lines("a\n\n\n\n\nb\n\nc") == "a\n\nb\n\nc",
                             "newline runs should cap at two");
                   }});

  tests.push_back({"normalize_content_reflow_example", [] {
                     require(o::normalize_content("Line one\nLine two\n\nLine three", "Psalm 23") ==
                                 "Line one Line two\n\nLine three",
                             "reflow example mismatch");
                   }});

  tests.push_back({"normalize_content_breaks_tags_and_entities", [] {
                     require(o::normalize_content("first<br><br>second<br>third", "The Collect") ==
                                 "first\n\nsecond third",
                             "break markers should reflow like newlines");
                     require(o::normalize_content("<em>Glory</em> to God<br/>\n   in the highest",
                                                  "Gloria") == "Glory to God\n\nin the highest",
                             "break followed by a source newline is a paragraph break");
                     require(o::normalize_content("Fish &amp;amp; chips", "Grace") == "Fish & chips",
                             "doubly escaped entities should decode fully");
                     require(o::normalize_content("a\r\nb", "Psalm") == "a b",
                             "CRLF should fold like a single newline");
                     require(o::normalize_content("  \n\n  ", "Psalm").empty(),
                             "whitespace-only content should normalize to empty");
                   }});

  tests.push_back({"normalize_content_never_has_three_newlines", [] {
                     for (int count = 1; count <= 9; ++count) {
                       const std::string raw = "a" + std::string(static_cast<std::size_t>(count), '\n') +
                                               "b<br><br><br><br>c \n \n \n d";
                       const auto out = o::normalize_content(raw, "Psalm");
                       require(out.find("\n\n\n") == std::string::npos,
                               "three newlines found for run of " + std::to_string(count));
                       require(out.front() != ' ' && out.back() != ' ', "output should be trimmed");
                     }
                   }});

  tests.push_back({"normalize_prose_classification_does_not_change_output", [] {
                     require(o::is_prose_section("A Reading from Romans"), "reading is prose");
                     require(o::is_prose_section("the collect"), "match is case-insensitive");
                     require(o::is_prose_section("The Prayer Appointed for the Week"),
                             "appointed prayer is prose");
                     require(!o::is_prose_section("Psalm 23"), "psalm is verse");
                     require(o::reflow_policy_for("Psalm 23") == o::ReflowPolicy::Verse,
                             "psalm policy should be verse");

                     const std::string raw = "The Lord is my shepherd;\nI shall not want.\n\nAmen.";
                     require(o::normalize_content(raw, "A Reading") ==
                                 o::normalize_content(raw, "Psalm 23"),
                             "prose and verse sections reflow identically");
                   }});
}
