#include "test_framework.hpp"

#include "vesper/office/citation.hpp"

#include <string>
#include <vector>

namespace {

const std::string EM_DASH = "\xE2\x80\x94";
const std::string EN_DASH = "\xE2\x80\x93";

std::string citation_block(const std::string &text) {
  return "<p class=\"text-sm text-gray-500 italic\">" + text + "</p>";
}

} // namespace

void register_citation_tests(std::vector<vesper::tests::TestCase> &tests) {
  using vesper::tests::require;
  namespace o = vesper::office;

  tests.push_back({"citation_fragment_strips_leading_dashes", [] {
                     require(o::clean_citation_fragment(EM_DASH + " Ps. 1") == "Ps. 1",
                             "em dash should be stripped");
                     require(o::clean_citation_fragment(EN_DASH + "Mark 1:1") == "Mark 1:1",
                             "en dash should be stripped");
                     require(o::clean_citation_fragment("-- John 3:16") == "John 3:16",
                             "hyphens should be stripped");
                     require(o::clean_citation_fragment("Acts 2:1-4") == "Acts 2:1-4",
                             "inner hyphens are kept");
                   }});

  tests.push_back({"citation_fragment_removes_markup_and_artifacts", [] {
                     require(o::clean_citation_fragment("<span>&mdash; Luke 2:14</span>") ==
                                 "Luke 2:14",
                             "encoded mdash decoration should be removed");
                     require(o::clean_citation_fragment("Psalm<!-- --> 23") == "Psalm 23",
                             "comment artifacts should be removed");
                     require(o::clean_citation_fragment("  Book of\nCommon\n\nPrayer &amp; Hymns ") ==
                                 "Book of Common Prayer & Hymns",
                             "newlines should fold and entities decode");
                     require(o::clean_citation_fragment(EM_DASH).empty(),
                             "dash-only fragment is empty");
                   }});

  tests.push_back({"citation_fragment_strips_dash_after_leading_whitespace", [] {
                     require(o::clean_citation_fragment("\n  " + EM_DASH + " Ps. 1") == "Ps. 1",
                             "dash behind a leading newline should still be stripped");
                     require(o::clean_citation_fragment("Ps. 1\n\n\nverse 2") == "Ps. 1 verse 2",
                             "a newline run folds to one space");
                   }});

  tests.push_back({"citation_merges_fragments_with_single_prefix", [] {
                     const std::string chunk =
                         citation_block(EM_DASH + " Ps. 1") + "<div>between</div>" +
                         citation_block(EM_DASH + " Ps. 2");
                     const auto citation = o::extract_citation(chunk);
                     require(citation.has_value(), "citation should be present");
                     require(*citation == EM_DASH + " Ps. 1 | Ps. 2",
                             "merged citation mismatch: " + *citation);
                   }});

  tests.push_back({"citation_absent_without_non_empty_fragment", [] {
                     require(!o::extract_citation("<p>no citation</p>").has_value(),
                             "chunk without citation blocks has none");
                     require(!o::extract_citation(citation_block(" " + EM_DASH + " ") +
                                                  citation_block("<span></span>"))
                                  .has_value(),
                             "empty fragments should be discarded");
                     const auto single =
                         o::extract_citation(citation_block("") + citation_block("Romans 8"));
                     require(single.has_value() && *single == EM_DASH + " Romans 8",
                             "empty fragments should not add separators");
                   }});
}
