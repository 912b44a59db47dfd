#include "test_framework.hpp"

#include "office_fixture.hpp"

#include "vesper/office/extractor.hpp"

#include <future>
#include <string>
#include <utility>
#include <vector>

namespace {

const std::string EM_DASH = "\xE2\x80\x94";

std::string single_section_page(const std::string &block) {
  return "<h1>Title</h1><div class=\"prose max-w-none\"><h2>Section</h2>"
         "<div class=\"whitespace-pre-line\">" +
         block + "</div></div>";
}

} // namespace

void register_extractor_tests(std::vector<vesper::tests::TestCase> &tests) {
  using vesper::tests::require;
  namespace o = vesper::office;

  tests.push_back({"extractor_sample_page_document", [] {
                     const auto doc = o::extract_office(vesper::tests::sample_office_page());
                     require(doc.title == "The Morning Office", "title mismatch: " + doc.title);
                     require(doc.subtitle == "Monday, \"Ordinary Time\"",
                             "subtitle mismatch: " + doc.subtitle);
                     require(doc.sections.size() == 3,
                             "expected 3 sections, got " + std::to_string(doc.sections.size()));

                     const auto &call = doc.sections[0];
                     require(call.title == "The Call to Prayer", "first section title mismatch");
                     require(call.content ==
                                 "O Lord, open my lips, and my mouth shall proclaim your praise.",
                             "first section content mismatch: " + call.content);
                     require(call.citation.has_value() && *call.citation == EM_DASH + " Psalm 51:15",
                             "first section citation mismatch");

                     const auto &reading = doc.sections[1];
                     require(reading.title == "A Reading", "second section title mismatch");
                     require(reading.content ==
                                 "**From the Gospel**\n\nJesus said, \"Come to me.\"\n\nHe spoke again.",
                             "reading content mismatch: " + reading.content);
                     require(reading.citation.has_value() &&
                                 *reading.citation == EM_DASH + " Matthew 11:28 | Luke 10",
                             "reading citation mismatch");

                     const auto &collect = doc.sections[2];
                     require(collect.title == "The Collect", "third section title mismatch");
                     require(collect.content == "Almighty God & Father.", "collect content mismatch");
                     require(!collect.citation.has_value(), "collect has no citation");
                   }});

  tests.push_back({"extractor_is_idempotent", [] {
                     const auto page = vesper::tests::sample_office_page();
                     require(o::extract_office(page) == o::extract_office(page),
                             "repeated extraction should be structurally equal");
                   }});

  tests.push_back({"extractor_preserves_heading_order", [] {
                     std::string page = "<h1>Order</h1>";
                     const std::vector<std::string> titles = {"Zeta", "Alpha", "Mu", "Beta"};
                     for (const auto &title : titles) {
                       page += "<div class=\"prose max-w-none\"><h2>" + title + "</h2></div>";
                     }
                     const auto doc = o::extract_office(page);
                     require(doc.sections.size() == titles.size(), "section count mismatch");
                     for (std::size_t i = 0; i < titles.size(); ++i) {
                       require(doc.sections[i].title == titles[i], "order mismatch at " +
                                                                        std::to_string(i));
                     }
                   }});

  tests.push_back({"extractor_falls_back_without_container", [] {
                     const auto doc = o::extract_office(single_section_page("Body"));
                     require(doc.title == "Title", "title should be found in the whole page");
                     require(doc.sections.size() == 1, "the one section should be found");
                     require(doc.sections[0].title == "Section" && doc.sections[0].content == "Body",
                             "section fields mismatch");
                   }});

  tests.push_back({"extractor_empty_and_garbage_input", [] {
                     const auto empty = o::extract_office("");
                     require(empty.title == o::DEFAULT_TITLE, "empty input uses default title");
                     require(empty.subtitle.empty() && empty.empty(), "empty input has no content");

                     const auto garbage = o::extract_office(std::string("\x01\xff<<<>>></h2><h2", 16));
                     require(garbage.title == o::DEFAULT_TITLE && garbage.empty(),
                             "garbage input yields an empty document");

                     const auto markers_only = o::extract_office(
                         "<div class=\"prose max-w-none\"><div class=\"prose max-w-none\">");
                     require(markers_only.empty(), "markers without headings yield no sections");
                   }});

  tests.push_back({"extractor_survives_large_unbalanced_markup", [] {
                     std::string page = "<div class=\"max-w-4xl mx-auto\">";
                     for (int i = 0; i < 20000; ++i) {
                       page += "<div class=\"prose max-w-none\"><h2>";
                     }
                     page += std::string(200000, 'x');
                     const auto doc = o::extract_office(page);
                     require(doc.empty(), "unterminated headings produce no sections");

                     const auto long_block = o::extract_office(
                         single_section_page(std::string(500000, 'a') + "\n" + std::string(10, 'b')));
                     require(long_block.sections.size() == 1 &&
                                 long_block.sections[0].content.size() == 500011,
                             "long content should survive intact");
                   }});

  tests.push_back({"extractor_handles_huge_class_attributes", [] {
                     const std::string padding(150000, 'x');
                     const auto unrelated = o::extract_office(
                         "<h1>T</h1><div class=\"" + padding + "\">body</div>");
                     require(unrelated.title == "T", "title should survive a huge class value");
                     require(unrelated.empty(), "no sections without a section marker");

                     const std::string page =
                         "<div class=\"" + padding + " max-w-4xl  mx-auto " + padding + "\">"
                         "<h1>Long</h1><div class=\"prose max-w-none\"><h2>Psalm</h2>"
                         "<div class=\"" + padding + " whitespace-pre-line\">Sing.</div>"
                         "<p class=\"text-sm " + padding + " text-gray-500 " + padding +
                         " italic\">Ps. 96</p></div></div></div></div></div></main>";
                     const auto doc = o::extract_office(page);
                     require(doc.title == "Long", "title mismatch: " + doc.title);
                     require(doc.sections.size() == 1, "expected one section");
                     require(doc.sections[0].content == "Sing.",
                             "content mismatch: " + doc.sections[0].content);
                     require(doc.sections[0].citation.has_value() &&
                                 *doc.sections[0].citation == EM_DASH + " Ps. 96",
                             "citation should match across padded class tokens");
                   }});

  tests.push_back({"extractor_class_signatures_need_their_tokens", [] {
                     const auto doc = o::extract_office(
                         "<h1>T</h1><div class=\"prose max-w-none\"><h2>S</h2>"
                         "<div class=\"whitespace-pre\">hidden</div>"
                         "<div class=\"whitespace-pre-line\">shown</div>"
                         "<p class=\"italic text-gray-500 text-sm\">wrong order</p></div>");
                     require(doc.sections.size() == 1, "expected one section");
                     require(doc.sections[0].content == "shown",
                             "only line-preserving blocks are content: " + doc.sections[0].content);
                     require(!doc.sections[0].citation.has_value(),
                             "citation classes must appear in order");
                   }});

  tests.push_back({"extractor_decodes_every_known_entity", [] {
                     const std::vector<std::pair<std::string, std::string>> cases = {
                         {"&nbsp;", " "},    {"&quot;", "\""},  {"&ldquo;", "\""},
                         {"&rdquo;", "\""},  {"&lsquo;", "'"},  {"&rsquo;", "'"},
                         {"&apos;", "'"},    {"&amp;", "&"},    {"&#x27;", "'"},
                         {"&#39;", "'"},     {"&mdash;", EM_DASH},
                     };
                     for (const auto &[entity, literal] : cases) {
                       const auto doc = o::extract_office(single_section_page("x" + entity + "y"));
                       require(doc.sections.size() == 1, "section missing for " + entity);
                       const auto &content = doc.sections[0].content;
                       require(content == "x" + literal + "y", entity + " decoded to " + content);
                       require(content.find(entity) == std::string::npos,
                               entity + " left residual entity text");
                     }
                   }});

  tests.push_back({"extractor_is_safe_to_call_concurrently", [] {
                     const auto page = vesper::tests::sample_office_page();
                     const auto expected = o::extract_office(page);
                     std::vector<std::future<o::Document>> futures;
                     for (int i = 0; i < 8; ++i) {
                       futures.push_back(
                           std::async(std::launch::async, [&page] { return o::extract_office(page); }));
                     }
                     for (auto &future : futures) {
                       require(future.get() == expected, "concurrent extraction diverged");
                     }
                   }});
}
