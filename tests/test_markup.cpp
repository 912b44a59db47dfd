#include "test_framework.hpp"

#include "vesper/office/document.hpp"
#include "vesper/office/markup.hpp"

#include <string>
#include <vector>

namespace {

const std::string WRAPPED_PAGE =
    "<header><h1>Site Navigation</h1></header>\n"
    "<main><div class=\"container\"><div class=\"grid\"><div class=\"col\">\n"
    "<div class=\"px-4 max-w-4xl mx-auto py-8\"><h1>Office</h1></div>\n"
    "</div> </div>\n</div></main>\n"
    "<footer><h1>Footer</h1></footer>";

} // namespace

void register_markup_tests(std::vector<vesper::tests::TestCase> &tests) {
  using vesper::tests::require;
  namespace o = vesper::office;

  tests.push_back({"markup_isolate_container_returns_wrapped_region", [] {
                     require(o::isolate_container(WRAPPED_PAGE) == "<h1>Office</h1>",
                             "region should be the wrapper's inner markup");
                   }});

  tests.push_back({"markup_isolate_container_falls_back_to_whole_input", [] {
                     const std::string no_wrapper = "<main><div class=\"mx-auto\">x</div></main>";
                     require(o::isolate_container(no_wrapper) == no_wrapper,
                             "missing wrapper should return the input");

                     const std::string unclosed =
                         "<div class=\"max-w-4xl mx-auto\"><h1>T</h1></div></main>";
                     require(o::isolate_container(unclosed) == unclosed,
                             "missing closing run should return the input");

                     require(o::isolate_container("").empty(), "empty input stays empty");
                   }});

  tests.push_back({"markup_extract_header_decodes_and_trims", [] {
                     const auto header = o::extract_header(
                         "<h1 class=\"text-3xl\"> Morning &amp; Evening </h1>\n"
                         "  <p class=\"sub\"> Monday, &ldquo;Week 3&rdquo; </p>");
                     require(header.title == "Morning & Evening", "title mismatch: " + header.title);
                     require(header.subtitle == "Monday, \"Week 3\"",
                             "subtitle mismatch: " + header.subtitle);
                   }});

  tests.push_back({"markup_extract_header_defaults", [] {
                     const auto empty = o::extract_header("");
                     require(empty.title == o::DEFAULT_TITLE, "missing h1 should use default title");
                     require(empty.subtitle.empty(), "missing subtitle should be empty");

                     const auto nested = o::extract_header("<h1><span>Styled</span></h1>");
                     require(nested.title == o::DEFAULT_TITLE,
                             "heading with inner markup is not a plain title");

                     const auto separated =
                         o::extract_header("<h1>Title</h1><div>gap</div><p>Not a subtitle</p>");
                     require(separated.title == "Title", "title should still be found");
                     require(separated.subtitle.empty(),
                             "paragraph not directly after the title is not a subtitle");
                   }});

  tests.push_back({"markup_first_heading_respects_tag_names", [] {
                     const auto text = o::first_heading_text("<pre>code</pre><p> para </p>", "p");
                     require(text.has_value() && *text == "para", "<pre> must not match <p>");
                     require(!o::first_heading_text("<h2></h2>", "h2").has_value(),
                             "empty heading has no text");
                   }});

  tests.push_back({"markup_split_sections_drops_preamble", [] {
                     const std::string region = "<div>preamble</div>"
                                                "<div class=\"prose max-w-none\">A</div>"
                                                "<div class=\"prose max-w-none\">B</div>";
                     const auto chunks = o::split_sections(region);
                     require(chunks.size() == 2, "expected two chunks");
                     require(chunks[0].find("A") != std::string_view::npos &&
                                 chunks[0].find("preamble") == std::string_view::npos,
                             "first chunk should hold A only");
                     require(chunks[1].find("B") != std::string_view::npos,
                             "second chunk should hold B");
                     require(o::split_sections("<div>nothing</div>").empty(),
                             "no marker means no chunks");
                   }});

  tests.push_back({"markup_section_fields_collects_blocks_in_order", [] {
                     const auto fields = o::extract_section_fields(
                         "><h2> Psalm 1 </h2><h3>Antiphon</h3>"
                         "<div class=\"whitespace-pre-line\">Blessed</div>"
                         "<div class=\"note\">skip</div>"
                         "<div class=\"text-lg whitespace-pre-line\">Second</div>");
                     require(fields.has_value(), "chunk with h2 should yield fields");
                     require(fields->title == "Psalm 1", "title mismatch");
                     require(fields->subheader == "Antiphon", "subheader mismatch");
                     require(fields->content_blocks.size() == 2, "expected two content blocks");
                     require(fields->content_blocks[0] == "Blessed" &&
                                 fields->content_blocks[1] == "Second",
                             "blocks should keep page order");
                   }});

  tests.push_back({"markup_section_fields_skip_missing_or_blank_heading", [] {
                     require(!o::extract_section_fields("><p>boilerplate</p>").has_value(),
                             "chunk without h2 should be skipped");
                     require(!o::extract_section_fields("><h2>&nbsp;</h2>").has_value(),
                             "heading that decodes to whitespace should be skipped");
                     const auto bare = o::extract_section_fields("><h2>Bare</h2>");
                     require(bare.has_value() && bare->content_blocks.empty() &&
                                 bare->subheader.empty(),
                             "heading alone is still a section");
                   }});

  tests.push_back({"markup_compose_raw_content", [] {
                     o::SectionFields with_sub{"T", "Sub", {"a", "b"}};
                     require(o::compose_raw_content(with_sub) == "**Sub**\n\na\n\nb",
                             "subheader should lead the content");
                     o::SectionFields without_sub{"T", "", {"a", "b"}};
                     require(o::compose_raw_content(without_sub) == "a\n\nb",
                             "blocks should be joined by a blank line");
                   }});

  tests.push_back({"markup_find_citation_blocks_matches_class_order", [] {
                     const auto blocks = o::find_citation_blocks(
                         "<p class=\"text-sm text-gray-500 italic mt-2\">One</p>"
                         "<p class=\"italic text-sm text-gray-500\">wrong order</p>"
                         "<p class=\"text-sm mt-1 text-gray-500 italic\">Two</p>");
                     require(blocks.size() == 2, "expected two citation blocks");
                     require(blocks[0] == "One" && blocks[1] == "Two", "citation block text mismatch");
                   }});
}
