#include "test_framework.hpp"

#include "vesper/office/entities.hpp"

#include <string>
#include <utility>
#include <vector>

void register_entities_tests(std::vector<vesper::tests::TestCase> &tests) {
  using vesper::tests::require;
  using vesper::office::decode_entities;

  tests.push_back({"entities_decode_quotes_and_apostrophes", [] {
                     require(decode_entities("&ldquo;Hi&rdquo; &quot;there&quot;") ==
                                 "\"Hi\" \"there\"",
                             "double quote variants should decode");
                     require(decode_entities("&lsquo;a&rsquo; &apos; &#x27; &#39;") ==
                                 "'a' ' ' '",
                             "apostrophe variants should decode");
                   }});

  tests.push_back({"entities_decode_space_ampersand_and_dash", [] {
                     require(decode_entities("a&nbsp;b") == "a b", "nbsp should become a space");
                     require(decode_entities("Tom &amp; Jerry") == "Tom & Jerry",
                             "ampersand should decode");
                     require(decode_entities("x&mdash;y") == "x\xE2\x80\x94y",
                             "mdash should become U+2014");
                   }});

  tests.push_back({"entities_decode_is_a_single_sequential_pass", [] {
                     require(decode_entities("&amp;quot;") == "&quot;",
                             "escaped entity should only decode one level");
                     require(decode_entities(decode_entities("&amp;quot;")) == "\"",
                             "second pass should finish decoding");
                   }});

  tests.push_back({"entities_leave_unknown_text_alone", [] {
                     require(decode_entities("&copy; &unknown; & done") == "&copy; &unknown; & done",
                             "unknown entities should be untouched");
                     require(decode_entities("") == "", "empty input stays empty");
                     require(decode_entities("plain text") == "plain text",
                             "text without entities should be untouched");
                   }});
}
