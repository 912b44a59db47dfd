#pragma once

#include <string>

namespace vesper::tests {

// Shape of the published office page: site chrome around a centred content
// wrapper holding one prose block per section.
inline std::string sample_office_page() {
  return "<!DOCTYPE html><html><head><title>Pray</title></head><body>\n"
         "<header><h1>Anglican Church</h1></header>\n"
         "<main class=\"flex\">\n"
         "<div class=\"container\"><div class=\"grid\"><div class=\"col\">\n"
         "<div class=\"px-4 max-w-4xl mx-auto py-10\">\n"
         "  <h1 class=\"text-3xl\">The Morning Office</h1>\n"
         "  <p class=\"text-gray-600\">Monday, &ldquo;Ordinary Time&rdquo;</p>\n"
         "  <div class=\"prose max-w-none\">\n"
         "    <h2>The Call to Prayer</h2>\n"
         "    <div class=\"whitespace-pre-line\">O Lord, open my lips,<br>and my mouth shall "
         "proclaim your praise.</div>\n"
         "    <p class=\"text-sm text-gray-500 italic\">&mdash; Psalm 51:15</p>\n"
         "  </div>\n"
         "  <div class=\"prose max-w-none\">\n"
         "    <p>Boilerplate without a heading</p>\n"
         "  </div>\n"
         "  <div class=\"prose max-w-none\">\n"
         "    <h2>A Reading</h2>\n"
         "    <h3>From the Gospel</h3>\n"
         "    <div class=\"whitespace-pre-line\">Jesus said,\n"
         "&ldquo;Come to me.&rdquo;\n"
         "\n"
         "He spoke again.</div>\n"
         "    <p class=\"text-sm text-gray-500 italic\">\xE2\x80\x94 Matthew 11:28</p>\n"
         "    <p class=\"text-sm text-gray-500 italic\">\xE2\x80\x93 Luke 10</p>\n"
         "  </div>\n"
         "  <div class=\"prose max-w-none\">\n"
         "    <h2>The Collect</h2>\n"
         "    <div class=\"whitespace-pre-line\">Almighty God &amp; Father.</div>\n"
         "  </div>\n"
         "</div>\n"
         "</div>\n"
         "</div>\n"
         "</div>\n"
         "</main>\n"
         "<footer><div class=\"prose max-w-none\"><h2>Footer Links</h2></div></footer>\n"
         "</body></html>\n";
}

} // namespace vesper::tests
