#pragma once

#include <string>
#include <string_view>

namespace vesper::office {

/// Replace the fixed entity set (`&nbsp;`, `&quot;`, `&ldquo;`, `&rdquo;`,
/// `&lsquo;`, `&rsquo;`, `&apos;`, `&amp;`, `&#x27;`, `&#39;`, `&mdash;`) with
/// literal characters. Each entity is replaced in one sequential pass, so
/// `&amp;quot;` becomes `&quot;`. Anything else is left untouched.
[[nodiscard]] std::string decode_entities(std::string_view raw);

} // namespace vesper::office
