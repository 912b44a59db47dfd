#include "vesper/common/strings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace vesper::common {

namespace {

constexpr std::string_view NBSP = "\xC2\xA0";

bool is_ascii_space(const char ch) {
  return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool is_horizontal_space(const char ch) { return ch == ' ' || ch == '\t' || ch == '\f' || ch == '\v'; }

} // namespace

std::string trim(std::string_view value) {
  std::size_t begin = 0;
  std::size_t end = value.size();
  while (begin < end && is_ascii_space(value[begin])) {
    ++begin;
  }
  while (end > begin && is_ascii_space(value[end - 1])) {
    --end;
  }
  return std::string(value.substr(begin, end - begin));
}

std::string trim_horizontal(std::string_view value) {
  while (!value.empty()) {
    if (is_horizontal_space(value.front())) {
      value.remove_prefix(1);
    } else if (starts_with(value, NBSP)) {
      value.remove_prefix(NBSP.size());
    } else {
      break;
    }
  }
  while (!value.empty()) {
    if (is_horizontal_space(value.back())) {
      value.remove_suffix(1);
    } else if (value.size() >= NBSP.size() &&
               value.substr(value.size() - NBSP.size()) == NBSP) {
      value.remove_suffix(NBSP.size());
    } else {
      break;
    }
  }
  return std::string(value);
}

std::string to_lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return out;
}

std::string to_upper(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
  return out;
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && value.substr(0, prefix.size()) == prefix;
}

bool contains_icase(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return true;
  }
  return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

void replace_all(std::string &value, std::string_view from, std::string_view to) {
  if (from.empty()) {
    return;
  }
  std::size_t pos = 0;
  while ((pos = value.find(from, pos)) != std::string::npos) {
    value.replace(pos, from.size(), to);
    pos += to.size();
  }
}

bool is_valid_utf8(std::string_view bytes) {
  std::size_t i = 0;
  while (i < bytes.size()) {
    const auto lead = static_cast<unsigned char>(bytes[i]);
    std::size_t extra = 0;
    std::uint32_t code_point = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    }
    if ((lead & 0xE0) == 0xC0) {
      extra = 1;
      code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      extra = 2;
      code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      extra = 3;
      code_point = lead & 0x07;
    } else {
      return false;
    }
    if (i + extra >= bytes.size()) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto next = static_cast<unsigned char>(bytes[i + k]);
      if ((next & 0xC0) != 0x80) {
        return false;
      }
      code_point = (code_point << 6) | (next & 0x3F);
    }
    // Overlong forms, surrogates and values past U+10FFFF.
    if ((extra == 1 && code_point < 0x80) || (extra == 2 && code_point < 0x800) ||
        (extra == 3 && code_point < 0x10000) || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

std::size_t utf8_length(std::string_view value) {
  std::size_t count = 0;
  for (std::size_t i = 0; i < value.size(); ++i) {
    const auto ch = static_cast<unsigned char>(value[i]);
    if ((ch & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

} // namespace vesper::common
