#include "vesper/common/json_util.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace vesper::common {

namespace {

// Position just after `"key":` at nesting depth 1, or npos.
std::size_t find_field_value(std::string_view object, std::string_view key) {
  int depth = 0;
  std::size_t pos = 0;
  while (pos < object.size()) {
    const char ch = object[pos];
    if (ch == '"') {
      const std::size_t end = json_find_string_end(object, pos);
      if (end == std::string_view::npos) {
        return std::string_view::npos;
      }
      if (depth == 1 && object.substr(pos + 1, end - pos - 1) == key) {
        const std::size_t colon = json_skip_ws(object, end + 1);
        if (colon < object.size() && object[colon] == ':') {
          return json_skip_ws(object, colon + 1);
        }
      }
      pos = end + 1;
      continue;
    }
    if (ch == '{' || ch == '[') {
      ++depth;
    } else if (ch == '}' || ch == ']') {
      --depth;
    }
    ++pos;
  }
  return std::string_view::npos;
}

} // namespace

std::string json_escape(std::string_view value) {
  std::string out;
  out.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        out += buffer;
      } else {
        out.push_back(ch);
      }
    }
  }
  return out;
}

std::string json_unescape(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] != '\\' || i + 1 >= value.size()) {
      out.push_back(value[i]);
      continue;
    }
    const char esc = value[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u':
      if (i + 4 < value.size()) {
        const std::string hex(value.substr(i + 1, 4));
        const auto cp = static_cast<unsigned>(std::strtoul(hex.c_str(), nullptr, 16));
        if (cp < 0x80) {
          out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
          out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
          out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
          out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
          out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
          out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        i += 4;
      }
      break;
    default:
      out.push_back(esc);
    }
  }
  return out;
}

std::size_t json_skip_ws(std::string_view json, std::size_t pos) {
  while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(std::string_view json, std::size_t open) {
  for (std::size_t pos = open + 1; pos < json.size(); ++pos) {
    if (json[pos] == '\\') {
      ++pos;
      continue;
    }
    if (json[pos] == '"') {
      return pos;
    }
  }
  return std::string_view::npos;
}

std::string json_get_string(std::string_view object, std::string_view key) {
  const std::size_t value_pos = find_field_value(object, key);
  if (value_pos == std::string_view::npos || value_pos >= object.size() ||
      object[value_pos] != '"') {
    return "";
  }
  const std::size_t end = json_find_string_end(object, value_pos);
  if (end == std::string_view::npos) {
    return "";
  }
  return json_unescape(object.substr(value_pos + 1, end - value_pos - 1));
}

std::string json_get_literal(std::string_view object, std::string_view key) {
  const std::size_t value_pos = find_field_value(object, key);
  if (value_pos == std::string_view::npos) {
    return "";
  }
  std::size_t end = value_pos;
  while (end < object.size() && object[end] != ',' && object[end] != '}' &&
         std::isspace(static_cast<unsigned char>(object[end])) == 0) {
    ++end;
  }
  return std::string(object.substr(value_pos, end - value_pos));
}

std::vector<std::string> json_split_top_level_objects(std::string_view array) {
  std::vector<std::string> objects;
  int depth = 0;
  std::size_t start = std::string_view::npos;
  for (std::size_t pos = 0; pos < array.size(); ++pos) {
    const char ch = array[pos];
    if (ch == '"') {
      const std::size_t end = json_find_string_end(array, pos);
      if (end == std::string_view::npos) {
        break;
      }
      pos = end;
      continue;
    }
    if (ch == '{') {
      if (depth == 0) {
        start = pos;
      }
      ++depth;
    } else if (ch == '}') {
      --depth;
      if (depth == 0 && start != std::string_view::npos) {
        objects.emplace_back(array.substr(start, pos - start + 1));
        start = std::string_view::npos;
      }
    }
  }
  return objects;
}

} // namespace vesper::common
