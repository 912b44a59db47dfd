#include "vesper/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>

namespace vesper::common {

namespace {

struct Cursor {
  std::string_view text;
  std::size_t pos = 0;
  std::size_t line = 1;

  [[nodiscard]] bool done() const { return pos >= text.size(); }
  [[nodiscard]] char peek() const { return done() ? '\0' : text[pos]; }

  char take() {
    const char ch = text[pos++];
    if (ch == '\n') {
      ++line;
    }
    return ch;
  }

  void skip_blank() {
    while (!done() && (peek() == ' ' || peek() == '\t')) {
      ++pos;
    }
  }

  void skip_comment() {
    if (peek() == '#') {
      while (!done() && peek() != '\n') {
        ++pos;
      }
    }
  }

  // Blank space, newlines and comments; used inside arrays.
  void skip_layout() {
    while (!done()) {
      skip_blank();
      skip_comment();
      if (peek() == '\n' || peek() == '\r') {
        take();
        continue;
      }
      break;
    }
  }
};

std::string error_at(const Cursor &cursor, const std::string &message) {
  return "config parse error at line " + std::to_string(cursor.line) + ": " + message;
}

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

Result<std::string> parse_basic_string(Cursor &cursor) {
  cursor.take(); // opening quote
  std::string out;
  while (!cursor.done() && cursor.peek() != '\n') {
    const char ch = cursor.take();
    if (ch == '"') {
      return Result<std::string>::success(std::move(out));
    }
    if (ch != '\\') {
      out.push_back(ch);
      continue;
    }
    if (cursor.done()) {
      break;
    }
    const char esc = cursor.take();
    switch (esc) {
    case '"':
      out.push_back('"');
      break;
    case '\\':
      out.push_back('\\');
      break;
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 'u': {
      if (cursor.pos + 4 > cursor.text.size()) {
        return Result<std::string>::failure(error_at(cursor, "truncated \\u escape"));
      }
      const std::string hex(cursor.text.substr(cursor.pos, 4));
      char *end = nullptr;
      const auto cp = std::strtoul(hex.c_str(), &end, 16);
      if (end != hex.c_str() + 4) {
        return Result<std::string>::failure(error_at(cursor, "invalid \\u escape"));
      }
      cursor.pos += 4;
      append_utf8(out, static_cast<std::uint32_t>(cp));
      break;
    }
    default:
      return Result<std::string>::failure(error_at(cursor, std::string("unknown escape \\") + esc));
    }
  }
  return Result<std::string>::failure(error_at(cursor, "unterminated string"));
}

Result<std::string> parse_literal_string(Cursor &cursor) {
  cursor.take();
  std::string out;
  while (!cursor.done() && cursor.peek() != '\n') {
    const char ch = cursor.take();
    if (ch == '\'') {
      return Result<std::string>::success(std::move(out));
    }
    out.push_back(ch);
  }
  return Result<std::string>::failure(error_at(cursor, "unterminated string"));
}

Result<std::string> parse_string(Cursor &cursor) {
  return cursor.peek() == '"' ? parse_basic_string(cursor) : parse_literal_string(cursor);
}

Result<TomlValue> parse_scalar(Cursor &cursor) {
  TomlValue value;
  if (cursor.peek() == '"' || cursor.peek() == '\'') {
    auto parsed = parse_string(cursor);
    if (!parsed.ok()) {
      return Result<TomlValue>::failure(parsed.error());
    }
    value.type = TomlValue::Type::String;
    value.string_value = std::move(parsed.value());
    return Result<TomlValue>::success(std::move(value));
  }

  std::string token;
  while (!cursor.done()) {
    const char ch = cursor.peek();
    if (ch == ',' || ch == ']' || ch == '#' || ch == '\n' || ch == '\r' || ch == ' ' ||
        ch == '\t') {
      break;
    }
    token.push_back(cursor.take());
  }

  if (token == "true" || token == "false") {
    value.type = TomlValue::Type::Bool;
    value.bool_value = token == "true";
    value.string_value = token;
    return Result<TomlValue>::success(std::move(value));
  }

  std::string digits;
  for (const char ch : token) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  if (digits.empty()) {
    return Result<TomlValue>::failure(error_at(cursor, "missing value"));
  }

  char *end = nullptr;
  const bool looks_float = digits.find_first_of(".eE") != std::string::npos;
  if (!looks_float) {
    const long long parsed = std::strtoll(digits.c_str(), &end, 10);
    if (end == digits.c_str() + digits.size()) {
      value.type = TomlValue::Type::Integer;
      value.int_value = parsed;
      value.float_value = static_cast<double>(parsed);
      value.string_value = token;
      return Result<TomlValue>::success(std::move(value));
    }
  } else {
    const double parsed = std::strtod(digits.c_str(), &end);
    if (end == digits.c_str() + digits.size()) {
      value.type = TomlValue::Type::Float;
      value.float_value = parsed;
      value.int_value = static_cast<std::int64_t>(parsed);
      value.string_value = token;
      return Result<TomlValue>::success(std::move(value));
    }
  }
  return Result<TomlValue>::failure(error_at(cursor, "unsupported value '" + token + "'"));
}

Result<TomlValue> parse_value(Cursor &cursor) {
  if (cursor.peek() != '[') {
    return parse_scalar(cursor);
  }

  cursor.take();
  TomlValue array;
  array.type = TomlValue::Type::Array;
  while (true) {
    cursor.skip_layout();
    if (cursor.done()) {
      return Result<TomlValue>::failure(error_at(cursor, "unterminated array"));
    }
    if (cursor.peek() == ']') {
      cursor.take();
      return Result<TomlValue>::success(std::move(array));
    }
    auto item = parse_scalar(cursor);
    if (!item.ok()) {
      return item;
    }
    array.array_values.push_back(item.value().string_value);
    cursor.skip_layout();
    if (cursor.peek() == ',') {
      cursor.take();
    } else if (cursor.peek() != ']') {
      return Result<TomlValue>::failure(error_at(cursor, "expected ',' or ']' in array"));
    }
  }
}

bool is_bare_key_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '-';
}

// Parses `a.b."c d"` up to (not including) the terminator character.
Result<std::string> parse_key(Cursor &cursor, const char terminator) {
  std::string key;
  while (true) {
    cursor.skip_blank();
    if (cursor.peek() == '"' || cursor.peek() == '\'') {
      auto part = parse_string(cursor);
      if (!part.ok()) {
        return part;
      }
      key += part.value();
    } else {
      std::string part;
      while (!cursor.done() && is_bare_key_char(cursor.peek())) {
        part.push_back(cursor.take());
      }
      if (part.empty()) {
        return Result<std::string>::failure(error_at(cursor, "expected key"));
      }
      key += part;
    }
    cursor.skip_blank();
    if (cursor.peek() == '.') {
      cursor.take();
      key.push_back('.');
      continue;
    }
    if (cursor.peek() == terminator) {
      return Result<std::string>::success(std::move(key));
    }
    return Result<std::string>::failure(error_at(cursor, std::string("expected '") + terminator + "'"));
  }
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.count(key) > 0; }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.type == TomlValue::Type::Array) {
    return fallback;
  }
  return it->second.string_value;
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.type != TomlValue::Type::Bool) {
    return fallback;
  }
  return it->second.bool_value;
}

std::int64_t TomlDocument::get_int(const std::string &key, const std::int64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || (it->second.type != TomlValue::Type::Integer &&
                             it->second.type != TomlValue::Type::Float)) {
    return fallback;
  }
  return it->second.int_value;
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || (it->second.type != TomlValue::Type::Integer &&
                             it->second.type != TomlValue::Type::Float)) {
    return fallback;
  }
  return it->second.float_value;
}

std::vector<std::string> TomlDocument::get_string_array(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return {};
  }
  if (it->second.type != TomlValue::Type::Array) {
    return {it->second.string_value};
  }
  return it->second.array_values;
}

Result<TomlDocument> parse_toml(std::string_view text) {
  TomlDocument doc;
  Cursor cursor{text};
  std::string table;

  while (!cursor.done()) {
    cursor.skip_blank();
    cursor.skip_comment();
    if (cursor.done()) {
      break;
    }
    if (cursor.peek() == '\n' || cursor.peek() == '\r') {
      cursor.take();
      continue;
    }

    if (cursor.peek() == '[') {
      cursor.take();
      auto header = parse_key(cursor, ']');
      if (!header.ok()) {
        return Result<TomlDocument>::failure(header.error());
      }
      cursor.take();
      table = header.value();
    } else {
      auto key = parse_key(cursor, '=');
      if (!key.ok()) {
        return Result<TomlDocument>::failure(key.error());
      }
      cursor.take();
      cursor.skip_blank();
      auto value = parse_value(cursor);
      if (!value.ok()) {
        return Result<TomlDocument>::failure(value.error());
      }
      const std::string full_key = table.empty() ? key.value() : table + "." + key.value();
      if (doc.values.count(full_key) > 0) {
        return Result<TomlDocument>::failure(error_at(cursor, "duplicate key '" + full_key + "'"));
      }
      doc.values[full_key] = std::move(value.value());
    }

    cursor.skip_blank();
    cursor.skip_comment();
    if (cursor.peek() == '\r') {
      cursor.take();
    }
    if (!cursor.done() && cursor.peek() != '\n') {
      return Result<TomlDocument>::failure(error_at(cursor, "unexpected trailing characters"));
    }
  }

  return Result<TomlDocument>::success(std::move(doc));
}

std::string quote_toml_string(const std::string &value) {
  std::ostringstream out;
  out << '"';
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\t':
      out << "\\t";
      break;
    case '\r':
      out << "\\r";
      break;
    default:
      out << ch;
    }
  }
  out << '"';
  return out.str();
}

} // namespace vesper::common
