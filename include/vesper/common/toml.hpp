#pragma once

#include "vesper/common/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace vesper::common {

struct TomlValue {
  enum class Type { String, Integer, Float, Bool, Array };

  Type type = Type::String;
  std::string string_value;
  std::int64_t int_value = 0;
  double float_value = 0.0;
  bool bool_value = false;
  std::vector<std::string> array_values;
};

/// Flat view of a TOML document: table headers and dotted keys are folded
/// into `section.sub.key` paths.
struct TomlDocument {
  std::map<std::string, TomlValue> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback = false) const;
  [[nodiscard]] std::int64_t get_int(const std::string &key, std::int64_t fallback = 0) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback = 0.0) const;
  [[nodiscard]] std::vector<std::string> get_string_array(const std::string &key) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(std::string_view text);

[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace vesper::common
