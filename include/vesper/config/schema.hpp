#pragma once

#include <cstdint>
#include <string>

namespace vesper::config {

inline constexpr const char *DEFAULT_SOURCE_URL =
    "https://www.a2cc.org/resources/pray-the-divine-hours";

struct SourceConfig {
  std::string url = DEFAULT_SOURCE_URL;
  std::uint64_t timeout_ms = 20'000;
  std::string user_agent = "Vesper/0.1";
};

struct ProxyConfig {
  bool enabled = false;
  std::string type = "prefix"; // prefix | domain
  std::string root;
};

struct RenderConfig {
  std::uint32_t width = 72;
  bool color = true;
};

struct TrackerConfig {
  bool enabled = true;
  std::string path; // empty: <config dir>/prayed_days.json
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "info";
};

struct Config {
  SourceConfig source;
  ProxyConfig proxy;
  RenderConfig render;
  TrackerConfig tracker;
  ObservabilityConfig observability;
};

[[nodiscard]] std::string json_schema();

} // namespace vesper::config
