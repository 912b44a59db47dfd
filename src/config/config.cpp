#include "vesper/config/config.hpp"

#include "vesper/common/fs.hpp"
#include "vesper/common/strings.hpp"
#include "vesper/common/toml.hpp"
#include "vesper/observability/observer.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace vesper::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".vesper";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *TRACKER_FILENAME = "prayed_days.json";
constexpr std::uint32_t MIN_RENDER_WIDTH = 20;

std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("VESPER_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string bool_to_string(const bool value) { return value ? "true" : "false"; }

common::Result<bool> parse_bool(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
    return common::Result<bool>::success(true);
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
    return common::Result<bool>::success(false);
  }
  return common::Result<bool>::failure("expected a boolean, got '" + value + "'");
}

common::Result<std::uint64_t> parse_unsigned(const std::string &value) {
  const std::string trimmed = common::trim(value);
  if (trimmed.empty() || trimmed.find_first_not_of("0123456789") != std::string::npos) {
    return common::Result<std::uint64_t>::failure("expected a non-negative integer, got '" +
                                                  value + "'");
  }
  try {
    return common::Result<std::uint64_t>::success(std::stoull(trimmed));
  } catch (const std::out_of_range &) {
    return common::Result<std::uint64_t>::failure("integer out of range: " + value);
  }
}

std::uint64_t clamp_non_negative(const std::int64_t value) {
  return value < 0 ? 0 : static_cast<std::uint64_t>(value);
}

void load_source_config(Config &config, const common::TomlDocument &doc) {
  if (doc.has("source.url")) {
    config.source.url = common::trim(doc.get_string("source.url"));
  }
  if (doc.has("source.timeout_ms")) {
    config.source.timeout_ms = clamp_non_negative(doc.get_int("source.timeout_ms"));
  }
  config.source.user_agent = doc.get_string("source.user_agent", config.source.user_agent);
}

void load_proxy_config(Config &config, const common::TomlDocument &doc) {
  config.proxy.enabled = doc.get_bool("proxy.enabled", config.proxy.enabled);
  config.proxy.type = common::to_lower(doc.get_string("proxy.type", config.proxy.type));
  config.proxy.root = common::trim(doc.get_string("proxy.root", config.proxy.root));
}

void load_render_config(Config &config, const common::TomlDocument &doc) {
  if (doc.has("render.width")) {
    const auto width = clamp_non_negative(doc.get_int("render.width"));
    config.render.width = static_cast<std::uint32_t>(
        std::min<std::uint64_t>(width, std::numeric_limits<std::uint32_t>::max()));
  }
  config.render.color = doc.get_bool("render.color", config.render.color);
}

void load_tracker_config(Config &config, const common::TomlDocument &doc) {
  config.tracker.enabled = doc.get_bool("tracker.enabled", config.tracker.enabled);
  if (doc.has("tracker.path")) {
    config.tracker.path = common::expand_path(doc.get_string("tracker.path"));
  }
}

void load_observability_config(Config &config, const common::TomlDocument &doc) {
  config.observability.backend =
      common::to_lower(doc.get_string("observability.backend", config.observability.backend));
  config.observability.level =
      common::to_lower(doc.get_string("observability.level", config.observability.level));
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *url = std::getenv("VESPER_SOURCE_URL"); url != nullptr && *url != '\0') {
    config.source.url = common::trim(url);
  }
  if (const char *level = std::getenv("VESPER_LOG_LEVEL"); level != nullptr && *level != '\0') {
    config.observability.level = common::to_lower(common::trim(level));
  }
}

common::Result<Config> load_config() {
  Config config;

  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::failure(path_result.error());
  }

  const auto &path = path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto text = common::read_file(path);
  if (!text.ok()) {
    return common::Result<Config>::failure(text.error());
  }

  const auto parsed = common::parse_toml(text.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }

  const auto &doc = parsed.value();
  load_source_config(config, doc);
  load_proxy_config(config, doc);
  load_render_config(config, doc);
  load_tracker_config(config, doc);
  load_observability_config(config, doc);

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto path = config_path();
  if (!path.ok()) {
    return common::Status::error(path.error());
  }

  std::ostringstream file;
  file << "[source]\n";
  file << "url = " << common::quote_toml_string(config.source.url) << "\n";
  file << "timeout_ms = " << config.source.timeout_ms << "\n";
  file << "user_agent = " << common::quote_toml_string(config.source.user_agent) << "\n";

  file << "\n[proxy]\n";
  file << "enabled = " << bool_to_string(config.proxy.enabled) << "\n";
  file << "type = " << common::quote_toml_string(config.proxy.type) << "\n";
  file << "root = " << common::quote_toml_string(config.proxy.root) << "\n";

  file << "\n[render]\n";
  file << "width = " << config.render.width << "\n";
  file << "color = " << bool_to_string(config.render.color) << "\n";

  file << "\n[tracker]\n";
  file << "enabled = " << bool_to_string(config.tracker.enabled) << "\n";
  if (!config.tracker.path.empty()) {
    file << "path = " << common::quote_toml_string(config.tracker.path) << "\n";
  }

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  file << "level = " << common::quote_toml_string(config.observability.level) << "\n";

  return common::write_file(path.value(), file.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  const std::string url = common::to_lower(config.source.url);
  if (url.empty()) {
    return common::Result<std::vector<std::string>>::failure("source.url must not be empty");
  }
  if (!common::starts_with(url, "http://") && !common::starts_with(url, "https://")) {
    return common::Result<std::vector<std::string>>::failure(
        "source.url must be an http(s) URL: " + config.source.url);
  }
  if (config.source.timeout_ms == 0) {
    return common::Result<std::vector<std::string>>::failure("source.timeout_ms must be positive");
  }

  if (config.proxy.type != "prefix" && config.proxy.type != "domain") {
    return common::Result<std::vector<std::string>>::failure("Invalid proxy.type: " +
                                                              config.proxy.type);
  }
  if (config.proxy.enabled && config.proxy.root.empty()) {
    warnings.push_back("proxy.enabled is set but proxy.root is empty; requests go direct");
  }

  if (config.render.width < MIN_RENDER_WIDTH) {
    return common::Result<std::vector<std::string>>::failure(
        "render.width must be at least " + std::to_string(MIN_RENDER_WIDTH));
  }

  if (config.observability.backend != "log" && config.observability.backend != "none") {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.backend: " +
                                                              config.observability.backend);
  }
  if (!observability::parse_level(config.observability.level).has_value()) {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.level: " +
                                                              config.observability.level);
  }

  if (!config.tracker.enabled && !config.tracker.path.empty()) {
    warnings.push_back("tracker.path is set while the tracker is disabled");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

common::Result<std::filesystem::path> tracker_path(const Config &config) {
  if (!config.tracker.path.empty()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(config.tracker.path)));
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / TRACKER_FILENAME);
}

const std::vector<std::string> &config_keys() {
  static const std::vector<std::string> keys = {
      "source.url",      "source.timeout_ms",     "source.user_agent",  "proxy.enabled",
      "proxy.type",      "proxy.root",            "render.width",       "render.color",
      "tracker.enabled", "tracker.path",          "observability.backend", "observability.level",
  };
  return keys;
}

common::Result<std::string> get_value(const Config &config, const std::string &key) {
  if (key == "source.url") {
    return common::Result<std::string>::success(config.source.url);
  }
  if (key == "source.timeout_ms") {
    return common::Result<std::string>::success(std::to_string(config.source.timeout_ms));
  }
  if (key == "source.user_agent") {
    return common::Result<std::string>::success(config.source.user_agent);
  }
  if (key == "proxy.enabled") {
    return common::Result<std::string>::success(bool_to_string(config.proxy.enabled));
  }
  if (key == "proxy.type") {
    return common::Result<std::string>::success(config.proxy.type);
  }
  if (key == "proxy.root") {
    return common::Result<std::string>::success(config.proxy.root);
  }
  if (key == "render.width") {
    return common::Result<std::string>::success(std::to_string(config.render.width));
  }
  if (key == "render.color") {
    return common::Result<std::string>::success(bool_to_string(config.render.color));
  }
  if (key == "tracker.enabled") {
    return common::Result<std::string>::success(bool_to_string(config.tracker.enabled));
  }
  if (key == "tracker.path") {
    return common::Result<std::string>::success(config.tracker.path);
  }
  if (key == "observability.backend") {
    return common::Result<std::string>::success(config.observability.backend);
  }
  if (key == "observability.level") {
    return common::Result<std::string>::success(config.observability.level);
  }
  return common::Result<std::string>::failure("unknown key: " + key);
}

common::Status set_value(Config &config, const std::string &key, const std::string &value) {
  if (key == "source.url") {
    config.source.url = common::trim(value);
    return common::Status::success();
  }
  if (key == "source.timeout_ms") {
    auto parsed = parse_unsigned(value);
    if (!parsed.ok()) {
      return common::Status::error(key + ": " + parsed.error());
    }
    config.source.timeout_ms = parsed.value();
    return common::Status::success();
  }
  if (key == "source.user_agent") {
    config.source.user_agent = value;
    return common::Status::success();
  }
  if (key == "proxy.enabled" || key == "render.color" || key == "tracker.enabled") {
    auto parsed = parse_bool(value);
    if (!parsed.ok()) {
      return common::Status::error(key + ": " + parsed.error());
    }
    if (key == "proxy.enabled") {
      config.proxy.enabled = parsed.value();
    } else if (key == "render.color") {
      config.render.color = parsed.value();
    } else {
      config.tracker.enabled = parsed.value();
    }
    return common::Status::success();
  }
  if (key == "proxy.type") {
    config.proxy.type = common::to_lower(common::trim(value));
    return common::Status::success();
  }
  if (key == "proxy.root") {
    config.proxy.root = common::trim(value);
    return common::Status::success();
  }
  if (key == "render.width") {
    auto parsed = parse_unsigned(value);
    if (!parsed.ok()) {
      return common::Status::error(key + ": " + parsed.error());
    }
    if (parsed.value() > std::numeric_limits<std::uint32_t>::max()) {
      return common::Status::error(key + ": value too large");
    }
    config.render.width = static_cast<std::uint32_t>(parsed.value());
    return common::Status::success();
  }
  if (key == "tracker.path") {
    config.tracker.path = common::trim(value);
    return common::Status::success();
  }
  if (key == "observability.backend") {
    config.observability.backend = common::to_lower(common::trim(value));
    return common::Status::success();
  }
  if (key == "observability.level") {
    config.observability.level = common::to_lower(common::trim(value));
    return common::Status::success();
  }
  return common::Status::error("unknown key: " + key);
}

} // namespace vesper::config
