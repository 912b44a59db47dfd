#pragma once

#include "vesper/common/result.hpp"
#include "vesper/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vesper::config {

/// `~/.vesper`, or the directory of the override path.
[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();

/// Takes precedence over VESPER_CONFIG_PATH. May name a file or a directory.
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Defaults when no config file exists; env overrides applied last.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// VESPER_SOURCE_URL and VESPER_LOG_LEVEL.
void apply_env_overrides(Config &config);

/// Hard errors fail; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// Resolved location of the prayed-days file.
[[nodiscard]] common::Result<std::filesystem::path> tracker_path(const Config &config);

/// Every dotted key understood by get_value/set_value, in file order.
[[nodiscard]] const std::vector<std::string> &config_keys();

/// Read or assign one dotted key (`source.url`, `render.width`, ...).
[[nodiscard]] common::Result<std::string> get_value(const Config &config, const std::string &key);
[[nodiscard]] common::Status set_value(Config &config, const std::string &key,
                                       const std::string &value);

} // namespace vesper::config
