#pragma once

#include "vesper/common/result.hpp"

#include <filesystem>
#include <string>

namespace vesper::common {

[[nodiscard]] Result<std::filesystem::path> home_dir();

/// Create `path` (and parents) if missing and return it.
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);

/// Expand a leading `~` and `$VAR` / `${VAR}` references.
[[nodiscard]] std::string expand_path(const std::string &path);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Write through a temporary sibling file and rename it into place.
[[nodiscard]] Status write_file(const std::filesystem::path &path, const std::string &content);

} // namespace vesper::common
