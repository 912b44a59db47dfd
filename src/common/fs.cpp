#include "vesper/common/fs.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace vesper::common {

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  if (const char *profile = std::getenv("USERPROFILE"); profile != nullptr && *profile != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(profile));
  }
  return Result<std::filesystem::path>::failure("unable to resolve home directory");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("failed to create directory " + path.string() +
                                                  ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(const std::string &path) {
  std::string out;
  out.reserve(path.size());

  std::size_t i = 0;
  if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
    if (const auto home = home_dir(); home.ok()) {
      out += home.value().string();
      i = 1;
    }
  }

  while (i < path.size()) {
    if (path[i] != '$') {
      out.push_back(path[i++]);
      continue;
    }

    std::size_t name_begin = i + 1;
    std::size_t name_end = name_begin;
    bool braced = false;
    if (name_begin < path.size() && path[name_begin] == '{') {
      braced = true;
      ++name_begin;
      name_end = path.find('}', name_begin);
      if (name_end == std::string::npos) {
        out.append(path, i, std::string::npos);
        break;
      }
    } else {
      while (name_end < path.size() &&
             (std::isalnum(static_cast<unsigned char>(path[name_end])) != 0 || path[name_end] == '_')) {
        ++name_end;
      }
    }

    if (name_end == name_begin) {
      out.push_back(path[i++]);
      continue;
    }

    const std::string name = path.substr(name_begin, name_end - name_begin);
    if (const char *value = std::getenv(name.c_str()); value != nullptr) {
      out += value;
    }
    i = braced ? name_end + 1 : name_end;
  }
  return out;
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return Result<std::string>::failure("unable to open " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return Result<std::string>::failure("failed to read " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

Status write_file(const std::filesystem::path &path, const std::string &content) {
  if (path.has_parent_path()) {
    auto dir = ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return Status::error(dir.error());
    }
  }

  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
    if (!file) {
      return Status::error("unable to open " + tmp.string() + " for writing");
    }
    file << content;
    if (!file) {
      return Status::error("failed to write " + tmp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    return Status::error("failed to replace " + path.string());
  }
  return Status::success();
}

} // namespace vesper::common
