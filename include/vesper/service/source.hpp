#pragma once

#include "vesper/common/result.hpp"
#include "vesper/net/http.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace vesper::service {

/// Where the raw office page comes from. A failed fetch is a transport
/// failure; its message is shown to the user verbatim.
class IOfficeSource {
public:
  virtual ~IOfficeSource() = default;

  [[nodiscard]] virtual common::Result<std::string> fetch() = 0;
  [[nodiscard]] virtual std::string describe() const = 0;
};

class HttpOfficeSource final : public IOfficeSource {
public:
  HttpOfficeSource(std::shared_ptr<net::HttpClient> http, std::string url,
                   std::uint64_t timeout_ms, std::string user_agent);

  [[nodiscard]] common::Result<std::string> fetch() override;
  [[nodiscard]] std::string describe() const override { return url_; }

private:
  std::shared_ptr<net::HttpClient> http_;
  std::string url_;
  std::uint64_t timeout_ms_;
  std::string user_agent_;
};

/// A page saved to disk.
class FileOfficeSource final : public IOfficeSource {
public:
  explicit FileOfficeSource(std::filesystem::path path);

  [[nodiscard]] common::Result<std::string> fetch() override;
  [[nodiscard]] std::string describe() const override { return path_.string(); }

private:
  std::filesystem::path path_;
};

} // namespace vesper::service
