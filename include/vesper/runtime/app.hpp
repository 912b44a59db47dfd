#pragma once

#include "vesper/common/result.hpp"
#include "vesper/config/schema.hpp"
#include "vesper/net/http.hpp"
#include "vesper/service/loader.hpp"
#include "vesper/service/source.hpp"
#include "vesper/tracker/prayed_days.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace vesper::runtime {

struct LoaderOptions {
  std::optional<std::string> url;            // overrides source.url
  std::optional<std::filesystem::path> file; // read a saved page instead
  bool mark_completed = true;
};

/// Wires config, observer, HTTP client, source and tracker together.
class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  /// Install the observer selected by `observability.*`.
  void install_observer() const;

  /// Defaults to CurlHttpClient.
  void set_http_client(std::shared_ptr<net::HttpClient> client);

  [[nodiscard]] std::string resolved_url(const std::optional<std::string> &url) const;

  [[nodiscard]] std::shared_ptr<service::IOfficeSource>
  create_source(const LoaderOptions &options);

  /// Null when `tracker.enabled` is off.
  [[nodiscard]] common::Result<std::shared_ptr<tracker::PrayedDayStore>> create_tracker() const;

  [[nodiscard]] common::Result<std::unique_ptr<service::OfficeLoader>>
  create_loader(const LoaderOptions &options);

private:
  config::Config config_;
  std::shared_ptr<net::HttpClient> http_client_;
};

} // namespace vesper::runtime
