#include "vesper/runtime/app.hpp"

#include "vesper/config/config.hpp"
#include "vesper/net/proxy.hpp"
#include "vesper/observability/factory.hpp"
#include "vesper/observability/global.hpp"

namespace vesper::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.error());
  }
  auto warnings = config::validate_config(loaded.value());
  if (!warnings.ok()) {
    return common::Result<RuntimeContext>::failure(warnings.error());
  }
  RuntimeContext context(std::move(loaded.value()));
  context.install_observer();
  for (const auto &warning : warnings.value()) {
    observability::record_warning("config", warning);
  }
  return common::Result<RuntimeContext>::success(std::move(context));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

void RuntimeContext::install_observer() const {
  observability::set_global_observer(observability::create_observer(config_));
}

void RuntimeContext::set_http_client(std::shared_ptr<net::HttpClient> client) {
  http_client_ = std::move(client);
}

std::string RuntimeContext::resolved_url(const std::optional<std::string> &url) const {
  return net::proxied_url(url.value_or(config_.source.url), config_.proxy);
}

std::shared_ptr<service::IOfficeSource>
RuntimeContext::create_source(const LoaderOptions &options) {
  if (options.file.has_value()) {
    return std::make_shared<service::FileOfficeSource>(*options.file);
  }
  if (http_client_ == nullptr) {
    http_client_ = std::make_shared<net::CurlHttpClient>();
  }
  const std::string url = resolved_url(options.url);
  if (url != options.url.value_or(config_.source.url)) {
    observability::record_debug("runtime", "routing through proxy: " + url);
  }
  return std::make_shared<service::HttpOfficeSource>(http_client_, url, config_.source.timeout_ms,
                                                     config_.source.user_agent);
}

common::Result<std::shared_ptr<tracker::PrayedDayStore>> RuntimeContext::create_tracker() const {
  if (!config_.tracker.enabled) {
    return common::Result<std::shared_ptr<tracker::PrayedDayStore>>::success(nullptr);
  }
  auto path = config::tracker_path(config_);
  if (!path.ok()) {
    return common::Result<std::shared_ptr<tracker::PrayedDayStore>>::failure(path.error());
  }
  return common::Result<std::shared_ptr<tracker::PrayedDayStore>>::success(
      std::make_shared<tracker::PrayedDayStore>(path.value()));
}

common::Result<std::unique_ptr<service::OfficeLoader>>
RuntimeContext::create_loader(const LoaderOptions &options) {
  std::shared_ptr<tracker::IDayTracker> day_tracker;
  if (options.mark_completed) {
    auto created = create_tracker();
    if (!created.ok()) {
      return common::Result<std::unique_ptr<service::OfficeLoader>>::failure(created.error());
    }
    day_tracker = created.value();
  }
  return common::Result<std::unique_ptr<service::OfficeLoader>>::success(
      std::make_unique<service::OfficeLoader>(create_source(options), std::move(day_tracker)));
}

} // namespace vesper::runtime
