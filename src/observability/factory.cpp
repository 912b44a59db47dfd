#include "vesper/observability/factory.hpp"

#include "vesper/common/strings.hpp"

namespace vesper::observability {

std::shared_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "none") {
    return std::make_shared<NoopObserver>();
  }
  const auto level = parse_level(config.observability.level).value_or(Level::Info);
  return std::make_shared<LogObserver>(level);
}

} // namespace vesper::observability
