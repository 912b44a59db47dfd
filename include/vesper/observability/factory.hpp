#pragma once

#include "vesper/config/schema.hpp"
#include "vesper/observability/observer.hpp"

#include <memory>

namespace vesper::observability {

/// Observer for `observability.backend`; unknown levels fall back to info.
[[nodiscard]] std::shared_ptr<IObserver> create_observer(const config::Config &config);

} // namespace vesper::observability
