#pragma once

#include "vesper/observability/observer.hpp"

#include <memory>
#include <string>

namespace vesper::observability {

/// Replace the process-wide observer. nullptr restores the default
/// (warnings and errors to stderr).
void set_global_observer(std::shared_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> global_observer();

void record(Level level, const std::string &component, const std::string &message);
void record_debug(const std::string &component, const std::string &message);
void record_event(const std::string &component, const std::string &message);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace vesper::observability
