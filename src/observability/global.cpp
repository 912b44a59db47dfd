#include "vesper/observability/global.hpp"

#include <mutex>

namespace vesper::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

std::shared_ptr<IObserver> default_observer() {
  static const auto observer = std::make_shared<LogObserver>(Level::Warn);
  return observer;
}

} // namespace

void set_global_observer(std::shared_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer == nullptr) {
    return default_observer();
  }
  return g_observer;
}

void record(const Level level, const std::string &component, const std::string &message) {
  Event event;
  event.level = level;
  event.component = component;
  event.message = message;
  global_observer()->record(event);
}

void record_debug(const std::string &component, const std::string &message) {
  record(Level::Debug, component, message);
}

void record_event(const std::string &component, const std::string &message) {
  record(Level::Info, component, message);
}

void record_warning(const std::string &component, const std::string &message) {
  record(Level::Warn, component, message);
}

void record_error(const std::string &component, const std::string &message) {
  record(Level::Error, component, message);
}

} // namespace vesper::observability
