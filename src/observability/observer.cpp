#include "vesper/observability/observer.hpp"

#include "vesper/common/strings.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>

namespace vesper::observability {

std::string_view level_name(const Level level) {
  switch (level) {
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warn:
    return "WARN";
  case Level::Error:
    return "ERROR";
  }
  return "INFO";
}

std::optional<Level> parse_level(std::string_view name) {
  const std::string normalized = common::to_lower(common::trim(name));
  if (normalized == "debug") {
    return Level::Debug;
  }
  if (normalized == "info") {
    return Level::Info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return Level::Warn;
  }
  if (normalized == "error") {
    return Level::Error;
  }
  return std::nullopt;
}

LogObserver::LogObserver(const Level threshold) : LogObserver(std::cerr, threshold) {}

LogObserver::LogObserver(std::ostream &out, const Level threshold)
    : out_(out), threshold_(threshold) {}

void LogObserver::record(const Event &event) {
  if (static_cast<int>(event.level) < static_cast<int>(threshold_)) {
    return;
  }

  const std::time_t seconds = std::chrono::system_clock::to_time_t(event.timestamp);
  std::tm utc{};
#ifdef _WIN32
  gmtime_s(&utc, &seconds);
#else
  gmtime_r(&seconds, &utc);
#endif

  std::lock_guard<std::mutex> lock(mutex_);
  out_ << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ") << ' ' << std::left << std::setw(5)
       << level_name(event.level) << " [" << event.component << "] " << event.message << '\n';
  out_.flush();
}

void MemoryObserver::record(const Event &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

std::vector<Event> MemoryObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::size_t MemoryObserver::count(const Level level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto &event : events_) {
    if (event.level == level) {
      ++total;
    }
  }
  return total;
}

void MemoryObserver::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.clear();
}

} // namespace vesper::observability
