#pragma once

#include <chrono>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vesper::observability {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

struct Event {
  Level level = Level::Info;
  std::string component;
  std::string message;
  std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

[[nodiscard]] std::string_view level_name(Level level);
[[nodiscard]] std::optional<Level> parse_level(std::string_view name);

class IObserver {
public:
  virtual ~IObserver() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  virtual void record(const Event &event) = 0;
};

class NoopObserver final : public IObserver {
public:
  [[nodiscard]] std::string_view name() const override { return "none"; }
  void record(const Event &) override {}
};

/// Writes `2026-01-01T10:00:00Z WARN  [loader] message` lines for events at or
/// above the threshold.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(Level threshold = Level::Info);
  LogObserver(std::ostream &out, Level threshold);

  [[nodiscard]] std::string_view name() const override { return "log"; }
  void record(const Event &event) override;

private:
  std::ostream &out_;
  Level threshold_;
  std::mutex mutex_;
};

/// Keeps every event in memory.
class MemoryObserver final : public IObserver {
public:
  [[nodiscard]] std::string_view name() const override { return "memory"; }
  void record(const Event &event) override;

  [[nodiscard]] std::vector<Event> events() const;
  [[nodiscard]] std::size_t count(Level level) const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::vector<Event> events_;
};

} // namespace vesper::observability
