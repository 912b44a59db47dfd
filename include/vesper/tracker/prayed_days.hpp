#pragma once

#include "vesper/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace vesper::tracker {

/// Local calendar date as `YYYY-MM-DD`.
[[nodiscard]] std::string date_key(std::chrono::system_clock::time_point when);
[[nodiscard]] std::string today_key();
[[nodiscard]] bool is_valid_date_key(const std::string &key);

class IDayTracker {
public:
  virtual ~IDayTracker() = default;

  [[nodiscard]] virtual common::Status mark_completed(const std::string &date_key) = 0;
  [[nodiscard]] virtual common::Result<bool> is_completed(const std::string &date_key) = 0;
};

/// Completed days persisted as a JSON array of `{"date":..., "prayed":true}`.
class PrayedDayStore final : public IDayTracker {
public:
  explicit PrayedDayStore(std::filesystem::path file);

  /// Idempotent: marking a day twice keeps one entry.
  [[nodiscard]] common::Status mark_completed(const std::string &date_key) override;
  [[nodiscard]] common::Result<bool> is_completed(const std::string &date_key) override;

  /// Completed day keys, newest first.
  [[nodiscard]] common::Result<std::vector<std::string>> list();

  [[nodiscard]] const std::filesystem::path &path() const { return file_; }

private:
  struct Entry {
    std::string date;
    bool prayed = false;
  };

  [[nodiscard]] common::Result<std::vector<Entry>> load_entries() const;
  [[nodiscard]] common::Status save_entries(const std::vector<Entry> &entries) const;

  std::filesystem::path file_;
  std::mutex mutex_;
};

} // namespace vesper::tracker
