#include "vesper/tracker/prayed_days.hpp"

#include "vesper/common/fs.hpp"
#include "vesper/common/json_util.hpp"
#include "vesper/common/strings.hpp"

#include <algorithm>
#include <ctime>
#include <functional>
#include <regex>
#include <sstream>

namespace vesper::tracker {

std::string date_key(const std::chrono::system_clock::time_point when) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &seconds);
#else
  localtime_r(&seconds, &local);
#endif
  char buffer[16];
  const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &local);
  return std::string(buffer, written);
}

std::string today_key() { return date_key(std::chrono::system_clock::now()); }

bool is_valid_date_key(const std::string &key) {
  static const std::regex key_re(R"(^(\d{4})-(0[1-9]|1[0-2])-(0[1-9]|[12]\d|3[01])$)");
  return std::regex_match(key, key_re);
}

PrayedDayStore::PrayedDayStore(std::filesystem::path file) : file_(std::move(file)) {}

common::Result<std::vector<PrayedDayStore::Entry>> PrayedDayStore::load_entries() const {
  std::error_code ec;
  if (!std::filesystem::exists(file_, ec)) {
    return common::Result<std::vector<Entry>>::success({});
  }

  auto content = common::read_file(file_);
  if (!content.ok()) {
    return common::Result<std::vector<Entry>>::failure(content.error());
  }

  const std::string trimmed = common::trim(content.value());
  if (trimmed.empty() || trimmed == "[]") {
    return common::Result<std::vector<Entry>>::success({});
  }
  if (trimmed.front() != '[') {
    return common::Result<std::vector<Entry>>::failure("malformed prayed-days file: " +
                                                       file_.string());
  }

  std::vector<Entry> entries;
  for (const auto &object : common::json_split_top_level_objects(trimmed)) {
    Entry entry;
    entry.date = common::json_get_string(object, "date");
    entry.prayed = common::json_get_literal(object, "prayed") != "false";
    if (is_valid_date_key(entry.date)) {
      entries.push_back(std::move(entry));
    }
  }
  return common::Result<std::vector<Entry>>::success(std::move(entries));
}

common::Status PrayedDayStore::save_entries(const std::vector<Entry> &entries) const {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "\n  {\"date\":\"" << common::json_escape(entries[i].date)
        << "\",\"prayed\":" << (entries[i].prayed ? "true" : "false") << "}";
  }
  out << (entries.empty() ? "]\n" : "\n]\n");
  return common::write_file(file_, out.str());
}

common::Status PrayedDayStore::mark_completed(const std::string &date_key) {
  if (!is_valid_date_key(date_key)) {
    return common::Status::error("invalid date key '" + date_key + "' (expected YYYY-MM-DD)");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto entries = load_entries();
  if (!entries.ok()) {
    return common::Status::error(entries.error());
  }

  auto &list = entries.value();
  const auto existing = std::find_if(list.begin(), list.end(),
                                     [&](const Entry &entry) { return entry.date == date_key; });
  if (existing != list.end()) {
    if (existing->prayed) {
      return common::Status::success();
    }
    existing->prayed = true;
  } else {
    list.push_back(Entry{date_key, true});
  }
  return save_entries(list);
}

common::Result<bool> PrayedDayStore::is_completed(const std::string &date_key) {
  if (!is_valid_date_key(date_key)) {
    return common::Result<bool>::failure("invalid date key '" + date_key +
                                         "' (expected YYYY-MM-DD)");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto entries = load_entries();
  if (!entries.ok()) {
    return common::Result<bool>::failure(entries.error());
  }
  for (const auto &entry : entries.value()) {
    if (entry.date == date_key) {
      return common::Result<bool>::success(entry.prayed);
    }
  }
  return common::Result<bool>::success(false);
}

common::Result<std::vector<std::string>> PrayedDayStore::list() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto entries = load_entries();
  if (!entries.ok()) {
    return common::Result<std::vector<std::string>>::failure(entries.error());
  }

  std::vector<std::string> days;
  for (const auto &entry : entries.value()) {
    if (entry.prayed) {
      days.push_back(entry.date);
    }
  }
  std::sort(days.begin(), days.end(), std::greater<>());
  days.erase(std::unique(days.begin(), days.end()), days.end());
  return common::Result<std::vector<std::string>>::success(std::move(days));
}

} // namespace vesper::tracker
