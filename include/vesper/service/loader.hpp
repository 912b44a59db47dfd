#pragma once

#include "vesper/office/document.hpp"
#include "vesper/service/source.hpp"
#include "vesper/tracker/prayed_days.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace vesper::service {

enum class LoadPhase { Idle, Loading, Loaded, Failed };

enum class FailureKind { Transport, Decode };

/// Shown when the fetched bytes are not valid UTF-8.
inline constexpr const char *DECODE_FAILURE_MESSAGE = "Failed to load content";

struct LoadFailure {
  FailureKind kind = FailureKind::Transport;
  std::string message;
};

struct LoadState {
  LoadPhase phase = LoadPhase::Idle;
  std::optional<office::Document> document; // set when Loaded
  std::optional<LoadFailure> failure;       // set when Failed
};

[[nodiscard]] std::string_view phase_name(LoadPhase phase);

/// Drives fetch -> decode -> extract for one office and publishes every state
/// transition to subscribers. Starting a load supersedes any load still in
/// flight; superseded or cancelled loads never publish.
class OfficeLoader {
public:
  using Listener = std::function<void(const LoadState &)>;
  using DateProvider = std::function<std::string()>;

  explicit OfficeLoader(std::shared_ptr<IOfficeSource> source,
                        std::shared_ptr<tracker::IDayTracker> tracker = nullptr);
  ~OfficeLoader();

  OfficeLoader(const OfficeLoader &) = delete;
  OfficeLoader &operator=(const OfficeLoader &) = delete;

  /// Listeners run on the thread that completes the transition. Deliveries are
  /// serialized, so every listener sees transitions in commit order.
  [[nodiscard]] std::size_t subscribe(Listener listener);
  void unsubscribe(std::size_t id);

  /// Blocking load; returns the final state.
  LoadState load();

  /// Publishes Loading before returning, then completes on a worker thread.
  [[nodiscard]] std::future<LoadState> load_async();

  /// Re-issue the fetch after a failure (or to refresh).
  LoadState retry();

  /// Drop the in-flight load, if any, and return to Idle.
  void cancel();

  [[nodiscard]] LoadState state() const;

  /// Date key handed to the tracker; defaults to tracker::today_key.
  void set_date_provider(DateProvider provider);

  /// Async workers not yet joined. Finished workers are joined by the next
  /// load_async() call.
  [[nodiscard]] std::size_t worker_count() const;

private:
  [[nodiscard]] std::uint64_t begin_load();
  [[nodiscard]] LoadState run(std::uint64_t generation);
  void join_finished_workers();
  bool publish(std::uint64_t generation, const LoadState &next);
  void mark_day_completed();

  std::shared_ptr<IOfficeSource> source_;
  std::shared_ptr<tracker::IDayTracker> tracker_;
  DateProvider date_provider_;

  mutable std::mutex mutex_;
  std::uint64_t generation_ = 0;
  LoadState state_;
  std::map<std::size_t, Listener> listeners_;
  std::size_t next_listener_id_ = 1;

  // Held across a state commit and its delivery. Recursive so a listener may
  // start or cancel a load.
  std::recursive_mutex publish_mutex_;

  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  mutable std::mutex workers_mutex_;
  std::vector<Worker> workers_;
};

} // namespace vesper::service
