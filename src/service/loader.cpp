#include "vesper/service/loader.hpp"

#include "vesper/common/strings.hpp"
#include "vesper/observability/global.hpp"
#include "vesper/office/extractor.hpp"

namespace vesper::service {

namespace {

constexpr const char *COMPONENT = "loader";

LoadState failed_state(const FailureKind kind, std::string message) {
  LoadState state;
  state.phase = LoadPhase::Failed;
  state.failure = LoadFailure{kind, std::move(message)};
  return state;
}

} // namespace

std::string_view phase_name(const LoadPhase phase) {
  switch (phase) {
  case LoadPhase::Idle:
    return "idle";
  case LoadPhase::Loading:
    return "loading";
  case LoadPhase::Loaded:
    return "loaded";
  case LoadPhase::Failed:
    return "failed";
  }
  return "idle";
}

OfficeLoader::OfficeLoader(std::shared_ptr<IOfficeSource> source,
                           std::shared_ptr<tracker::IDayTracker> tracker)
    : source_(std::move(source)), tracker_(std::move(tracker)),
      date_provider_([] { return tracker::today_key(); }) {}

OfficeLoader::~OfficeLoader() {
  std::vector<Worker> workers;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers.swap(workers_);
  }
  for (auto &worker : workers) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

std::size_t OfficeLoader::subscribe(Listener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void OfficeLoader::unsubscribe(const std::size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(id);
}

LoadState OfficeLoader::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

void OfficeLoader::set_date_provider(DateProvider provider) {
  std::lock_guard<std::mutex> lock(mutex_);
  date_provider_ = std::move(provider);
}

LoadState OfficeLoader::load() { return run(begin_load()); }

std::future<LoadState> OfficeLoader::load_async() {
  join_finished_workers();

  const std::uint64_t generation = begin_load();
  auto finished = std::make_shared<std::atomic<bool>>(false);
  std::packaged_task<LoadState()> task([this, generation, finished] {
    auto state = run(generation);
    finished->store(true);
    return state;
  });
  auto future = task.get_future();

  std::lock_guard<std::mutex> lock(workers_mutex_);
  workers_.push_back(Worker{std::thread(std::move(task)), std::move(finished)});
  return future;
}

std::size_t OfficeLoader::worker_count() const {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  return workers_.size();
}

void OfficeLoader::join_finished_workers() {
  std::vector<Worker> done;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = workers_.begin();
    while (it != workers_.end()) {
      if (it->finished->load()) {
        done.push_back(std::move(*it));
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &worker : done) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

LoadState OfficeLoader::retry() {
  observability::record_event(COMPONENT, "retrying office load");
  return load();
}

void OfficeLoader::cancel() {
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.phase != LoadPhase::Loading) {
      return;
    }
    generation = ++generation_;
  }
  observability::record_event(COMPONENT, "office load cancelled");
  publish(generation, LoadState{});
}

std::uint64_t OfficeLoader::begin_load() {
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    generation = ++generation_;
  }
  LoadState loading;
  loading.phase = LoadPhase::Loading;
  publish(generation, loading);
  return generation;
}

LoadState OfficeLoader::run(const std::uint64_t generation) {
  if (source_ == nullptr) {
    auto state = failed_state(FailureKind::Transport, "no office source configured");
    publish(generation, state);
    return state;
  }

  observability::record_debug(COMPONENT, "fetching office from " + source_->describe());
  auto fetched = source_->fetch();
  if (!fetched.ok()) {
    observability::record_error(COMPONENT, "fetch failed: " + fetched.error());
    auto state = failed_state(FailureKind::Transport, fetched.error());
    publish(generation, state);
    return state;
  }

  if (!common::is_valid_utf8(fetched.value())) {
    observability::record_error(COMPONENT, "response from " + source_->describe() +
                                               " is not valid UTF-8");
    auto state = failed_state(FailureKind::Decode, DECODE_FAILURE_MESSAGE);
    publish(generation, state);
    return state;
  }

  LoadState state;
  state.phase = LoadPhase::Loaded;
  state.document = office::extract_office(fetched.value());
  observability::record_event(COMPONENT, "loaded \"" + state.document->title + "\" with " +
                                             std::to_string(state.document->sections.size()) +
                                             " sections");

  if (publish(generation, state)) {
    mark_day_completed();
  }
  return state;
}

bool OfficeLoader::publish(const std::uint64_t generation, const LoadState &next) {
  std::lock_guard<std::recursive_mutex> delivery(publish_mutex_);
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_) {
      return false;
    }
    state_ = next;
    listeners.reserve(listeners_.size());
    for (const auto &[id, listener] : listeners_) {
      listeners.push_back(listener);
    }
  }
  for (const auto &listener : listeners) {
    listener(next);
  }
  return true;
}

void OfficeLoader::mark_day_completed() {
  if (tracker_ == nullptr) {
    return;
  }
  DateProvider provider;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    provider = date_provider_;
  }
  const std::string key = provider();
  const auto marked = tracker_->mark_completed(key);
  if (!marked.ok()) {
    observability::record_warning(COMPONENT, "could not record " + key + ": " + marked.error());
  }
}

} // namespace vesper::service
