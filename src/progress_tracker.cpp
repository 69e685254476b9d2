#include <cqa/progress_tracker.h>

#include <exception>
#include <utility>

namespace cqa {
namespace {

bool IsAllowed(RunStatus from, RunStatus to) {
  switch (from) {
  case RunStatus::kPending:
    return to != RunStatus::kPending;
  case RunStatus::kRunning:
    return to == RunStatus::kCompleted || to == RunStatus::kFailed;
  case RunStatus::kCompleted:
  case RunStatus::kFailed:
    return false;
  }
  return false;
}

} // namespace

ProgressTracker::ProgressTracker(std::string analysis_id,
                                 std::shared_ptr<Logger> logger,
                                 TimePoint start_time)
    : logger_(EnsureLogger(std::move(logger))) {
  state_.analysis_id = std::move(analysis_id);
  state_.start_time = start_time;
  state_.phase = "Pending";
}

bool ProgressTracker::Start(const std::string &phase) {
  return Transition(RunStatus::kRunning, phase, {});
}

bool ProgressTracker::Complete() {
  return Transition(RunStatus::kCompleted, "Completed", {});
}

bool ProgressTracker::Fail(const std::string &message) {
  return Transition(RunStatus::kFailed, "Failed", message);
}

bool ProgressTracker::Transition(RunStatus target, const std::string &phase,
                                 const std::string &error) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!IsAllowed(state_.status, target)) {
      logger_->Log(LogLevel::kWarn, "progress.transition.rejected",
                   {{"analysis_id", state_.analysis_id},
                    {"from", ToString(state_.status)},
                    {"to", ToString(target)}});
      return false;
    }
    state_.status = target;
    state_.phase = phase;
    if (!error.empty()) {
      state_.error = error;
    }
  }
  Notify();
  if (target == RunStatus::kCompleted || target == RunStatus::kFailed) {
    // Callbacks often capture the caller's stack; release them with the run.
    std::lock_guard<std::mutex> lock(callback_mutex_);
    subscribers_.clear();
  }
  return true;
}

void ProgressTracker::SetPhase(const std::string &phase) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.IsTerminal()) {
      return;
    }
    state_.phase = phase;
  }
  logger_->Log(LogLevel::kDebug, "progress.phase", {{"phase", phase}});
  Notify();
}

void ProgressTracker::SetTotalFiles(std::size_t total) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.IsTerminal()) {
      return;
    }
    state_.total_files = total;
  }
  Notify();
}

void ProgressTracker::SetTotalAnalyzers(std::size_t total) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.IsTerminal()) {
      return;
    }
    state_.total_analyzers = total;
  }
  Notify();
}

void ProgressTracker::Update(const ProgressDelta &delta) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.IsTerminal()) {
      return;
    }
    state_.files_processed += delta.files_processed;
    state_.analyzers_completed += delta.analyzers_completed;
  }
  Notify();
}

void ProgressTracker::Subscribe(ProgressCallback callback) {
  if (!callback) {
    return;
  }
  std::lock_guard<std::mutex> lock(callback_mutex_);
  subscribers_.push_back(std::move(callback));
}

ProgressState ProgressTracker::Snapshot() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

// The snapshot is taken under the callback lock so subscribers observe states
// in the order they were produced.
void ProgressTracker::Notify() {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  if (subscribers_.empty()) {
    return;
  }
  const auto snapshot = Snapshot();
  for (const auto &subscriber : subscribers_) {
    try {
      subscriber(snapshot);
    } catch (const std::exception &ex) {
      logger_->Log(LogLevel::kWarn, "progress.callback.failed",
                   {{"analysis_id", snapshot.analysis_id},
                    {"error", ex.what()}});
    } catch (...) {
      logger_->Log(LogLevel::kWarn, "progress.callback.failed",
                   {{"analysis_id", snapshot.analysis_id},
                    {"error", "non-standard exception"}});
    }
  }
}

} // namespace cqa
