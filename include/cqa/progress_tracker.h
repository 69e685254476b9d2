#pragma once

#include <cqa/interfaces.h>
#include <cqa/logging.h>
#include <cqa/models.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cqa {

struct ProgressDelta {
  std::size_t files_processed = 0;
  std::size_t analyzers_completed = 0;
};

// Shared run state written from worker threads. Status only moves forward:
// pending -> running -> completed|failed, and pending may end directly.
class ProgressTracker {
public:
  ProgressTracker(std::string analysis_id, std::shared_ptr<Logger> logger,
                  TimePoint start_time = Clock::now());

  bool Start(const std::string &phase);
  bool Complete();
  bool Fail(const std::string &message);

  void SetPhase(const std::string &phase);
  void SetTotalFiles(std::size_t total);
  void SetTotalAnalyzers(std::size_t total);
  void Update(const ProgressDelta &delta);

  void Subscribe(ProgressCallback callback);
  ProgressState Snapshot() const;

private:
  bool Transition(RunStatus target, const std::string &phase,
                  const std::string &error);
  void Notify();

  mutable std::mutex state_mutex_;
  ProgressState state_;
  std::mutex callback_mutex_;
  std::vector<ProgressCallback> subscribers_;
  std::shared_ptr<Logger> logger_;
};

} // namespace cqa
