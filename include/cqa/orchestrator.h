#pragma once

#include <cqa/analyzer_registry.h>
#include <cqa/cache_store.h>
#include <cqa/interfaces.h>
#include <cqa/logging.h>
#include <cqa/models.h>
#include <cqa/progress_tracker.h>
#include <cqa/worker_pool.h>

#include <atomic>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cqa {

struct OrchestratorComponents {
  std::unique_ptr<FileDiscovery> discovery;
  std::unique_ptr<ParserAdapter> parser;
  std::unique_ptr<AnalyzerRegistry> registry;
  std::unique_ptr<CacheStore> cache;
  std::shared_ptr<Logger> logger;
};

// Hash of the enabled units and the options that decide which issues a
// file record holds. Records are only reused under the profile that wrote
// them.
std::string BuildAnalysisProfile(const std::vector<RegisteredUnit> &units,
                                 const AnalysisOptions &options);

class Orchestrator {
public:
  explicit Orchestrator(OrchestratorComponents components);

  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  // Throws ResourceError, AnalysisError or CancelledError when the run
  // cannot produce a result. Recovered failures land in result.failures.
  AnalysisRunResult Run(const std::filesystem::path &root,
                        const AnalysisOptions &options,
                        ProgressCallback callback = {},
                        const CancellationToken *cancellation = nullptr);

  // Ignores every cached result but still refreshes the caches.
  AnalysisRunResult ForceFullRun(const std::filesystem::path &root,
                                 const AnalysisOptions &options,
                                 ProgressCallback callback = {});

  // Finished runs stay queryable until kRetainedRuns newer runs finish.
  std::optional<ProgressState> GetStatus(const std::string &analysis_id) const;

  static constexpr std::size_t kRetainedRuns = 64;

  AnalyzerRegistry &Registry() { return *registry_; }
  CacheAdmin &Cache() { return *cache_; }

private:
  struct ParseOutcome {
    std::string path;
    FileFingerprint fingerprint;
    std::optional<ParsedFile> parsed;
    std::optional<FailureRecord> failure;
  };

  struct UnitOutcome {
    std::string name;
    std::vector<Issue> issues;
    std::optional<FailureRecord> failure;
  };

  std::string NextAnalysisId();
  void RetireTracker(const std::string &analysis_id);
  AnalysisRunResult Execute(const std::string &analysis_id,
                            const std::filesystem::path &root,
                            const AnalysisOptions &options,
                            const std::string &profile,
                            ProgressTracker &tracker,
                            const CancellationToken *cancellation);

  std::vector<ParseOutcome> ParseFiles(const std::vector<std::string> &paths,
                                       const AnalysisOptions &options,
                                       ProgressTracker &tracker,
                                       const CancellationToken *cancellation);
  ParseOutcome ParseOne(const std::string &path, ProgressTracker &tracker);

  std::vector<UnitOutcome> RunUnits(const std::vector<PlannedUnit> &plan,
                                    const AnalysisContext &context,
                                    ProgressTracker &tracker,
                                    const CancellationToken *cancellation);
  UnitOutcome RunUnit(const PlannedUnit &planned,
                      const AnalysisContext &context,
                      ProgressTracker &tracker);
  std::vector<Issue> AcceptedIssues(const PlannedUnit &planned,
                                    std::vector<Issue> issues,
                                    const AnalysisOptions &options);

  std::unique_ptr<FileDiscovery> discovery_;
  std::unique_ptr<ParserAdapter> parser_;
  std::unique_ptr<AnalyzerRegistry> registry_;
  std::unique_ptr<CacheStore> cache_;
  std::shared_ptr<Logger> logger_;

  std::atomic<std::uint64_t> run_counter_{0};
  mutable std::mutex trackers_mutex_;
  std::map<std::string, std::shared_ptr<ProgressTracker>> trackers_;
  std::deque<std::string> finished_runs_;
};

} // namespace cqa
