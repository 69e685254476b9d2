#include <cqa/orchestrator.h>

#include <cqa/errors.h>
#include <cqa/hashing.h>
#include <cqa/metrics.h>

#include <algorithm>
#include <chrono>
#include <future>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace cqa {
namespace {
constexpr const char *kPhaseDiscovering = "Discovering files";
constexpr const char *kPhaseParsing = "Parsing files";
constexpr const char *kPhaseAnalyzing = "Running analysis";
constexpr const char *kPhaseMetrics = "Calculating metrics";

void ThrowIfCancelled(const CancellationToken *cancellation) {
  if (cancellation != nullptr && cancellation->IsCancelled()) {
    throw CancelledError();
  }
}

bool RunsSequentially(const AnalysisOptions &options, std::size_t tasks) {
  return !options.parallel_processing || options.max_workers <= 1 ||
         tasks <= 1;
}

bool MeetsMinimumSeverity(const Issue &issue,
                          const std::optional<Severity> &minimum) {
  // Severity enumerators run from most to least severe.
  return !minimum.has_value() ||
         static_cast<int>(issue.severity) <= static_cast<int>(*minimum);
}

bool IssueOrder(const Issue &lhs, const Issue &rhs) {
  return std::tie(lhs.location.file_path, lhs.location.line_start,
                  lhs.analyzer, lhs.id) < std::tie(rhs.location.file_path,
                                                   rhs.location.line_start,
                                                   rhs.analyzer, rhs.id);
}

std::filesystem::path CanonicalRoot(const std::filesystem::path &root) {
  std::error_code error;
  auto canonical = std::filesystem::weakly_canonical(root, error);
  return error ? root : canonical;
}

// Thresholds that differ in any digit must produce different profiles.
std::string FormatThreshold(double value) {
  std::ostringstream stream;
  stream << std::setprecision(std::numeric_limits<double>::max_digits10)
         << value;
  return stream.str();
}
} // namespace

std::string BuildAnalysisProfile(const std::vector<RegisteredUnit> &units,
                                 const AnalysisOptions &options) {
  std::vector<std::string> unit_lines;
  unit_lines.reserve(units.size());
  for (const auto &registered : units) {
    std::ostringstream line;
    line << registered.unit->Name() << '|'
         << ToString(registered.unit->Category()) << '|'
         << FormatThreshold(registered.unit->ConfidenceThreshold()) << '|'
         << ToString(registered.priority) << '|';
    for (const auto &language : registered.languages) {
      line << language << ',';
    }
    unit_lines.push_back(line.str());
  }
  std::sort(unit_lines.begin(), unit_lines.end());

  std::vector<std::string> categories;
  for (const auto category : options.categories) {
    categories.push_back(ToString(category));
  }
  std::sort(categories.begin(), categories.end());

  std::ostringstream stream;
  stream << "cqa-profile-v1\n";
  for (const auto &line : unit_lines) {
    stream << "unit=" << line << '\n';
  }
  stream << "confidence_threshold="
         << FormatThreshold(options.confidence_threshold) << '\n';
  stream << "categories=";
  for (const auto &category : categories) {
    stream << category << ',';
  }
  stream << '\n';
  return Sha256Hex(stream.str());
}

Orchestrator::Orchestrator(OrchestratorComponents components)
    : discovery_(std::move(components.discovery)),
      parser_(std::move(components.parser)),
      registry_(std::move(components.registry)),
      cache_(std::move(components.cache)),
      logger_(EnsureLogger(std::move(components.logger))) {
  if (!discovery_ || !parser_ || !registry_ || !cache_) {
    throw std::invalid_argument(
        "Orchestrator requires discovery, parser, registry and cache");
  }
}

std::string Orchestrator::NextAnalysisId() {
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          Clock::now().time_since_epoch())
                          .count();
  return "analysis-" + std::to_string(millis) + "-" +
         std::to_string(++run_counter_);
}

std::optional<ProgressState>
Orchestrator::GetStatus(const std::string &analysis_id) const {
  std::shared_ptr<ProgressTracker> tracker;
  {
    std::lock_guard<std::mutex> lock(trackers_mutex_);
    const auto found = trackers_.find(analysis_id);
    if (found == trackers_.end()) {
      return std::nullopt;
    }
    tracker = found->second;
  }
  return tracker->Snapshot();
}

void Orchestrator::RetireTracker(const std::string &analysis_id) {
  std::lock_guard<std::mutex> lock(trackers_mutex_);
  finished_runs_.push_back(analysis_id);
  while (finished_runs_.size() > kRetainedRuns) {
    trackers_.erase(finished_runs_.front());
    finished_runs_.pop_front();
  }
}

AnalysisRunResult Orchestrator::ForceFullRun(const std::filesystem::path &root,
                                             const AnalysisOptions &options,
                                             ProgressCallback callback) {
  auto forced = options;
  forced.use_cache = false;
  forced.incremental = false;
  return Run(root, forced, std::move(callback));
}

AnalysisRunResult Orchestrator::Run(const std::filesystem::path &root,
                                    const AnalysisOptions &options,
                                    ProgressCallback callback,
                                    const CancellationToken *cancellation) {
  ValidateOptions(options);
  const auto analysis_id = NextAnalysisId();
  auto tracker = std::make_shared<ProgressTracker>(analysis_id, logger_);
  if (callback) {
    tracker->Subscribe(std::move(callback));
  }
  {
    std::lock_guard<std::mutex> lock(trackers_mutex_);
    trackers_[analysis_id] = tracker;
  }

  const auto canonical_root = CanonicalRoot(root);
  cache_->SetTimeToLive(CacheTimeToLive(options));
  const auto profile = BuildAnalysisProfile(registry_->EnabledUnits(), options);
  logger_->Log(LogLevel::kInfo, "run.start",
               {{"analysis_id", analysis_id},
                {"root", canonical_root.string()},
                {"incremental", options.incremental ? "true" : "false"},
                {"use_cache", options.use_cache ? "true" : "false"}});

  try {
    ThrowIfCancelled(cancellation);
    if (options.use_cache) {
      const auto key = BuildRunCacheKey(canonical_root, options, profile);
      if (auto cached = cache_->RunGet(key)) {
        cached->analysis_id = analysis_id;
        cached->options = options;
        tracker->Complete();
        RetireTracker(analysis_id);
        logger_->Log(LogLevel::kInfo, "run.cache_hit",
                     {{"analysis_id", analysis_id},
                      {"issues", std::to_string(cached->issues.size())}});
        return std::move(*cached);
      }
    }
    auto result = Execute(analysis_id, canonical_root, options, profile,
                          *tracker, cancellation);
    tracker->Complete();
    RetireTracker(analysis_id);
    return result;
  } catch (const CancelledError &error) {
    tracker->Fail(error.what());
    RetireTracker(analysis_id);
    logger_->Log(LogLevel::kWarn, "run.cancelled",
                 {{"analysis_id", analysis_id}});
    throw;
  } catch (const std::exception &error) {
    tracker->Fail(error.what());
    RetireTracker(analysis_id);
    logger_->Log(LogLevel::kError, "run.failed",
                 {{"analysis_id", analysis_id}, {"error", error.what()}});
    throw;
  }
}

AnalysisRunResult Orchestrator::Execute(const std::string &analysis_id,
                                        const std::filesystem::path &root,
                                        const AnalysisOptions &options,
                                        const std::string &profile,
                                        ProgressTracker &tracker,
                                        const CancellationToken *cancellation) {
  const auto started = std::chrono::steady_clock::now();
  tracker.Start(kPhaseDiscovering);
  const auto discovered =
      discovery_->Discover(root, options.include_patterns,
                           options.exclude_patterns, options.max_file_size_mb);
  std::vector<std::string> paths;
  paths.reserve(discovered.size());
  for (const auto &path : discovered) {
    paths.push_back(path.string());
  }
  tracker.SetTotalFiles(paths.size());
  ThrowIfCancelled(cancellation);

  CacheDiff diff;
  if (options.incremental) {
    diff = cache_->Diff(paths, profile);
  } else {
    diff.changed = paths;
  }
  tracker.Update({diff.unchanged.size(), 0});

  tracker.SetPhase(kPhaseParsing);
  auto parse_outcomes =
      ParseFiles(diff.changed, options, tracker, cancellation);

  AnalysisRunResult result;
  result.analysis_id = analysis_id;
  result.root = root.string();
  result.options = options;

  std::vector<ParsedFile> fresh_files;
  for (auto &outcome : parse_outcomes) {
    if (outcome.failure) {
      result.failures.push_back(std::move(*outcome.failure));
    } else {
      fresh_files.push_back(*outcome.parsed);
    }
  }
  if (fresh_files.empty() && diff.records.empty()) {
    throw AnalysisError("No files could be parsed under " + root.string());
  }

  tracker.SetPhase(kPhaseAnalyzing);
  auto plan = registry_->Plan(fresh_files, options.categories);
  tracker.SetTotalAnalyzers(plan.size());
  AnalysisContext context{analysis_id, root, options};

  // Files whose unit failed are not recorded so the next run retries them.
  std::unordered_set<std::string> unretained_files;
  auto unit_outcomes = RunUnits(plan, context, tracker, cancellation);

  std::unordered_map<std::string, std::vector<Issue>> fresh_issues;
  for (std::size_t i = 0; i < unit_outcomes.size(); ++i) {
    auto &outcome = unit_outcomes[i];
    if (outcome.failure) {
      for (const auto &file : plan[i].files) {
        unretained_files.insert(file.path);
      }
      result.failures.push_back(std::move(*outcome.failure));
      continue;
    }
    for (auto &issue : outcome.issues) {
      fresh_issues[issue.location.file_path].push_back(std::move(issue));
    }
  }

  tracker.SetPhase(kPhaseMetrics);
  std::vector<Issue> merged;
  std::vector<FileFingerprint> inputs;
  for (auto &record : diff.records) {
    inputs.push_back(record.fingerprint);
    for (auto &issue : record.issues) {
      merged.push_back(std::move(issue));
    }
    result.files.push_back(std::move(record.parsed));
  }
  for (auto &outcome : parse_outcomes) {
    if (!outcome.parsed) {
      continue;
    }
    auto &file_issues = fresh_issues[outcome.path];
    if (unretained_files.count(outcome.path) == 0) {
      cache_->Put(outcome.fingerprint, *outcome.parsed, file_issues, profile);
    }
    inputs.push_back(outcome.fingerprint);
    merged.insert(merged.end(), file_issues.begin(), file_issues.end());
    result.files.push_back(std::move(*outcome.parsed));
  }

  merged.erase(std::remove_if(merged.begin(), merged.end(),
                              [&](const Issue &issue) {
                                return !MeetsMinimumSeverity(
                                    issue, options.min_severity);
                              }),
               merged.end());
  std::sort(merged.begin(), merged.end(), IssueOrder);
  std::sort(result.files.begin(), result.files.end(),
            [](const ParsedFile &lhs, const ParsedFile &rhs) {
              return lhs.path < rhs.path;
            });
  result.issues = std::move(merged);
  result.metrics = ComputeMetrics(result.files, result.issues,
                                  diff.records.size(), fresh_files.size());
  result.metrics.duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)
          .count();

  if (result.failures.empty()) {
    cache_->RunPut(BuildRunCacheKey(root, options, profile), result,
                   std::move(inputs));
  } else {
    logger_->Log(LogLevel::kInfo, "run.cache_skipped",
                 {{"analysis_id", analysis_id},
                  {"failures", std::to_string(result.failures.size())}});
  }

  logger_->Log(LogLevel::kInfo, "run.complete",
               {{"analysis_id", analysis_id},
                {"files", std::to_string(result.files.size())},
                {"reused", std::to_string(result.metrics.reused_files)},
                {"issues", std::to_string(result.issues.size())},
                {"failures", std::to_string(result.failures.size())},
                {"duration_ms", std::to_string(result.metrics.duration_ms)}});
  return result;
}

Orchestrator::ParseOutcome Orchestrator::ParseOne(const std::string &path,
                                                  ProgressTracker &tracker) {
  ParseOutcome outcome;
  outcome.path = path;
  try {
    // Fingerprint first so an edit made while parsing is seen next run.
    outcome.fingerprint = FingerprintFile(path);
    auto parsed = parser_->Parse(path);
    parsed.path = path;
    outcome.parsed = std::move(parsed);
  } catch (const std::exception &error) {
    outcome.failure = FailureRecord{FailureKind::kParsing, path, error.what()};
    logger_->Log(LogLevel::kWarn, "parse.failed",
                 {{"path", path}, {"error", error.what()}});
  }
  tracker.Update({1, 0});
  return outcome;
}

std::vector<Orchestrator::ParseOutcome>
Orchestrator::ParseFiles(const std::vector<std::string> &paths,
                         const AnalysisOptions &options,
                         ProgressTracker &tracker,
                         const CancellationToken *cancellation) {
  std::vector<ParseOutcome> outcomes;
  outcomes.reserve(paths.size());
  if (RunsSequentially(options, paths.size())) {
    for (const auto &path : paths) {
      ThrowIfCancelled(cancellation);
      outcomes.push_back(ParseOne(path, tracker));
    }
    return outcomes;
  }

  WorkerPool pool(static_cast<std::size_t>(options.max_workers));
  std::vector<std::future<ParseOutcome>> futures;
  futures.reserve(paths.size());
  for (const auto &path : paths) {
    ThrowIfCancelled(cancellation);
    futures.push_back(pool.Submit(
        [this, path, &tracker]() { return ParseOne(path, tracker); }));
  }
  for (auto &future : futures) {
    outcomes.push_back(future.get());
  }
  return outcomes;
}

std::vector<Orchestrator::UnitOutcome>
Orchestrator::RunUnits(const std::vector<PlannedUnit> &plan,
                       const AnalysisContext &context,
                       ProgressTracker &tracker,
                       const CancellationToken *cancellation) {
  std::vector<UnitOutcome> outcomes;
  outcomes.reserve(plan.size());
  if (RunsSequentially(context.options, plan.size())) {
    for (const auto &planned : plan) {
      ThrowIfCancelled(cancellation);
      outcomes.push_back(RunUnit(planned, context, tracker));
    }
    return outcomes;
  }

  // One task per unit, so a unit is never invoked concurrently with itself.
  WorkerPool pool(static_cast<std::size_t>(context.options.max_workers));
  std::vector<std::future<UnitOutcome>> futures;
  futures.reserve(plan.size());
  for (const auto &planned : plan) {
    ThrowIfCancelled(cancellation);
    futures.push_back(pool.Submit([this, &planned, &context, &tracker]() {
      return RunUnit(planned, context, tracker);
    }));
  }
  for (auto &future : futures) {
    outcomes.push_back(future.get());
  }
  return outcomes;
}

Orchestrator::UnitOutcome
Orchestrator::RunUnit(const PlannedUnit &planned,
                      const AnalysisContext &context,
                      ProgressTracker &tracker) {
  UnitOutcome outcome;
  outcome.name = planned.unit->Name();
  logger_->Log(LogLevel::kDebug, "analysis.unit.start",
               {{"unit", outcome.name},
                {"files", std::to_string(planned.files.size())}});
  try {
    outcome.issues = AcceptedIssues(
        planned, planned.unit->Analyze(planned.files, context),
        context.options);
  } catch (const std::exception &error) {
    outcome.failure =
        FailureRecord{FailureKind::kAnalysis, outcome.name, error.what()};
    logger_->Log(LogLevel::kWarn, "analysis.unit.failed",
                 {{"unit", outcome.name}, {"error", error.what()}});
  }
  tracker.Update({0, 1});
  return outcome;
}

std::vector<Issue> Orchestrator::AcceptedIssues(const PlannedUnit &planned,
                                                std::vector<Issue> issues,
                                                const AnalysisOptions &options) {
  const auto name = planned.unit->Name();
  const auto threshold =
      std::max(planned.unit->ConfidenceThreshold(),
               options.confidence_threshold);
  std::set<std::string> scope;
  for (const auto &file : planned.files) {
    scope.insert(file.path);
  }

  std::vector<Issue> accepted;
  accepted.reserve(issues.size());
  std::size_t below_threshold = 0;
  for (auto &issue : issues) {
    if (scope.count(issue.location.file_path) == 0) {
      logger_->Log(LogLevel::kWarn, "analysis.issue.out_of_scope",
                   {{"unit", name},
                    {"issue", issue.id},
                    {"path", issue.location.file_path}});
      continue;
    }
    if (issue.confidence < threshold) {
      ++below_threshold;
      continue;
    }
    if (issue.analyzer.empty()) {
      issue.analyzer = name;
    }
    accepted.push_back(std::move(issue));
  }
  logger_->Log(LogLevel::kDebug, "analysis.unit.complete",
               {{"unit", name},
                {"accepted", std::to_string(accepted.size())},
                {"below_threshold", std::to_string(below_threshold)}});
  return accepted;
}

} // namespace cqa
