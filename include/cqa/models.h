#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cqa {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class IssueCategory {
  kSecurity,
  kPerformance,
  kComplexity,
  kDuplication,
  kTesting,
  kDocumentation,
  kHotspot
};

enum class Severity { kCritical, kHigh, kMedium, kLow, kInfo };

enum class RunStatus { kPending, kRunning, kCompleted, kFailed };

// Lower tiers run earlier.
enum class PriorityTier { kCritical = 1, kHigh = 2, kMedium = 3, kLow = 4 };

enum class FailureKind { kParsing, kAnalysis, kCache };

std::string ToString(IssueCategory category);
std::string ToString(Severity severity);
std::string ToString(RunStatus status);
std::string ToString(PriorityTier priority);
std::string ToString(FailureKind kind);

IssueCategory ParseIssueCategory(const std::string &value);
Severity ParseSeverity(const std::string &value);
PriorityTier ParsePriorityTier(const std::string &value);
FailureKind ParseFailureKind(const std::string &value);

const std::vector<IssueCategory> &AllIssueCategories();
const std::vector<Severity> &AllSeverities();

std::string DetectLanguage(const std::filesystem::path &path);

struct CodeLocation {
  std::string file_path;
  int line_start = 0;
  int line_end = 0;
};

struct Issue {
  std::string id;
  IssueCategory category = IssueCategory::kComplexity;
  Severity severity = Severity::kInfo;
  std::string title;
  std::string description;
  CodeLocation location;
  std::string suggestion;
  double confidence = 1.0;
  std::string analyzer;
};

struct FunctionInfo {
  std::string name;
  std::string owner;
  int line_start = 0;
  int line_end = 0;
  int parameter_count = 0;
  int complexity = 1;
  bool documented = false;
};

struct ClassInfo {
  std::string name;
  int line_start = 0;
  int line_end = 0;
  bool documented = false;
};

struct IncludeInfo {
  std::string target;
  int line = 0;
};

struct ParsedFile {
  std::string path;
  std::string language;
  std::string content;
  int line_count = 0;
  std::uintmax_t size_bytes = 0;
  std::vector<FunctionInfo> functions;
  std::vector<ClassInfo> classes;
  std::vector<IncludeInfo> includes;
};

struct FileFingerprint {
  std::string path;
  std::string content_hash;
  std::uintmax_t size_bytes = 0;
};

bool operator==(const FileFingerprint &lhs, const FileFingerprint &rhs);
bool operator!=(const FileFingerprint &lhs, const FileFingerprint &rhs);

struct FileRecord {
  FileFingerprint fingerprint;
  ParsedFile parsed;
  std::vector<Issue> issues;
  std::string profile;
  TimePoint cached_at;
};

struct AnalysisOptions {
  std::vector<std::string> include_patterns;
  std::vector<std::string> exclude_patterns;
  bool parallel_processing = true;
  int max_workers = 4;
  bool use_cache = true;
  bool incremental = true;
  double confidence_threshold = 0.0;
  double max_file_size_mb = 10.0;
  double cache_ttl_hours = 24.0;
  std::vector<IssueCategory> categories;
  std::optional<Severity> min_severity;
};

const std::vector<std::string> &DefaultIncludePatterns();
const std::vector<std::string> &DefaultExcludePatterns();
AnalysisOptions DefaultAnalysisOptions();
void ValidateOptions(const AnalysisOptions &options);
// Clamped to MaxTimeToLive().
std::chrono::milliseconds CacheTimeToLive(const AnalysisOptions &options);
// Longest TTL that still compares safely against clock durations.
std::chrono::milliseconds MaxTimeToLive();

struct ProgressState {
  std::string analysis_id;
  RunStatus status = RunStatus::kPending;
  std::string phase;
  std::size_t files_processed = 0;
  std::size_t total_files = 0;
  std::size_t analyzers_completed = 0;
  std::size_t total_analyzers = 0;
  TimePoint start_time;
  std::string error;

  double Percentage() const;
  bool IsTerminal() const;
};

struct FailureRecord {
  FailureKind kind = FailureKind::kParsing;
  std::string subject;
  std::string message;
};

struct QualityMetrics {
  std::size_t total_files = 0;
  std::size_t reused_files = 0;
  std::size_t reanalyzed_files = 0;
  std::size_t total_lines = 0;
  std::size_t total_functions = 0;
  std::size_t total_classes = 0;
  std::size_t total_issues = 0;
  std::map<Severity, std::size_t> issues_by_severity;
  std::map<IssueCategory, std::size_t> issues_by_category;
  double issues_per_thousand_lines = 0.0;
  std::int64_t duration_ms = 0;
};

struct AnalysisRunResult {
  std::string analysis_id;
  std::string root;
  std::vector<ParsedFile> files;
  std::vector<Issue> issues;
  QualityMetrics metrics;
  AnalysisOptions options;
  std::vector<FailureRecord> failures;
  bool served_from_cache = false;
};

struct RunCacheEntry {
  std::string key;
  AnalysisRunResult result;
  std::vector<FileFingerprint> inputs;
  TimePoint cached_at;
};

struct CacheDiff {
  std::vector<std::string> changed;
  std::vector<std::string> unchanged;
  // Validated records of the unchanged paths, in the same order.
  std::vector<FileRecord> records;
};

struct CacheStats {
  std::size_t file_entries = 0;
  std::size_t run_entries = 0;
  std::size_t hits = 0;
  std::size_t misses = 0;

  double HitRatePercent() const;
};

} // namespace cqa
