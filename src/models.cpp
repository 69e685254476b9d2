#include <cqa/models.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace cqa {
namespace {

std::string Normalize(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  std::replace(value.begin(), value.end(), '-', '_');
  return value;
}

template <typename Enum>
Enum LookupOrThrow(const std::unordered_map<std::string, Enum> &table,
                   const std::string &value, const std::string &kind) {
  const auto found = table.find(Normalize(value));
  if (found == table.end()) {
    throw std::invalid_argument("Unknown " + kind + ": " + value);
  }
  return found->second;
}

} // namespace

std::string ToString(IssueCategory category) {
  switch (category) {
  case IssueCategory::kSecurity:
    return "security";
  case IssueCategory::kPerformance:
    return "performance";
  case IssueCategory::kComplexity:
    return "complexity";
  case IssueCategory::kDuplication:
    return "duplication";
  case IssueCategory::kTesting:
    return "testing";
  case IssueCategory::kDocumentation:
    return "documentation";
  case IssueCategory::kHotspot:
    return "hotspot";
  }
  return "unknown";
}

std::string ToString(Severity severity) {
  switch (severity) {
  case Severity::kCritical:
    return "critical";
  case Severity::kHigh:
    return "high";
  case Severity::kMedium:
    return "medium";
  case Severity::kLow:
    return "low";
  case Severity::kInfo:
    return "info";
  }
  return "unknown";
}

std::string ToString(RunStatus status) {
  switch (status) {
  case RunStatus::kPending:
    return "pending";
  case RunStatus::kRunning:
    return "running";
  case RunStatus::kCompleted:
    return "completed";
  case RunStatus::kFailed:
    return "failed";
  }
  return "unknown";
}

std::string ToString(PriorityTier priority) {
  switch (priority) {
  case PriorityTier::kCritical:
    return "critical";
  case PriorityTier::kHigh:
    return "high";
  case PriorityTier::kMedium:
    return "medium";
  case PriorityTier::kLow:
    return "low";
  }
  return "unknown";
}

std::string ToString(FailureKind kind) {
  switch (kind) {
  case FailureKind::kParsing:
    return "parsing";
  case FailureKind::kAnalysis:
    return "analysis";
  case FailureKind::kCache:
    return "cache";
  }
  return "unknown";
}

IssueCategory ParseIssueCategory(const std::string &value) {
  static const std::unordered_map<std::string, IssueCategory> table = {
      {"security", IssueCategory::kSecurity},
      {"performance", IssueCategory::kPerformance},
      {"complexity", IssueCategory::kComplexity},
      {"duplication", IssueCategory::kDuplication},
      {"testing", IssueCategory::kTesting},
      {"documentation", IssueCategory::kDocumentation},
      {"hotspot", IssueCategory::kHotspot}};
  return LookupOrThrow(table, value, "issue category");
}

Severity ParseSeverity(const std::string &value) {
  static const std::unordered_map<std::string, Severity> table = {
      {"critical", Severity::kCritical},
      {"high", Severity::kHigh},
      {"medium", Severity::kMedium},
      {"low", Severity::kLow},
      {"info", Severity::kInfo}};
  return LookupOrThrow(table, value, "severity");
}

PriorityTier ParsePriorityTier(const std::string &value) {
  static const std::unordered_map<std::string, PriorityTier> table = {
      {"critical", PriorityTier::kCritical},
      {"high", PriorityTier::kHigh},
      {"medium", PriorityTier::kMedium},
      {"low", PriorityTier::kLow}};
  return LookupOrThrow(table, value, "priority");
}

FailureKind ParseFailureKind(const std::string &value) {
  static const std::unordered_map<std::string, FailureKind> table = {
      {"parsing", FailureKind::kParsing},
      {"analysis", FailureKind::kAnalysis},
      {"cache", FailureKind::kCache}};
  return LookupOrThrow(table, value, "failure kind");
}

const std::vector<IssueCategory> &AllIssueCategories() {
  static const std::vector<IssueCategory> categories = {
      IssueCategory::kSecurity,    IssueCategory::kPerformance,
      IssueCategory::kComplexity,  IssueCategory::kDuplication,
      IssueCategory::kTesting,     IssueCategory::kDocumentation,
      IssueCategory::kHotspot};
  return categories;
}

const std::vector<Severity> &AllSeverities() {
  static const std::vector<Severity> severities = {
      Severity::kCritical, Severity::kHigh, Severity::kMedium, Severity::kLow,
      Severity::kInfo};
  return severities;
}

std::string DetectLanguage(const std::filesystem::path &path) {
  static const std::unordered_map<std::string, std::string> kLanguages = {
      {".c", "c"},          {".h", "c"},           {".cc", "cpp"},
      {".cpp", "cpp"},      {".cxx", "cpp"},       {".hh", "cpp"},
      {".hpp", "cpp"},      {".hxx", "cpp"},       {".ixx", "cpp"},
      {".py", "python"},    {".js", "javascript"}, {".jsx", "javascript"},
      {".ts", "typescript"}, {".tsx", "typescript"}};
  auto extension = path.extension().string();
  std::transform(
      extension.begin(), extension.end(), extension.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  const auto found = kLanguages.find(extension);
  if (found == kLanguages.end()) {
    return "unknown";
  }
  return found->second;
}

bool operator==(const FileFingerprint &lhs, const FileFingerprint &rhs) {
  return lhs.path == rhs.path && lhs.content_hash == rhs.content_hash &&
         lhs.size_bytes == rhs.size_bytes;
}

bool operator!=(const FileFingerprint &lhs, const FileFingerprint &rhs) {
  return !(lhs == rhs);
}

const std::vector<std::string> &DefaultIncludePatterns() {
  static const std::vector<std::string> patterns = {
      "*.c", "*.cc", "*.cpp", "*.cxx", "*.h", "*.hh", "*.hpp", "*.hxx"};
  return patterns;
}

const std::vector<std::string> &DefaultExcludePatterns() {
  static const std::vector<std::string> patterns = {
      ".git/**", "build/**", "node_modules/**", ".cqa_cache/**"};
  return patterns;
}

AnalysisOptions DefaultAnalysisOptions() {
  AnalysisOptions options;
  options.include_patterns = DefaultIncludePatterns();
  options.exclude_patterns = DefaultExcludePatterns();
  return options;
}

void ValidateOptions(const AnalysisOptions &options) {
  if (options.max_workers < 1) {
    throw std::invalid_argument("max_workers must be at least 1");
  }
  if (!(options.confidence_threshold >= 0.0 &&
        options.confidence_threshold <= 1.0)) {
    throw std::invalid_argument("confidence_threshold must be within [0, 1]");
  }
  if (!(options.max_file_size_mb > 0.0)) {
    throw std::invalid_argument("max_file_size_mb must be positive");
  }
  if (!(options.cache_ttl_hours > 0.0) ||
      !std::isfinite(options.cache_ttl_hours)) {
    throw std::invalid_argument("cache_ttl_hours must be positive and finite");
  }
}

std::chrono::milliseconds MaxTimeToLive() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::duration::max());
}

std::chrono::milliseconds CacheTimeToLive(const AnalysisOptions &options) {
  const auto limit = MaxTimeToLive();
  const auto millis = options.cache_ttl_hours * 3600.0 * 1000.0;
  if (!(millis < static_cast<double>(limit.count()))) {
    return limit;
  }
  return std::chrono::milliseconds(
      static_cast<std::int64_t>(std::llround(millis)));
}

double ProgressState::Percentage() const {
  if (status == RunStatus::kCompleted) {
    return 100.0;
  }
  const auto files_ratio =
      static_cast<double>(files_processed) /
      static_cast<double>(std::max<std::size_t>(1, total_files));
  const auto analyzers_ratio =
      static_cast<double>(analyzers_completed) /
      static_cast<double>(std::max<std::size_t>(1, total_analyzers));
  const auto value = 100.0 * (0.3 * files_ratio + 0.7 * analyzers_ratio);
  return std::clamp(value, 0.0, 100.0);
}

bool ProgressState::IsTerminal() const {
  return status == RunStatus::kCompleted || status == RunStatus::kFailed;
}

double CacheStats::HitRatePercent() const {
  const auto total = hits + misses;
  if (total == 0) {
    return 0.0;
  }
  return 100.0 * static_cast<double>(hits) / static_cast<double>(total);
}

} // namespace cqa
