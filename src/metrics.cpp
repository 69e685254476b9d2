#include <cqa/metrics.h>

#include <algorithm>

namespace cqa {

QualityMetrics ComputeMetrics(const std::vector<ParsedFile> &files,
                              const std::vector<Issue> &issues,
                              std::size_t reused_files,
                              std::size_t reanalyzed_files) {
  QualityMetrics metrics;
  metrics.total_files = files.size();
  metrics.reused_files = reused_files;
  metrics.reanalyzed_files = reanalyzed_files;
  for (const auto &file : files) {
    metrics.total_lines += static_cast<std::size_t>(std::max(0, file.line_count));
    metrics.total_functions += file.functions.size();
    metrics.total_classes += file.classes.size();
  }

  for (const auto severity : AllSeverities()) {
    metrics.issues_by_severity[severity] = 0;
  }
  for (const auto category : AllIssueCategories()) {
    metrics.issues_by_category[category] = 0;
  }
  for (const auto &issue : issues) {
    ++metrics.issues_by_severity[issue.severity];
    ++metrics.issues_by_category[issue.category];
  }
  metrics.total_issues = issues.size();
  if (metrics.total_lines > 0) {
    metrics.issues_per_thousand_lines =
        1000.0 * static_cast<double>(issues.size()) /
        static_cast<double>(metrics.total_lines);
  }
  return metrics;
}

bool HasBlockingIssues(const std::vector<Issue> &issues) {
  return std::any_of(issues.begin(), issues.end(), [](const Issue &issue) {
    return issue.severity == Severity::kCritical ||
           issue.severity == Severity::kHigh;
  });
}

} // namespace cqa
