#include <cqa/report_writer.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace cqa {
namespace {
constexpr const char *kMarkdownFile = "cqa_report.md";
constexpr const char *kJsonFile = "cqa_report.json";

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""},
      {'\\', "\\\\"},
      {'\n', "\\n"},
      {'\r', "\\r"},
      {'\t', "\\t"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string Quote(const std::string &value) {
  return "\"" + EscapeJsonString(value) + "\"";
}

// Table cells cannot carry pipes or line breaks.
std::string EscapeCell(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    if (character == '|') {
      escaped.append("\\|");
    } else if (character == '\n' || character == '\r') {
      escaped.push_back(' ');
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

template <typename Collection, typename Formatter>
std::string Join(const Collection &items, const std::string &delimiter,
                 Formatter formatter) {
  std::ostringstream output;
  bool first = true;
  std::for_each(items.begin(), items.end(), [&](const auto &item) {
    if (!first) {
      output << delimiter;
    }
    output << formatter(item);
    first = false;
  });
  return output.str();
}

std::string FormatDouble(double value) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(2) << value;
  return stream.str();
}

std::string BuildSummaryMarkdown(const AnalysisRunResult &result) {
  const auto &metrics = result.metrics;
  std::ostringstream section;
  section << "## Summary\n\n";
  section << "| Field | Value |\n";
  section << "| --- | --- |\n";
  section << "| Analysis | " << result.analysis_id << " |\n";
  section << "| Root | " << EscapeCell(result.root) << " |\n";
  section << "| Files | " << metrics.total_files << " |\n";
  section << "| Reused From Cache | " << metrics.reused_files << " |\n";
  section << "| Reanalyzed | " << metrics.reanalyzed_files << " |\n";
  section << "| Lines | " << metrics.total_lines << " |\n";
  section << "| Functions | " << metrics.total_functions << " |\n";
  section << "| Classes | " << metrics.total_classes << " |\n";
  section << "| Issues | " << metrics.total_issues << " |\n";
  section << "| Issues per 1000 Lines | "
          << FormatDouble(metrics.issues_per_thousand_lines) << " |\n";
  section << "| Served From Run Cache | "
          << (result.served_from_cache ? "yes" : "no") << " |\n";
  section << "| Duration (ms) | " << metrics.duration_ms << " |\n\n";
  return section.str();
}

std::string BuildBreakdownMarkdown(const QualityMetrics &metrics) {
  std::ostringstream section;
  section << "## Issues by Severity\n\n";
  section << "| Severity | Count |\n";
  section << "| --- | --- |\n";
  for (const auto severity : AllSeverities()) {
    const auto found = metrics.issues_by_severity.find(severity);
    section << "| " << ToString(severity) << " | "
            << (found == metrics.issues_by_severity.end() ? 0 : found->second)
            << " |\n";
  }
  section << "\n## Issues by Category\n\n";
  section << "| Category | Count |\n";
  section << "| --- | --- |\n";
  for (const auto category : AllIssueCategories()) {
    const auto found = metrics.issues_by_category.find(category);
    section << "| " << ToString(category) << " | "
            << (found == metrics.issues_by_category.end() ? 0 : found->second)
            << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildIssuesMarkdown(const std::vector<Issue> &issues) {
  std::ostringstream section;
  section << "## Issues\n\n";
  section << "| Severity | Category | Location | Title | Suggestion | "
             "Confidence | Analyzer |\n";
  section << "| --- | --- | --- | --- | --- | --- | --- |\n";
  if (issues.empty()) {
    section << "| None | - | - | - | - | - | - |\n\n";
    return section.str();
  }
  for (const auto &issue : issues) {
    const auto suggestion =
        issue.suggestion.empty() ? std::string("-") : issue.suggestion;
    section << "| " << ToString(issue.severity) << " | "
            << ToString(issue.category) << " | "
            << EscapeCell(issue.location.file_path) << ":"
            << issue.location.line_start << " | " << EscapeCell(issue.title)
            << " | " << EscapeCell(suggestion) << " | "
            << FormatDouble(issue.confidence) << " | " << issue.analyzer
            << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildFailuresMarkdown(const std::vector<FailureRecord> &failures) {
  std::ostringstream section;
  section << "## Partial Failures\n\n";
  if (failures.empty()) {
    section << "- None\n\n";
    return section.str();
  }
  for (const auto &failure : failures) {
    section << "- " << ToString(failure.kind) << ": " << failure.subject
            << " (" << failure.message << ")\n";
  }
  section << "\n";
  return section.str();
}

std::string LocationJson(const CodeLocation &location) {
  std::ostringstream json;
  json << "{\"file\":" << Quote(location.file_path)
       << ",\"line_start\":" << location.line_start
       << ",\"line_end\":" << location.line_end << "}";
  return json.str();
}

std::string IssueJson(const Issue &issue) {
  std::ostringstream json;
  json << "{\"id\":" << Quote(issue.id)
       << ",\"category\":" << Quote(ToString(issue.category))
       << ",\"severity\":" << Quote(ToString(issue.severity))
       << ",\"title\":" << Quote(issue.title)
       << ",\"description\":" << Quote(issue.description)
       << ",\"location\":" << LocationJson(issue.location)
       << ",\"suggestion\":" << Quote(issue.suggestion)
       << ",\"confidence\":" << FormatDouble(issue.confidence)
       << ",\"analyzer\":" << Quote(issue.analyzer) << "}";
  return json.str();
}

template <typename Key>
std::string CountsJson(const std::map<Key, std::size_t> &counts) {
  return "{" +
         Join(counts, ",",
              [](const auto &entry) {
                return Quote(ToString(entry.first)) + ":" +
                       std::to_string(entry.second);
              }) +
         "}";
}

std::string MetricsJson(const QualityMetrics &metrics) {
  std::ostringstream json;
  json << "{\"total_files\":" << metrics.total_files
       << ",\"reused_files\":" << metrics.reused_files
       << ",\"reanalyzed_files\":" << metrics.reanalyzed_files
       << ",\"total_lines\":" << metrics.total_lines
       << ",\"total_functions\":" << metrics.total_functions
       << ",\"total_classes\":" << metrics.total_classes
       << ",\"total_issues\":" << metrics.total_issues
       << ",\"issues_by_severity\":" << CountsJson(metrics.issues_by_severity)
       << ",\"issues_by_category\":" << CountsJson(metrics.issues_by_category)
       << ",\"issues_per_thousand_lines\":"
       << FormatDouble(metrics.issues_per_thousand_lines)
       << ",\"duration_ms\":" << metrics.duration_ms << "}";
  return json.str();
}

void WriteFile(const std::filesystem::path &path, const std::string &content) {
  std::ofstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
}
} // namespace

std::string RenderMarkdownReport(const AnalysisRunResult &result) {
  std::ostringstream report;
  report << "# Code Quality Report\n\n";
  report << BuildSummaryMarkdown(result);
  report << BuildBreakdownMarkdown(result.metrics);
  report << BuildIssuesMarkdown(result.issues);
  report << BuildFailuresMarkdown(result.failures);
  return report.str();
}

std::string RenderJsonReport(const AnalysisRunResult &result) {
  std::ostringstream json;
  json << "{\"analysis_id\":" << Quote(result.analysis_id)
       << ",\"root\":" << Quote(result.root)
       << ",\"served_from_cache\":"
       << (result.served_from_cache ? "true" : "false")
       << ",\"files\":["
       << Join(result.files, ",",
               [](const ParsedFile &file) { return Quote(file.path); })
       << "],\"metrics\":" << MetricsJson(result.metrics) << ",\"issues\":["
       << Join(result.issues, ",", IssueJson) << "],\"failures\":["
       << Join(result.failures, ",",
               [](const FailureRecord &failure) {
                 return "{\"kind\":" + Quote(ToString(failure.kind)) +
                        ",\"subject\":" + Quote(failure.subject) +
                        ",\"message\":" + Quote(failure.message) + "}";
               })
       << "]}";
  return json.str();
}

std::vector<std::filesystem::path>
WriteReports(const std::filesystem::path &directory,
             const AnalysisRunResult &result,
             const std::vector<std::string> &formats) {
  const auto wants = [&](const std::string &format) {
    if (formats.empty()) {
      return format == "markdown";
    }
    return std::find(formats.begin(), formats.end(), format) != formats.end();
  };

  std::filesystem::create_directories(directory);
  std::vector<std::filesystem::path> written;
  if (wants("markdown")) {
    written.push_back(directory / kMarkdownFile);
    WriteFile(written.back(), RenderMarkdownReport(result));
  }
  if (wants("json")) {
    written.push_back(directory / kJsonFile);
    WriteFile(written.back(), RenderJsonReport(result));
  }
  return written;
}

} // namespace cqa
