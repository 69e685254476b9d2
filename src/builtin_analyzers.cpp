#include <cqa/builtin_analyzers.h>

#include <algorithm>

namespace cqa {
namespace {

std::string QualifiedName(const FunctionInfo &function) {
  if (function.owner.empty()) {
    return function.name;
  }
  return function.owner + "::" + function.name;
}

std::string IssueId(const std::string &analyzer, const std::string &path,
                    int line, const std::string &subject) {
  return analyzer + ":" + path + ":" + std::to_string(line) + ":" + subject;
}

int LineSpan(int start, int end) { return std::max(0, end - start + 1); }

} // namespace

LongFunctionAnalyzer::LongFunctionAnalyzer(int max_lines, int max_complexity)
    : max_lines_(max_lines), max_complexity_(max_complexity) {}

std::vector<std::string> LongFunctionAnalyzer::SupportedLanguages() const {
  return {"c", "cpp"};
}

std::vector<Issue>
LongFunctionAnalyzer::Analyze(const std::vector<ParsedFile> &files,
                              const AnalysisContext &) {
  std::vector<Issue> issues;
  for (const auto &file : files) {
    for (const auto &function : file.functions) {
      const auto length = LineSpan(function.line_start, function.line_end);
      const bool too_long = length > max_lines_;
      const bool too_complex = function.complexity > max_complexity_;
      if (!too_long && !too_complex) {
        continue;
      }

      const auto name = QualifiedName(function);
      Issue issue;
      issue.id = IssueId(Name(), file.path, function.line_start, name);
      issue.category = Category();
      issue.analyzer = Name();
      issue.location = {file.path, function.line_start, function.line_end};
      if (too_long && too_complex) {
        issue.severity = Severity::kHigh;
        issue.title = "Long and complex function '" + name + "'";
      } else if (too_complex) {
        issue.severity = Severity::kMedium;
        issue.title = "Complex function '" + name + "'";
      } else {
        issue.severity =
            length > 2 * max_lines_ ? Severity::kMedium : Severity::kLow;
        issue.title = "Long function '" + name + "'";
      }
      issue.description = name + " spans " + std::to_string(length) +
                          " lines with cyclomatic complexity " +
                          std::to_string(function.complexity) + " (limits " +
                          std::to_string(max_lines_) + " lines, complexity " +
                          std::to_string(max_complexity_) + ").";
      issue.suggestion =
          "Extract cohesive blocks of '" + name + "' into helper functions.";
      issue.confidence = too_complex ? 0.9 : 0.8;
      issues.push_back(std::move(issue));
    }
  }
  return issues;
}

MissingDocumentationAnalyzer::MissingDocumentationAnalyzer(
    int min_function_lines)
    : min_function_lines_(min_function_lines) {}

std::vector<std::string>
MissingDocumentationAnalyzer::SupportedLanguages() const {
  return {"c", "cpp"};
}

std::vector<Issue>
MissingDocumentationAnalyzer::Analyze(const std::vector<ParsedFile> &files,
                                      const AnalysisContext &) {
  std::vector<Issue> issues;
  for (const auto &file : files) {
    for (const auto &klass : file.classes) {
      if (klass.documented) {
        continue;
      }
      Issue issue;
      issue.id = IssueId(Name(), file.path, klass.line_start, klass.name);
      issue.category = Category();
      issue.severity = Severity::kLow;
      issue.analyzer = Name();
      issue.title = "Undocumented type '" + klass.name + "'";
      issue.description = "Type '" + klass.name +
                          "' has no preceding documentation comment.";
      issue.location = {file.path, klass.line_start, klass.line_end};
      issue.suggestion = "Describe the responsibility of '" + klass.name +
                         "' in a comment above its definition.";
      issue.confidence = 0.85;
      issues.push_back(std::move(issue));
    }

    for (const auto &function : file.functions) {
      if (function.documented ||
          LineSpan(function.line_start, function.line_end) <
              min_function_lines_) {
        continue;
      }
      const auto name = QualifiedName(function);
      Issue issue;
      issue.id = IssueId(Name(), file.path, function.line_start, name);
      issue.category = Category();
      issue.severity = Severity::kInfo;
      issue.analyzer = Name();
      issue.title = "Undocumented function '" + name + "'";
      issue.description =
          "Function '" + name + "' has no preceding documentation comment.";
      issue.location = {file.path, function.line_start, function.line_end};
      issue.suggestion = "Document the contract of '" + name + "'.";
      issue.confidence = 0.75;
      issues.push_back(std::move(issue));
    }
  }
  return issues;
}

} // namespace cqa
