#pragma once

#include <cqa/interfaces.h>

#include <string>
#include <vector>

namespace cqa {

class LongFunctionAnalyzer : public AnalyzerUnit {
public:
  explicit LongFunctionAnalyzer(int max_lines = 60, int max_complexity = 10);

  std::string Name() const override { return "long-function"; }
  IssueCategory Category() const override {
    return IssueCategory::kComplexity;
  }
  std::vector<std::string> SupportedLanguages() const override;
  std::vector<Issue> Analyze(const std::vector<ParsedFile> &files,
                             const AnalysisContext &context) override;

private:
  int max_lines_;
  int max_complexity_;
};

class MissingDocumentationAnalyzer : public AnalyzerUnit {
public:
  explicit MissingDocumentationAnalyzer(int min_function_lines = 5);

  std::string Name() const override { return "missing-documentation"; }
  IssueCategory Category() const override {
    return IssueCategory::kDocumentation;
  }
  std::vector<std::string> SupportedLanguages() const override;
  std::vector<Issue> Analyze(const std::vector<ParsedFile> &files,
                             const AnalysisContext &context) override;

private:
  int min_function_lines_;
};

} // namespace cqa
