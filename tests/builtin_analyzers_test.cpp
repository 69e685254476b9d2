#include <cqa/builtin_analyzers.h>

#include <gtest/gtest.h>

namespace cqa {
namespace {

FunctionInfo Function(const std::string &name, int start, int end,
                      int complexity = 1, bool documented = false) {
  FunctionInfo function;
  function.name = name;
  function.line_start = start;
  function.line_end = end;
  function.complexity = complexity;
  function.documented = documented;
  return function;
}

ParsedFile FileWith(std::vector<FunctionInfo> functions,
                    std::vector<ClassInfo> classes = {}) {
  ParsedFile file;
  file.path = "/project/widget.cpp";
  file.language = "cpp";
  file.functions = std::move(functions);
  file.classes = std::move(classes);
  return file;
}

TEST(LongFunctionAnalyzerTest, FlagsFunctionsOverEitherLimit) {
  LongFunctionAnalyzer analyzer(10, 3);
  const auto issues = analyzer.Analyze(
      {FileWith({Function("short", 1, 5), Function("long", 10, 25),
                 Function("branchy", 30, 35, 5),
                 Function("both", 40, 60, 4)})},
      AnalysisContext{});

  ASSERT_EQ(3u, issues.size());
  EXPECT_EQ("Long function 'long'", issues[0].title);
  EXPECT_EQ(Severity::kLow, issues[0].severity);
  EXPECT_DOUBLE_EQ(0.8, issues[0].confidence);
  EXPECT_EQ("Complex function 'branchy'", issues[1].title);
  EXPECT_EQ(Severity::kMedium, issues[1].severity);
  EXPECT_EQ("Long and complex function 'both'", issues[2].title);
  EXPECT_EQ(Severity::kHigh, issues[2].severity);
  for (const auto &issue : issues) {
    EXPECT_EQ("long-function", issue.analyzer);
    EXPECT_EQ(IssueCategory::kComplexity, issue.category);
    EXPECT_EQ("/project/widget.cpp", issue.location.file_path);
  }
}

TEST(LongFunctionAnalyzerTest, VeryLongFunctionIsMediumAndQualified) {
  LongFunctionAnalyzer analyzer(10, 100);
  auto method = Function("Draw", 1, 30);
  method.owner = "Widget";
  const auto issues = analyzer.Analyze({FileWith({method})}, AnalysisContext{});
  ASSERT_EQ(1u, issues.size());
  EXPECT_EQ(Severity::kMedium, issues[0].severity);
  EXPECT_EQ("long-function:/project/widget.cpp:1:Widget::Draw", issues[0].id);
}

TEST(MissingDocumentationAnalyzerTest, FlagsUndocumentedTypesAndFunctions) {
  MissingDocumentationAnalyzer analyzer(5);
  ClassInfo documented{"Documented", 1, 10, true};
  ClassInfo bare{"Bare", 20, 30, false};
  const auto issues = analyzer.Analyze(
      {FileWith({Function("tiny", 40, 42), Function("big", 50, 60),
                 Function("explained", 70, 90, 1, true)},
                {documented, bare})},
      AnalysisContext{});

  ASSERT_EQ(2u, issues.size());
  EXPECT_EQ("Undocumented type 'Bare'", issues[0].title);
  EXPECT_EQ(Severity::kLow, issues[0].severity);
  EXPECT_EQ("Undocumented function 'big'", issues[1].title);
  EXPECT_EQ(Severity::kInfo, issues[1].severity);
  EXPECT_EQ(IssueCategory::kDocumentation, issues[1].category);
}

TEST(BuiltinAnalyzersTest, SupportCAndCpp) {
  const std::vector<std::string> expected = {"c", "cpp"};
  EXPECT_EQ(expected, LongFunctionAnalyzer().SupportedLanguages());
  EXPECT_EQ(expected, MissingDocumentationAnalyzer().SupportedLanguages());
}

} // namespace
} // namespace cqa
