#include <cqa/errors.h>
#include <cqa/orchestrator_builder.h>

#include "test_support/counting_collaborators.h"
#include "test_support/temporary_project.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

namespace cqa {
namespace {

using ::testing::Contains;
using ::testing::Each;
using ::testing::Field;
using ::testing::Not;

// Reports one issue outside its scope and one without an analyzer name.
class StrayUnit : public AnalyzerUnit {
public:
  std::string Name() const override { return "stray"; }
  IssueCategory Category() const override { return IssueCategory::kHotspot; }
  std::vector<std::string> SupportedLanguages() const override {
    return {"cpp"};
  }
  std::vector<Issue> Analyze(const std::vector<ParsedFile> &files,
                             const AnalysisContext &) override {
    Issue outside;
    outside.id = "outside";
    outside.location = {"/elsewhere/other.cpp", 1, 1};
    outside.analyzer = Name();
    Issue unnamed;
    unnamed.id = "unnamed";
    unnamed.location = {files.front().path, 2, 2};
    return {outside, unnamed};
  }
};

std::vector<std::string> IssueIds(const AnalysisRunResult &result) {
  std::vector<std::string> ids;
  for (const auto &issue : result.issues) {
    ids.push_back(issue.id);
  }
  return ids;
}

class OrchestratorTest : public ::testing::Test {
protected:
  std::unique_ptr<Orchestrator>
  Build(const std::vector<std::shared_ptr<AnalyzerUnit>> &units) {
    auto parser = std::make_unique<test::CountingParser>();
    parser_ = parser.get();
    auto registry = std::make_unique<AnalyzerRegistry>();
    for (const auto &unit : units) {
      registry->Register(unit);
    }
    return OrchestratorBuilder()
        .WithParser(std::move(parser))
        .WithRegistry(std::move(registry))
        .Build();
  }

  static AnalysisOptions Options() {
    auto options = DefaultAnalysisOptions();
    options.max_workers = 4;
    return options;
  }

  void AddThreeFiles() {
    project_.AddFile("one.cpp", "int one();\n");
    project_.AddFile("two.cpp", "int two();\n");
    project_.AddFile("three.cpp", "int three();\n");
  }

  test::TemporaryProject project_;
  test::CountingParser *parser_ = nullptr;
};

TEST_F(OrchestratorTest, IncrementalRunsReuseUnchangedFiles) {
  AddThreeFiles();
  auto unit = std::make_shared<test::CountingUnit>();
  auto orchestrator = Build({unit});

  const auto first = orchestrator->Run(project_.root(), Options());
  EXPECT_EQ(3, parser_->calls.load());
  EXPECT_EQ(3, unit->visits.load());
  EXPECT_EQ(3u, first.issues.size());
  EXPECT_EQ(3u, orchestrator->Cache().Stats().file_entries);
  EXPECT_FALSE(first.served_from_cache);

  const auto second = orchestrator->Run(project_.root(), Options());
  EXPECT_EQ(3, parser_->calls.load());
  EXPECT_EQ(3, unit->visits.load());
  EXPECT_TRUE(second.served_from_cache);
  EXPECT_EQ(IssueIds(first), IssueIds(second));
  EXPECT_NE(first.analysis_id, second.analysis_id);

  const auto two = (project_.root() / "two.cpp").string();
  project_.AddFile("two.cpp", "int two(int changed);\n");
  const auto third = orchestrator->Run(project_.root(), Options());
  EXPECT_EQ(4, parser_->calls.load());
  EXPECT_EQ(4, unit->visits.load());
  EXPECT_EQ(3u, third.issues.size());
  EXPECT_EQ(2u, third.metrics.reused_files);
  EXPECT_EQ(1u, third.metrics.reanalyzed_files);
  EXPECT_FALSE(third.served_from_cache);

  project_.RemoveFile("two.cpp");
  const auto fourth = orchestrator->Run(project_.root(), Options());
  EXPECT_EQ(4, parser_->calls.load());
  EXPECT_EQ(4, unit->visits.load());
  EXPECT_EQ(2u, fourth.issues.size());
  EXPECT_EQ(2u, fourth.files.size());
  EXPECT_THAT(fourth.issues,
              Each(Field(&Issue::location,
                         Field(&CodeLocation::file_path, Not(two)))));
}

TEST_F(OrchestratorTest, ForceFullRunIgnoresCaches) {
  AddThreeFiles();
  auto unit = std::make_shared<test::CountingUnit>();
  auto orchestrator = Build({unit});

  orchestrator->Run(project_.root(), Options());
  const auto forced = orchestrator->ForceFullRun(project_.root(), Options());
  EXPECT_EQ(6, parser_->calls.load());
  EXPECT_EQ(6, unit->visits.load());
  EXPECT_FALSE(forced.served_from_cache);
  EXPECT_EQ(0u, forced.metrics.reused_files);
  EXPECT_EQ(3u, forced.issues.size());
}

TEST_F(OrchestratorTest, FailingUnitIsRecordedAndRetriedNextRun) {
  AddThreeFiles();
  auto healthy = std::make_shared<test::CountingUnit>("healthy");
  auto broken = std::make_shared<test::CountingUnit>("broken");
  broken->fail = true;
  auto orchestrator = Build({healthy, broken});

  const auto first = orchestrator->Run(project_.root(), Options());
  ASSERT_EQ(1u, first.failures.size());
  EXPECT_EQ(FailureKind::kAnalysis, first.failures[0].kind);
  EXPECT_EQ("broken", first.failures[0].subject);
  EXPECT_EQ(3u, first.issues.size());
  EXPECT_EQ(0u, orchestrator->Cache().Stats().file_entries);
  EXPECT_EQ(0u, orchestrator->Cache().Stats().run_entries);

  broken->fail = false;
  const auto second = orchestrator->Run(project_.root(), Options());
  EXPECT_EQ(6, parser_->calls.load());
  EXPECT_TRUE(second.failures.empty());
  EXPECT_EQ(6u, second.issues.size());
}

TEST_F(OrchestratorTest, ParseFailureKeepsOtherFiles) {
  AddThreeFiles();
  auto unit = std::make_shared<test::CountingUnit>();
  auto orchestrator = Build({unit});
  const auto broken = project_.root() / "two.cpp";
  parser_->FailOn(broken);

  const auto first = orchestrator->Run(project_.root(), Options());
  ASSERT_EQ(1u, first.failures.size());
  EXPECT_EQ(FailureKind::kParsing, first.failures[0].kind);
  EXPECT_EQ(broken.string(), first.failures[0].subject);
  EXPECT_EQ(2u, first.files.size());
  EXPECT_EQ(2u, first.issues.size());

  orchestrator->Run(project_.root(), Options());
  EXPECT_EQ(4, parser_->calls.load());
  EXPECT_EQ(2, unit->visits.load());
}

TEST_F(OrchestratorTest, NothingParsedIsAnalysisError) {
  auto orchestrator = Build({std::make_shared<test::CountingUnit>()});
  std::string analysis_id;
  EXPECT_THROW(orchestrator->Run(project_.root(), Options(),
                                 [&](const ProgressState &state) {
                                   analysis_id = state.analysis_id;
                                 }),
               AnalysisError);
  const auto status = orchestrator->GetStatus(analysis_id);
  ASSERT_TRUE(status);
  EXPECT_EQ(RunStatus::kFailed, status->status);
  EXPECT_FALSE(status->error.empty());
}

TEST_F(OrchestratorTest, MissingRootIsResourceError) {
  auto orchestrator = Build({std::make_shared<test::CountingUnit>()});
  EXPECT_THROW(orchestrator->Run(project_.root() / "absent", Options()),
               ResourceError);
}

TEST_F(OrchestratorTest, InvalidOptionsAreRejectedBeforeRunning) {
  auto orchestrator = Build({std::make_shared<test::CountingUnit>()});
  auto options = Options();
  options.max_workers = 0;
  EXPECT_THROW(orchestrator->Run(project_.root(), options),
               std::invalid_argument);
}

TEST_F(OrchestratorTest, CancellationStopsRunWithoutCaching) {
  AddThreeFiles();
  auto orchestrator = Build({std::make_shared<test::CountingUnit>()});
  CancellationToken token;
  std::string analysis_id;
  const auto cancel_on_parse = [&](const ProgressState &state) {
    analysis_id = state.analysis_id;
    if (state.phase == "Parsing files") {
      token.Cancel();
    }
  };

  EXPECT_THROW(
      orchestrator->Run(project_.root(), Options(), cancel_on_parse, &token),
      CancelledError);
  EXPECT_EQ(0, parser_->calls.load());
  const auto status = orchestrator->GetStatus(analysis_id);
  ASSERT_TRUE(status);
  EXPECT_EQ(RunStatus::kFailed, status->status);
  EXPECT_EQ("cancelled", status->error);
  EXPECT_EQ(0u, orchestrator->Cache().Stats().file_entries);
  EXPECT_EQ(0u, orchestrator->Cache().Stats().run_entries);
}

TEST_F(OrchestratorTest, ThrowingCallbackDoesNotAbortRun) {
  AddThreeFiles();
  auto orchestrator = Build({std::make_shared<test::CountingUnit>()});
  const auto result = orchestrator->Run(
      project_.root(), Options(), [](const ProgressState &) {
        throw std::runtime_error("observer failure");
      });
  EXPECT_EQ(3u, result.issues.size());
}

TEST_F(OrchestratorTest, ProgressIsMonotonicAndEndsCompleted) {
  AddThreeFiles();
  auto orchestrator = Build({std::make_shared<test::CountingUnit>("a"),
                             std::make_shared<test::CountingUnit>("b")});
  std::vector<ProgressState> states;
  const auto result =
      orchestrator->Run(project_.root(), Options(),
                        [&](const ProgressState &state) {
                          states.push_back(state);
                        });

  ASSERT_FALSE(states.empty());
  double previous = 0.0;
  for (const auto &state : states) {
    EXPECT_GE(state.Percentage(), previous);
    EXPECT_LE(state.Percentage(), 100.0);
    previous = state.Percentage();
  }
  EXPECT_EQ(RunStatus::kCompleted, states.back().status);
  const auto status = orchestrator->GetStatus(result.analysis_id);
  ASSERT_TRUE(status);
  EXPECT_EQ(RunStatus::kCompleted, status->status);
  EXPECT_EQ(3u, status->files_processed);
  EXPECT_EQ(2u, status->analyzers_completed);
  EXPECT_FALSE(orchestrator->GetStatus("analysis-unknown"));
}

TEST_F(OrchestratorTest, MergedIssuesIgnoreExecutionOrder) {
  AddThreeFiles();
  std::vector<std::shared_ptr<AnalyzerUnit>> units;
  for (const auto *name : {"alpha", "beta", "gamma", "delta"}) {
    units.push_back(std::make_shared<test::CountingUnit>(name));
  }
  auto parallel = Build(units);
  const auto parallel_result = parallel->Run(project_.root(), Options());

  std::reverse(units.begin(), units.end());
  auto sequential = Build(units);
  auto options = Options();
  options.parallel_processing = false;
  options.use_cache = false;
  const auto sequential_result = sequential->Run(project_.root(), options);

  EXPECT_EQ(12u, parallel_result.issues.size());
  EXPECT_EQ(IssueIds(parallel_result), IssueIds(sequential_result));
}

TEST_F(OrchestratorTest, UnitsNeverRunConcurrentlyWithThemselves) {
  for (int i = 0; i < 8; ++i) {
    project_.AddFile("file" + std::to_string(i) + ".cpp", "int x;\n");
  }
  auto unit = std::make_shared<test::CountingUnit>();
  auto orchestrator = Build({unit});
  orchestrator->Run(project_.root(), Options());
  EXPECT_EQ(1, unit->calls.load());
  EXPECT_FALSE(unit->overlapped.load());
}

TEST_F(OrchestratorTest, IssuesBelowConfidenceThresholdAreDropped) {
  AddThreeFiles();
  auto unsure = std::make_shared<test::CountingUnit>("unsure");
  unsure->confidence = 0.4;
  auto sure = std::make_shared<test::CountingUnit>("sure");
  auto orchestrator = Build({unsure, sure});

  const auto result = orchestrator->Run(project_.root(), Options());
  EXPECT_EQ(3u, result.issues.size());
  EXPECT_THAT(result.issues, Each(Field(&Issue::analyzer, "sure")));

  auto strict = Options();
  strict.confidence_threshold = 0.95;
  EXPECT_TRUE(orchestrator->Run(project_.root(), strict).issues.empty());
}

TEST_F(OrchestratorTest, NearbyThresholdsDoNotShareFileRecords) {
  project_.AddFile("one.cpp", "int one();\n");
  auto unit = std::make_shared<test::CountingUnit>();
  unit->confidence = 0.5;
  auto orchestrator = Build({unit});

  auto options = Options();
  options.use_cache = false;
  options.confidence_threshold = 0.5000001;
  EXPECT_TRUE(orchestrator->Run(project_.root(), options).issues.empty());

  options.confidence_threshold = 0.5;
  const auto result = orchestrator->Run(project_.root(), options);
  ASSERT_EQ(1u, result.issues.size());
  EXPECT_EQ(2, unit->calls.load());
}

TEST_F(OrchestratorTest, MinimumSeverityFiltersMergedIssues) {
  AddThreeFiles();
  auto unit = std::make_shared<test::CountingUnit>();
  unit->severity = Severity::kLow;
  auto orchestrator = Build({unit});

  auto options = Options();
  options.min_severity = Severity::kMedium;
  EXPECT_TRUE(orchestrator->Run(project_.root(), options).issues.empty());
  options.min_severity = Severity::kLow;
  EXPECT_EQ(3u, orchestrator->Run(project_.root(), options).issues.size());
}

TEST_F(OrchestratorTest, CategoryFilterSelectsUnits) {
  AddThreeFiles();
  auto complexity = std::make_shared<test::CountingUnit>(
      "complexity", IssueCategory::kComplexity);
  auto security = std::make_shared<test::CountingUnit>(
      "security", IssueCategory::kSecurity);
  auto orchestrator = Build({complexity, security});

  auto options = Options();
  options.categories = {IssueCategory::kSecurity};
  const auto result = orchestrator->Run(project_.root(), options);
  EXPECT_EQ(0, complexity->calls.load());
  EXPECT_EQ(3u, result.issues.size());
  EXPECT_THAT(result.issues,
              Each(Field(&Issue::category, IssueCategory::kSecurity)));
}

TEST_F(OrchestratorTest, OutOfScopeIssuesDroppedAndAnalyzerFilled) {
  project_.AddFile("one.cpp", "int one();\n");
  auto orchestrator = Build({std::make_shared<StrayUnit>()});
  const auto result = orchestrator->Run(project_.root(), Options());
  ASSERT_EQ(1u, result.issues.size());
  EXPECT_EQ("unnamed", result.issues[0].id);
  EXPECT_EQ("stray", result.issues[0].analyzer);
}

TEST_F(OrchestratorTest, ResultIsSortedAndCarriesMetrics) {
  AddThreeFiles();
  auto orchestrator = Build({std::make_shared<test::CountingUnit>()});
  const auto result = orchestrator->Run(project_.root(), Options());
  EXPECT_TRUE(std::is_sorted(
      result.files.begin(), result.files.end(),
      [](const ParsedFile &lhs, const ParsedFile &rhs) {
        return lhs.path < rhs.path;
      }));
  EXPECT_EQ(3u, result.metrics.total_files);
  EXPECT_EQ(3u, result.metrics.total_lines);
  EXPECT_EQ(3u, result.metrics.total_issues);
  EXPECT_EQ(project_.root().string(), result.root);
}

TEST_F(OrchestratorTest, StatusIsKeptOnlyForRecentRuns) {
  project_.AddFile("one.cpp", "int one();\n");
  auto orchestrator = Build({std::make_shared<test::CountingUnit>()});

  std::vector<std::string> ids;
  for (std::size_t i = 0; i <= Orchestrator::kRetainedRuns; ++i) {
    ids.push_back(orchestrator->Run(project_.root(), Options()).analysis_id);
  }
  EXPECT_FALSE(orchestrator->GetStatus(ids.front()).has_value());
  for (std::size_t i = 1; i < ids.size(); ++i) {
    const auto status = orchestrator->GetStatus(ids[i]);
    ASSERT_TRUE(status.has_value()) << ids[i];
    EXPECT_EQ(RunStatus::kCompleted, status->status);
  }
}

TEST_F(OrchestratorTest, FinishedRunReleasesItsCallback) {
  project_.AddFile("one.cpp", "int one();\n");
  auto orchestrator = Build({std::make_shared<test::CountingUnit>()});
  auto captured = std::make_shared<int>(0);
  const auto result = orchestrator->Run(
      project_.root(), Options(),
      [captured](const ProgressState &) { ++*captured; });
  EXPECT_GT(*captured, 0);
  EXPECT_EQ(1, captured.use_count());
  EXPECT_TRUE(orchestrator->GetStatus(result.analysis_id).has_value());
}

TEST(OrchestratorConstructionTest, RequiresEveryComponent) {
  EXPECT_THROW(std::make_unique<Orchestrator>(OrchestratorComponents{}),
               std::invalid_argument);
}

TEST(AnalysisProfileTest, ChangesWithUnitsAndThreshold) {
  AnalyzerRegistry registry;
  registry.Register(std::make_shared<test::CountingUnit>("a"));
  const auto options = DefaultAnalysisOptions();
  const auto base = BuildAnalysisProfile(registry.EnabledUnits(), options);
  EXPECT_EQ(base, BuildAnalysisProfile(registry.EnabledUnits(), options));

  auto stricter = options;
  stricter.confidence_threshold = 0.9;
  EXPECT_NE(base, BuildAnalysisProfile(registry.EnabledUnits(), stricter));

  registry.Register(std::make_shared<test::CountingUnit>("b"));
  EXPECT_NE(base, BuildAnalysisProfile(registry.EnabledUnits(), options));
}

} // namespace
} // namespace cqa
