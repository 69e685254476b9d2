#include <cqa/analyzer_registry.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

namespace cqa {
namespace {

using ::testing::ElementsAre;
using ::testing::NiceMock;
using ::testing::Return;

class MockAnalyzerUnit : public AnalyzerUnit {
public:
  MOCK_METHOD(std::string, Name, (), (const, override));
  MOCK_METHOD(IssueCategory, Category, (), (const, override));
  MOCK_METHOD(std::vector<std::string>, SupportedLanguages, (),
              (const, override));
  MOCK_METHOD(bool, Enabled, (), (const, override));
  MOCK_METHOD(double, ConfidenceThreshold, (), (const, override));
  MOCK_METHOD(std::vector<Issue>, Analyze,
              (const std::vector<ParsedFile> &, const AnalysisContext &),
              (override));
};

std::shared_ptr<MockAnalyzerUnit>
MakeUnit(const std::string &name, IssueCategory category,
         std::vector<std::string> languages, bool enabled = true,
         double threshold = 0.7) {
  auto unit = std::make_shared<NiceMock<MockAnalyzerUnit>>();
  ON_CALL(*unit, Name()).WillByDefault(Return(name));
  ON_CALL(*unit, Category()).WillByDefault(Return(category));
  ON_CALL(*unit, SupportedLanguages()).WillByDefault(Return(languages));
  ON_CALL(*unit, Enabled()).WillByDefault(Return(enabled));
  ON_CALL(*unit, ConfidenceThreshold()).WillByDefault(Return(threshold));
  return unit;
}

ParsedFile File(const std::string &path, const std::string &language) {
  ParsedFile file;
  file.path = path;
  file.language = language;
  return file;
}

std::vector<std::string> PlannedNames(const std::vector<PlannedUnit> &plan) {
  std::vector<std::string> names;
  for (const auto &planned : plan) {
    names.push_back(planned.unit->Name());
  }
  return names;
}

TEST(AnalyzerRegistryTest, RejectsInvalidUnitsAtRegistration) {
  AnalyzerRegistry registry;
  EXPECT_THROW(registry.Register(nullptr), std::invalid_argument);
  EXPECT_THROW(
      registry.Register(MakeUnit("", IssueCategory::kSecurity, {"cpp"})),
      std::invalid_argument);
  EXPECT_THROW(registry.Register(MakeUnit("too-sure", IssueCategory::kSecurity,
                                          {"cpp"}, true, 1.5)),
               std::invalid_argument);
  EXPECT_EQ(0u, registry.Size());
}

TEST(AnalyzerRegistryTest, WarnsWhenUnitSupportsNoLanguages) {
  std::stringstream log;
  AnalyzerRegistry registry(MakeLogger({LogLevel::kWarn}, log));
  registry.Register(MakeUnit("idle", IssueCategory::kTesting, {}));
  EXPECT_EQ(1u, registry.Size());
  EXPECT_NE(std::string::npos, log.str().find("registry.no_languages"));
}

TEST(AnalyzerRegistryTest, LastRegistrationWinsAndIsLogged) {
  std::stringstream log;
  AnalyzerRegistry registry(MakeLogger({LogLevel::kWarn}, log));
  registry.Register(MakeUnit("dup", IssueCategory::kSecurity, {"c"}));
  auto replacement = MakeUnit("dup", IssueCategory::kPerformance, {"cpp"});
  registry.Register(replacement, PriorityTier::kCritical);

  EXPECT_EQ(1u, registry.Size());
  EXPECT_EQ(replacement, registry.Find("dup"));
  EXPECT_TRUE(registry.UnitsForCategory(IssueCategory::kSecurity).empty());
  EXPECT_TRUE(registry.UnitsForLanguage("c").empty());
  EXPECT_EQ(1u, registry.UnitsForLanguage("cpp").size());
  EXPECT_NE(std::string::npos, log.str().find("registry.replace"));
}

TEST(AnalyzerRegistryTest, IndexesByCategoryAndLanguage) {
  AnalyzerRegistry registry;
  registry.Register(MakeUnit("a", IssueCategory::kSecurity, {"c", "cpp"}));
  registry.Register(MakeUnit("b", IssueCategory::kSecurity, {"python"}));
  registry.Register(MakeUnit("c", IssueCategory::kDocumentation, {"cpp"}));

  EXPECT_EQ(2u, registry.UnitsForCategory(IssueCategory::kSecurity).size());
  EXPECT_EQ(2u, registry.UnitsForLanguage("cpp").size());
  EXPECT_THAT(registry.Names(), ElementsAre("a", "b", "c"));

  EXPECT_TRUE(registry.Unregister("a"));
  EXPECT_FALSE(registry.Unregister("a"));
  EXPECT_EQ(nullptr, registry.Find("a"));
  EXPECT_EQ(1u, registry.UnitsForLanguage("cpp").size());
}

TEST(AnalyzerRegistryTest, PlanOrdersByPriorityThenName) {
  AnalyzerRegistry registry;
  registry.Register(MakeUnit("zeta", IssueCategory::kSecurity, {"cpp"}),
                    PriorityTier::kHigh);
  registry.Register(MakeUnit("alpha", IssueCategory::kSecurity, {"cpp"}),
                    PriorityTier::kLow);
  registry.Register(MakeUnit("beta", IssueCategory::kSecurity, {"cpp"}),
                    PriorityTier::kHigh);
  registry.Register(MakeUnit("gamma", IssueCategory::kSecurity, {"cpp"}),
                    PriorityTier::kCritical);

  const auto plan = registry.Plan({File("a.cpp", "cpp")});
  EXPECT_THAT(PlannedNames(plan), ElementsAre("gamma", "beta", "zeta", "alpha"));
}

TEST(AnalyzerRegistryTest, PlanPairsUnitsWithSupportedFilesOnly) {
  AnalyzerRegistry registry;
  registry.Register(MakeUnit("c-only", IssueCategory::kSecurity, {"c"}));
  registry.Register(MakeUnit("py-only", IssueCategory::kSecurity, {"python"}));
  registry.Register(
      MakeUnit("off", IssueCategory::kSecurity, {"c", "cpp"}, false));
  registry.Register(MakeUnit("docs", IssueCategory::kDocumentation, {"cpp"}));

  const std::vector<ParsedFile> files = {File("a.c", "c"), File("b.cpp", "cpp"),
                                         File("c.c", "c")};
  const auto plan = registry.Plan(files);
  ASSERT_EQ(2u, plan.size());
  EXPECT_EQ("c-only", plan[0].unit->Name());
  ASSERT_EQ(2u, plan[0].files.size());
  EXPECT_EQ("a.c", plan[0].files[0].path);
  EXPECT_EQ("c.c", plan[0].files[1].path);
  EXPECT_EQ("docs", plan[1].unit->Name());
  ASSERT_EQ(1u, plan[1].files.size());

  const auto filtered = registry.Plan(files, {IssueCategory::kDocumentation});
  EXPECT_THAT(PlannedNames(filtered), ElementsAre("docs"));

  const auto by_language = registry.Plan(files, {}, {"cpp"});
  EXPECT_THAT(PlannedNames(by_language), ElementsAre("docs"));
}

TEST(AnalyzerRegistryTest, StatisticsSummarizeRegistrations) {
  AnalyzerRegistry registry;
  registry.Register(MakeUnit("a", IssueCategory::kSecurity, {"c", "cpp"}),
                    PriorityTier::kHigh);
  registry.Register(
      MakeUnit("b", IssueCategory::kSecurity, {"cpp"}, false),
      PriorityTier::kLow);

  const auto statistics = registry.Statistics();
  EXPECT_EQ(2u, statistics.total_units);
  EXPECT_EQ(1u, statistics.enabled_units);
  EXPECT_EQ(2u, statistics.by_category.at("security"));
  EXPECT_EQ(2u, statistics.by_language.at("cpp"));
  EXPECT_EQ(1u, statistics.by_language.at("c"));
  EXPECT_EQ(1u, statistics.by_priority.at("high"));
  EXPECT_EQ(1u, statistics.by_priority.at("low"));
}

TEST(AnalyzerRegistryTest, BuiltinRegistryHoldsDefaultUnits) {
  const auto registry = MakeRegistryWithBuiltins();
  EXPECT_THAT(registry->Names(),
              ElementsAre("long-function", "missing-documentation"));
}

} // namespace
} // namespace cqa
