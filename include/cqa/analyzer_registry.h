#pragma once

#include <cqa/interfaces.h>
#include <cqa/logging.h>

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace cqa {

struct RegisteredUnit {
  std::shared_ptr<AnalyzerUnit> unit;
  PriorityTier priority = PriorityTier::kMedium;
  std::vector<std::string> languages;
};

struct PlannedUnit {
  std::shared_ptr<AnalyzerUnit> unit;
  PriorityTier priority = PriorityTier::kMedium;
  std::vector<ParsedFile> files;
};

struct RegistryStatistics {
  std::size_t total_units = 0;
  std::size_t enabled_units = 0;
  std::map<std::string, std::size_t> by_category;
  std::map<std::string, std::size_t> by_language;
  std::map<std::string, std::size_t> by_priority;
};

class AnalyzerRegistry {
public:
  explicit AnalyzerRegistry(std::shared_ptr<Logger> logger = nullptr);

  AnalyzerRegistry(const AnalyzerRegistry &) = delete;
  AnalyzerRegistry &operator=(const AnalyzerRegistry &) = delete;

  // Re-registering a name replaces the earlier unit.
  void Register(std::shared_ptr<AnalyzerUnit> unit,
                PriorityTier priority = PriorityTier::kMedium);
  bool Unregister(const std::string &name);

  std::shared_ptr<AnalyzerUnit> Find(const std::string &name) const;
  std::vector<std::string> Names() const;
  std::size_t Size() const;

  std::vector<std::shared_ptr<AnalyzerUnit>>
  UnitsForCategory(IssueCategory category) const;
  std::vector<std::shared_ptr<AnalyzerUnit>>
  UnitsForLanguage(const std::string &language) const;
  std::vector<RegisteredUnit> EnabledUnits() const;

  std::vector<PlannedUnit>
  Plan(const std::vector<ParsedFile> &files,
       const std::vector<IssueCategory> &categories = {},
       const std::vector<std::string> &languages = {}) const;

  RegistryStatistics Statistics() const;

private:
  void RemoveFromIndexes(const std::string &name,
                         const RegisteredUnit &registered);
  std::vector<RegisteredUnit> SortedEnabledUnitsLocked() const;

  mutable std::mutex mutex_;
  std::map<std::string, RegisteredUnit> units_;
  std::map<IssueCategory, std::set<std::string>> by_category_;
  std::map<std::string, std::set<std::string>> by_language_;
  std::shared_ptr<Logger> logger_;
};

void RegisterBuiltinAnalyzers(AnalyzerRegistry &registry);
std::unique_ptr<AnalyzerRegistry>
MakeRegistryWithBuiltins(std::shared_ptr<Logger> logger = nullptr);

} // namespace cqa
