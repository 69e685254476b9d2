#include <cqa/analyzer_registry.h>

#include <cqa/builtin_analyzers.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace cqa {
namespace {

std::string JoinLanguages(const std::vector<std::string> &languages) {
  std::string joined;
  for (std::size_t i = 0; i < languages.size(); ++i) {
    joined += languages[i];
    if (i + 1 < languages.size()) {
      joined += ",";
    }
  }
  return joined;
}

std::vector<std::string> NormalizeLanguages(std::vector<std::string> values) {
  std::sort(values.begin(), values.end());
  values.erase(std::unique(values.begin(), values.end()), values.end());
  return values;
}

bool Contains(const std::vector<std::string> &values,
              const std::string &value) {
  return std::binary_search(values.begin(), values.end(), value);
}

} // namespace

AnalyzerRegistry::AnalyzerRegistry(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

void AnalyzerRegistry::Register(std::shared_ptr<AnalyzerUnit> unit,
                                PriorityTier priority) {
  if (!unit) {
    throw std::invalid_argument("Analyzer unit cannot be null");
  }
  const auto name = unit->Name();
  if (name.empty()) {
    throw std::invalid_argument("Analyzer unit name cannot be empty");
  }
  const auto threshold = unit->ConfidenceThreshold();
  if (!(threshold >= 0.0 && threshold <= 1.0)) {
    throw std::invalid_argument("Analyzer unit '" + name +
                                "' has confidence threshold outside [0, 1]: " +
                                std::to_string(threshold));
  }

  auto languages = NormalizeLanguages(unit->SupportedLanguages());
  RegisteredUnit registered{std::move(unit), priority, std::move(languages)};
  if (registered.languages.empty()) {
    logger_->Log(LogLevel::kWarn, "registry.no_languages", {{"unit", name}});
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto existing = units_.find(name); existing != units_.end()) {
    logger_->Log(LogLevel::kWarn, "registry.replace",
                 {{"unit", name},
                  {"previous_priority", ToString(existing->second.priority)},
                  {"priority", ToString(priority)}});
    RemoveFromIndexes(name, existing->second);
    units_.erase(existing);
  }

  by_category_[registered.unit->Category()].insert(name);
  for (const auto &language : registered.languages) {
    by_language_[language].insert(name);
  }
  logger_->Log(LogLevel::kDebug, "registry.register",
               {{"unit", name},
                {"category", ToString(registered.unit->Category())},
                {"languages", JoinLanguages(registered.languages)},
                {"priority", ToString(priority)}});
  units_.emplace(name, std::move(registered));
}

bool AnalyzerRegistry::Unregister(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto found = units_.find(name);
  if (found == units_.end()) {
    return false;
  }
  RemoveFromIndexes(name, found->second);
  units_.erase(found);
  logger_->Log(LogLevel::kDebug, "registry.unregister", {{"unit", name}});
  return true;
}

void AnalyzerRegistry::RemoveFromIndexes(const std::string &name,
                                         const RegisteredUnit &registered) {
  const auto category = by_category_.find(registered.unit->Category());
  if (category != by_category_.end()) {
    category->second.erase(name);
    if (category->second.empty()) {
      by_category_.erase(category);
    }
  }
  for (const auto &language : registered.languages) {
    const auto entry = by_language_.find(language);
    if (entry == by_language_.end()) {
      continue;
    }
    entry->second.erase(name);
    if (entry->second.empty()) {
      by_language_.erase(entry);
    }
  }
}

std::shared_ptr<AnalyzerUnit>
AnalyzerRegistry::Find(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto found = units_.find(name);
  if (found == units_.end()) {
    return nullptr;
  }
  return found->second.unit;
}

std::vector<std::string> AnalyzerRegistry::Names() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(units_.size());
  for (const auto &entry : units_) {
    names.push_back(entry.first);
  }
  return names;
}

std::size_t AnalyzerRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return units_.size();
}

std::vector<std::shared_ptr<AnalyzerUnit>>
AnalyzerRegistry::UnitsForCategory(IssueCategory category) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<AnalyzerUnit>> units;
  const auto found = by_category_.find(category);
  if (found == by_category_.end()) {
    return units;
  }
  for (const auto &name : found->second) {
    units.push_back(units_.at(name).unit);
  }
  return units;
}

std::vector<std::shared_ptr<AnalyzerUnit>>
AnalyzerRegistry::UnitsForLanguage(const std::string &language) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<AnalyzerUnit>> units;
  const auto found = by_language_.find(language);
  if (found == by_language_.end()) {
    return units;
  }
  for (const auto &name : found->second) {
    units.push_back(units_.at(name).unit);
  }
  return units;
}

std::vector<RegisteredUnit> AnalyzerRegistry::SortedEnabledUnitsLocked() const {
  std::vector<RegisteredUnit> enabled;
  for (const auto &entry : units_) {
    if (entry.second.unit->Enabled()) {
      enabled.push_back(entry.second);
    }
  }
  // units_ is ordered by name, so a stable sort keeps name order within a
  // tier.
  std::stable_sort(enabled.begin(), enabled.end(),
                   [](const RegisteredUnit &lhs, const RegisteredUnit &rhs) {
                     return static_cast<int>(lhs.priority) <
                            static_cast<int>(rhs.priority);
                   });
  return enabled;
}

std::vector<RegisteredUnit> AnalyzerRegistry::EnabledUnits() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return SortedEnabledUnitsLocked();
}

std::vector<PlannedUnit>
AnalyzerRegistry::Plan(const std::vector<ParsedFile> &files,
                       const std::vector<IssueCategory> &categories,
                       const std::vector<std::string> &languages) const {
  const auto language_filter = NormalizeLanguages(languages);
  std::vector<RegisteredUnit> candidates;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    candidates = SortedEnabledUnitsLocked();
  }

  std::vector<PlannedUnit> plan;
  for (const auto &candidate : candidates) {
    if (!categories.empty() &&
        std::find(categories.begin(), categories.end(),
                  candidate.unit->Category()) == categories.end()) {
      continue;
    }

    PlannedUnit planned{candidate.unit, candidate.priority, {}};
    for (const auto &file : files) {
      if (!language_filter.empty() && !Contains(language_filter, file.language)) {
        continue;
      }
      if (Contains(candidate.languages, file.language)) {
        planned.files.push_back(file);
      }
    }
    if (planned.files.empty()) {
      continue;
    }
    plan.push_back(std::move(planned));
  }

  logger_->Log(LogLevel::kDebug, "registry.plan",
               {{"candidates", std::to_string(candidates.size())},
                {"planned", std::to_string(plan.size())},
                {"files", std::to_string(files.size())}});
  return plan;
}

RegistryStatistics AnalyzerRegistry::Statistics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  RegistryStatistics statistics;
  statistics.total_units = units_.size();
  for (const auto &entry : units_) {
    const auto &registered = entry.second;
    if (registered.unit->Enabled()) {
      ++statistics.enabled_units;
    }
    ++statistics.by_priority[ToString(registered.priority)];
  }
  for (const auto &entry : by_category_) {
    statistics.by_category[ToString(entry.first)] = entry.second.size();
  }
  for (const auto &entry : by_language_) {
    statistics.by_language[entry.first] = entry.second.size();
  }
  return statistics;
}

void RegisterBuiltinAnalyzers(AnalyzerRegistry &registry) {
  registry.Register(std::make_shared<LongFunctionAnalyzer>(),
                    PriorityTier::kHigh);
  registry.Register(std::make_shared<MissingDocumentationAnalyzer>(),
                    PriorityTier::kLow);
}

std::unique_ptr<AnalyzerRegistry>
MakeRegistryWithBuiltins(std::shared_ptr<Logger> logger) {
  auto registry = std::make_unique<AnalyzerRegistry>(std::move(logger));
  RegisterBuiltinAnalyzers(*registry);
  return registry;
}

} // namespace cqa
