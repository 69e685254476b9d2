#pragma once

#include <cqa/logging.h>
#include <cqa/models.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cqa {

struct AnalyzeCommandOptions {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::filesystem::path> cache_directory;
  std::vector<std::string> include_patterns;
  std::vector<std::string> exclude_patterns;
  std::vector<std::string> formats;
  std::vector<IssueCategory> categories;
  std::optional<int> workers;
  std::optional<bool> parallel;
  std::optional<bool> use_cache;
  std::optional<bool> incremental;
  std::optional<double> confidence_threshold;
  std::optional<double> max_file_size_mb;
  std::optional<double> cache_ttl_hours;
  std::optional<Severity> min_severity;
  std::optional<LogLevel> log_level;
  bool show_help = false;
};

struct CacheCommandOptions {
  std::string action;
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> cache_directory;
  std::optional<double> cache_ttl_hours;
  bool show_help = false;
};

AnalyzeCommandOptions
ParseAnalyzeArguments(const std::vector<std::string> &arguments);
AnalyzeCommandOptions ParseConfigFile(const std::filesystem::path &path);
AnalyzeCommandOptions MergeOptions(const AnalyzeCommandOptions &config_options,
                                   const AnalyzeCommandOptions &cli_options);
AnalyzeCommandOptions
ResolveAnalyzeOptions(const AnalyzeCommandOptions &cli_options);
AnalysisOptions BuildAnalysisOptions(const AnalyzeCommandOptions &options);

CacheCommandOptions
ParseCacheArguments(const std::vector<std::string> &arguments);

int RunAnalyze(const std::vector<std::string> &arguments);
int RunCacheCommand(const std::vector<std::string> &arguments);

} // namespace cqa
