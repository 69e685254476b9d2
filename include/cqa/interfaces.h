#pragma once

#include <cqa/models.h>

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace cqa {

class FileDiscovery {
public:
  virtual ~FileDiscovery() = default;
  virtual std::vector<std::filesystem::path>
  Discover(const std::filesystem::path &root,
           const std::vector<std::string> &include_patterns,
           const std::vector<std::string> &exclude_patterns,
           double max_file_size_mb) = 0;
};

class ParserAdapter {
public:
  virtual ~ParserAdapter() = default;
  // Throws ParsingError when the file cannot be summarized.
  virtual ParsedFile Parse(const std::filesystem::path &path) = 0;
  virtual std::vector<std::string> SupportedLanguages() const = 0;
};

struct AnalysisContext {
  std::string analysis_id;
  std::filesystem::path root;
  AnalysisOptions options;
};

class AnalyzerUnit {
public:
  virtual ~AnalyzerUnit() = default;
  virtual std::string Name() const = 0;
  virtual IssueCategory Category() const = 0;
  virtual std::vector<std::string> SupportedLanguages() const = 0;
  virtual bool Enabled() const { return true; }
  virtual double ConfidenceThreshold() const { return 0.7; }
  virtual std::vector<Issue> Analyze(const std::vector<ParsedFile> &files,
                                     const AnalysisContext &context) = 0;
};

class CacheAdmin {
public:
  virtual ~CacheAdmin() = default;
  virtual void ClearCache() = 0;
  virtual std::size_t CleanupExpired() = 0;
  virtual CacheStats Stats() const = 0;
};

using ProgressCallback = std::function<void(const ProgressState &)>;

} // namespace cqa
