#pragma once

#include <cqa/interfaces.h>
#include <cqa/logging.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace cqa {

bool MatchesAnyPattern(const std::filesystem::path &path,
                       const std::vector<std::string> &patterns);

class GlobFileDiscovery : public FileDiscovery {
public:
  explicit GlobFileDiscovery(std::shared_ptr<Logger> logger = nullptr);

  // Throws ResourceError when the root does not exist or cannot be walked.
  std::vector<std::filesystem::path>
  Discover(const std::filesystem::path &root,
           const std::vector<std::string> &include_patterns,
           const std::vector<std::string> &exclude_patterns,
           double max_file_size_mb) override;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace cqa
