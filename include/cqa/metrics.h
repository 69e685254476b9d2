#pragma once

#include <cqa/models.h>

#include <vector>

namespace cqa {

QualityMetrics ComputeMetrics(const std::vector<ParsedFile> &files,
                              const std::vector<Issue> &issues,
                              std::size_t reused_files,
                              std::size_t reanalyzed_files);

bool HasBlockingIssues(const std::vector<Issue> &issues);

} // namespace cqa
