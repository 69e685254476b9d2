#pragma once

#include <cqa/models.h>

namespace cqa {

constexpr int kExitClean = 0;
constexpr int kExitError = 1;
constexpr int kExitBlockingIssues = 2;

// Blocking means at least one critical or high severity issue remains.
int AnalysisExitCode(const AnalysisRunResult &result);

} // namespace cqa
