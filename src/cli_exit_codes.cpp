#include <cqa/cli_exit_codes.h>

#include <cqa/metrics.h>

namespace cqa {

int AnalysisExitCode(const AnalysisRunResult &result) {
  return HasBlockingIssues(result.issues) ? kExitBlockingIssues : kExitClean;
}

} // namespace cqa
