#pragma once

#include <cqa/models.h>

#include <filesystem>
#include <string>
#include <vector>

namespace cqa {

std::string RenderMarkdownReport(const AnalysisRunResult &result);
std::string RenderJsonReport(const AnalysisRunResult &result);

// Writes cqa_report.md and/or cqa_report.json. An empty format list means
// markdown only. Returns the written paths.
std::vector<std::filesystem::path>
WriteReports(const std::filesystem::path &directory,
             const AnalysisRunResult &result,
             const std::vector<std::string> &formats);

} // namespace cqa
