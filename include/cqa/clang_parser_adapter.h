#pragma once

#include <cqa/interfaces.h>
#include <cqa/logging.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace cqa {

// Summarizes C and C++ files through libclang. Files are parsed standalone;
// unresolved includes are tolerated and only the main file is summarized.
class ClangParserAdapter : public ParserAdapter {
public:
  explicit ClangParserAdapter(std::vector<std::string> extra_arguments = {},
                              std::shared_ptr<Logger> logger = nullptr);

  ParsedFile Parse(const std::filesystem::path &path) override;
  std::vector<std::string> SupportedLanguages() const override;

private:
  std::vector<std::string> ArgumentsFor(const std::filesystem::path &path) const;

  std::vector<std::string> extra_arguments_;
  std::shared_ptr<Logger> logger_;
};

} // namespace cqa
