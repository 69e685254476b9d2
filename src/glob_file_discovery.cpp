#include <cqa/glob_file_discovery.h>

#include <cqa/errors.h>

#include <fnmatch.h>

#include <algorithm>
#include <system_error>
#include <utility>

namespace cqa {

namespace {
bool Matches(const std::string &pattern, const std::string &value) {
  return ::fnmatch(pattern.c_str(), value.c_str(), 0) == 0;
}

bool IsDirectoryExcluded(const std::filesystem::path &relative,
                         const std::vector<std::string> &exclude_patterns) {
  // "build/**" prunes the build directory itself, not only its children.
  return MatchesAnyPattern(relative, exclude_patterns) ||
         MatchesAnyPattern(relative.generic_string() + "/", exclude_patterns);
}

bool IsWithinSizeLimit(const std::filesystem::path &path,
                       double max_file_size_mb, Logger &logger) {
  std::error_code error;
  const auto size = std::filesystem::file_size(path, error);
  if (error) {
    logger.Log(LogLevel::kDebug, "discovery.size_unavailable",
               {{"path", path.string()}, {"error", error.message()}});
    return false;
  }
  const auto size_mb = static_cast<double>(size) / (1024.0 * 1024.0);
  if (size_mb > max_file_size_mb) {
    logger.Log(LogLevel::kDebug, "discovery.skip_large",
               {{"path", path.string()}, {"size_bytes", std::to_string(size)}});
    return false;
  }
  return true;
}

// Patterns see the path relative to the analysis root so that directories
// above the root never take part in matching.
bool IsCollectableFile(const std::filesystem::path &path,
                       const std::filesystem::path &relative,
                       const std::vector<std::string> &include_patterns,
                       const std::vector<std::string> &exclude_patterns,
                       double max_file_size_mb, Logger &logger) {
  if (MatchesAnyPattern(relative, exclude_patterns)) {
    return false;
  }
  if (!MatchesAnyPattern(relative, include_patterns)) {
    return false;
  }
  return IsWithinSizeLimit(path, max_file_size_mb, logger);
}

[[noreturn]] void ThrowWalkError(const std::filesystem::path &path,
                                 const std::error_code &error) {
  throw ResourceError("Failed to walk " + path.string() + ": " +
                      error.message());
}

std::filesystem::path ResolveRootPath(const std::filesystem::path &root) {
  if (root.empty()) {
    throw ResourceError("Analysis root must not be empty");
  }
  std::error_code error;
  const auto normalized = std::filesystem::weakly_canonical(root, error);
  if (error || !std::filesystem::exists(normalized)) {
    throw ResourceError("Path does not exist: " + root.string());
  }
  return normalized;
}
} // namespace

bool MatchesAnyPattern(const std::filesystem::path &path,
                       const std::vector<std::string> &patterns) {
  const auto full_path = path.generic_string();
  const auto name = path.filename().string();
  return std::any_of(
      patterns.begin(), patterns.end(), [&](const std::string &pattern) {
        if (pattern.find("**") != std::string::npos) {
          return Matches(pattern, full_path) ||
                 Matches("*" + pattern, full_path);
        }
        return Matches(pattern, name) || Matches("*" + pattern, full_path);
      });
}

GlobFileDiscovery::GlobFileDiscovery(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

std::vector<std::filesystem::path>
GlobFileDiscovery::Discover(const std::filesystem::path &root,
                            const std::vector<std::string> &include_patterns,
                            const std::vector<std::string> &exclude_patterns,
                            double max_file_size_mb) {
  const auto resolved_root = ResolveRootPath(root);
  const auto &includes =
      include_patterns.empty() ? DefaultIncludePatterns() : include_patterns;

  std::vector<std::filesystem::path> files;
  std::error_code root_error;
  const auto root_status = std::filesystem::status(resolved_root, root_error);
  if (root_error) {
    ThrowWalkError(resolved_root, root_error);
  }
  if (std::filesystem::is_regular_file(root_status)) {
    if (IsCollectableFile(resolved_root, resolved_root.filename(), includes,
                          exclude_patterns, max_file_size_mb, *logger_)) {
      files.push_back(resolved_root);
    }
    return files;
  }

  std::error_code error;
  std::filesystem::recursive_directory_iterator it(
      resolved_root,
      std::filesystem::directory_options::skip_permission_denied, error);
  if (error) {
    ThrowWalkError(resolved_root, error);
  }
  for (std::filesystem::recursive_directory_iterator end; it != end;
       it.increment(error)) {
    if (error) {
      ThrowWalkError(resolved_root, error);
    }
    const auto &entry = *it;
    const auto relative = entry.path().lexically_relative(resolved_root);
    std::error_code status_error;
    const auto status = entry.status(status_error);
    if (status_error) {
      // Dangling links and files removed mid-walk are skipped.
      std::error_code link_error;
      if (status.type() == std::filesystem::file_type::not_found ||
          entry.is_symlink(link_error)) {
        logger_->Log(LogLevel::kDebug, "discovery.skip_unresolvable",
                     {{"path", entry.path().string()},
                      {"error", status_error.message()}});
        continue;
      }
      ThrowWalkError(entry.path(), status_error);
    }
    if (std::filesystem::is_directory(status)) {
      if (IsDirectoryExcluded(relative, exclude_patterns)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!std::filesystem::is_regular_file(status)) {
      continue;
    }
    if (IsCollectableFile(entry.path(), relative, includes, exclude_patterns,
                          max_file_size_mb, *logger_)) {
      files.push_back(entry.path().lexically_normal());
    }
  }
  // A failed increment leaves the iterator at end, so the loop exits before
  // seeing the error.
  if (error) {
    ThrowWalkError(resolved_root, error);
  }

  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());
  logger_->Log(LogLevel::kInfo, "discovery.complete",
               {{"root", resolved_root.string()},
                {"count", std::to_string(files.size())}});
  return files;
}

} // namespace cqa
