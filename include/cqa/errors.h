#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace cqa {

enum class ErrorKind { kResource, kParsing, kAnalysis, kCache, kCancelled };

class QualityError : public std::runtime_error {
public:
  QualityError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind Kind() const { return kind_; }

private:
  ErrorKind kind_;
};

class ResourceError : public QualityError {
public:
  explicit ResourceError(const std::string &message)
      : QualityError(ErrorKind::kResource, message) {}
};

class ParsingError : public QualityError {
public:
  ParsingError(std::string path, const std::string &message)
      : QualityError(ErrorKind::kParsing, message), path_(std::move(path)) {}

  const std::string &Path() const { return path_; }

private:
  std::string path_;
};

class AnalysisError : public QualityError {
public:
  explicit AnalysisError(const std::string &message)
      : QualityError(ErrorKind::kAnalysis, message) {}
};

class CacheError : public QualityError {
public:
  explicit CacheError(const std::string &message)
      : QualityError(ErrorKind::kCache, message) {}
};

class CancelledError : public QualityError {
public:
  CancelledError() : QualityError(ErrorKind::kCancelled, "cancelled") {}
};

} // namespace cqa
