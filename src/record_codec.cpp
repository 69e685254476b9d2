#include <cqa/record_codec.h>

#include <cqa/errors.h>
#include <cqa/metrics.h>

#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace cqa {
namespace {

constexpr const char kFileRecordHeader[] = "# cqa file record v1";
constexpr const char kRunEntryHeader[] = "# cqa run entry v1";

std::int64_t ToEpochMillis(TimePoint time) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             time.time_since_epoch())
      .count();
}

TimePoint FromEpochMillis(std::int64_t millis) {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(
      std::chrono::milliseconds(millis)));
}

std::string FormatDouble(double value) {
  std::ostringstream stream;
  stream << std::setprecision(std::numeric_limits<double>::max_digits10)
         << value;
  return stream.str();
}

std::int64_t ParseInteger(const std::string &value, const std::string &field) {
  std::size_t consumed = 0;
  std::int64_t parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception &) {
    throw CacheError("Invalid integer for " + field + ": '" + value + "'");
  }
  if (consumed != value.size()) {
    throw CacheError("Invalid integer for " + field + ": '" + value + "'");
  }
  return parsed;
}

double ParseDouble(const std::string &value, const std::string &field) {
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::exception &) {
    throw CacheError("Invalid number for " + field + ": '" + value + "'");
  }
  if (consumed != value.size()) {
    throw CacheError("Invalid number for " + field + ": '" + value + "'");
  }
  return parsed;
}

bool ParseFlag(const std::string &value, const std::string &field) {
  if (value == "1") {
    return true;
  }
  if (value == "0") {
    return false;
  }
  throw CacheError("Invalid flag for " + field + ": '" + value + "'");
}

template <typename Parser>
auto ParseEnum(const std::string &value, Parser parser) {
  try {
    return parser(value);
  } catch (const std::invalid_argument &ex) {
    throw CacheError(ex.what());
  }
}

void RequireFieldCount(const std::vector<std::string> &fields,
                       std::size_t expected) {
  if (fields.size() != expected) {
    throw CacheError("Malformed '" + fields.front() + "' line: expected " +
                     std::to_string(expected) + " fields, found " +
                     std::to_string(fields.size()));
  }
}

void WriteLine(std::ostream &stream, const std::vector<std::string> &fields) {
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      stream << '\t';
    }
    stream << Escape(fields[i]);
  }
  stream << '\n';
}

void WriteParsedFile(std::ostream &stream, const ParsedFile &file) {
  WriteLine(stream, {"parsed", file.path, file.language,
                     std::to_string(file.line_count),
                     std::to_string(file.size_bytes)});
  WriteLine(stream, {"content", file.content});
  for (const auto &function : file.functions) {
    WriteLine(stream,
              {"function", function.name, function.owner,
               std::to_string(function.line_start),
               std::to_string(function.line_end),
               std::to_string(function.parameter_count),
               std::to_string(function.complexity),
               function.documented ? "1" : "0"});
  }
  for (const auto &klass : file.classes) {
    WriteLine(stream, {"class", klass.name, std::to_string(klass.line_start),
                       std::to_string(klass.line_end),
                       klass.documented ? "1" : "0"});
  }
  for (const auto &include : file.includes) {
    WriteLine(stream,
              {"include", include.target, std::to_string(include.line)});
  }
}

void WriteIssue(std::ostream &stream, const Issue &issue) {
  WriteLine(stream,
            {"issue", issue.id, ToString(issue.category),
             ToString(issue.severity), issue.title, issue.description,
             issue.location.file_path,
             std::to_string(issue.location.line_start),
             std::to_string(issue.location.line_end), issue.suggestion,
             FormatDouble(issue.confidence), issue.analyzer});
}

void WriteFingerprint(std::ostream &stream, const std::string &tag,
                      const FileFingerprint &fingerprint) {
  WriteLine(stream, {tag, fingerprint.path, fingerprint.content_hash,
                     std::to_string(fingerprint.size_bytes)});
}

FileFingerprint ReadFingerprint(const std::vector<std::string> &fields) {
  RequireFieldCount(fields, 4);
  return FileFingerprint{
      fields[1], fields[2],
      static_cast<std::uintmax_t>(ParseInteger(fields[3], "size"))};
}

Issue ReadIssue(const std::vector<std::string> &fields) {
  RequireFieldCount(fields, 12);
  Issue issue;
  issue.id = fields[1];
  issue.category = ParseEnum(fields[2], ParseIssueCategory);
  issue.severity = ParseEnum(fields[3], ParseSeverity);
  issue.title = fields[4];
  issue.description = fields[5];
  issue.location.file_path = fields[6];
  issue.location.line_start =
      static_cast<int>(ParseInteger(fields[7], "line_start"));
  issue.location.line_end =
      static_cast<int>(ParseInteger(fields[8], "line_end"));
  issue.suggestion = fields[9];
  issue.confidence = ParseDouble(fields[10], "confidence");
  issue.analyzer = fields[11];
  return issue;
}

// Applies a parsed-file line to the file currently being read. Returns false
// when the tag does not describe parsed-file content.
bool ReadParsedLine(const std::vector<std::string> &fields,
                    std::vector<ParsedFile> &files) {
  const auto &tag = fields.front();
  if (tag == "parsed") {
    RequireFieldCount(fields, 5);
    ParsedFile file;
    file.path = fields[1];
    file.language = fields[2];
    file.line_count = static_cast<int>(ParseInteger(fields[3], "line_count"));
    file.size_bytes =
        static_cast<std::uintmax_t>(ParseInteger(fields[4], "size"));
    files.push_back(std::move(file));
    return true;
  }
  if (tag != "content" && tag != "function" && tag != "class" &&
      tag != "include") {
    return false;
  }
  if (files.empty()) {
    throw CacheError("'" + tag + "' line precedes any 'parsed' line");
  }
  auto &file = files.back();
  if (tag == "content") {
    RequireFieldCount(fields, 2);
    file.content = fields[1];
  } else if (tag == "function") {
    RequireFieldCount(fields, 8);
    FunctionInfo function;
    function.name = fields[1];
    function.owner = fields[2];
    function.line_start =
        static_cast<int>(ParseInteger(fields[3], "line_start"));
    function.line_end = static_cast<int>(ParseInteger(fields[4], "line_end"));
    function.parameter_count =
        static_cast<int>(ParseInteger(fields[5], "parameter_count"));
    function.complexity =
        static_cast<int>(ParseInteger(fields[6], "complexity"));
    function.documented = ParseFlag(fields[7], "documented");
    file.functions.push_back(std::move(function));
  } else if (tag == "class") {
    RequireFieldCount(fields, 5);
    ClassInfo klass;
    klass.name = fields[1];
    klass.line_start = static_cast<int>(ParseInteger(fields[2], "line_start"));
    klass.line_end = static_cast<int>(ParseInteger(fields[3], "line_end"));
    klass.documented = ParseFlag(fields[4], "documented");
    file.classes.push_back(std::move(klass));
  } else {
    RequireFieldCount(fields, 3);
    file.includes.push_back(
        {fields[1], static_cast<int>(ParseInteger(fields[2], "line"))});
  }
  return true;
}

std::vector<std::vector<std::string>> ReadLines(const std::string &text,
                                                const std::string &header) {
  std::istringstream stream(text);
  std::string line;
  if (!std::getline(stream, line) || line != header) {
    throw CacheError("Missing or unexpected cache header");
  }
  std::vector<std::vector<std::string>> lines;
  while (std::getline(stream, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    lines.push_back(SplitEscaped(line));
  }
  return lines;
}

} // namespace

std::string Escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    if (character == '\\' || character == '\t' || character == '\n' ||
        character == '\r') {
      escaped.push_back('\\');
      if (character == '\t') {
        escaped.push_back('t');
        continue;
      }
      if (character == '\n') {
        escaped.push_back('n');
        continue;
      }
      if (character == '\r') {
        escaped.push_back('r');
        continue;
      }
    }
    escaped.push_back(character);
  }
  return escaped;
}

std::string Unescape(const std::string &value) {
  std::string unescaped;
  unescaped.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '\\' && i + 1 < value.size()) {
      const auto next = value[i + 1];
      ++i;
      if (next == 't') {
        unescaped.push_back('\t');
      } else if (next == 'n') {
        unescaped.push_back('\n');
      } else if (next == 'r') {
        unescaped.push_back('\r');
      } else {
        unescaped.push_back(next);
      }
      continue;
    }
    unescaped.push_back(value[i]);
  }
  return unescaped;
}

std::vector<std::string> SplitEscaped(const std::string &line) {
  std::vector<std::string> fields;
  std::string current;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '\\' && i + 1 < line.size()) {
      current.push_back(line[i]);
      current.push_back(line[++i]);
      continue;
    }
    if (line[i] == '\t') {
      fields.push_back(Unescape(current));
      current.clear();
      continue;
    }
    current.push_back(line[i]);
  }
  fields.push_back(Unescape(current));
  return fields;
}

std::string EncodeFileRecord(const FileRecord &record) {
  std::ostringstream stream;
  stream << kFileRecordHeader << '\n';
  WriteFingerprint(stream, "fingerprint", record.fingerprint);
  WriteLine(stream, {"meta", record.profile,
                     std::to_string(ToEpochMillis(record.cached_at))});
  WriteParsedFile(stream, record.parsed);
  for (const auto &issue : record.issues) {
    WriteIssue(stream, issue);
  }
  return stream.str();
}

FileRecord DecodeFileRecord(const std::string &text) {
  FileRecord record;
  bool has_fingerprint = false;
  bool has_meta = false;
  std::vector<ParsedFile> parsed;

  for (const auto &fields : ReadLines(text, kFileRecordHeader)) {
    const auto &tag = fields.front();
    if (tag == "fingerprint") {
      record.fingerprint = ReadFingerprint(fields);
      has_fingerprint = true;
    } else if (tag == "meta") {
      RequireFieldCount(fields, 3);
      record.profile = fields[1];
      record.cached_at = FromEpochMillis(ParseInteger(fields[2], "cached_at"));
      has_meta = true;
    } else if (tag == "issue") {
      record.issues.push_back(ReadIssue(fields));
    } else if (!ReadParsedLine(fields, parsed)) {
      throw CacheError("Unknown file record line: '" + tag + "'");
    }
  }

  if (!has_fingerprint || !has_meta || parsed.size() != 1) {
    throw CacheError("Incomplete file record");
  }
  record.parsed = std::move(parsed.front());
  return record;
}

std::string EncodeRunEntry(const RunCacheEntry &entry) {
  std::ostringstream stream;
  stream << kRunEntryHeader << '\n';
  const auto &result = entry.result;
  WriteLine(stream, {"run", entry.key,
                     std::to_string(ToEpochMillis(entry.cached_at)),
                     result.analysis_id, result.root});
  const auto &metrics = result.metrics;
  WriteLine(stream, {"metrics", std::to_string(metrics.reused_files),
                     std::to_string(metrics.reanalyzed_files),
                     std::to_string(metrics.duration_ms)});
  for (const auto &input : entry.inputs) {
    WriteFingerprint(stream, "input", input);
  }
  for (const auto &file : result.files) {
    WriteParsedFile(stream, file);
  }
  for (const auto &issue : result.issues) {
    WriteIssue(stream, issue);
  }
  for (const auto &failure : result.failures) {
    WriteLine(stream, {"failure", ToString(failure.kind), failure.subject,
                       failure.message});
  }
  return stream.str();
}

RunCacheEntry DecodeRunEntry(const std::string &text) {
  RunCacheEntry entry;
  bool has_run = false;
  std::size_t reused = 0;
  std::size_t reanalyzed = 0;
  std::int64_t duration_ms = 0;

  for (const auto &fields : ReadLines(text, kRunEntryHeader)) {
    const auto &tag = fields.front();
    if (tag == "run") {
      RequireFieldCount(fields, 5);
      entry.key = fields[1];
      entry.cached_at = FromEpochMillis(ParseInteger(fields[2], "cached_at"));
      entry.result.analysis_id = fields[3];
      entry.result.root = fields[4];
      has_run = true;
    } else if (tag == "metrics") {
      RequireFieldCount(fields, 4);
      reused = static_cast<std::size_t>(ParseInteger(fields[1], "reused"));
      reanalyzed =
          static_cast<std::size_t>(ParseInteger(fields[2], "reanalyzed"));
      duration_ms = ParseInteger(fields[3], "duration_ms");
    } else if (tag == "input") {
      entry.inputs.push_back(ReadFingerprint(fields));
    } else if (tag == "issue") {
      entry.result.issues.push_back(ReadIssue(fields));
    } else if (tag == "failure") {
      RequireFieldCount(fields, 4);
      entry.result.failures.push_back(
          {ParseEnum(fields[1], ParseFailureKind), fields[2], fields[3]});
    } else if (!ReadParsedLine(fields, entry.result.files)) {
      throw CacheError("Unknown run entry line: '" + tag + "'");
    }
  }

  if (!has_run) {
    throw CacheError("Incomplete run entry");
  }
  entry.result.metrics = ComputeMetrics(entry.result.files,
                                        entry.result.issues, reused,
                                        reanalyzed);
  entry.result.metrics.duration_ms = duration_ms;
  return entry;
}

} // namespace cqa
