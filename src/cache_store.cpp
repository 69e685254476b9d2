#include <cqa/cache_store.h>

#include <cqa/errors.h>
#include <cqa/hashing.h>
#include <cqa/record_codec.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace cqa {
namespace {

constexpr const char kRecordDirectory[] = "files";
constexpr const char kRunDirectory[] = "runs";
constexpr const char kRecordExtension[] = ".rec";
constexpr const char kRunExtension[] = ".run";

std::string JoinSorted(std::vector<std::string> values) {
  std::sort(values.begin(), values.end());
  std::string joined;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      joined += ',';
    }
    joined += values[i];
  }
  return joined;
}

std::string FormatDouble(double value) {
  std::ostringstream stream;
  stream << std::setprecision(std::numeric_limits<double>::max_digits10)
         << value;
  return stream.str();
}

std::optional<std::string> ReadFile(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    return std::nullopt;
  }
  return std::string(std::istreambuf_iterator<char>(stream),
                     std::istreambuf_iterator<char>());
}

} // namespace

std::filesystem::path
ResolveCacheDirectory(const std::filesystem::path &root,
                      const std::optional<std::filesystem::path> &directory) {
  if (directory && !directory->empty()) {
    return std::filesystem::weakly_canonical(*directory);
  }
  return std::filesystem::weakly_canonical(root / ".cqa_cache");
}

std::string SerializeOptions(const AnalysisOptions &options) {
  std::vector<std::string> categories;
  categories.reserve(options.categories.size());
  for (const auto category : options.categories) {
    categories.push_back(ToString(category));
  }
  std::ostringstream stream;
  stream << "include=" << JoinSorted(options.include_patterns) << '\n'
         << "exclude=" << JoinSorted(options.exclude_patterns) << '\n'
         << "confidence_threshold="
         << FormatDouble(options.confidence_threshold) << '\n'
         << "max_file_size_mb=" << FormatDouble(options.max_file_size_mb)
         << '\n'
         << "categories=" << JoinSorted(categories) << '\n'
         << "min_severity="
         << (options.min_severity ? ToString(*options.min_severity) : "none")
         << '\n';
  return stream.str();
}

std::string BuildRunCacheKey(const std::filesystem::path &root,
                             const AnalysisOptions &options,
                             const std::string &profile) {
  const auto canonical_root =
      std::filesystem::weakly_canonical(root).generic_string();
  return Sha256Hex("cqa-run-v1\n" + canonical_root + '\n' +
                   SerializeOptions(options) + "profile=" + profile + '\n');
}

CacheStore::CacheStore(CacheStoreOptions options,
                       std::shared_ptr<Logger> logger, ClockFunction clock)
    : directory_(std::move(options.directory)),
      ttl_ms_(std::min(options.time_to_live, MaxTimeToLive()).count()),
      logger_(EnsureLogger(std::move(logger))), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = []() { return Clock::now(); };
  }
  const auto shard_count = std::max<std::size_t>(1, options.shard_count);
  shards_.reserve(shard_count);
  for (std::size_t i = 0; i < shard_count; ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
}

CacheStore::Shard &CacheStore::ShardFor(const std::string &path) const {
  return *shards_[std::hash<std::string>{}(path) % shards_.size()];
}

void CacheStore::SetTimeToLive(std::chrono::milliseconds ttl) {
  ttl_ms_.store(std::min(ttl, MaxTimeToLive()).count());
}

std::chrono::milliseconds CacheStore::TimeToLive() const {
  return std::chrono::milliseconds(ttl_ms_.load());
}

bool CacheStore::IsExpired(TimePoint cached_at,
                           std::chrono::milliseconds ttl) const {
  return clock_() - cached_at >= std::min(ttl, MaxTimeToLive());
}

std::optional<FileRecord> CacheStore::Get(const std::string &path,
                                          const std::string &profile) {
  return Lookup(path, profile, std::nullopt);
}

std::optional<FileRecord>
CacheStore::Lookup(const std::string &path, const std::string &profile,
                   const std::optional<FileFingerprint> &live) {
  auto &shard = ShardFor(path);
  std::optional<FileRecord> record;
  {
    std::lock_guard<std::mutex> lock(shard.mutex);
    if (const auto found = shard.records.find(path);
        found != shard.records.end()) {
      record = found->second;
    }
  }
  if (!record && Persistent()) {
    record = LoadRecord(path);
    if (record) {
      std::lock_guard<std::mutex> lock(shard.mutex);
      shard.records.try_emplace(path, *record);
    }
  }

  if (!record) {
    ++misses_;
    logger_->Log(LogLevel::kDebug, "cache.miss", {{"path", path}});
    return std::nullopt;
  }
  if (IsExpired(record->cached_at, TimeToLive())) {
    Evict(path);
    ++misses_;
    logger_->Log(LogLevel::kDebug, "cache.expired", {{"path", path}});
    return std::nullopt;
  }
  if (record->profile != profile) {
    ++misses_;
    logger_->Log(LogLevel::kDebug, "cache.profile_mismatch", {{"path", path}});
    return std::nullopt;
  }

  FileFingerprint current;
  if (live) {
    current = *live;
  } else {
    try {
      current = FingerprintFile(path);
    } catch (const ResourceError &ex) {
      Evict(path);
      ++misses_;
      logger_->Log(LogLevel::kDebug, "cache.unreadable",
                   {{"path", path}, {"error", ex.what()}});
      return std::nullopt;
    }
  }
  if (current != record->fingerprint) {
    Evict(path);
    ++misses_;
    logger_->Log(LogLevel::kDebug, "cache.stale", {{"path", path}});
    return std::nullopt;
  }

  ++hits_;
  logger_->Log(LogLevel::kDebug, "cache.hit", {{"path", path}});
  return record;
}

void CacheStore::Put(const FileFingerprint &fingerprint, ParsedFile parsed,
                     std::vector<Issue> issues, const std::string &profile) {
  FileRecord record{fingerprint, std::move(parsed), std::move(issues), profile,
                    clock_()};
  if (Persistent()) {
    WriteAtomically(RecordPath(fingerprint.path), EncodeFileRecord(record));
  }
  auto &shard = ShardFor(fingerprint.path);
  std::lock_guard<std::mutex> lock(shard.mutex);
  shard.records.insert_or_assign(fingerprint.path, std::move(record));
}

CacheDiff CacheStore::Diff(const std::vector<std::string> &paths,
                           const std::string &profile) {
  CacheDiff diff;
  for (const auto &path : paths) {
    std::optional<FileFingerprint> live;
    try {
      live = FingerprintFile(path);
    } catch (const ResourceError &ex) {
      ++misses_;
      logger_->Log(LogLevel::kDebug, "cache.unreadable",
                   {{"path", path}, {"error", ex.what()}});
      diff.changed.push_back(path);
      continue;
    }

    auto record = Lookup(path, profile, live);
    if (!record) {
      diff.changed.push_back(path);
      continue;
    }
    diff.unchanged.push_back(path);
    diff.records.push_back(std::move(*record));
  }

  logger_->Log(LogLevel::kInfo, "cache.diff",
               {{"changed", std::to_string(diff.changed.size())},
                {"unchanged", std::to_string(diff.unchanged.size())}});
  return diff;
}

void CacheStore::Evict(const std::string &path) {
  auto &shard = ShardFor(path);
  {
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.records.erase(path);
  }
  if (Persistent()) {
    RemoveQuietly(RecordPath(path));
  }
}

std::size_t CacheStore::Expire(std::chrono::milliseconds ttl) {
  const auto records = ExpireRecords(ttl);
  const auto runs = ExpireRuns(ttl);
  logger_->Log(LogLevel::kInfo, "cache.expire",
               {{"ttl_ms", std::to_string(ttl.count())},
                {"file_entries", std::to_string(records)},
                {"run_entries", std::to_string(runs)}});
  return records + runs;
}

std::size_t CacheStore::ExpireRecords(std::chrono::milliseconds ttl) {
  std::size_t removed = 0;
  std::unordered_set<std::string> visited;
  for (auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    for (auto it = shard->records.begin(); it != shard->records.end();) {
      visited.insert(RecordPath(it->first).stem().string());
      if (!IsExpired(it->second.cached_at, ttl)) {
        ++it;
        continue;
      }
      if (Persistent()) {
        RemoveQuietly(RecordPath(it->first));
      }
      it = shard->records.erase(it);
      ++removed;
    }
  }

  if (!Persistent()) {
    return removed;
  }
  for (const auto &stem : PersistedStems(kRecordDirectory)) {
    if (visited.count(stem) != 0) {
      continue;
    }
    const auto path = directory_ / kRecordDirectory / (stem + kRecordExtension);
    const auto text = ReadFile(path);
    if (!text) {
      continue;
    }
    try {
      if (!IsExpired(DecodeFileRecord(*text).cached_at, ttl)) {
        continue;
      }
    } catch (const CacheError &ex) {
      logger_->Log(LogLevel::kWarn, "cache.corrupt",
                   {{"path", path.string()}, {"error", ex.what()}});
    }
    RemoveQuietly(path);
    ++removed;
  }
  return removed;
}

std::size_t CacheStore::ExpireRuns(std::chrono::milliseconds ttl) {
  std::size_t removed = 0;
  std::unordered_set<std::string> visited;
  {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    for (auto it = runs_.begin(); it != runs_.end();) {
      visited.insert(it->first);
      if (!IsExpired(it->second.cached_at, ttl)) {
        ++it;
        continue;
      }
      if (Persistent()) {
        RemoveQuietly(RunPath(it->first));
      }
      it = runs_.erase(it);
      ++removed;
    }
  }

  if (!Persistent()) {
    return removed;
  }
  for (const auto &stem : PersistedStems(kRunDirectory)) {
    if (visited.count(stem) != 0) {
      continue;
    }
    const auto path = RunPath(stem);
    const auto text = ReadFile(path);
    if (!text) {
      continue;
    }
    try {
      if (!IsExpired(DecodeRunEntry(*text).cached_at, ttl)) {
        continue;
      }
    } catch (const CacheError &ex) {
      logger_->Log(LogLevel::kWarn, "cache.corrupt",
                   {{"path", path.string()}, {"error", ex.what()}});
    }
    RemoveQuietly(path);
    ++removed;
  }
  return removed;
}

std::optional<AnalysisRunResult> CacheStore::RunGet(const std::string &key) {
  std::optional<RunCacheEntry> entry;
  {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    if (const auto found = runs_.find(key); found != runs_.end()) {
      entry = found->second;
    }
  }
  if (!entry && Persistent()) {
    entry = LoadRun(key);
    if (entry) {
      std::lock_guard<std::mutex> lock(runs_mutex_);
      runs_.try_emplace(key, *entry);
    }
  }
  if (!entry) {
    ++misses_;
    logger_->Log(LogLevel::kDebug, "cache.run.miss", {{"key", key}});
    return std::nullopt;
  }

  bool fresh = !IsExpired(entry->cached_at, TimeToLive());
  for (std::size_t i = 0; fresh && i < entry->inputs.size(); ++i) {
    const auto &input = entry->inputs[i];
    try {
      fresh = FingerprintFile(input.path) == input;
    } catch (const ResourceError &) {
      fresh = false;
    }
  }
  if (!fresh) {
    {
      std::lock_guard<std::mutex> lock(runs_mutex_);
      runs_.erase(key);
    }
    if (Persistent()) {
      RemoveQuietly(RunPath(key));
    }
    ++misses_;
    logger_->Log(LogLevel::kDebug, "cache.run.stale", {{"key", key}});
    return std::nullopt;
  }

  ++hits_;
  logger_->Log(LogLevel::kInfo, "cache.run.hit", {{"key", key}});
  auto result = std::move(entry->result);
  result.served_from_cache = true;
  return result;
}

void CacheStore::RunPut(const std::string &key, const AnalysisRunResult &result,
                        std::vector<FileFingerprint> inputs) {
  RunCacheEntry entry{key, result, std::move(inputs), clock_()};
  entry.result.served_from_cache = false;
  if (Persistent()) {
    WriteAtomically(RunPath(key), EncodeRunEntry(entry));
  }
  std::lock_guard<std::mutex> lock(runs_mutex_);
  runs_.insert_or_assign(key, std::move(entry));
}

void CacheStore::ClearCache() {
  for (auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    shard->records.clear();
  }
  {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    runs_.clear();
  }
  if (Persistent()) {
    std::error_code error;
    std::filesystem::remove_all(directory_ / kRecordDirectory, error);
    std::filesystem::remove_all(directory_ / kRunDirectory, error);
    if (error) {
      logger_->Log(LogLevel::kWarn, "cache.clear.failed",
                   {{"directory", directory_.string()},
                    {"error", error.message()}});
    }
  }
  hits_ = 0;
  misses_ = 0;
  logger_->Log(LogLevel::kInfo, "cache.clear",
               {{"directory", directory_.string()}});
}

std::size_t CacheStore::CleanupExpired() { return Expire(TimeToLive()); }

CacheStats CacheStore::Stats() const {
  CacheStats stats;
  std::unordered_set<std::string> record_stems;
  for (const auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    for (const auto &entry : shard->records) {
      record_stems.insert(RecordPath(entry.first).stem().string());
    }
  }
  std::unordered_set<std::string> run_stems;
  {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    for (const auto &entry : runs_) {
      run_stems.insert(entry.first);
    }
  }
  if (Persistent()) {
    const auto persisted_records = PersistedStems(kRecordDirectory);
    record_stems.insert(persisted_records.begin(), persisted_records.end());
    const auto persisted_runs = PersistedStems(kRunDirectory);
    run_stems.insert(persisted_runs.begin(), persisted_runs.end());
  }
  stats.file_entries = record_stems.size();
  stats.run_entries = run_stems.size();
  stats.hits = hits_.load();
  stats.misses = misses_.load();
  return stats;
}

std::filesystem::path CacheStore::RecordPath(const std::string &path) const {
  return directory_ / kRecordDirectory / (Sha256Hex(path) + kRecordExtension);
}

std::filesystem::path CacheStore::RunPath(const std::string &key) const {
  return directory_ / kRunDirectory / (key + kRunExtension);
}

std::optional<FileRecord>
CacheStore::LoadRecord(const std::string &path) const {
  const auto location = RecordPath(path);
  const auto text = ReadFile(location);
  if (!text) {
    return std::nullopt;
  }
  try {
    auto record = DecodeFileRecord(*text);
    if (record.fingerprint.path != path) {
      throw CacheError("Record path mismatch: " + record.fingerprint.path);
    }
    return record;
  } catch (const CacheError &ex) {
    logger_->Log(LogLevel::kWarn, "cache.corrupt",
                 {{"path", location.string()}, {"error", ex.what()}});
    RemoveQuietly(location);
    return std::nullopt;
  }
}

std::optional<RunCacheEntry>
CacheStore::LoadRun(const std::string &key) const {
  const auto location = RunPath(key);
  const auto text = ReadFile(location);
  if (!text) {
    return std::nullopt;
  }
  try {
    auto entry = DecodeRunEntry(*text);
    if (entry.key != key) {
      throw CacheError("Run key mismatch: " + entry.key);
    }
    return entry;
  } catch (const CacheError &ex) {
    logger_->Log(LogLevel::kWarn, "cache.corrupt",
                 {{"path", location.string()}, {"error", ex.what()}});
    RemoveQuietly(location);
    return std::nullopt;
  }
}

void CacheStore::WriteAtomically(const std::filesystem::path &target,
                                 const std::string &content) const {
  auto temporary = target;
  temporary += ".tmp" + std::to_string(std::hash<std::thread::id>{}(
                            std::this_thread::get_id()));
  try {
    std::filesystem::create_directories(target.parent_path());
    {
      std::ofstream stream(temporary, std::ios::binary | std::ios::trunc);
      if (!stream) {
        throw std::runtime_error("cannot open " + temporary.string());
      }
      stream << content;
      if (!stream.flush()) {
        throw std::runtime_error("cannot write " + temporary.string());
      }
    }
    std::filesystem::rename(temporary, target);
  } catch (const std::exception &ex) {
    logger_->Log(LogLevel::kWarn, "cache.write_failed",
                 {{"path", target.string()}, {"error", ex.what()}});
    RemoveQuietly(temporary);
  }
}

void CacheStore::RemoveQuietly(const std::filesystem::path &target) const {
  std::error_code error;
  std::filesystem::remove(target, error);
  if (error) {
    logger_->Log(LogLevel::kDebug, "cache.remove_failed",
                 {{"path", target.string()}, {"error", error.message()}});
  }
}

std::unordered_set<std::string>
CacheStore::PersistedStems(const std::string &kind) const {
  std::unordered_set<std::string> stems;
  const auto directory = directory_ / kind;
  const auto extension =
      kind == kRecordDirectory ? kRecordExtension : kRunExtension;
  std::error_code error;
  if (!std::filesystem::is_directory(directory, error)) {
    return stems;
  }
  for (std::filesystem::directory_iterator it(directory, error), end;
       !error && it != end; it.increment(error)) {
    const auto &path = it->path();
    if (path.extension() == extension) {
      stems.insert(path.stem().string());
    }
  }
  return stems;
}

} // namespace cqa
