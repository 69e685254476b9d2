#pragma once

#include <cqa/interfaces.h>
#include <cqa/logging.h>
#include <cqa/models.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cqa {

struct CacheStoreOptions {
  // Empty keeps the cache in memory only.
  std::filesystem::path directory;
  std::size_t shard_count = 16;
  std::chrono::milliseconds time_to_live = std::chrono::hours(24);
};

std::filesystem::path
ResolveCacheDirectory(const std::filesystem::path &root,
                      const std::optional<std::filesystem::path> &directory);

std::string SerializeOptions(const AnalysisOptions &options);
std::string BuildRunCacheKey(const std::filesystem::path &root,
                             const AnalysisOptions &options,
                             const std::string &profile = {});

// Content-addressed, TTL-bound store for per-file records and whole-run
// results. Every hit is revalidated against the live file contents.
class CacheStore : public CacheAdmin {
public:
  using ClockFunction = std::function<TimePoint()>;

  explicit CacheStore(CacheStoreOptions options = {},
                      std::shared_ptr<Logger> logger = nullptr,
                      ClockFunction clock = nullptr);

  CacheStore(const CacheStore &) = delete;
  CacheStore &operator=(const CacheStore &) = delete;

  std::optional<FileRecord> Get(const std::string &path,
                                const std::string &profile = {});
  void Put(const FileFingerprint &fingerprint, ParsedFile parsed,
           std::vector<Issue> issues, const std::string &profile = {});
  CacheDiff Diff(const std::vector<std::string> &paths,
                 const std::string &profile = {});
  std::size_t Expire(std::chrono::milliseconds ttl);

  std::optional<AnalysisRunResult> RunGet(const std::string &key);
  void RunPut(const std::string &key, const AnalysisRunResult &result,
              std::vector<FileFingerprint> inputs);

  void SetTimeToLive(std::chrono::milliseconds ttl);
  std::chrono::milliseconds TimeToLive() const;

  void ClearCache() override;
  std::size_t CleanupExpired() override;
  CacheStats Stats() const override;

  const std::filesystem::path &Directory() const { return directory_; }
  bool Persistent() const { return !directory_.empty(); }

private:
  struct Shard {
    std::mutex mutex;
    std::unordered_map<std::string, FileRecord> records;
  };

  Shard &ShardFor(const std::string &path) const;
  bool IsExpired(TimePoint cached_at, std::chrono::milliseconds ttl) const;
  std::optional<FileRecord> Lookup(const std::string &path,
                                   const std::string &profile,
                                   const std::optional<FileFingerprint> &live);
  void Evict(const std::string &path);

  std::filesystem::path RecordPath(const std::string &path) const;
  std::filesystem::path RunPath(const std::string &key) const;
  std::optional<FileRecord> LoadRecord(const std::string &path) const;
  std::optional<RunCacheEntry> LoadRun(const std::string &key) const;
  void WriteAtomically(const std::filesystem::path &target,
                       const std::string &content) const;
  void RemoveQuietly(const std::filesystem::path &target) const;

  std::size_t ExpireRecords(std::chrono::milliseconds ttl);
  std::size_t ExpireRuns(std::chrono::milliseconds ttl);
  std::unordered_set<std::string> PersistedStems(const std::string &kind) const;

  std::filesystem::path directory_;
  std::vector<std::unique_ptr<Shard>> shards_;
  mutable std::mutex runs_mutex_;
  std::unordered_map<std::string, RunCacheEntry> runs_;
  std::atomic<std::int64_t> ttl_ms_;
  std::atomic<std::size_t> hits_{0};
  std::atomic<std::size_t> misses_{0};
  std::shared_ptr<Logger> logger_;
  ClockFunction clock_;
};

} // namespace cqa
