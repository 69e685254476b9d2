#pragma once

#include <cqa/cache_store.h>
#include <cqa/orchestrator.h>

#include <memory>

namespace cqa {

class OrchestratorBuilder {
public:
  OrchestratorBuilder &WithDiscovery(std::unique_ptr<FileDiscovery> discovery);
  OrchestratorBuilder &WithParser(std::unique_ptr<ParserAdapter> parser);
  OrchestratorBuilder &
  WithRegistry(std::unique_ptr<AnalyzerRegistry> registry);
  OrchestratorBuilder &WithLogger(std::shared_ptr<Logger> logger);
  OrchestratorBuilder &WithCacheOptions(CacheStoreOptions options);
  OrchestratorBuilder &WithClock(CacheStore::ClockFunction clock);
  // Only consulted when no registry is supplied.
  OrchestratorBuilder &WithBuiltinAnalyzers(bool enabled);

  std::unique_ptr<Orchestrator> Build();

private:
  OrchestratorComponents components_;
  CacheStoreOptions cache_options_;
  CacheStore::ClockFunction clock_;
  bool builtin_analyzers_ = true;
};

} // namespace cqa
