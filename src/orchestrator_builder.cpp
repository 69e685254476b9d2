#include <cqa/orchestrator_builder.h>

#include <cqa/clang_parser_adapter.h>
#include <cqa/glob_file_discovery.h>

#include <utility>

namespace cqa {

OrchestratorBuilder &
OrchestratorBuilder::WithDiscovery(std::unique_ptr<FileDiscovery> discovery) {
  components_.discovery = std::move(discovery);
  return *this;
}

OrchestratorBuilder &
OrchestratorBuilder::WithParser(std::unique_ptr<ParserAdapter> parser) {
  components_.parser = std::move(parser);
  return *this;
}

OrchestratorBuilder &
OrchestratorBuilder::WithRegistry(std::unique_ptr<AnalyzerRegistry> registry) {
  components_.registry = std::move(registry);
  return *this;
}

OrchestratorBuilder &
OrchestratorBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

OrchestratorBuilder &
OrchestratorBuilder::WithCacheOptions(CacheStoreOptions options) {
  cache_options_ = std::move(options);
  return *this;
}

OrchestratorBuilder &
OrchestratorBuilder::WithClock(CacheStore::ClockFunction clock) {
  clock_ = std::move(clock);
  return *this;
}

OrchestratorBuilder &OrchestratorBuilder::WithBuiltinAnalyzers(bool enabled) {
  builtin_analyzers_ = enabled;
  return *this;
}

std::unique_ptr<Orchestrator> OrchestratorBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  if (!components_.discovery) {
    components_.discovery =
        std::make_unique<GlobFileDiscovery>(components_.logger);
  }
  if (!components_.parser) {
    components_.parser = std::make_unique<ClangParserAdapter>(
        std::vector<std::string>{}, components_.logger);
  }
  if (!components_.registry) {
    components_.registry =
        builtin_analyzers_
            ? MakeRegistryWithBuiltins(components_.logger)
            : std::make_unique<AnalyzerRegistry>(components_.logger);
  }
  components_.cache = std::make_unique<CacheStore>(
      cache_options_, components_.logger, clock_);
  return std::make_unique<Orchestrator>(std::move(components_));
}

} // namespace cqa
