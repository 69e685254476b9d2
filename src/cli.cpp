#include <cqa/cli.h>

#include <cqa/cache_store.h>
#include <cqa/cli_exit_codes.h>
#include <cqa/orchestrator_builder.h>
#include <cqa/report_writer.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include <variant>

#include <yaml-cpp/yaml.h>

namespace {

using cqa::AnalyzeCommandOptions;

void PrintAnalyzeUsage() {
  std::cout
      << "Usage: cqa analyze --root <path> [options]\n"
      << "Options:\n"
      << "  --root <path>            File or directory to analyze\n"
      << "  --include <globs>        Comma-separated include patterns\n"
      << "  --exclude <globs>        Comma-separated exclude patterns\n"
      << "  --workers <n>            Worker threads per pool (default: 4)\n"
      << "  --sequential             Parse and analyze on one thread\n"
      << "  --no-cache               Skip the whole-run cache lookup\n"
      << "  --no-incremental         Reprocess every file\n"
      << "  --confidence <x>         Minimum issue confidence in [0, 1]\n"
      << "  --max-file-size-mb <x>   Skip larger files (default: 10)\n"
      << "  --cache-ttl-hours <x>    Cache entry lifetime (default: 24)\n"
      << "  --categories <list>      Comma-separated issue categories\n"
      << "  --min-severity <level>   Drop issues below this severity\n"
      << "  --cache-dir <path>       Cache directory (default: "
         "<root>/.cqa_cache)\n"
      << "  --format <list>          Report formats (markdown,json)\n"
      << "  --out <path>             Report directory (default: root)\n"
      << "  --config <file>          Optional YAML config file\n"
      << "  --log-level <level>      Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose                Shortcut for --log-level info\n"
      << "  --debug                  Shortcut for --log-level debug\n"
      << "  --help                   Show this message\n";
}

void PrintCacheUsage() {
  std::cout << "Usage: cqa cache <clean|cleanup|stats> --root <path> "
               "[--cache-dir <path>] [--cache-ttl-hours <x>]\n";
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "true" || normalized == "1" || normalized == "yes" ||
      normalized == "on") {
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" ||
      normalized == "off") {
    return false;
  }
  throw std::invalid_argument("Invalid boolean value: " + value);
}

int ParseInt(const std::string &value, const std::string &name) {
  std::size_t consumed = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(Trim(value), &consumed);
  } catch (const std::exception &) {
    throw std::invalid_argument("Invalid integer for " + name + ": " + value);
  }
  if (consumed != Trim(value).size()) {
    throw std::invalid_argument("Invalid integer for " + name + ": " + value);
  }
  return parsed;
}

double ParseNumber(const std::string &value, const std::string &name) {
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(Trim(value), &consumed);
  } catch (const std::exception &) {
    throw std::invalid_argument("Invalid number for " + name + ": " + value);
  }
  if (consumed != Trim(value).size()) {
    throw std::invalid_argument("Invalid number for " + name + ": " + value);
  }
  return parsed;
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_values) {
    if (character == ',') {
      if (!current.empty()) {
        values.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(character);
    }
  }
  if (!current.empty()) {
    values.push_back(current);
  }
  return values;
}

void AppendValues(const std::string &raw_values,
                  std::vector<std::string> &target) {
  for (auto value : SplitList(raw_values)) {
    value = Trim(value);
    if (value.empty()) {
      continue;
    }
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(std::move(value));
    }
  }
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &target) {
  for (auto format : SplitList(raw_formats)) {
    format = ToLower(Trim(format));
    if (format != "markdown" && format != "json") {
      throw std::invalid_argument("Unsupported format: " + format);
    }
    if (std::find(target.begin(), target.end(), format) == target.end()) {
      target.push_back(std::move(format));
    }
  }
}

void AppendCategories(const std::string &raw_categories,
                      std::vector<cqa::IssueCategory> &target) {
  for (const auto &name : SplitList(raw_categories)) {
    const auto category = cqa::ParseIssueCategory(Trim(name));
    if (std::find(target.begin(), target.end(), category) == target.end()) {
      target.push_back(category);
    }
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, AnalyzeCommandOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level =
        cqa::ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = cqa::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = cqa::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleExecutionOption(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeCommandOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--workers") {
    options.workers = ParseInt(RequireValue(arguments, index, argument),
                               argument);
    return true;
  }
  if (argument == "--sequential") {
    options.parallel = false;
    return true;
  }
  if (argument == "--no-cache") {
    options.use_cache = false;
    return true;
  }
  if (argument == "--no-incremental") {
    options.incremental = false;
    return true;
  }
  if (argument == "--cache-dir") {
    options.cache_directory = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--cache-ttl-hours") {
    options.cache_ttl_hours =
        ParseNumber(RequireValue(arguments, index, argument), argument);
    return true;
  }
  return false;
}

bool HandleFilterOption(const std::vector<std::string> &arguments,
                        std::size_t &index, AnalyzeCommandOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--include") {
    AppendValues(RequireValue(arguments, index, argument),
                 options.include_patterns);
    return true;
  }
  if (argument == "--exclude") {
    AppendValues(RequireValue(arguments, index, argument),
                 options.exclude_patterns);
    return true;
  }
  if (argument == "--confidence") {
    options.confidence_threshold =
        ParseNumber(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--max-file-size-mb") {
    options.max_file_size_mb =
        ParseNumber(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--categories") {
    AppendCategories(RequireValue(arguments, index, argument),
                     options.categories);
    return true;
  }
  if (argument == "--min-severity") {
    options.min_severity =
        cqa::ParseSeverity(RequireValue(arguments, index, argument));
    return true;
  }
  return false;
}

bool DispatchAnalyzeOption(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeCommandOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--root") {
    options.root = RequireValue(arguments, index, "--root");
    return true;
  }
  if (argument == "--out") {
    options.output_directory = RequireValue(arguments, index, "--out");
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, "--config");
    return true;
  }
  if (argument == "--format") {
    AppendFormats(RequireValue(arguments, index, "--format"), options.formats);
    return true;
  }
  return HandleLoggingOption(arguments, index, options) ||
         HandleExecutionOption(arguments, index, options) ||
         HandleFilterOption(arguments, index, options);
}

void ValidateAnalyzeOptions(const AnalyzeCommandOptions &options) {
  if (!options.root) {
    throw std::invalid_argument("--root is required (or set in config file)");
  }
}

cqa::LoggingConfig BuildLoggingConfig(const AnalyzeCommandOptions &options) {
  cqa::LoggingConfig logging;
  logging.level = options.log_level.value_or(cqa::LogLevel::kWarn);
  return logging;
}

void PrintRunSummary(const cqa::AnalysisRunResult &result,
                     const std::vector<std::filesystem::path> &reports) {
  const auto &metrics = result.metrics;
  std::cout << "Analyzed " << metrics.total_files << " files ("
            << metrics.reused_files << " reused from cache), "
            << metrics.total_issues << " issues";
  if (result.served_from_cache) {
    std::cout << " [run cache]";
  }
  std::cout << "\n";
  for (const auto &failure : result.failures) {
    std::cout << "  " << cqa::ToString(failure.kind)
              << " failure: " << failure.subject << ": " << failure.message
              << "\n";
  }
  for (const auto &report : reports) {
    std::cout << "Wrote " << report.string() << "\n";
  }
}

} // namespace

namespace cqa {

AnalyzeCommandOptions
ParseAnalyzeArguments(const std::vector<std::string> &arguments) {
  AnalyzeCommandOptions options;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchAnalyzeOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }

  return options;
}

namespace {

using ConfigValue = std::variant<std::string, bool, std::vector<std::string>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {"root",
                                                "include",
                                                "exclude",
                                                "workers",
                                                "parallel",
                                                "use_cache",
                                                "incremental",
                                                "confidence_threshold",
                                                "max_file_size_mb",
                                                "cache_ttl_hours",
                                                "categories",
                                                "min_severity",
                                                "cache_dir",
                                                "formats",
                                                "out",
                                                "log_level"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"include_patterns", "include"},
      {"exclude_patterns", "exclude"},
      {"max_workers", "workers"},
      {"parallel_processing", "parallel"},
      {"cache", "use_cache"},
      {"confidence", "confidence_threshold"},
      {"output", "out"},
      {"output_directory", "out"},
      {"format", "formats"},
      {"cache_directory", "cache_dir"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  const auto found = std::find(supported.begin(), supported.end(), normalized);
  if (found == supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractScalar(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a scalar value");
  }
  return node.as<std::string>();
}

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      AppendValues(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    AppendValues(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "include" || key == "exclude" || key == "categories" ||
      key == "formats") {
    return ExtractList(node, key);
  }
  if (key == "parallel" || key == "use_cache" || key == "incremental") {
    return ConfigValue{ParseBool(ExtractScalar(node, key))};
  }
  return ConfigValue{ExtractScalar(node, key)};
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception &error) {
    throw std::invalid_argument("Invalid config file " + path.string() + ": " +
                                error.what());
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyListConfig(const std::string &key,
                     const std::vector<std::string> &values,
                     AnalyzeCommandOptions &options) {
  if (key == "include") {
    options.include_patterns = values;
    return;
  }
  if (key == "exclude") {
    options.exclude_patterns = values;
    return;
  }
  if (key == "formats") {
    options.formats.clear();
    for (const auto &value : values) {
      AppendFormats(value, options.formats);
    }
    return;
  }
  if (key == "categories") {
    options.categories.clear();
    for (const auto &value : values) {
      AppendCategories(value, options.categories);
    }
    return;
  }
  ThrowUnknownKey(key);
}

void ApplyBoolConfig(const std::string &key, bool value,
                     AnalyzeCommandOptions &options) {
  if (key == "parallel") {
    options.parallel = value;
    return;
  }
  if (key == "use_cache") {
    options.use_cache = value;
    return;
  }
  if (key == "incremental") {
    options.incremental = value;
    return;
  }
  ThrowUnknownKey(key);
}

void ApplyScalarConfig(const std::string &key, const std::string &value,
                       AnalyzeCommandOptions &options) {
  if (key == "root") {
    options.root = value;
  } else if (key == "out") {
    options.output_directory = value;
  } else if (key == "cache_dir") {
    options.cache_directory = value;
  } else if (key == "workers") {
    options.workers = ParseInt(value, key);
  } else if (key == "confidence_threshold") {
    options.confidence_threshold = ParseNumber(value, key);
  } else if (key == "max_file_size_mb") {
    options.max_file_size_mb = ParseNumber(value, key);
  } else if (key == "cache_ttl_hours") {
    options.cache_ttl_hours = ParseNumber(value, key);
  } else if (key == "min_severity") {
    options.min_severity = ParseSeverity(value);
  } else if (key == "log_level") {
    options.log_level = ParseLogLevel(value);
  } else {
    ThrowUnknownKey(key);
  }
}

void ApplyConfig(const RawConfig &config, AnalyzeCommandOptions &options) {
  for (const auto &[key, value] : config) {
    if (const auto *values = std::get_if<std::vector<std::string>>(&value)) {
      ApplyListConfig(key, *values, options);
    } else if (const auto *flag = std::get_if<bool>(&value)) {
      ApplyBoolConfig(key, *flag, options);
    } else {
      ApplyScalarConfig(key, std::get<std::string>(value), options);
    }
  }
}

} // namespace

AnalyzeCommandOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  AnalyzeCommandOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  return options;
}

AnalyzeCommandOptions MergeOptions(const AnalyzeCommandOptions &config_options,
                                   const AnalyzeCommandOptions &cli_options) {
  AnalyzeCommandOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };
  const auto override_list = [](auto &target, const auto &source) {
    if (!source.empty()) {
      target = source;
    }
  };

  override_value(merged.root, cli_options.root);
  override_value(merged.output_directory, cli_options.output_directory);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.cache_directory, cli_options.cache_directory);
  override_value(merged.workers, cli_options.workers);
  override_value(merged.parallel, cli_options.parallel);
  override_value(merged.use_cache, cli_options.use_cache);
  override_value(merged.incremental, cli_options.incremental);
  override_value(merged.confidence_threshold, cli_options.confidence_threshold);
  override_value(merged.max_file_size_mb, cli_options.max_file_size_mb);
  override_value(merged.cache_ttl_hours, cli_options.cache_ttl_hours);
  override_value(merged.min_severity, cli_options.min_severity);
  override_value(merged.log_level, cli_options.log_level);
  override_list(merged.include_patterns, cli_options.include_patterns);
  override_list(merged.exclude_patterns, cli_options.exclude_patterns);
  override_list(merged.formats, cli_options.formats);
  override_list(merged.categories, cli_options.categories);
  return merged;
}

AnalyzeCommandOptions
ResolveAnalyzeOptions(const AnalyzeCommandOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  AnalyzeCommandOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  const auto merged = MergeOptions(config_options, cli_options);
  ValidateAnalyzeOptions(merged);
  return merged;
}

AnalysisOptions BuildAnalysisOptions(const AnalyzeCommandOptions &options) {
  auto analysis = DefaultAnalysisOptions();
  if (!options.include_patterns.empty()) {
    analysis.include_patterns = options.include_patterns;
  }
  if (!options.exclude_patterns.empty()) {
    analysis.exclude_patterns = options.exclude_patterns;
  }
  analysis.max_workers = options.workers.value_or(analysis.max_workers);
  analysis.parallel_processing =
      options.parallel.value_or(analysis.parallel_processing);
  analysis.use_cache = options.use_cache.value_or(analysis.use_cache);
  analysis.incremental = options.incremental.value_or(analysis.incremental);
  analysis.confidence_threshold =
      options.confidence_threshold.value_or(analysis.confidence_threshold);
  analysis.max_file_size_mb =
      options.max_file_size_mb.value_or(analysis.max_file_size_mb);
  analysis.cache_ttl_hours =
      options.cache_ttl_hours.value_or(analysis.cache_ttl_hours);
  analysis.categories = options.categories;
  analysis.min_severity = options.min_severity;
  ValidateOptions(analysis);
  return analysis;
}

int RunAnalyze(const std::vector<std::string> &arguments) {
  const auto cli_options = ParseAnalyzeArguments(arguments);
  if (cli_options.show_help) {
    PrintAnalyzeUsage();
    return kExitClean;
  }

  const auto merged = ResolveAnalyzeOptions(cli_options);
  const auto root = std::filesystem::weakly_canonical(*merged.root);
  const auto project_directory =
      std::filesystem::is_directory(root) ? root : root.parent_path();
  const auto options = BuildAnalysisOptions(merged);
  auto logger = MakeLogger(BuildLoggingConfig(merged), std::clog);

  CacheStoreOptions cache_options;
  cache_options.directory =
      ResolveCacheDirectory(project_directory, merged.cache_directory);
  cache_options.time_to_live = CacheTimeToLive(options);
  auto orchestrator = OrchestratorBuilder()
                          .WithLogger(logger)
                          .WithCacheOptions(cache_options)
                          .Build();

  const auto result = orchestrator->Run(root, options);
  const auto output_root =
      merged.output_directory.value_or(project_directory);
  const auto reports = WriteReports(output_root, result, merged.formats);
  PrintRunSummary(result, reports);
  return AnalysisExitCode(result);
}

CacheCommandOptions
ParseCacheArguments(const std::vector<std::string> &arguments) {
  CacheCommandOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &arg = arguments[i];
    if (arg == "--help" || arg == "-h") {
      options.show_help = true;
      return options;
    }
    if (i == 0 && arg.rfind('-', 0) != 0) {
      options.action = arg;
      continue;
    }
    if (arg == "--root") {
      options.root = RequireValue(arguments, i, "--root");
      continue;
    }
    if (arg == "--cache-dir") {
      options.cache_directory = RequireValue(arguments, i, "--cache-dir");
      continue;
    }
    if (arg == "--cache-ttl-hours") {
      options.cache_ttl_hours =
          ParseNumber(RequireValue(arguments, i, arg), arg);
      continue;
    }
    throw std::invalid_argument("Unknown cache argument: " + arg);
  }
  return options;
}

int RunCacheCommand(const std::vector<std::string> &arguments) {
  const auto options = ParseCacheArguments(arguments);
  if (options.show_help) {
    PrintCacheUsage();
    return kExitClean;
  }
  if (options.action.empty()) {
    std::cout << "Cache subcommand requires an action (clean, cleanup, "
                 "stats).\n";
    return kExitError;
  }
  if (options.action != "clean" && options.action != "cleanup" &&
      options.action != "stats") {
    std::cout << "Unknown cache subcommand: " << options.action << "\n";
    return kExitError;
  }
  if (!options.root) {
    throw std::invalid_argument("--root is required for cache " +
                                options.action);
  }

  auto ttl_options = DefaultAnalysisOptions();
  ttl_options.cache_ttl_hours =
      options.cache_ttl_hours.value_or(ttl_options.cache_ttl_hours);
  ValidateOptions(ttl_options);

  const auto root = std::filesystem::weakly_canonical(*options.root);
  CacheStoreOptions cache_options;
  cache_options.directory = ResolveCacheDirectory(root, options.cache_directory);
  cache_options.time_to_live = CacheTimeToLive(ttl_options);
  CacheStore cache(cache_options);

  if (options.action == "clean") {
    cache.ClearCache();
    std::cout << "Cleared cache at " << cache.Directory().string() << "\n";
  } else if (options.action == "cleanup") {
    const auto removed = cache.CleanupExpired();
    std::cout << "Removed " << removed << " expired entries from "
              << cache.Directory().string() << "\n";
  } else {
    const auto stats = cache.Stats();
    std::cout << "Cache directory: " << cache.Directory().string() << "\n"
              << "File entries: " << stats.file_entries << "\n"
              << "Run entries: " << stats.run_entries << "\n";
  }
  return kExitClean;
}

} // namespace cqa
