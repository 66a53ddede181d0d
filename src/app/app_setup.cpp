#include "app/app_setup.hpp"

#include <array>
#include <charconv>
#include <cstdlib>
#include <unordered_map>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace app {

namespace {

constexpr std::string_view kDefaultLogLevel = "info";
constexpr std::string_view kLogPattern = "[%n][%L] %v";

constexpr std::string_view kConfigPrefix = "--config=";
constexpr std::string_view kJobsPrefix = "--jobs=";
constexpr std::string_view kJsonFlag = "--json";

struct LoggerConfig {
  std::string_view name;
};

auto ParseLogLevel(std::string_view level_str) -> spdlog::level::level_enum {
  static const std::unordered_map<std::string_view, spdlog::level::level_enum>
      kLevelMap = {
          {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
          {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
          {"error", spdlog::level::err},   {"off", spdlog::level::off},
      };

  if (auto it = kLevelMap.find(level_str); it != kLevelMap.end()) {
    return it->second;
  }
  return spdlog::level::info;
}

auto GetLogLevelFromEnv() -> spdlog::level::level_enum {
  const char* env_level = std::getenv("SPDLOG_LEVEL");
  return ParseLogLevel(env_level != nullptr ? env_level : kDefaultLogLevel);
}

void ConfigureLogger(
    std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level) {
  logger->set_pattern(std::string(kLogPattern));
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
}

auto ParseJobs(std::string_view value)
    -> std::expected<size_t, csmap::CsmapError> {
  size_t jobs = 0;
  const auto* end = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(value.data(), end, jobs);
  if (ec != std::errc{} || ptr != end || jobs == 0) {
    return csmap::CsmapError::Unexpected(
        csmap::CsmapErrorCode::kInvalidArguments,
        fmt::format("--jobs expects a positive integer, got '{}'", value));
  }
  return jobs;
}

}  // namespace

auto ParseArguments(const std::vector<std::string>& args)
    -> std::expected<CommandLineOptions, csmap::CsmapError> {
  CommandLineOptions options;
  std::vector<std::string_view> positional;

  for (size_t i = 1; i < args.size(); ++i) {
    std::string_view arg = args[i];
    if (arg == "--help" || arg == "-h") {
      options.show_help = true;
    } else if (arg == kJsonFlag) {
      options.write_json = true;
    } else if (arg.starts_with(kConfigPrefix)) {
      options.config_path = arg.substr(kConfigPrefix.size());
    } else if (arg.starts_with(kJobsPrefix)) {
      auto jobs = ParseJobs(arg.substr(kJobsPrefix.size()));
      if (!jobs) {
        return std::unexpected(jobs.error());
      }
      options.jobs = *jobs;
    } else if (arg.starts_with("--")) {
      return csmap::CsmapError::Unexpected(
          csmap::CsmapErrorCode::kInvalidArguments,
          fmt::format("unknown option '{}'", arg));
    } else {
      positional.push_back(arg);
    }
  }

  if (options.show_help) {
    return options;
  }

  if (positional.empty() || positional.size() > 2) {
    return csmap::CsmapError::Unexpected(
        csmap::CsmapErrorCode::kInvalidArguments,
        "expected <input_dir> [output_dir]");
  }

  options.input_dir = positional[0];
  if (positional.size() == 2) {
    options.output_dir = positional[1];
  }
  return options;
}

auto UsageText(std::string_view program) -> std::string {
  return fmt::format(
      "Usage: {} <input_dir> [output_dir] [--config=PATH] [--jobs=N] "
      "[--json]\n"
      "  input_dir     directory searched recursively for .cs files\n"
      "  output_dir    report directory (default: "
      "<input_dir>/_interface_maps)\n"
      "  --config=PATH configuration file (default: <input_dir>/.csmap)\n"
      "  --jobs=N      parser worker threads (default: hardware "
      "concurrency)\n"
      "  --json        also write model.json",
      program);
}

auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> {
  const auto user_log_level = GetLogLevelFromEnv();
  spdlog::set_level(user_log_level);

  constexpr std::array kLoggerConfigs = {
      LoggerConfig{.name = "csmap"},
      LoggerConfig{.name = "report"},
  };

  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;

  for (const auto& config : kLoggerConfigs) {
    auto logger = spdlog::stdout_color_mt(std::string(config.name));
    ConfigureLogger(logger, user_log_level);
    loggers[std::string(config.name)] = std::move(logger);
  }

  return loggers;
}

}  // namespace app
