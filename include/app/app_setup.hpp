#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

#include "csmap/error/error.hpp"

namespace app {

struct CommandLineOptions {
  std::filesystem::path input_dir;
  std::optional<std::filesystem::path> output_dir;
  std::optional<std::filesystem::path> config_path;
  std::optional<size_t> jobs;
  bool write_json = false;
  bool show_help = false;
};

/// Parse `csmap <input_dir> [output_dir] [--config=PATH] [--jobs=N]
/// [--json]`. args[0] is the program name.
auto ParseArguments(const std::vector<std::string>& args)
    -> std::expected<CommandLineOptions, csmap::CsmapError>;

/// Usage text for --help and argument errors
auto UsageText(std::string_view program) -> std::string;

/// Setup structured logging with named loggers
/// Returns configured loggers for the csmap and report components
auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

}  // namespace app
