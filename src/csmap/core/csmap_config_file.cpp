#include "csmap/core/csmap_config_file.hpp"

#include <fstream>
#include <regex>
#include <sstream>
#include <yaml-cpp/yaml.h>

#include <spdlog/spdlog.h>

namespace csmap {

namespace {

// Accepts a single scalar or a sequence of scalars
auto ReadStringList(const YAML::Node& node) -> std::vector<std::string> {
  std::vector<std::string> values;
  if (node.IsScalar()) {
    values.push_back(node.as<std::string>());
  } else if (node.IsSequence()) {
    for (const auto& item : node) {
      values.push_back(item.as<std::string>());
    }
  }
  return values;
}

auto MatchesAny(
    const std::string& path, const std::vector<std::string>& patterns)
    -> bool {
  for (const auto& pattern : patterns) {
    if (std::regex_match(path, std::regex(pattern))) {
      return true;
    }
  }
  return false;
}

}  // namespace

CsmapConfigFile::CsmapConfigFile(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto CsmapConfigFile::CreateDefault(std::shared_ptr<spdlog::logger> logger)
    -> CsmapConfigFile {
  return CsmapConfigFile(logger);
}

auto CsmapConfigFile::LoadFromFile(
    const CanonicalPath& config_path, std::shared_ptr<spdlog::logger> logger)
    -> std::optional<CsmapConfigFile> {
  CsmapConfigFile config(logger);

  if (!std::filesystem::exists(config_path.Path())) {
    config.logger_->debug(
        "No .csmap configuration file found at {}", config_path);
    return std::nullopt;
  }

  std::ifstream file(config_path.Path());
  if (!file) {
    config.logger_->error(
        "Cannot open .csmap configuration file: {}", config_path);
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto loaded = LoadFromString(buffer.str(), config.logger_);
  if (loaded) {
    config.logger_->debug(
        "Loaded .csmap configuration from {}", config_path);
  }
  return loaded;
}

auto CsmapConfigFile::LoadFromString(
    std::string_view yaml_text, std::shared_ptr<spdlog::logger> logger)
    -> std::optional<CsmapConfigFile> {
  CsmapConfigFile config(logger);

  try {
    config.ParseDocument(std::string(yaml_text));
    return config;
  } catch (const YAML::Exception& e) {
    config.logger_->error(
        "Error parsing .csmap configuration file: {}", e.what());
    return std::nullopt;
  } catch (const std::exception& e) {
    config.logger_->error(
        "Error loading .csmap configuration file: {}", e.what());
    return std::nullopt;
  }
}

auto CsmapConfigFile::ParseDocument(const std::string& yaml_text) -> void {
  YAML::Node yaml = YAML::Load(yaml_text);
  if (!yaml || yaml.IsNull()) {
    return;
  }

  // Parse If section (path filtering)
  if (yaml["If"]) {
    if (yaml["If"]["PathMatch"]) {
      path_condition_.path_match = ReadStringList(yaml["If"]["PathMatch"]);
      logger_->debug(
          "Loaded PathMatch with {} patterns", path_condition_.path_match.size());
    }
    if (yaml["If"]["PathExclude"]) {
      path_condition_.path_exclude = ReadStringList(yaml["If"]["PathExclude"]);
      logger_->debug(
          "Loaded PathExclude with {} patterns",
          path_condition_.path_exclude.size());
    }
  }

  // Parse Parser section
  if (const auto parser = yaml["Parser"]) {
    auto& options = parser_options_;
    if (parser["InclusionAnnotations"]) {
      options.inclusion_annotations =
          ReadStringList(parser["InclusionAnnotations"]);
    }
    if (parser["IteratorMarkers"]) {
      options.iterator_markers = ReadStringList(parser["IteratorMarkers"]);
    }
    if (parser["RestrictedBuildSymbols"]) {
      options.restricted_build_symbols =
          ReadStringList(parser["RestrictedBuildSymbols"]);
    }
    if (parser["IncludePublicFields"]) {
      options.include_public_fields = parser["IncludePublicFields"].as<bool>();
    }
    if (parser["IncludeAnnotatedFields"]) {
      options.include_annotated_fields =
          parser["IncludeAnnotatedFields"].as<bool>();
    }
    if (parser["IncludeConstants"]) {
      options.include_constants = parser["IncludeConstants"].as<bool>();
    }
    if (parser["MinFileDocLength"]) {
      options.min_file_doc_length = parser["MinFileDocLength"].as<size_t>();
    }
  }

  // Parse Workers (0 or absent: hardware concurrency)
  if (yaml["Workers"]) {
    auto workers = yaml["Workers"].as<size_t>();
    if (workers > 0) {
      workers_ = workers;
    }
    logger_->debug("Loaded Workers: {}", workers);
  }
}

auto CsmapConfigFile::ShouldIncludeFile(std::string_view relative_path) const
    -> bool {
  // No conditions specified -> include everything
  if (path_condition_.path_match.empty() &&
      path_condition_.path_exclude.empty()) {
    return true;
  }

  std::string path_str(relative_path);

  try {
    if (!path_condition_.path_match.empty() &&
        !MatchesAny(path_str, path_condition_.path_match)) {
      return false;
    }
    return !MatchesAny(path_str, path_condition_.path_exclude);
  } catch (const std::regex_error& e) {
    logger_->warn(
        "Invalid regex in path condition ({}), including file by default: {}",
        e.what(), relative_path);
    return true;
  }
}

}  // namespace csmap
