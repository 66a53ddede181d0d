#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "csmap/parse/parser_options.hpp"
#include "csmap/utils/canonical_path.hpp"

namespace csmap {

// Contents of a .csmap configuration file:
//
//   If:
//     PathMatch: Assets/.*
//     PathExclude: [.*/Generated/.*, .*/ThirdParty/.*]
//   Parser:
//     InclusionAnnotations: [SerializeField, SerializeReference]
//     IteratorMarkers: [IEnumerator]
//     RestrictedBuildSymbols: [UNITY_EDITOR]
//     IncludePublicFields: true
//     IncludeAnnotatedFields: true
//     IncludeConstants: true
//     MinFileDocLength: 40
//   Workers: 8
//
// Every key is optional; missing keys keep their defaults.
class CsmapConfigFile {
 public:
  // Path filtering conditions (If block). Patterns match the whole path
  // relative to the input root, with forward slashes.
  struct PathCondition {
    std::vector<std::string> path_match;    // Include only if one matches
    std::vector<std::string> path_exclude;  // Exclude if one matches
  };

  explicit CsmapConfigFile(std::shared_ptr<spdlog::logger> logger = nullptr);

  static auto CreateDefault(std::shared_ptr<spdlog::logger> logger = nullptr)
      -> CsmapConfigFile;

  // Returns std::nullopt if the file doesn't exist or cannot be parsed
  static auto LoadFromFile(
      const CanonicalPath& config_path,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<CsmapConfigFile>;

  // Same as LoadFromFile, from YAML text
  static auto LoadFromString(
      std::string_view yaml_text,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<CsmapConfigFile>;

  [[nodiscard]] auto GetPathCondition() const -> const PathCondition& {
    return path_condition_;
  }

  [[nodiscard]] auto GetParserOptions() const -> const parse::ParserOptions& {
    return parser_options_;
  }

  // Worker pool size; nullopt means "use the hardware concurrency"
  [[nodiscard]] auto GetWorkers() const -> std::optional<size_t> {
    return workers_;
  }

  [[nodiscard]] auto ShouldIncludeFile(std::string_view relative_path) const
      -> bool;

 private:
  auto ParseDocument(const std::string& yaml_text) -> void;

  std::shared_ptr<spdlog::logger> logger_;
  PathCondition path_condition_;
  parse::ParserOptions parser_options_;
  std::optional<size_t> workers_;
};

}  // namespace csmap
