#pragma once

#include <expected>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "csmap/error/error.hpp"
#include "csmap/parse/model.hpp"
#include "csmap/utils/canonical_path.hpp"

namespace csmap {

// Reads discovered files into SourceText values. Identifiers are paths
// relative to the input root, with forward slashes.
class SourceLoader {
 public:
  struct LoadResult {
    std::vector<parse::SourceText> sources;
    // Files that could not be read
    std::vector<parse::UnitDiagnostic> diagnostics;
    // Bytes read across all sources
    size_t total_bytes = 0;
  };

  explicit SourceLoader(
      CanonicalPath input_root,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Raw bytes of one file; decoding is left to the parser
  [[nodiscard]] auto Load(const CanonicalPath& path) const
      -> std::expected<parse::SourceText, CsmapError>;

  [[nodiscard]] auto LoadAll(const std::vector<CanonicalPath>& paths) const
      -> LoadResult;

 private:
  CanonicalPath input_root_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace csmap
