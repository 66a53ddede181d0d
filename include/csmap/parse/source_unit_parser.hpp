#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "csmap/error/error.hpp"
#include "csmap/parse/model.hpp"
#include "csmap/parse/parser_options.hpp"

namespace csmap::parse {

// Composes the normalizer, scanner, member extractor and doc resolver into
// one SourceUnit per file. Dependency edges are left empty; they need the
// whole corpus.
//
// Stateless apart from its options, so one instance may be shared by
// concurrent parse tasks.
class SourceUnitParser {
 public:
  explicit SourceUnitParser(
      ParserOptions options = {},
      std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

  // Fails with kFileInvalidEncoding for text the normalizer cannot read and
  // kParseFailed when matching itself throws. Constructs that cannot be
  // classified are omitted without an error.
  [[nodiscard]] auto Parse(const SourceText& source) const
      -> std::expected<SourceUnit, CsmapError>;

  [[nodiscard]] auto GetOptions() const -> const ParserOptions& {
    return options_;
  }

  // True when a #if/#elif line names one of the symbols
  static auto HasRestrictedBuildGuard(
      std::string_view clean_text, const std::vector<std::string>& symbols)
      -> bool;

 private:
  [[nodiscard]] auto ParseUnchecked(const SourceText& source) const
      -> SourceUnit;

  ParserOptions options_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace csmap::parse
