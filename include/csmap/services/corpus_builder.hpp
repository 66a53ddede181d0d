#pragma once

#include <expected>
#include <memory>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <spdlog/spdlog.h>

#include "csmap/error/error.hpp"
#include "csmap/parse/model.hpp"
#include "csmap/parse/parser_options.hpp"
#include "csmap/parse/source_unit_parser.hpp"
#include "csmap/semantic/dependency_resolver.hpp"

namespace csmap::services {

// Two-phase pipeline from raw sources to an InterfaceModel.
//
// Phase 1 parses every source independently on the worker executor; each
// task writes only its own result slot. Phase 2 runs on the calling
// coroutine once all tasks have finished: failed units become diagnostics,
// the rest go to the dependency resolver.
class CorpusBuilder {
 public:
  explicit CorpusBuilder(
      parse::ParserOptions options = {},
      std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

  CorpusBuilder(const CorpusBuilder&) = delete;
  CorpusBuilder(CorpusBuilder&&) = delete;
  auto operator=(const CorpusBuilder&) -> CorpusBuilder& = delete;
  auto operator=(CorpusBuilder&&) -> CorpusBuilder& = delete;
  ~CorpusBuilder() = default;

  // Units keep the order of sources
  [[nodiscard]] auto Build(
      std::vector<parse::SourceText> sources,
      asio::any_io_executor worker_executor) const
      -> asio::awaitable<parse::InterfaceModel>;

  // Same result as Build, parsed on the calling thread
  [[nodiscard]] auto BuildSerial(
      const std::vector<parse::SourceText>& sources) const
      -> parse::InterfaceModel;

 private:
  using UnitResult = std::expected<parse::SourceUnit, CsmapError>;

  [[nodiscard]] auto Reduce(
      const std::vector<parse::SourceText>& sources,
      std::vector<UnitResult> results) const -> parse::InterfaceModel;

  parse::SourceUnitParser parser_;
  semantic::DependencyResolver resolver_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace csmap::services
