#include "csmap/services/corpus_builder.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include "csmap/utils/completion_latch.hpp"
#include "csmap/utils/scoped_timer.hpp"

namespace csmap::services {

CorpusBuilder::CorpusBuilder(
    parse::ParserOptions options, std::shared_ptr<spdlog::logger> logger)
    : parser_(std::move(options), logger),
      resolver_(logger),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto CorpusBuilder::Build(
    std::vector<parse::SourceText> sources,
    asio::any_io_executor worker_executor) const
    -> asio::awaitable<parse::InterfaceModel> {
  utils::ScopedTimer timer("Corpus build", logger_);
  logger_->debug("CorpusBuilder: Parsing {} source files", sources.size());

  if (sources.empty()) {
    co_return parse::InterfaceModel{};
  }

  // One slot per source, written only by that source's task
  std::vector<UnitResult> results(sources.size());

  auto executor = co_await asio::this_coro::executor;
  utils::CompletionLatch latch(executor, sources.size());

  {
    utils::ScopedTimer parse_timer("Parse phase", logger_);
    for (size_t i = 0; i < sources.size(); ++i) {
      asio::co_spawn(
          worker_executor,
          [this, i, &sources, &results, &latch]() -> asio::awaitable<void> {
            results[i] = parser_.Parse(sources[i]);
            latch.CountDown();
            co_return;
          },
          asio::detached);
    }

    co_await latch.AsyncWait(asio::use_awaitable);
  }

  co_return Reduce(sources, std::move(results));
}

auto CorpusBuilder::BuildSerial(
    const std::vector<parse::SourceText>& sources) const
    -> parse::InterfaceModel {
  utils::ScopedTimer timer("Corpus build", logger_);

  std::vector<UnitResult> results;
  results.reserve(sources.size());
  for (const auto& source : sources) {
    results.push_back(parser_.Parse(source));
  }
  return Reduce(sources, std::move(results));
}

auto CorpusBuilder::Reduce(
    const std::vector<parse::SourceText>& sources,
    std::vector<UnitResult> results) const -> parse::InterfaceModel {
  parse::InterfaceModel model;
  model.units.reserve(results.size());

  for (size_t i = 0; i < results.size(); ++i) {
    if (results[i]) {
      model.units.push_back(std::move(*results[i]));
      continue;
    }
    logger_->warn(
        "CorpusBuilder: Skipping {}: {}", sources[i].identifier,
        results[i].error().Message());
    model.diagnostics.push_back(
        {sources[i].identifier, results[i].error().Message()});
  }

  auto edge_count = resolver_.Resolve(model.units);
  logger_->debug(
      "CorpusBuilder: {} units, {} skipped, {} dependency edges",
      model.units.size(), model.diagnostics.size(), edge_count);
  return model;
}

}  // namespace csmap::services
