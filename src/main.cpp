#include <algorithm>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "app/app_setup.hpp"
#include "app/crash_handler.hpp"
#include "csmap/core/csmap_config_file.hpp"
#include "csmap/core/discovery_provider.hpp"
#include "csmap/core/source_loader.hpp"
#include "csmap/report/json_model_writer.hpp"
#include "csmap/report/markdown_report_writer.hpp"
#include "csmap/services/corpus_builder.hpp"
#include "csmap/utils/canonical_path.hpp"

using csmap::CanonicalPath;
using csmap::CsmapConfigFile;
using csmap::RepoScanProvider;
using csmap::SourceLoader;
using csmap::parse::InterfaceModel;
using csmap::report::JsonModelWriter;
using csmap::report::MarkdownReportWriter;
using csmap::services::CorpusBuilder;

namespace {

constexpr std::string_view kDefaultOutputDirName = "_interface_maps";
constexpr std::string_view kConfigFileName = ".csmap";

auto WorkerCount(
    const app::CommandLineOptions& options, const CsmapConfigFile& config)
    -> size_t {
  if (options.jobs) {
    return *options.jobs;
  }
  if (auto workers = config.GetWorkers()) {
    return *workers;
  }
  return std::max(1U, std::thread::hardware_concurrency());
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  // Initialize debugging features
  app::WaitForDebuggerIfRequested();
  app::InitializeCrashHandlers();

  // Parse command-line arguments
  const std::vector<std::string> args(argv, argv + argc);
  const std::string program = args.empty() ? "csmap" : args[0];
  auto options = app::ParseArguments(args);
  if (!options) {
    spdlog::error("{}", options.error().Message());
    spdlog::error("{}", app::UsageText(program));
    return 1;
  }
  if (options->show_help) {
    spdlog::info("{}", app::UsageText(program));
    return 0;
  }

  // Setup loggers
  auto loggers = app::SetupLoggers();
  auto logger = loggers["csmap"];

  std::error_code ec;
  if (!std::filesystem::is_directory(options->input_dir, ec)) {
    logger->error("'{}' is not a directory", options->input_dir.string());
    return 1;
  }
  const CanonicalPath input_root(options->input_dir);
  const CanonicalPath output_dir =
      options->output_dir
          ? CanonicalPath(std::filesystem::absolute(*options->output_dir)
                              .lexically_normal())
          : input_root / kDefaultOutputDirName;

  // Configuration: --config, else <input_dir>/.csmap, else defaults
  const CanonicalPath config_path =
      options->config_path ? CanonicalPath(*options->config_path)
                           : input_root / kConfigFileName;
  if (options->config_path && !std::filesystem::exists(config_path.Path())) {
    logger->warn("Configuration file {} not found, using defaults", config_path);
  }
  auto config = CsmapConfigFile::LoadFromFile(config_path, logger)
                    .value_or(CsmapConfigFile::CreateDefault(logger));

  // Discover and load sources
  RepoScanProvider discovery({output_dir}, logger);
  auto files = discovery.DiscoverFiles(input_root, config);
  if (files.empty()) {
    logger->info("No .cs files found in '{}'", input_root);
    return 0;
  }
  logger->info("Found {} C# files in '{}'", files.size(), input_root);

  SourceLoader loader(input_root, logger);
  auto loaded = loader.LoadAll(files);

  // Parse on the worker pool, reduce on the io_context
  const auto workers = WorkerCount(*options, config);
  logger->debug("Using {} parser workers", workers);

  asio::io_context io_context;
  asio::thread_pool worker_pool(workers);
  CorpusBuilder builder(config.GetParserOptions(), logger);

  std::optional<InterfaceModel> model;
  asio::co_spawn(
      io_context,
      builder.Build(std::move(loaded.sources), worker_pool.get_executor()),
      [&model, &logger](std::exception_ptr error, InterfaceModel result) {
        if (error) {
          try {
            std::rethrow_exception(error);
          } catch (const std::exception& e) {
            logger->error("Corpus build failed: {}", e.what());
          }
          return;
        }
        model = std::move(result);
      });

  io_context.run();
  worker_pool.join();

  if (!model) {
    return 1;
  }

  // Unreadable files are reported next to the ones that failed to parse
  model->diagnostics.insert(
      model->diagnostics.begin(), loaded.diagnostics.begin(),
      loaded.diagnostics.end());
  if (!model->diagnostics.empty()) {
    logger->warn(
        "{} files skipped, listed in {}", model->diagnostics.size(),
        MarkdownReportWriter::kIndexFileName);
  }

  // Write reports
  MarkdownReportWriter markdown_writer(loggers["report"]);
  auto written = markdown_writer.Write(*model, output_dir);
  if (!written) {
    logger->error("{}", written.error().Message());
    return 1;
  }
  size_t total_written = *written;

  if (options->write_json) {
    JsonModelWriter json_writer(loggers["report"]);
    auto json_written = json_writer.Write(*model, output_dir);
    if (!json_written) {
      logger->error("{}", json_written.error().Message());
      return 1;
    }
    total_written += *json_written;
  }

  logger->info(
      "Generated {} interface maps + {} in '{}'", model->units.size(),
      MarkdownReportWriter::kIndexFileName, output_dir);

  const auto ratio = loaded.total_bytes > 0
                         ? static_cast<double>(total_written) * 100.0 /
                               static_cast<double>(loaded.total_bytes)
                         : 0.0;
  logger->info(
      "Source total: {} bytes -> interface maps total: {} bytes ({:.1f}%)",
      loaded.total_bytes, total_written, ratio);
  return 0;
}
