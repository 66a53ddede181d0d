#include "csmap/core/source_loader.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace csmap {

SourceLoader::SourceLoader(
    CanonicalPath input_root, std::shared_ptr<spdlog::logger> logger)
    : input_root_(std::move(input_root)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto SourceLoader::Load(const CanonicalPath& path) const
    -> std::expected<parse::SourceText, CsmapError> {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path.Path(), ec)) {
    return CsmapError::Unexpected(CsmapErrorCode::kFileNotFound, path.String());
  }

  std::ifstream file(path.Path(), std::ios::binary);
  if (!file) {
    return CsmapError::Unexpected(
        CsmapErrorCode::kFileAccessDenied, path.String());
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return CsmapError::Unexpected(
        CsmapErrorCode::kFileAccessDenied, path.String());
  }

  return parse::SourceText{
      .identifier = path.RelativeTo(input_root_), .content = buffer.str()};
}

auto SourceLoader::LoadAll(const std::vector<CanonicalPath>& paths) const
    -> LoadResult {
  LoadResult result;
  result.sources.reserve(paths.size());

  for (const auto& path : paths) {
    auto source = Load(path);
    if (!source) {
      logger_->warn("SourceLoader: {}", source.error().Message());
      result.diagnostics.push_back(
          {path.RelativeTo(input_root_), source.error().Message()});
      continue;
    }
    result.total_bytes += source->content.size();
    result.sources.push_back(std::move(*source));
  }

  logger_->debug(
      "SourceLoader: Loaded {} files ({} bytes), {} unreadable",
      result.sources.size(), result.total_bytes, result.diagnostics.size());
  return result;
}

}  // namespace csmap
