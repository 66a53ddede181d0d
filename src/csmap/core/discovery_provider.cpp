#include "csmap/core/discovery_provider.hpp"

#include <algorithm>
#include <filesystem>

#include "csmap/utils/path_utils.hpp"

namespace csmap {

RepoScanProvider::RepoScanProvider(
    std::vector<CanonicalPath> excluded_directories,
    std::shared_ptr<spdlog::logger> logger)
    : excluded_directories_(std::move(excluded_directories)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto RepoScanProvider::DiscoverFiles(
    const CanonicalPath& input_root, const CsmapConfigFile& config) const
    -> std::vector<CanonicalPath> {
  std::vector<CanonicalPath> files;
  size_t filtered = 0;

  logger_->debug(
      "RepoScanProvider discovering files in directory: {}", input_root);

  try {
    for (const auto& entry :
         std::filesystem::recursive_directory_iterator(
             input_root.Path(),
             std::filesystem::directory_options::skip_permission_denied)) {
      if (!entry.is_regular_file() || !IsCSharpSourceFile(entry.path())) {
        continue;
      }
      CanonicalPath path(entry.path());
      if (IsExcluded(path)) {
        continue;
      }
      if (!config.ShouldIncludeFile(path.RelativeTo(input_root))) {
        ++filtered;
        continue;
      }
      files.push_back(std::move(path));
    }
  } catch (const std::exception& e) {
    logger_->error(
        "RepoScanProvider error discovering files in directory {}: {}",
        input_root, e.what());
  }

  std::sort(files.begin(), files.end());
  logger_->debug(
      "RepoScanProvider discovered {} files ({} filtered by path conditions)",
      files.size(), filtered);
  return files;
}

auto RepoScanProvider::IsExcluded(const CanonicalPath& path) const -> bool {
  return std::ranges::any_of(
      excluded_directories_, [&path](const CanonicalPath& directory) {
        return !directory.Empty() && path.IsSubPathOf(directory);
      });
}

}  // namespace csmap
