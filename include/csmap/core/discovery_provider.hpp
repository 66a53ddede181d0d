#pragma once

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "csmap/core/csmap_config_file.hpp"
#include "csmap/utils/canonical_path.hpp"

namespace csmap {

// Strategy for finding the source files of one input tree
class DiscoveryProviderBase {
 public:
  DiscoveryProviderBase() = default;
  DiscoveryProviderBase(const DiscoveryProviderBase&) = default;
  DiscoveryProviderBase(DiscoveryProviderBase&&) = delete;
  auto operator=(const DiscoveryProviderBase&)
      -> DiscoveryProviderBase& = default;
  auto operator=(DiscoveryProviderBase&&) -> DiscoveryProviderBase& = delete;
  virtual ~DiscoveryProviderBase() = default;

  // Discovered files, sorted by path
  [[nodiscard]] virtual auto DiscoverFiles(
      const CanonicalPath& input_root, const CsmapConfigFile& config) const
      -> std::vector<CanonicalPath> = 0;
};

// Scans the input tree recursively for C# source files. Files below any
// excluded directory (typically the report output directory) are skipped,
// as are files rejected by the config's path conditions.
class RepoScanProvider : public DiscoveryProviderBase {
 public:
  explicit RepoScanProvider(
      std::vector<CanonicalPath> excluded_directories = {},
      std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto DiscoverFiles(
      const CanonicalPath& input_root, const CsmapConfigFile& config) const
      -> std::vector<CanonicalPath> override;

 private:
  [[nodiscard]] auto IsExcluded(const CanonicalPath& path) const -> bool;

  std::vector<CanonicalPath> excluded_directories_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace csmap
