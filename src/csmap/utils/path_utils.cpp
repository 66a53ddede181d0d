#include "csmap/utils/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string>
#include <string_view>

namespace csmap {

namespace {

auto HasExtension(
    const std::filesystem::path& path,
    std::initializer_list<std::string_view> exts) -> bool {
  std::string ext = path.extension().string();
  if (ext.empty()) {
    return false;
  }
  std::ranges::transform(
      ext, ext.begin(), [](unsigned char c) { return std::tolower(c); });
  return std::ranges::find(exts, ext) != exts.end();
}

}  // namespace

auto IsCSharpSourceFile(const std::filesystem::path& path) -> bool {
  return HasExtension(path, {".cs"});
}

auto NormalizePath(std::filesystem::path path) -> std::filesystem::path {
  try {
    // Synthetic paths (tests, in-memory sources) are kept as given
    if (std::filesystem::exists(path)) {
      return std::filesystem::canonical(path);
    }
    return path;
  } catch (const std::filesystem::filesystem_error&) {
    return path;
  }
}

}  // namespace csmap
