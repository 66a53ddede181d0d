#include "csmap/utils/canonical_path.hpp"

#include <algorithm>

#include "csmap/utils/path_utils.hpp"

namespace csmap {

CanonicalPath::CanonicalPath(std::filesystem::path path)
    : path_(NormalizePath(std::move(path))) {
}

auto CanonicalPath::CurrentPath() -> CanonicalPath {
  return CanonicalPath(std::filesystem::current_path());
}

auto CanonicalPath::Path() const -> const std::filesystem::path& {
  return path_;
}

auto CanonicalPath::String() const -> const std::string& {
  if (cached_string_.empty()) {
    cached_string_ = path_.string();
  }
  return cached_string_;
}

auto CanonicalPath::Filename() const -> std::string {
  return path_.filename().string();
}

auto CanonicalPath::Stem() const -> std::string {
  return path_.stem().string();
}

auto CanonicalPath::Empty() const -> bool {
  return path_.empty();
}

auto CanonicalPath::IsSubPathOf(const CanonicalPath& other) const -> bool {
  auto [other_it, self_it] = std::mismatch(
      other.path_.begin(), other.path_.end(), path_.begin(), path_.end());
  return other_it == other.path_.end();
}

auto CanonicalPath::RelativeTo(const CanonicalPath& base) const
    -> std::string {
  if (!IsSubPathOf(base)) {
    return path_.generic_string();
  }
  return path_.lexically_relative(base.path_).generic_string();
}

auto CanonicalPath::operator/(const std::filesystem::path& rhs) const
    -> CanonicalPath {
  return CanonicalPath(path_ / rhs);
}

}  // namespace csmap
