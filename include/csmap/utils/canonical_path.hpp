#pragma once

#include <filesystem>
#include <string>

#include <fmt/format.h>

namespace csmap {

// Filesystem path normalized on construction (canonical when it exists).
// Used as the identity of input files and output locations.
class CanonicalPath {
 public:
  CanonicalPath() = default;

  explicit CanonicalPath(std::filesystem::path path);

  static auto CurrentPath() -> CanonicalPath;

  [[nodiscard]] auto Path() const -> const std::filesystem::path&;
  [[nodiscard]] auto String() const -> const std::string&;

  // File name without directories, e.g. "Player.cs"
  [[nodiscard]] auto Filename() const -> std::string;

  // File name without extension, e.g. "Player"
  [[nodiscard]] auto Stem() const -> std::string;

  [[nodiscard]] auto Empty() const -> bool;

  [[nodiscard]] auto IsSubPathOf(const CanonicalPath& other) const -> bool;

  // Path relative to base with forward slashes; the full path when the
  // two are unrelated
  [[nodiscard]] auto RelativeTo(const CanonicalPath& base) const
      -> std::string;

  friend auto operator==(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.String() == rhs.String();
  }

  friend auto operator!=(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return !(lhs == rhs);
  }

  friend auto operator<(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.String() < rhs.String();
  }

  auto operator/(const std::filesystem::path& rhs) const -> CanonicalPath;

 private:
  std::filesystem::path path_;
  mutable std::string cached_string_;
};

}  // namespace csmap

// Format support for logging
template <>
struct fmt::formatter<csmap::CanonicalPath> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const csmap::CanonicalPath& p, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(p.String(), ctx);
  }
};

template <>
struct std::hash<csmap::CanonicalPath> {
  auto operator()(const csmap::CanonicalPath& path) const noexcept
      -> std::size_t {
    return std::hash<std::string>{}(path.String());
  }
};
