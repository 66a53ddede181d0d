#pragma once

#include <filesystem>

namespace csmap {

// File type checks
[[nodiscard]] auto IsCSharpSourceFile(const std::filesystem::path& path)
    -> bool;

// Canonical form when the path exists, the path unchanged otherwise
[[nodiscard]] auto NormalizePath(std::filesystem::path path)
    -> std::filesystem::path;

}  // namespace csmap
