#include "csmap/parse/model.hpp"

#include <algorithm>
#include <filesystem>

namespace csmap::parse {

auto ToString(Visibility visibility) -> std::string_view {
  switch (visibility) {
    case Visibility::kPublic:
      return "public";
    case Visibility::kProtected:
      return "protected";
    case Visibility::kInternal:
      return "internal";
    case Visibility::kPrivate:
      return "private";
  }
  return "private";
}

auto ToString(TypeKind kind) -> std::string_view {
  switch (kind) {
    case TypeKind::kClass:
      return "class";
    case TypeKind::kStruct:
      return "struct";
    case TypeKind::kInterface:
      return "interface";
  }
  return "class";
}

auto ParseVisibility(std::string_view keyword) -> std::optional<Visibility> {
  if (keyword == "public") {
    return Visibility::kPublic;
  }
  if (keyword == "protected") {
    return Visibility::kProtected;
  }
  if (keyword == "internal") {
    return Visibility::kInternal;
  }
  if (keyword == "private") {
    return Visibility::kPrivate;
  }
  return std::nullopt;
}

auto SourceUnit::Stem() const -> std::string {
  return std::filesystem::path(filename).stem().string();
}

auto SourceUnit::PrimaryType() const -> const TypeDeclaration* {
  auto stem = Stem();
  auto by_stem = std::ranges::find_if(types, [&stem](const auto& type) {
    return !type.IsNested() && type.name == stem;
  });
  if (by_stem != types.end()) {
    return &*by_stem;
  }

  auto first_top_level = std::ranges::find_if(
      types, [](const auto& type) { return !type.IsNested(); });
  if (first_top_level != types.end()) {
    return &*first_top_level;
  }
  return nullptr;
}

auto InterfaceModel::AllEdges() const -> std::vector<DependencyEdge> {
  std::vector<DependencyEdge> edges;
  for (const auto& unit : units) {
    edges.insert(
        edges.end(), unit.dependencies.begin(), unit.dependencies.end());
  }
  return edges;
}

auto InterfaceModel::FindUnit(std::string_view identifier) const
    -> const SourceUnit* {
  auto it = std::ranges::find_if(units, [identifier](const auto& unit) {
    return unit.identifier == identifier;
  });
  return it != units.end() ? &*it : nullptr;
}

}  // namespace csmap::parse
