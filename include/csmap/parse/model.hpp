#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csmap::parse {

enum class Visibility { kPublic, kProtected, kInternal, kPrivate };

enum class TypeKind { kClass, kStruct, kInterface };

// Keyword spelling, e.g. "public"
auto ToString(Visibility visibility) -> std::string_view;
auto ToString(TypeKind kind) -> std::string_view;

// Keyword to visibility; nullopt for anything else
auto ParseVisibility(std::string_view keyword) -> std::optional<Visibility>;

struct ParameterSpec {
  std::string name;
  // "?" when the type could not be separated from the name
  std::string type_name;
  std::optional<std::string> default_value;

  auto operator==(const ParameterSpec&) const -> bool = default;
};

struct EnumDeclaration {
  std::string name;
  Visibility visibility = Visibility::kInternal;
  // Symbolic member names only; explicit values are dropped
  std::vector<std::string> values;
};

struct FieldSpec {
  std::string name;
  std::string type_name;
  Visibility visibility = Visibility::kPrivate;
  bool is_static = false;
  bool is_readonly = false;
  bool is_constant = false;
  // Carries one of the configured inclusion annotations
  bool is_annotated = false;
  std::optional<std::string> default_value;
  // From [Header("...")] / [Tooltip("...")] on annotated fields
  std::optional<std::string> group_label;
  std::optional<std::string> description;
  std::optional<std::string> documentation;
};

struct PropertySpec {
  std::string name;
  std::string type_name;
  Visibility visibility = Visibility::kPublic;
  bool has_getter = false;
  bool has_setter = false;
  bool is_static = false;
  std::optional<std::string> documentation;
};

struct MethodSpec {
  std::string name;
  std::string return_type;
  Visibility visibility = Visibility::kPublic;
  std::vector<ParameterSpec> parameters;
  bool is_static = false;
  bool is_virtual = false;
  bool is_override = false;
  bool is_abstract = false;
  bool is_async = false;
  // Return type is one of the configured iterator markers
  bool is_generator = false;
  std::optional<std::string> documentation;
};

struct TypeDeclaration {
  std::string name;
  Visibility visibility = Visibility::kInternal;
  TypeKind kind = TypeKind::kClass;
  bool is_abstract = false;
  bool is_static = false;
  bool is_partial = false;
  bool is_sealed = false;
  // Superclass and implemented interfaces, not distinguished
  std::vector<std::string> base_types;
  std::vector<FieldSpec> fields;
  std::vector<PropertySpec> properties;
  std::vector<MethodSpec> methods;
  std::vector<EnumDeclaration> enums;
  std::optional<std::string> documentation;
  // Set for nested declarations
  std::optional<std::string> enclosing_type;

  [[nodiscard]] auto IsNested() const -> bool {
    return enclosing_type.has_value();
  }
};

struct DependencyEdge {
  std::string from_unit;
  std::string to_type_name;

  auto operator==(const DependencyEdge&) const -> bool = default;
  auto operator<=>(const DependencyEdge&) const = default;
};

struct SourceUnit {
  // Path or other caller-supplied identity
  std::string identifier;
  std::string filename;
  std::optional<std::string> namespace_name;
  std::vector<std::string> usings;
  std::vector<TypeDeclaration> types;
  std::vector<EnumDeclaration> enums;
  // Filled by the dependency resolver after all units are parsed
  std::vector<DependencyEdge> dependencies;
  std::optional<std::string> file_documentation;
  // Source contains a conditional compilation guard (e.g. #if UNITY_EDITOR)
  bool restricted_build = false;

  // File name without extension
  [[nodiscard]] auto Stem() const -> std::string;

  // Type whose name matches the file stem, else the first non-nested type
  [[nodiscard]] auto PrimaryType() const -> const TypeDeclaration*;
};

// Raw contents of one input file, as handed to the parser
struct SourceText {
  std::string identifier;
  std::string content;
};

// One failed input file
struct UnitDiagnostic {
  std::string identifier;
  std::string message;
};

// Everything the reporting collaborators consume
struct InterfaceModel {
  std::vector<SourceUnit> units;
  std::vector<UnitDiagnostic> diagnostics;

  // Edges of all units, in unit order
  [[nodiscard]] auto AllEdges() const -> std::vector<DependencyEdge>;

  [[nodiscard]] auto FindUnit(std::string_view identifier) const
      -> const SourceUnit*;
};

}  // namespace csmap::parse
