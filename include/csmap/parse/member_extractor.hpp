#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "csmap/parse/model.hpp"
#include "csmap/parse/parser_options.hpp"

namespace csmap::parse {

// Maps a body-relative offset of a declaration's first keyword to its
// documentation
using DocLookup = std::function<std::optional<std::string>(size_t)>;

struct ExtractedMembers {
  std::vector<FieldSpec> fields;
  std::vector<PropertySpec> properties;
  std::vector<MethodSpec> methods;
  std::vector<EnumDeclaration> enums;
};

// Extracts the interface-relevant members of one type body under the
// visibility-inclusion policy.
class MemberExtractor {
 public:
  explicit MemberExtractor(ParserOptions options = {});

  // body: the type's inner text (no outer braces) with nested type
  // declarations blanked out. nested_type_names are the names of those
  // declarations. doc_lookup may be empty.
  [[nodiscard]] auto Extract(
      std::string_view body, TypeKind kind,
      const std::vector<std::string>& nested_type_names = {},
      const DocLookup& doc_lookup = {}) const -> ExtractedMembers;

  [[nodiscard]] auto ExtractFields(
      std::string_view body, const std::vector<std::string>& sibling_names,
      const DocLookup& doc_lookup) const -> std::vector<FieldSpec>;

  [[nodiscard]] auto ExtractProperties(
      std::string_view body, TypeKind kind,
      const std::vector<std::string>& sibling_names,
      const DocLookup& doc_lookup) const -> std::vector<PropertySpec>;

  [[nodiscard]] auto ExtractMethods(
      std::string_view body, TypeKind kind,
      const std::vector<std::string>& sibling_names,
      const DocLookup& doc_lookup) const -> std::vector<MethodSpec>;

  // Public, internal or unqualified enums only
  [[nodiscard]] static auto ExtractEnums(std::string_view body)
      -> std::vector<EnumDeclaration>;

  // Field inclusion policy; exposed for tests
  [[nodiscard]] auto ShouldIncludeField(const FieldSpec& field) const -> bool;

  // Method inclusion policy: public, or protected/internal when overridable
  [[nodiscard]] static auto ShouldIncludeMethod(const MethodSpec& method)
      -> bool;

 private:
  [[nodiscard]] auto IsInclusionAnnotated(std::string_view attributes) const
      -> bool;

  [[nodiscard]] auto IsIteratorMarker(std::string_view return_type) const
      -> bool;

  ParserOptions options_;
};

}  // namespace csmap::parse
