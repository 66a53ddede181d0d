#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "csmap/parse/model.hpp"

namespace csmap::parse {

// A type declaration header found in the normalized text. Members are not
// filled in; offsets are relative to the scanned text.
struct TypeMatch {
  TypeDeclaration declaration;
  // First keyword of the declaration (visibility, modifier or kind)
  size_t start = 0;
  size_t open_brace = 0;
  // From the opening brace through the matching closing brace
  std::string_view block;

  [[nodiscard]] auto End() const -> size_t {
    return open_brace + block.size();
  }

  [[nodiscard]] auto Contains(size_t offset) const -> bool {
    return offset > open_brace && offset < End();
  }
};

struct EnumMatch {
  EnumDeclaration declaration;
  size_t start = 0;
  size_t open_brace = 0;
  std::string_view block;
};

struct ScanResult {
  std::vector<std::string> usings;
  std::optional<std::string> namespace_name;
  // Document order, nested declarations included
  std::vector<TypeMatch> types;
  // Only enums starting before the first type's opening brace
  std::vector<EnumMatch> top_level_enums;
};

// Ordered pattern matchers over comment-stripped source. The scanned text
// must outlive the returned views.
class DeclarationScanner {
 public:
  static auto Scan(std::string_view text) -> ScanResult;

  static auto ScanUsings(std::string_view text) -> std::vector<std::string>;

  static auto ScanNamespace(std::string_view text)
      -> std::optional<std::string>;

  static auto ScanTypes(std::string_view text) -> std::vector<TypeMatch>;

  // Every enum declaration in the text, nested or not
  static auto ScanEnums(std::string_view text) -> std::vector<EnumMatch>;

  // Splits a raw base list on top-level commas; a "where" constraint clause
  // ends the list
  static auto SplitBaseList(std::string_view bases)
      -> std::vector<std::string>;

  // Member names of an enum body (without braces); values are dropped
  static auto ParseEnumValues(std::string_view inner)
      -> std::vector<std::string>;
};

}  // namespace csmap::parse
