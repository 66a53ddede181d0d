#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "csmap/parse/model.hpp"

namespace csmap::semantic {

// Second pass over a fully parsed corpus: maps type names found in each
// unit's signatures to the units whose primary type carries that name.
//
// Names are compared bare. When two units export the same short name the
// first unit keeps the table entry; there is no namespace-qualified lookup.
class DependencyResolver {
 public:
  explicit DependencyResolver(
      std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

  // Replaces the dependencies of every unit. Returns the number of edges.
  auto Resolve(std::vector<parse::SourceUnit>& units) const -> size_t;

  // Primary type name -> identifier of the unit exporting it
  static auto BuildNameTable(const std::vector<parse::SourceUnit>& units)
      -> std::unordered_map<std::string, std::string>;

  // Candidate type tokens of a type expression: generic, array, nullable,
  // tuple and qualification punctuation split the expression apart
  static auto TypeTokens(std::string_view type_expression)
      -> std::vector<std::string>;

  // Every type expression the unit's declarations mention
  static auto ReferencedTypeExpressions(const parse::SourceUnit& unit)
      -> std::vector<std::string_view>;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace csmap::semantic
