#include "csmap/semantic/dependency_resolver.hpp"

#include <cctype>
#include <set>
#include <unordered_set>

namespace csmap::semantic {

namespace {

auto IsTypeSeparator(char c) -> bool {
  switch (c) {
    case '[':
    case ']':
    case '<':
    case '>':
    case ',':
    case '?':
    case '(':
    case ')':
    case '.':
      return true;
    default:
      return std::isspace(static_cast<unsigned char>(c)) != 0;
  }
}

}  // namespace

DependencyResolver::DependencyResolver(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto DependencyResolver::BuildNameTable(
    const std::vector<parse::SourceUnit>& units)
    -> std::unordered_map<std::string, std::string> {
  std::unordered_map<std::string, std::string> table;
  for (const auto& unit : units) {
    const auto* primary = unit.PrimaryType();
    if (primary == nullptr) {
      continue;
    }
    table.emplace(primary->name, unit.identifier);
  }
  return table;
}

auto DependencyResolver::TypeTokens(std::string_view type_expression)
    -> std::vector<std::string> {
  std::vector<std::string> tokens;
  std::string current;
  for (char c : type_expression) {
    if (IsTypeSeparator(c)) {
      if (!current.empty()) {
        tokens.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    current += c;
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

auto DependencyResolver::ReferencedTypeExpressions(
    const parse::SourceUnit& unit) -> std::vector<std::string_view> {
  std::vector<std::string_view> expressions;
  for (const auto& type : unit.types) {
    for (const auto& base : type.base_types) {
      expressions.emplace_back(base);
    }
    for (const auto& field : type.fields) {
      expressions.emplace_back(field.type_name);
    }
    for (const auto& property : type.properties) {
      expressions.emplace_back(property.type_name);
    }
    for (const auto& method : type.methods) {
      expressions.emplace_back(method.return_type);
      for (const auto& parameter : method.parameters) {
        expressions.emplace_back(parameter.type_name);
      }
    }
  }
  return expressions;
}

auto DependencyResolver::Resolve(std::vector<parse::SourceUnit>& units) const
    -> size_t {
  auto table = BuildNameTable(units);
  logger_->debug(
      "DependencyResolver: {} exported type names across {} units",
      table.size(), units.size());

  size_t edge_count = 0;
  for (auto& unit : units) {
    std::unordered_set<std::string> own_names;
    for (const auto& type : unit.types) {
      own_names.insert(type.name);
    }

    std::set<std::string> targets;
    for (auto expression : ReferencedTypeExpressions(unit)) {
      for (auto& token : TypeTokens(expression)) {
        if (own_names.contains(token)) {
          continue;
        }
        auto it = table.find(token);
        if (it == table.end() || it->second == unit.identifier) {
          continue;
        }
        targets.insert(std::move(token));
      }
    }

    unit.dependencies.clear();
    for (const auto& target : targets) {
      unit.dependencies.push_back({unit.identifier, target});
    }
    edge_count += unit.dependencies.size();
  }

  logger_->debug("DependencyResolver: {} edges", edge_count);
  return edge_count;
}

}  // namespace csmap::semantic
