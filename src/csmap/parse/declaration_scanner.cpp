#include "csmap/parse/declaration_scanner.hpp"

#include <algorithm>
#include <regex>

#include "csmap/parse/block_extractor.hpp"
#include "csmap/parse/parameter_splitter.hpp"
#include "csmap/parse/text_utils.hpp"

namespace csmap::parse {

namespace {

auto UsingPattern() -> const std::regex& {
  static const std::regex kPattern(
      R"((?:^|\n)[ \t]*(?:global\s+)?using\s+((?:static\s+)?[\w.]+(?:\s*=\s*[\w.<>, ]+)?)\s*;)");
  return kPattern;
}

auto NamespacePattern() -> const std::regex& {
  static const std::regex kPattern(R"((?:^|\n)[ \t]*namespace\s+([\w.]+))");
  return kPattern;
}

// Groups: 1 visibility, 2 modifiers, 3 kind, 4 name, 5 raw base list.
// Generic parameters allow one level of nesting; a constraint clause may
// follow with or without a base list. The head consumes no delimiter, so a
// declaration may follow the previous match's brace directly.
auto TypePattern() -> const std::regex& {
  static const std::regex kPattern(
      R"(\b(?:(public|private|protected|internal)\s+)?)"
      R"(((?:(?:protected|internal|private|abstract|static|partial|sealed|unsafe|new|readonly|ref)\s+)*))"
      R"((class|struct|interface)\s+(\w+)\s*)"
      R"((?:<[^<>{};]*(?:<[^<>{};]*>[^<>{};]*)*>)?)"
      R"((?:\s*:\s*([^{;]+?))?(?:\s+where\s[^{;]*?)?\s*\{)");
  return kPattern;
}

// Groups: 1 visibility, 2 name
auto EnumPattern() -> const std::regex& {
  static const std::regex kPattern(
      R"(\b(?:(public|private|protected|internal)\s+)?(?:new\s+)?)"
      R"(enum\s+(\w+)\s*(?::\s*[\w.]+\s*)?\{)");
  return kPattern;
}

auto HasModifier(std::string_view modifiers, std::string_view keyword)
    -> bool {
  return ContainsWord(modifiers, keyword);
}

auto ToTypeKind(std::string_view keyword) -> TypeKind {
  if (keyword == "struct") {
    return TypeKind::kStruct;
  }
  if (keyword == "interface") {
    return TypeKind::kInterface;
  }
  return TypeKind::kClass;
}

auto MatchView(const std::cmatch& match, size_t group) -> std::string_view {
  return {match[group].first, static_cast<size_t>(match.length(group))};
}

// Member access such as "x.class" is not a declaration
auto FollowsMemberAccess(std::string_view text, const std::cmatch& match)
    -> bool {
  auto position = static_cast<size_t>(match.position(0));
  return position > 0 && text[position - 1] == '.';
}

}  // namespace

auto DeclarationScanner::Scan(std::string_view text) -> ScanResult {
  ScanResult result;
  result.usings = ScanUsings(text);
  result.namespace_name = ScanNamespace(text);
  result.types = ScanTypes(text);

  // Enums after the first type's opening brace are assumed nested and are
  // picked up by the member extractor instead
  size_t enum_boundary =
      result.types.empty() ? text.size() : result.types.front().open_brace;
  for (auto& enum_match : ScanEnums(text)) {
    if (enum_match.start >= enum_boundary) {
      break;
    }
    result.top_level_enums.push_back(std::move(enum_match));
  }

  return result;
}

auto DeclarationScanner::ScanUsings(std::string_view text)
    -> std::vector<std::string> {
  std::vector<std::string> usings;
  const char* begin = text.data();
  for (std::cregex_iterator it(begin, begin + text.size(), UsingPattern()), end;
       it != end; ++it) {
    usings.push_back(CollapseWhitespace(MatchView(*it, 1)));
  }
  return usings;
}

auto DeclarationScanner::ScanNamespace(std::string_view text)
    -> std::optional<std::string> {
  std::cmatch match;
  if (std::regex_search(
          text.data(), text.data() + text.size(), match, NamespacePattern())) {
    return match[1].str();
  }
  return std::nullopt;
}

auto DeclarationScanner::ScanTypes(std::string_view text)
    -> std::vector<TypeMatch> {
  std::vector<TypeMatch> types;
  const char* begin = text.data();

  for (std::cregex_iterator it(begin, begin + text.size(), TypePattern()), end;
       it != end; ++it) {
    const auto& match = *it;
    if (FollowsMemberAccess(text, match)) {
      continue;
    }

    TypeMatch type;
    type.start = static_cast<size_t>(match.position(0));
    type.open_brace =
        static_cast<size_t>(match.position(0) + match.length(0) - 1);
    type.block = ExtractBraceBlock(text, type.open_brace);

    auto& declaration = type.declaration;
    auto modifiers = MatchView(match, 2);
    declaration.name = match[4].str();
    declaration.kind = ToTypeKind(MatchView(match, 3));
    declaration.visibility =
        match[1].matched
            ? ParseVisibility(MatchView(match, 1)).value_or(Visibility::kInternal)
            : Visibility::kInternal;
    declaration.is_abstract = HasModifier(modifiers, "abstract");
    declaration.is_static = HasModifier(modifiers, "static");
    declaration.is_partial = HasModifier(modifiers, "partial");
    declaration.is_sealed = HasModifier(modifiers, "sealed");
    if (match[5].matched) {
      declaration.base_types = SplitBaseList(MatchView(match, 5));
    }

    types.push_back(std::move(type));
  }

  // Innermost enclosing declaration, found by block containment
  for (size_t i = 0; i < types.size(); ++i) {
    for (size_t j = i; j-- > 0;) {
      if (types[j].Contains(types[i].start)) {
        types[i].declaration.enclosing_type = types[j].declaration.name;
        break;
      }
    }
  }

  return types;
}

auto DeclarationScanner::ScanEnums(std::string_view text)
    -> std::vector<EnumMatch> {
  std::vector<EnumMatch> enums;
  const char* begin = text.data();

  for (std::cregex_iterator it(begin, begin + text.size(), EnumPattern()), end;
       it != end; ++it) {
    const auto& match = *it;
    if (FollowsMemberAccess(text, match)) {
      continue;
    }

    EnumMatch enum_match;
    enum_match.start = static_cast<size_t>(match.position(0));
    enum_match.open_brace =
        static_cast<size_t>(match.position(0) + match.length(0) - 1);
    enum_match.block = ExtractBraceBlock(text, enum_match.open_brace);

    auto& declaration = enum_match.declaration;
    declaration.name = match[2].str();
    declaration.visibility =
        match[1].matched
            ? ParseVisibility(MatchView(match, 1)).value_or(Visibility::kInternal)
            : Visibility::kInternal;
    declaration.values = ParseEnumValues(BlockInner(enum_match.block));

    enums.push_back(std::move(enum_match));
  }

  return enums;
}

auto DeclarationScanner::SplitBaseList(std::string_view bases)
    -> std::vector<std::string> {
  std::vector<std::string> result;
  for (const auto& part : SplitTopLevel(bases)) {
    auto where = part.find("where");
    bool is_constraint = false;
    while (where != std::string::npos) {
      bool left_ok = where == 0 || !IsIdentifierChar(part[where - 1]);
      bool right_ok =
          where + 5 >= part.size() || !IsIdentifierChar(part[where + 5]);
      if (left_ok && right_ok) {
        is_constraint = true;
        break;
      }
      where = part.find("where", where + 1);
    }

    if (!is_constraint) {
      result.push_back(CollapseWhitespace(part));
      continue;
    }

    auto head = CollapseWhitespace(std::string_view(part).substr(0, where));
    if (!head.empty()) {
      result.push_back(std::move(head));
    }
    break;
  }
  return result;
}

auto DeclarationScanner::ParseEnumValues(std::string_view inner)
    -> std::vector<std::string> {
  std::vector<std::string> values;
  size_t start = 0;
  while (start <= inner.size()) {
    size_t comma = inner.find(',', start);
    if (comma == std::string_view::npos) {
      comma = inner.size();
    }
    auto entry = Trim(inner.substr(start, comma - start));
    start = comma + 1;

    // Drop attributes such as [InspectorName("...")]
    while (entry.starts_with('[')) {
      auto close = entry.find(']');
      if (close == std::string_view::npos) {
        entry = {};
        break;
      }
      entry = Trim(entry.substr(close + 1));
    }

    auto name = Trim(entry.substr(0, entry.find('=')));
    if (!name.empty() &&
        std::ranges::all_of(name, [](char c) { return IsIdentifierChar(c); })) {
      values.emplace_back(name);
    }
  }
  return values;
}

}  // namespace csmap::parse
