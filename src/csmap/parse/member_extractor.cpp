#include "csmap/parse/member_extractor.hpp"

#include <algorithm>
#include <array>
#include <regex>
#include <string>

#include "csmap/parse/block_extractor.hpp"
#include "csmap/parse/declaration_scanner.hpp"
#include "csmap/parse/lexical_normalizer.hpp"
#include "csmap/parse/parameter_splitter.hpp"
#include "csmap/parse/text_utils.hpp"

namespace csmap::parse {

namespace {

// Statement keywords that comment stripping or loose matching can leave in
// the type position of a candidate
constexpr std::array<std::string_view, 10> kStatementKeywords = {
    "return", "yield", "var",  "throw", "new",
    "await",  "else",  "case", "goto",  "using"};

// Type position keywords of declarations that are not members
constexpr std::array<std::string_view, 9> kDeclarationKeywords = {
    "class",    "struct",   "interface", "enum",    "event",
    "delegate", "implicit", "explicit",  "operator"};

// Shared head of every member pattern. Groups: 1 attributes, 2 visibility.
// A member starts at the beginning of the body or after a line break,
// statement end or brace.
constexpr std::string_view kMemberHead =
    R"((?:^|[\n;{}])\s*((?:\[[^\]\n]*\]\s*)*))";
constexpr std::string_view kRequiredAccess =
    R"((public|private|protected|internal)\s+)";
constexpr std::string_view kOptionalAccess =
    R"((?:(public|private|protected|internal)\s+)?)";

// Groups: 3 modifiers, 4 type, 5 name, 6 default value. Ends before the
// semicolon so it can anchor the next declaration.
constexpr std::string_view kFieldTail =
    R"(((?:(?:static|readonly|const|volatile|new|internal|protected|private|unsafe|required)\s+)*))"
    R"(([\w<>\[\],\s?.]+?)\s+(\w+)\s*(?:=(?![=>])\s*([^;]+?))?\s*(?=;))";

// Groups: 3 modifiers, 4 type, 5 name, 6 "{" or "=>"
constexpr std::string_view kPropertyTail =
    R"(((?:(?:static|virtual|override|abstract|new|sealed|readonly|required|unsafe|extern|internal|protected|private)\s+)*))"
    R"(([\w<>\[\],\s?.]+?)\s+(\w+)\s*(\{|=>))";

// Groups: 3 modifiers, 4 return type, 5 name. Ends at the opening
// parenthesis of the parameter list.
constexpr std::string_view kMethodTail =
    R"(((?:(?:static|virtual|override|abstract|async|sealed|new|extern|unsafe|partial|internal|protected|private)\s+)*))"
    R"(([\w<>\[\],\s?.]+?)\s+(\w+)\s*(?:<[^<>()]*(?:<[^<>()]*>[^<>()]*)*>)?\s*\()";

auto MakePattern(std::string_view access, std::string_view tail)
    -> std::regex {
  std::string pattern(kMemberHead);
  pattern += access;
  pattern += tail;
  return std::regex(pattern);
}

auto FieldPattern() -> const std::regex& {
  static const std::regex kPattern = MakePattern(kRequiredAccess, kFieldTail);
  return kPattern;
}

auto PropertyPattern(TypeKind kind) -> const std::regex& {
  static const std::regex kPattern =
      MakePattern(kRequiredAccess, kPropertyTail);
  static const std::regex kInterfacePattern =
      MakePattern(kOptionalAccess, kPropertyTail);
  return kind == TypeKind::kInterface ? kInterfacePattern : kPattern;
}

auto MethodPattern(TypeKind kind) -> const std::regex& {
  static const std::regex kPattern = MakePattern(kRequiredAccess, kMethodTail);
  static const std::regex kInterfacePattern =
      MakePattern(kOptionalAccess, kMethodTail);
  return kind == TypeKind::kInterface ? kInterfacePattern : kPattern;
}

auto RestrictedAccessorPattern() -> const std::regex& {
  static const std::regex kPattern(
      R"(\b(?:private|protected|internal)\s+(get|set|init)\b)");
  return kPattern;
}

auto HeaderPattern() -> const std::regex& {
  static const std::regex kPattern(R"re(\bHeader\s*\(\s*"([^"]*)")re");
  return kPattern;
}

auto TooltipPattern() -> const std::regex& {
  static const std::regex kPattern(R"re(\bTooltip\s*\(\s*"([^"]*)")re");
  return kPattern;
}

// First quoted argument of an attribute, e.g. Header("Movement")
auto QuotedAttributeArgument(
    std::string_view attributes, const std::regex& pattern)
    -> std::optional<std::string> {
  std::cmatch match;
  if (std::regex_search(
          attributes.data(), attributes.data() + attributes.size(), match,
          pattern)) {
    return match[1].str();
  }
  return std::nullopt;
}

auto GroupView(const std::cmatch& match, size_t group) -> std::string_view {
  if (!match[group].matched) {
    return {};
  }
  return {match[group].first, static_cast<size_t>(match.length(group))};
}

auto FirstWord(std::string_view text) -> std::string_view {
  text = Trim(text);
  size_t end = 0;
  while (end < text.size() && IsIdentifierChar(text[end])) {
    ++end;
  }
  return text.substr(0, end);
}

auto IsReserved(std::string_view type_name) -> bool {
  auto word = FirstWord(type_name);
  return std::ranges::find(kStatementKeywords, word) !=
             kStatementKeywords.end() ||
         std::ranges::find(kDeclarationKeywords, word) !=
             kDeclarationKeywords.end();
}

auto CollidesWithSibling(
    std::string_view name, const std::vector<std::string>& sibling_names)
    -> bool {
  return std::find(sibling_names.begin(), sibling_names.end(), name) !=
         sibling_names.end();
}

// Offset of the first keyword of a member match, used to locate its
// declaration line
auto DeclarationOffset(const std::cmatch& match) -> size_t {
  for (size_t group : {2, 3, 4}) {
    if (match[group].matched && match.length(group) > 0) {
      return static_cast<size_t>(match.position(group));
    }
  }
  return static_cast<size_t>(match.position(0));
}

auto VisibilityOf(const std::cmatch& match) -> Visibility {
  // Interface members without a keyword are public
  if (!match[2].matched) {
    return Visibility::kPublic;
  }
  return ParseVisibility(GroupView(match, 2)).value_or(Visibility::kPrivate);
}

auto LookupDoc(const DocLookup& doc_lookup, size_t offset)
    -> std::optional<std::string> {
  if (!doc_lookup) {
    return std::nullopt;
  }
  return doc_lookup(offset);
}

}  // namespace

MemberExtractor::MemberExtractor(ParserOptions options)
    : options_(std::move(options)) {
}

auto MemberExtractor::Extract(
    std::string_view body, TypeKind kind,
    const std::vector<std::string>& nested_type_names,
    const DocLookup& doc_lookup) const -> ExtractedMembers {
  ExtractedMembers members;

  // Blanked nested declarations leave long whitespace runs behind
  auto compact = CompactWhitespace(body);
  DocLookup compact_doc_lookup;
  if (doc_lookup) {
    compact_doc_lookup = [&compact, &doc_lookup](size_t offset) {
      return doc_lookup(compact.SourceOffset(offset));
    };
  }
  body = compact.text;

  // Enums first: their names guard the other extractors
  members.enums = ExtractEnums(body);

  std::vector<std::string> sibling_names = nested_type_names;
  for (const auto& enum_declaration : members.enums) {
    sibling_names.push_back(enum_declaration.name);
  }

  if (kind != TypeKind::kInterface) {
    members.fields = ExtractFields(body, sibling_names, compact_doc_lookup);
  }
  members.properties =
      ExtractProperties(body, kind, sibling_names, compact_doc_lookup);
  members.methods =
      ExtractMethods(body, kind, sibling_names, compact_doc_lookup);
  return members;
}

auto MemberExtractor::ExtractFields(
    std::string_view body, const std::vector<std::string>& sibling_names,
    const DocLookup& doc_lookup) const -> std::vector<FieldSpec> {
  std::vector<FieldSpec> fields;
  const char* begin = body.data();

  for (std::cregex_iterator it(begin, begin + body.size(), FieldPattern()), end;
       it != end; ++it) {
    const auto& match = *it;

    auto type_name = CollapseWhitespace(GroupView(match, 4));
    auto name = std::string(GroupView(match, 5));
    if (IsReserved(type_name) ||
        CollidesWithSibling(name, sibling_names)) {
      continue;
    }
    // "int a, b;" style declarator lists are not split
    if (type_name.ends_with(',') || SplitTopLevel(type_name).size() > 1) {
      continue;
    }

    auto attributes = GroupView(match, 1);
    auto modifiers = GroupView(match, 3);

    FieldSpec field;
    field.name = std::move(name);
    field.type_name = std::move(type_name);
    field.visibility = VisibilityOf(match);
    field.is_static = ContainsWord(modifiers, "static");
    field.is_readonly = ContainsWord(modifiers, "readonly");
    field.is_constant = ContainsWord(modifiers, "const");
    field.is_annotated = IsInclusionAnnotated(attributes);
    if (match[6].matched) {
      field.default_value = CollapseWhitespace(GroupView(match, 6));
    }

    if (!ShouldIncludeField(field)) {
      continue;
    }

    if (field.is_annotated) {
      field.group_label = QuotedAttributeArgument(attributes, HeaderPattern());
      field.description = QuotedAttributeArgument(attributes, TooltipPattern());
    }
    field.documentation = LookupDoc(doc_lookup, DeclarationOffset(match));

    fields.push_back(std::move(field));
  }

  return fields;
}

auto MemberExtractor::ExtractProperties(
    std::string_view body, TypeKind kind,
    const std::vector<std::string>& sibling_names,
    const DocLookup& doc_lookup) const -> std::vector<PropertySpec> {
  std::vector<PropertySpec> properties;
  const char* begin = body.data();

  for (std::cregex_iterator it(
           begin, begin + body.size(), PropertyPattern(kind)),
       end;
       it != end; ++it) {
    const auto& match = *it;

    if (VisibilityOf(match) != Visibility::kPublic) {
      continue;
    }

    auto type_name = CollapseWhitespace(GroupView(match, 4));
    auto name = std::string(GroupView(match, 5));
    if (IsReserved(type_name) ||
        CollidesWithSibling(name, sibling_names)) {
      continue;
    }

    PropertySpec property;
    property.name = std::move(name);
    property.type_name = std::move(type_name);
    property.visibility = Visibility::kPublic;
    property.is_static = ContainsWord(GroupView(match, 3), "static");

    if (GroupView(match, 6) == "=>") {
      // Expression-bodied: read-only
      property.has_getter = true;
    } else {
      auto accessors =
          ExtractBraceBlock(body, static_cast<size_t>(match.position(6)));
      property.has_getter = ContainsWord(accessors, "get");
      property.has_setter =
          ContainsWord(accessors, "set") || ContainsWord(accessors, "init");

      const char* accessors_begin = accessors.data();
      for (std::cregex_iterator restricted(
               accessors_begin, accessors_begin + accessors.size(),
               RestrictedAccessorPattern()),
           restricted_end;
           restricted != restricted_end; ++restricted) {
        if ((*restricted)[1].str() == "get") {
          property.has_getter = false;
        } else {
          property.has_setter = false;
        }
      }
    }

    property.documentation = LookupDoc(doc_lookup, DeclarationOffset(match));
    properties.push_back(std::move(property));
  }

  return properties;
}

auto MemberExtractor::ExtractMethods(
    std::string_view body, TypeKind kind,
    const std::vector<std::string>& sibling_names,
    const DocLookup& doc_lookup) const -> std::vector<MethodSpec> {
  std::vector<MethodSpec> methods;
  const char* begin = body.data();

  for (std::cregex_iterator it(begin, begin + body.size(), MethodPattern(kind)),
       end;
       it != end; ++it) {
    const auto& match = *it;

    auto return_type = CollapseWhitespace(GroupView(match, 4));
    auto name = std::string(GroupView(match, 5));
    if (IsReserved(return_type) ||
        CollidesWithSibling(name, sibling_names)) {
      continue;
    }

    auto modifiers = GroupView(match, 3);

    MethodSpec method;
    method.name = std::move(name);
    method.visibility = VisibilityOf(match);
    method.is_static = ContainsWord(modifiers, "static");
    method.is_virtual = ContainsWord(modifiers, "virtual");
    method.is_override = ContainsWord(modifiers, "override");
    method.is_abstract = ContainsWord(modifiers, "abstract");
    method.is_async = ContainsWord(modifiers, "async");
    method.is_generator = IsIteratorMarker(return_type);
    method.return_type = std::move(return_type);

    if (!ShouldIncludeMethod(method)) {
      continue;
    }

    auto open_paren =
        static_cast<size_t>(match.position(0) + match.length(0) - 1);
    method.parameters =
        SplitParameters(BlockInner(ExtractParenBlock(body, open_paren)));
    method.documentation = LookupDoc(doc_lookup, DeclarationOffset(match));

    methods.push_back(std::move(method));
  }

  return methods;
}

auto MemberExtractor::ExtractEnums(std::string_view body)
    -> std::vector<EnumDeclaration> {
  std::vector<EnumDeclaration> enums;
  for (auto& enum_match : DeclarationScanner::ScanEnums(body)) {
    auto visibility = enum_match.declaration.visibility;
    if (visibility != Visibility::kPublic &&
        visibility != Visibility::kInternal) {
      continue;
    }
    enums.push_back(std::move(enum_match.declaration));
  }
  return enums;
}

auto MemberExtractor::ShouldIncludeField(const FieldSpec& field) const
    -> bool {
  if (options_.include_public_fields &&
      field.visibility == Visibility::kPublic) {
    return true;
  }
  if (options_.include_annotated_fields && field.is_annotated) {
    return true;
  }
  bool is_constant =
      field.is_constant || (field.is_static && field.is_readonly);
  return options_.include_constants && is_constant &&
         field.visibility != Visibility::kPrivate;
}

auto MemberExtractor::ShouldIncludeMethod(const MethodSpec& method) -> bool {
  switch (method.visibility) {
    case Visibility::kPublic:
      return true;
    case Visibility::kProtected:
    case Visibility::kInternal:
      return method.is_virtual || method.is_override || method.is_abstract;
    case Visibility::kPrivate:
      return false;
  }
  return false;
}

auto MemberExtractor::IsInclusionAnnotated(std::string_view attributes) const
    -> bool {
  return std::ranges::any_of(
      options_.inclusion_annotations, [attributes](const auto& annotation) {
        return ContainsWord(attributes, annotation);
      });
}

auto MemberExtractor::IsIteratorMarker(std::string_view return_type) const
    -> bool {
  const auto& markers = options_.iterator_markers;
  return std::find(markers.begin(), markers.end(), return_type) !=
         markers.end();
}

}  // namespace csmap::parse
