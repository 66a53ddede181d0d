#include "csmap/parse/source_unit_parser.hpp"

#include <algorithm>
#include <filesystem>
#include <regex>
#include <string>

#include "csmap/parse/block_extractor.hpp"
#include "csmap/parse/declaration_scanner.hpp"
#include "csmap/parse/doc_resolver.hpp"
#include "csmap/parse/lexical_normalizer.hpp"
#include "csmap/parse/member_extractor.hpp"
#include "csmap/parse/text_utils.hpp"

namespace csmap::parse {

namespace {

// Group 1: the condition of a #if or #elif directive
auto ConditionalDirectivePattern() -> const std::regex& {
  static const std::regex kPattern(
      R"((?:^|\n)[ \t]*#[ \t]*(?:if|elif)\b([^\n]*))");
  return kPattern;
}

// Overwrites [begin, end) of text with spaces, keeping line breaks
void BlankRange(std::string& text, size_t begin, size_t end) {
  end = std::min(end, text.size());
  for (size_t i = begin; i < end; ++i) {
    if (text[i] != '\n' && text[i] != '\r') {
      text[i] = ' ';
    }
  }
}

}  // namespace

SourceUnitParser::SourceUnitParser(
    ParserOptions options, std::shared_ptr<spdlog::logger> logger)
    : options_(std::move(options)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto SourceUnitParser::Parse(const SourceText& source) const
    -> std::expected<SourceUnit, CsmapError> {
  if (HasUnsupportedEncoding(source.content)) {
    return CsmapError::Unexpected(
        CsmapErrorCode::kFileInvalidEncoding,
        "UTF-16/UTF-32 byte order mark or NUL bytes");
  }

  try {
    return ParseUnchecked(source);
  } catch (const std::regex_error& e) {
    return CsmapError::Unexpected(
        CsmapErrorCode::kParseFailed,
        fmt::format("pattern matching failed ({})", e.what()));
  } catch (const std::exception& e) {
    return CsmapError::Unexpected(CsmapErrorCode::kParseFailed, e.what());
  }
}

auto SourceUnitParser::ParseUnchecked(const SourceText& source) const
    -> SourceUnit {
  // Comment stripping keeps every offset, so positions in the clean text
  // are positions in the original as well. Matching runs on the compact
  // form; its offsets map back through source_offsets.
  auto original = StripByteOrderMark(source.content);
  auto clean = StripComments(original);
  auto compact = CompactWhitespace(clean);
  LineMap line_map(clean);
  DocResolver docs(original);

  auto line_of = [&](size_t compact_offset) {
    return line_map.LineOf(compact.SourceOffset(compact_offset));
  };

  SourceUnit unit;
  unit.identifier = source.identifier;
  unit.filename = std::filesystem::path(source.identifier).filename().string();
  unit.file_documentation =
      docs.ResolveFileDocumentation(options_.min_file_doc_length);
  unit.restricted_build =
      HasRestrictedBuildGuard(compact.text, options_.restricted_build_symbols);

  auto scan = DeclarationScanner::Scan(compact.text);
  unit.usings = std::move(scan.usings);
  unit.namespace_name = std::move(scan.namespace_name);
  for (auto& enum_match : scan.top_level_enums) {
    unit.enums.push_back(std::move(enum_match.declaration));
  }

  MemberExtractor extractor(options_);

  for (auto& type : scan.types) {
    // Body with every nested declaration blanked, so each member is
    // extracted only by its innermost owner
    size_t body_offset = type.open_brace + 1;
    std::string body(BlockInner(type.block));
    std::vector<std::string> nested_type_names;
    for (const auto& other : scan.types) {
      if (&other == &type || !type.Contains(other.start)) {
        continue;
      }
      if (other.declaration.enclosing_type == type.declaration.name) {
        nested_type_names.push_back(other.declaration.name);
      }
      BlankRange(body, other.start - body_offset, other.End() - body_offset);
    }

    DocLookup doc_lookup = [&](size_t offset) -> std::optional<std::string> {
      return docs.ResolveAt(line_of(body_offset + offset));
    };

    auto members =
        extractor.Extract(body, type.declaration.kind, nested_type_names,
                          doc_lookup);

    auto& declaration = type.declaration;
    declaration.fields = std::move(members.fields);
    declaration.properties = std::move(members.properties);
    declaration.methods = std::move(members.methods);
    declaration.enums = std::move(members.enums);
    declaration.documentation = docs.ResolveAt(line_of(type.start));

    unit.types.push_back(std::move(declaration));
  }

  logger_->debug(
      "SourceUnitParser: {} ({} types, {} enums{})", unit.identifier,
      unit.types.size(), unit.enums.size(),
      unit.restricted_build ? ", restricted build" : "");
  return unit;
}

auto SourceUnitParser::HasRestrictedBuildGuard(
    std::string_view clean_text, const std::vector<std::string>& symbols)
    -> bool {
  const char* begin = clean_text.data();
  for (std::cregex_iterator
           it(begin, begin + clean_text.size(), ConditionalDirectivePattern()),
       end;
       it != end; ++it) {
    std::string_view condition(
        (*it)[1].first, static_cast<size_t>(it->length(1)));
    for (const auto& symbol : symbols) {
      if (ContainsWord(condition, symbol)) {
        return true;
      }
    }
  }
  return false;
}

}  // namespace csmap::parse
