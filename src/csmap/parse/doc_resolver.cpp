#include "csmap/parse/doc_resolver.hpp"

#include <algorithm>
#include <array>
#include <regex>

#include "csmap/parse/lexical_normalizer.hpp"
#include "csmap/parse/text_utils.hpp"

namespace csmap::parse {

namespace {

constexpr std::array<std::string_view, 4> kVisibilityKeywords = {
    "public", "private", "protected", "internal"};

// Position of word delimited by non-identifier characters, or npos
auto FindWord(std::string_view text, std::string_view word) -> size_t {
  size_t pos = text.find(word);
  while (pos != std::string_view::npos) {
    bool left_ok = pos == 0 || !IsIdentifierChar(text[pos - 1]);
    size_t end = pos + word.size();
    bool right_ok = end >= text.size() || !IsIdentifierChar(text[end]);
    if (left_ok && right_ok) {
      return pos;
    }
    pos = text.find(word, pos + 1);
  }
  return std::string_view::npos;
}

auto IsCommentLine(std::string_view trimmed) -> bool {
  return trimmed.starts_with("//") || trimmed.starts_with("/*") ||
         trimmed.starts_with("*");
}

auto StripCommentMarkers(std::string_view line) -> std::string_view {
  auto text = Trim(line);
  if (text.starts_with("///")) {
    text.remove_prefix(3);
  } else if (text.starts_with("//")) {
    text.remove_prefix(2);
  } else if (text.starts_with("/**")) {
    text.remove_prefix(3);
  } else if (text.starts_with("/*")) {
    text.remove_prefix(2);
  }
  text = Trim(text);
  if (text.ends_with("*/")) {
    text.remove_suffix(2);
    text = Trim(text);
  }
  while (text.starts_with('*')) {
    text.remove_prefix(1);
  }
  return Trim(text);
}

auto StripDocTags(std::string text) -> std::string {
  static const std::regex kReferenceTag(
      R"re(<(?:see|seealso|paramref|typeparamref)\s+\w+\s*=\s*"([^"]*)"\s*/?>)re");
  static const std::regex kStructuringTag(
      R"(</?(?:summary|remarks|para|returns|value|example|c|code|br|param|typeparam|exception|inheritdoc)\b[^>]*>)");

  text = std::regex_replace(text, kReferenceTag, "$1");
  text = std::regex_replace(text, kStructuringTag, " ");
  return text;
}

}  // namespace

DocResolver::DocResolver(std::string_view source)
    : lines_(SplitLines(StripByteOrderMark(source))) {
}

auto DocResolver::ClassifyLine(std::string_view line) -> LineKind {
  auto text = Trim(line);
  if (text.empty()) {
    return LineKind::kBlank;
  }
  if (text.starts_with('[') && text.ends_with(']')) {
    return LineKind::kAnnotation;
  }
  if (text.starts_with("///")) {
    return LineKind::kLineDoc;
  }
  if (text.ends_with("*/")) {
    return LineKind::kBlockEnd;
  }
  return LineKind::kCode;
}

auto DocResolver::Step(State state, LineKind kind) -> State {
  switch (state) {
    case State::kSeeking:
      switch (kind) {
        case LineKind::kBlank:
        case LineKind::kAnnotation:
          return State::kSeeking;
        case LineKind::kLineDoc:
          return State::kCollectingLines;
        case LineKind::kBlockEnd:
          return State::kCollectingBlock;
        case LineKind::kCode:
          return State::kDone;
      }
      return State::kDone;

    case State::kCollectingLines:
      if (kind == LineKind::kLineDoc || kind == LineKind::kAnnotation) {
        return State::kCollectingLines;
      }
      return State::kDone;

    case State::kCollectingBlock:
      return State::kCollectingBlock;

    case State::kDone:
      return State::kDone;
  }
  return State::kDone;
}

auto DocResolver::ResolveAt(size_t declaration_line) const
    -> std::optional<std::string> {
  if (declaration_line >= lines_.size()) {
    return std::nullopt;
  }

  // Collected bottom-up, reversed into reading order at the end
  std::vector<std::string_view> collected;
  auto state = State::kSeeking;

  for (size_t i = declaration_line; i-- > 0 && state != State::kDone;) {
    auto line = lines_[i];

    if (state == State::kCollectingBlock) {
      collected.push_back(line);
      if (line.find("/*") != std::string_view::npos) {
        state = State::kDone;
      }
      continue;
    }

    auto kind = ClassifyLine(line);
    auto next = Step(state, kind);

    if (kind == LineKind::kLineDoc && next == State::kCollectingLines) {
      collected.push_back(line);
    } else if (next == State::kCollectingBlock) {
      collected.push_back(line);
      if (line.find("/*") != std::string_view::npos) {
        next = State::kDone;
      }
    }
    state = next;
  }

  // A "*/" without its opener is not a comment we can trust
  if (state == State::kCollectingBlock) {
    return std::nullopt;
  }

  std::ranges::reverse(collected);
  return NormalizeDocLines(collected);
}

auto DocResolver::FindDeclarationLine(std::string_view name) const
    -> std::optional<size_t> {
  if (name.empty()) {
    return std::nullopt;
  }

  for (size_t i = 0; i < lines_.size(); ++i) {
    auto line = lines_[i];
    if (IsCommentLine(Trim(line))) {
      continue;
    }
    for (auto keyword : kVisibilityKeywords) {
      size_t pos = FindWord(line, keyword);
      if (pos == std::string_view::npos) {
        continue;
      }
      if (FindWord(line.substr(pos + keyword.size()), name) !=
          std::string_view::npos) {
        return i;
      }
    }
  }
  return std::nullopt;
}

auto DocResolver::Resolve(std::string_view member_name) const
    -> std::optional<std::string> {
  auto line = FindDeclarationLine(member_name);
  if (!line) {
    return std::nullopt;
  }
  return ResolveAt(*line);
}

auto DocResolver::ResolveFileDocumentation(size_t min_length) const
    -> std::optional<std::string> {
  std::vector<std::string_view> collected;
  bool in_block = false;

  for (auto line : lines_) {
    auto text = Trim(line);
    if (in_block) {
      collected.push_back(line);
      if (text.find("*/") != std::string_view::npos) {
        in_block = false;
      }
      continue;
    }
    if (text.empty()) {
      continue;
    }
    if (text.starts_with("//")) {
      collected.push_back(line);
      continue;
    }
    if (text.starts_with("/*")) {
      collected.push_back(line);
      in_block = text.find("*/", 2) == std::string_view::npos;
      continue;
    }
    // First code line: using, namespace, a directive or a declaration
    break;
  }

  auto doc = NormalizeDocLines(collected);
  if (!doc || doc->size() < min_length) {
    return std::nullopt;
  }
  return doc;
}

auto DocResolver::NormalizeDocLines(const std::vector<std::string_view>& raw)
    -> std::optional<std::string> {
  std::string joined;
  for (auto line : raw) {
    auto text = StripCommentMarkers(line);
    if (text.empty()) {
      continue;
    }
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += text;
  }

  auto summary = CollapseWhitespace(StripDocTags(std::move(joined)));
  if (summary.empty()) {
    return std::nullopt;
  }
  return summary;
}

auto ResolveDocumentation(std::string_view source, std::string_view name)
    -> std::optional<std::string> {
  return DocResolver(source).Resolve(name);
}

auto ResolveFileDocumentation(std::string_view source, size_t min_length)
    -> std::optional<std::string> {
  return DocResolver(source).ResolveFileDocumentation(min_length);
}

}  // namespace csmap::parse
