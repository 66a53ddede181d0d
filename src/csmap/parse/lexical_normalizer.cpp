#include "csmap/parse/lexical_normalizer.hpp"

namespace csmap::parse {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

auto IsLineBreak(char c) -> bool {
  return c == '\n' || c == '\r';
}

auto IsBlank(char c) -> bool {
  return c == ' ' || c == '\t' || c == '\f' || c == '\v' || IsLineBreak(c);
}

}  // namespace

auto StripByteOrderMark(std::string_view text) -> std::string_view {
  if (text.starts_with(kUtf8Bom)) {
    text.remove_prefix(kUtf8Bom.size());
  }
  return text;
}

auto HasUnsupportedEncoding(std::string_view text) -> bool {
  // UTF-32 LE starts with FF FE 00 00, which the UTF-16 LE check covers
  if (text.starts_with("\xFF\xFE") || text.starts_with("\xFE\xFF")) {
    return true;
  }
  if (text.starts_with(std::string_view("\x00\x00\xFE\xFF", 4))) {
    return true;
  }
  return text.find('\0') != std::string_view::npos;
}

auto StripComments(std::string_view text) -> std::string {
  enum class State { kCode, kLineComment, kBlockComment };

  std::string result(text);
  auto state = State::kCode;

  for (size_t i = 0; i < result.size(); ++i) {
    char c = result[i];
    char next = i + 1 < result.size() ? result[i + 1] : '\0';

    switch (state) {
      case State::kCode:
        if (c == '/' && next == '/') {
          state = State::kLineComment;
          result[i] = ' ';
          result[i + 1] = ' ';
          ++i;
        } else if (c == '/' && next == '*') {
          state = State::kBlockComment;
          result[i] = ' ';
          result[i + 1] = ' ';
          ++i;
        }
        break;

      case State::kLineComment:
        if (IsLineBreak(c)) {
          state = State::kCode;
        } else {
          result[i] = ' ';
        }
        break;

      case State::kBlockComment:
        if (c == '*' && next == '/') {
          state = State::kCode;
          result[i] = ' ';
          result[i + 1] = ' ';
          ++i;
        } else if (!IsLineBreak(c)) {
          result[i] = ' ';
        }
        break;
    }
  }

  return result;
}

auto CompactWhitespace(std::string_view text) -> CompactText {
  CompactText result;
  result.text.reserve(text.size());
  result.source_offsets.reserve(text.size() + 1);

  size_t i = 0;
  while (i < text.size()) {
    if (!IsBlank(text[i])) {
      result.text += text[i];
      result.source_offsets.push_back(i);
      ++i;
      continue;
    }

    size_t run_start = i;
    size_t first_break = std::string_view::npos;
    while (i < text.size() && IsBlank(text[i])) {
      if (text[i] == '\n' && first_break == std::string_view::npos) {
        first_break = i;
      }
      ++i;
    }
    if (first_break != std::string_view::npos) {
      result.text += '\n';
      result.source_offsets.push_back(first_break);
    } else {
      result.text += ' ';
      result.source_offsets.push_back(run_start);
    }
  }

  result.source_offsets.push_back(text.size());
  return result;
}

}  // namespace csmap::parse
