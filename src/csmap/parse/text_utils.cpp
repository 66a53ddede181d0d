#include "csmap/parse/text_utils.hpp"

#include <algorithm>
#include <cctype>

namespace csmap::parse {

namespace {

auto IsSpace(char c) -> bool {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

auto Trim(std::string_view text) -> std::string_view {
  while (!text.empty() && IsSpace(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && IsSpace(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

auto SplitLines(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> lines;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    auto line = text.substr(start, end - start);
    if (line.ends_with('\r')) {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    start = end + 1;
  }
  return lines;
}

auto LineIndexAt(std::string_view text, size_t offset) -> size_t {
  offset = std::min(offset, text.size());
  return static_cast<size_t>(
      std::count(text.begin(), text.begin() + offset, '\n'));
}

auto IsIdentifierChar(char c) -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto ContainsWord(std::string_view text, std::string_view word) -> bool {
  if (word.empty()) {
    return false;
  }
  size_t pos = text.find(word);
  while (pos != std::string_view::npos) {
    bool left_ok = pos == 0 || !IsIdentifierChar(text[pos - 1]);
    size_t end = pos + word.size();
    bool right_ok = end >= text.size() || !IsIdentifierChar(text[end]);
    if (left_ok && right_ok) {
      return true;
    }
    pos = text.find(word, pos + 1);
  }
  return false;
}

LineMap::LineMap(std::string_view text) {
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      newline_offsets_.push_back(i);
    }
  }
}

auto LineMap::LineOf(size_t offset) const -> size_t {
  auto it = std::ranges::lower_bound(newline_offsets_, offset);
  return static_cast<size_t>(it - newline_offsets_.begin());
}

auto CollapseWhitespace(std::string_view text) -> std::string {
  std::string result;
  result.reserve(text.size());
  bool pending_space = false;
  for (char c : Trim(text)) {
    if (IsSpace(c)) {
      pending_space = true;
      continue;
    }
    if (pending_space) {
      result += ' ';
      pending_space = false;
    }
    result += c;
  }
  return result;
}

}  // namespace csmap::parse
