#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace csmap::parse {

auto Trim(std::string_view text) -> std::string_view;

// Lines without their terminators; a trailing "\r" is dropped as well
auto SplitLines(std::string_view text) -> std::vector<std::string_view>;

// Zero-based line index of a byte offset
auto LineIndexAt(std::string_view text, size_t offset) -> size_t;

auto IsIdentifierChar(char c) -> bool;

// True when word occurs in text delimited by non-identifier characters
auto ContainsWord(std::string_view text, std::string_view word) -> bool;

// Offset to zero-based line index lookup over a fixed text
class LineMap {
 public:
  explicit LineMap(std::string_view text);

  [[nodiscard]] auto LineOf(size_t offset) const -> size_t;

 private:
  std::vector<size_t> newline_offsets_;
};

// Collapses runs of whitespace (newlines included) into one space and trims
auto CollapseWhitespace(std::string_view text) -> std::string;

}  // namespace csmap::parse
