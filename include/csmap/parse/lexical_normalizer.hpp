#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace csmap::parse {

// Drops a leading UTF-8 byte order mark
auto StripByteOrderMark(std::string_view text) -> std::string_view;

// True when the text starts with a UTF-16 or UTF-32 byte order mark or
// contains NUL bytes, i.e. it is not something the parser can read
auto HasUnsupportedEncoding(std::string_view text) -> bool;

// Replaces the contents of // and /* */ comments with spaces. Newlines are
// kept, so offsets and line numbers in the result match the input.
//
// String and character literals are not recognized: a "//" inside a string
// starts a comment here. The interface summary tolerates that.
auto StripComments(std::string_view text) -> std::string;

// Text with every whitespace run shortened to a single character: a line
// break when the run spans lines, a space otherwise. The std::regex
// matchers run on this form; their recursion depth grows with run length.
struct CompactText {
  std::string text;
  // Offset in the input of each character of text, plus the input size
  std::vector<size_t> source_offsets;

  [[nodiscard]] auto SourceOffset(size_t offset) const -> size_t {
    return source_offsets[std::min(offset, source_offsets.size() - 1)];
  }
};

auto CompactWhitespace(std::string_view text) -> CompactText;

}  // namespace csmap::parse
