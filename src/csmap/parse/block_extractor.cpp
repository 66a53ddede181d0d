#include "csmap/parse/block_extractor.hpp"

namespace csmap::parse {

namespace {

auto ExtractBalanced(
    std::string_view text, size_t open_offset, char open, char close)
    -> std::string_view {
  if (open_offset >= text.size()) {
    return {};
  }

  int depth = 0;
  for (size_t i = open_offset; i < text.size(); ++i) {
    if (text[i] == open) {
      ++depth;
    } else if (text[i] == close) {
      --depth;
      if (depth == 0) {
        return text.substr(open_offset, i - open_offset + 1);
      }
    }
  }
  return text.substr(open_offset);
}

}  // namespace

auto ExtractBraceBlock(std::string_view text, size_t open_offset)
    -> std::string_view {
  return ExtractBalanced(text, open_offset, '{', '}');
}

auto ExtractParenBlock(std::string_view text, size_t open_offset)
    -> std::string_view {
  return ExtractBalanced(text, open_offset, '(', ')');
}

auto BlockInner(std::string_view block) -> std::string_view {
  if (block.empty()) {
    return block;
  }
  char open = block.front();
  char close = open == '{' ? '}' : (open == '(' ? ')' : '\0');
  block.remove_prefix(1);
  if (!block.empty() && block.back() == close) {
    block.remove_suffix(1);
  }
  return block;
}

}  // namespace csmap::parse
