#pragma once

#include <string_view>

namespace csmap::parse {

// Span from the brace at open_offset through its matching closing brace.
// Unbalanced input yields the remainder of the text from open_offset; an
// offset past the end yields an empty span.
auto ExtractBraceBlock(std::string_view text, size_t open_offset)
    -> std::string_view;

// Same as ExtractBraceBlock for parentheses
auto ExtractParenBlock(std::string_view text, size_t open_offset)
    -> std::string_view;

// Block without its outer delimiters. A block missing its closing
// delimiter (the unbalanced case above) only loses the opening one.
auto BlockInner(std::string_view block) -> std::string_view;

}  // namespace csmap::parse
