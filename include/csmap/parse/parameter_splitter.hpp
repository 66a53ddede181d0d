#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "csmap/parse/model.hpp"

namespace csmap::parse {

// Sentinel type for parameters whose type cannot be separated from the name
inline constexpr std::string_view kUnknownType = "?";

// Splits on commas outside <...> and (...); empty fragments are dropped
auto SplitTopLevel(std::string_view text, char separator = ',')
    -> std::vector<std::string>;

// Parses the text between a method's parentheses, e.g.
// "int count = 0, List<Dictionary<string, int>> maps"
auto SplitParameters(std::string_view parameter_list)
    -> std::vector<ParameterSpec>;

// Parses one parameter fragment; exposed for tests
auto ParseParameter(std::string_view fragment) -> ParameterSpec;

}  // namespace csmap::parse
