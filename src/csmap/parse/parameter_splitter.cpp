#include "csmap/parse/parameter_splitter.hpp"

#include <array>

#include "csmap/parse/text_utils.hpp"

namespace csmap::parse {

namespace {

constexpr std::array<std::string_view, 7> kPassingModifiers = {
    "ref", "out", "in", "params", "this", "scoped", "readonly"};

// Removes leading [Attribute(...)] groups
auto StripAnnotations(std::string_view text) -> std::string_view {
  text = Trim(text);
  while (text.starts_with('[')) {
    int depth = 0;
    size_t end = 0;
    for (; end < text.size(); ++end) {
      if (text[end] == '[') {
        ++depth;
      } else if (text[end] == ']' && --depth == 0) {
        break;
      }
    }
    if (end >= text.size()) {
      // Unterminated annotation: nothing sensible left
      return {};
    }
    text = Trim(text.substr(end + 1));
  }
  return text;
}

auto StripPassingModifiers(std::string_view text) -> std::string_view {
  bool stripped = true;
  while (stripped) {
    stripped = false;
    for (auto modifier : kPassingModifiers) {
      if (text.size() > modifier.size() && text.starts_with(modifier) &&
          !IsIdentifierChar(text[modifier.size()])) {
        text = Trim(text.substr(modifier.size()));
        stripped = true;
      }
    }
  }
  return text;
}

// Offset of the '=' introducing a default value, skipping comparison and
// lambda operators; npos when there is none
auto FindDefaultAssignment(std::string_view text) -> size_t {
  int depth = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '<' || c == '(' || c == '[') {
      ++depth;
    } else if (c == '>' || c == ')' || c == ']') {
      --depth;
    } else if (c == '=' && depth == 0) {
      char prev = i > 0 ? text[i - 1] : '\0';
      char next = i + 1 < text.size() ? text[i + 1] : '\0';
      bool is_operator = next == '=' || next == '>' || prev == '=' ||
                         prev == '!' || prev == '<' || prev == '>';
      if (!is_operator) {
        return i;
      }
    }
  }
  return std::string_view::npos;
}

}  // namespace

auto SplitTopLevel(std::string_view text, char separator)
    -> std::vector<std::string> {
  std::vector<std::string> parts;
  int depth = 0;
  std::string current;

  auto flush = [&parts, &current]() {
    auto trimmed = Trim(current);
    if (!trimmed.empty()) {
      parts.emplace_back(trimmed);
    }
    current.clear();
  };

  for (char c : text) {
    if (c == '<' || c == '(') {
      ++depth;
    } else if (c == '>' || c == ')') {
      --depth;
    } else if (c == separator && depth == 0) {
      flush();
      continue;
    }
    current += c;
  }
  flush();

  return parts;
}

auto ParseParameter(std::string_view fragment) -> ParameterSpec {
  auto text = StripPassingModifiers(StripAnnotations(fragment));

  ParameterSpec parameter;
  size_t assign = FindDefaultAssignment(text);
  if (assign != std::string_view::npos) {
    auto default_value = Trim(text.substr(assign + 1));
    if (!default_value.empty()) {
      parameter.default_value = std::string(default_value);
    }
    text = Trim(text.substr(0, assign));
  }

  size_t split = text.find_last_of(" \t\r\n");
  if (split == std::string_view::npos) {
    parameter.name = std::string(text);
    parameter.type_name = std::string(kUnknownType);
    return parameter;
  }

  parameter.name = std::string(Trim(text.substr(split + 1)));
  parameter.type_name = CollapseWhitespace(text.substr(0, split));
  return parameter;
}

auto SplitParameters(std::string_view parameter_list)
    -> std::vector<ParameterSpec> {
  std::vector<ParameterSpec> parameters;
  for (const auto& fragment : SplitTopLevel(parameter_list)) {
    auto parameter = ParseParameter(fragment);
    if (!parameter.name.empty()) {
      parameters.push_back(std::move(parameter));
    }
  }
  return parameters;
}

}  // namespace csmap::parse
