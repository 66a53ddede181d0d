#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace csmap::parse {

// Tunables of the structural parser. Defaults target Unity projects.
struct ParserOptions {
  // Attribute names that pull a field into the summary regardless of its
  // visibility
  std::vector<std::string> inclusion_annotations = {
      "SerializeField", "SerializeReference"};

  // Return types that mark a method as generator-style
  std::vector<std::string> iterator_markers = {"IEnumerator"};

  // Conditional compilation symbols that set SourceUnit::restricted_build
  std::vector<std::string> restricted_build_symbols = {"UNITY_EDITOR"};

  // Field inclusion policies, each toggled independently
  bool include_public_fields = true;
  bool include_annotated_fields = true;
  bool include_constants = true;

  // File-level documentation shorter than this is dropped
  std::size_t min_file_doc_length = 40;
};

}  // namespace csmap::parse
