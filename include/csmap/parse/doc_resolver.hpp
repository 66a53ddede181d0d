#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csmap::parse {

// Recovers documentation comments attached to declarations by scanning the
// original (unstripped) source line by line.
//
// The backward walk from a declaration line is a small state machine:
//
//   kSeeking --- "///" line ---> kCollectingLines --- blank/code ---> kDone
//      |                              (annotation lines are skipped)
//      +------- "... */" line --> kCollectingBlock --- "/*" line ---> kDone
//      |
//      +------- code line -----> kDone (no documentation)
//
// Blank lines are skipped while seeking and end line collection. Lines
// holding a single annotation ("[SerializeField]") are skipped in every
// state.
//
// The resolver keeps views into the source, which must outlive it.
class DocResolver {
 public:
  enum class State { kSeeking, kCollectingLines, kCollectingBlock, kDone };

  enum class LineKind { kBlank, kAnnotation, kLineDoc, kBlockEnd, kCode };

  explicit DocResolver(std::string_view source);

  // Documentation above the first line declaring member_name after a
  // visibility keyword
  [[nodiscard]] auto Resolve(std::string_view member_name) const
      -> std::optional<std::string>;

  // Documentation above a known zero-based declaration line
  [[nodiscard]] auto ResolveAt(size_t declaration_line) const
      -> std::optional<std::string>;

  // Leading comment block of the file, before the first code line
  // (using/namespace included); dropped when shorter than min_length
  [[nodiscard]] auto ResolveFileDocumentation(size_t min_length) const
      -> std::optional<std::string>;

  // First line where name appears as a whole word after a visibility
  // keyword
  [[nodiscard]] auto FindDeclarationLine(std::string_view name) const
      -> std::optional<size_t>;

  static auto ClassifyLine(std::string_view line) -> LineKind;

  // Transition for one line of the backward walk. Lines inside a block
  // comment are not classified; the walk leaves kCollectingBlock when it
  // meets the opening marker.
  static auto Step(State state, LineKind kind) -> State;

  // Strips comment markers and structuring tags from raw comment lines (in
  // reading order) and joins them into one summary string
  static auto NormalizeDocLines(const std::vector<std::string_view>& raw)
      -> std::optional<std::string>;

 private:
  std::vector<std::string_view> lines_;
};

// Convenience wrapper over DocResolver::Resolve
auto ResolveDocumentation(std::string_view source, std::string_view name)
    -> std::optional<std::string>;

// Convenience wrapper over DocResolver::ResolveFileDocumentation
auto ResolveFileDocumentation(std::string_view source, size_t min_length)
    -> std::optional<std::string>;

}  // namespace csmap::parse
