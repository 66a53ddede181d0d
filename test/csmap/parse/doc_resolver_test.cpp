#include "csmap/parse/doc_resolver.hpp"

#include <string>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");

  // Suppress Bazel test sharding warnings
  setenv("TEST_SHARD_INDEX", "0", 0);
  setenv("TEST_TOTAL_SHARDS", "1", 0);
  setenv("TEST_SHARD_STATUS_FILE", "", 0);

  return Catch::Session().run(argc, argv);
}

using csmap::parse::DocResolver;
using csmap::parse::ResolveDocumentation;
using csmap::parse::ResolveFileDocumentation;

TEST_CASE("Doc lines above annotations are attached", "[doc]") {
  std::string source =
      "public class Spawner {\n"
      "    public int count;\n"
      "\n"
      "    /// Spawns a wave of enemies.\n"
      "    /// Returns when the wave is cleared.\n"
      "    [ContextMenu(\"Spawn\")]\n"
      "    [Obsolete]\n"
      "    [Conditional(\"DEBUG\")]\n"
      "    public void SpawnWave() { }\n"
      "}\n";

  auto doc = ResolveDocumentation(source, "SpawnWave");

  REQUIRE(doc ==
          "Spawns a wave of enemies. Returns when the wave is cleared.");
}

TEST_CASE("Resolving twice yields the same result", "[doc]") {
  std::string source =
      "/// <summary>Current health.</summary>\n"
      "public float health;\n";
  DocResolver resolver(source);

  auto first = resolver.Resolve("health");
  auto second = resolver.Resolve("health");

  REQUIRE(first == "Current health.");
  REQUIRE(first == second);
}

TEST_CASE("A code line directly above ends the search", "[doc]") {
  std::string source =
      "/// Belongs to speed.\n"
      "public float speed;\n"
      "public float jump;\n";

  REQUIRE_FALSE(ResolveDocumentation(source, "jump").has_value());
  REQUIRE(ResolveDocumentation(source, "speed") == "Belongs to speed.");
}

TEST_CASE("Plain line comments are not documentation", "[doc]") {
  std::string source =
      "// implementation note\n"
      "public int value;\n";

  REQUIRE_FALSE(ResolveDocumentation(source, "value").has_value());
}

TEST_CASE("Block comments above a declaration are collected", "[doc]") {
  std::string source =
      "/**\n"
      " * Moves the actor.\n"
      " * Clamped to the arena.\n"
      " */\n"
      "public void Move(Vector3 delta) { }\n";

  REQUIRE(ResolveDocumentation(source, "Move") ==
          "Moves the actor. Clamped to the arena.");
}

TEST_CASE("A block end without its opener yields nothing", "[doc]") {
  std::string source =
      "int x; */\n"
      "public void Orphan() { }\n";

  REQUIRE_FALSE(ResolveDocumentation(source, "Orphan").has_value());
}

TEST_CASE("Structuring tags are removed and references kept", "[doc]") {
  std::string source =
      "/// <summary>\n"
      "/// Uses <see cref=\"Inventory\"/> to pick an item.\n"
      "/// </summary>\n"
      "/// <param name=\"slot\">Slot index.</param>\n"
      "public Item Pick(int slot) { return null; }\n";

  REQUIRE(ResolveDocumentation(source, "Pick") ==
          "Uses Inventory to pick an item. Slot index.");
}

TEST_CASE("Reference tags keep their target name", "[doc]") {
  std::string source =
      "/// Heals by <paramref name=\"amount\" /> and refreshes\n"
      "/// <seealso cref=\"HealthBar\"/>.\n"
      "public void Heal(int amount) { }\n";

  REQUIRE(ResolveDocumentation(source, "Heal") ==
          "Heals by amount and refreshes HealthBar.");
}

TEST_CASE("Unknown names resolve to nothing", "[doc]") {
  REQUIRE_FALSE(
      ResolveDocumentation("public int a;\n", "missing").has_value());
  REQUIRE_FALSE(ResolveDocumentation("public int a;\n", "").has_value());
}

TEST_CASE("Names only match as whole words after a visibility keyword",
          "[doc]") {
  std::string source =
      "/// Not this one.\n"
      "int speedLimit;\n"
      "/// The speed.\n"
      "public float speed;\n";
  DocResolver resolver(source);

  REQUIRE(resolver.FindDeclarationLine("speed") == 3);
  REQUIRE(resolver.Resolve("speed") == "The speed.");
}

TEST_CASE("ResolveAt past the end yields nothing", "[doc]") {
  DocResolver resolver("/// doc\npublic int a;\n");

  REQUIRE(resolver.ResolveAt(1) == "doc");
  REQUIRE_FALSE(resolver.ResolveAt(42).has_value());
}

TEST_CASE("Step follows the documented transitions", "[doc]") {
  using State = DocResolver::State;
  using Kind = DocResolver::LineKind;

  REQUIRE(DocResolver::Step(State::kSeeking, Kind::kBlank) == State::kSeeking);
  REQUIRE(
      DocResolver::Step(State::kSeeking, Kind::kAnnotation) ==
      State::kSeeking);
  REQUIRE(
      DocResolver::Step(State::kSeeking, Kind::kLineDoc) ==
      State::kCollectingLines);
  REQUIRE(
      DocResolver::Step(State::kSeeking, Kind::kBlockEnd) ==
      State::kCollectingBlock);
  REQUIRE(DocResolver::Step(State::kSeeking, Kind::kCode) == State::kDone);
  REQUIRE(
      DocResolver::Step(State::kCollectingLines, Kind::kAnnotation) ==
      State::kCollectingLines);
  REQUIRE(
      DocResolver::Step(State::kCollectingLines, Kind::kBlank) ==
      State::kDone);
  REQUIRE(DocResolver::Step(State::kDone, Kind::kLineDoc) == State::kDone);
}

TEST_CASE("ClassifyLine recognizes each line kind", "[doc]") {
  using Kind = DocResolver::LineKind;

  REQUIRE(DocResolver::ClassifyLine("   ") == Kind::kBlank);
  REQUIRE(DocResolver::ClassifyLine("  [SerializeField]") == Kind::kAnnotation);
  REQUIRE(DocResolver::ClassifyLine("  /// text") == Kind::kLineDoc);
  REQUIRE(DocResolver::ClassifyLine("   */") == Kind::kBlockEnd);
  REQUIRE(DocResolver::ClassifyLine("int x;") == Kind::kCode);
}

TEST_CASE("File documentation is the leading comment block", "[doc]") {
  std::string source =
      "// Handles player input and forwards it to the controller.\n"
      "// Attach to the root object.\n"
      "\n"
      "using UnityEngine;\n"
      "// not part of the header\n"
      "public class PlayerInput { }\n";

  REQUIRE(ResolveFileDocumentation(source, 10) ==
          "Handles player input and forwards it to the controller. Attach to "
          "the root object.");
}

TEST_CASE("Short file documentation is dropped", "[doc]") {
  std::string source = "// todo\nusing System;\n";

  REQUIRE_FALSE(ResolveFileDocumentation(source, 10).has_value());
  REQUIRE(ResolveFileDocumentation(source, 0) == "todo");
}

TEST_CASE("Files starting with code have no file documentation", "[doc]") {
  REQUIRE_FALSE(
      ResolveFileDocumentation("using System;\n// late\n", 0).has_value());
}
