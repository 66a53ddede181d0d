#include "csmap/parse/source_unit_parser.hpp"

#include <string>
#include <vector>

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

using csmap::CsmapErrorCode;
using csmap::parse::ParserOptions;
using csmap::parse::SourceText;
using csmap::parse::SourceUnit;
using csmap::parse::SourceUnitParser;
using csmap::parse::TypeKind;
using csmap::parse::Visibility;

namespace {

auto ParseOrFail(
    const std::string& content, const std::string& identifier = "Test.cs",
    ParserOptions options = {}) -> SourceUnit {
  SourceUnitParser parser(std::move(options));
  auto result = parser.Parse(SourceText{identifier, content});
  if (!result) {
    FAIL("parse failed: " << result.error().Message());
  }
  return std::move(*result);
}

}  // namespace

TEST_CASE("Single class with public and private fields", "[parser]") {
  auto unit = ParseOrFail(
      "public class Foo : Bar { public int X; private int y; }", "Foo.cs");

  REQUIRE(unit.types.size() == 1);
  const auto& foo = unit.types[0];
  REQUIRE(foo.name == "Foo");
  REQUIRE(foo.kind == TypeKind::kClass);
  REQUIRE(foo.base_types == std::vector<std::string>{"Bar"});
  REQUIRE(foo.fields.size() == 1);
  REQUIRE(foo.fields[0].name == "X");
  REQUIRE(foo.fields[0].visibility == Visibility::kPublic);
  REQUIRE(unit.dependencies.empty());
  REQUIRE(unit.PrimaryType() == &foo);
}

TEST_CASE("Unit identity comes from the identifier", "[parser]") {
  auto unit = ParseOrFail(
      "namespace Game.Doors {\n"
      "  using UnityEngine;\n"
      "  public class Door { }\n"
      "}\n",
      "Scripts/World/Door.cs");

  REQUIRE(unit.identifier == "Scripts/World/Door.cs");
  REQUIRE(unit.filename == "Door.cs");
  REQUIRE(unit.Stem() == "Door");
  REQUIRE(unit.namespace_name == "Game.Doors");
  REQUIRE(unit.usings == std::vector<std::string>{"UnityEngine"});
}

TEST_CASE("Members belong to their innermost type", "[parser]") {
  auto unit = ParseOrFail(
      "public class Outer {\n"
      "  public int a;\n"
      "  public class Inner {\n"
      "    public int b;\n"
      "    public void Run() { }\n"
      "  }\n"
      "  public Inner Create() { return new Inner(); }\n"
      "  public int c;\n"
      "}\n");

  REQUIRE(unit.types.size() == 2);

  const auto& outer = unit.types[0];
  REQUIRE(outer.name == "Outer");
  REQUIRE_FALSE(outer.IsNested());
  REQUIRE(outer.fields.size() == 2);
  REQUIRE(outer.fields[0].name == "a");
  REQUIRE(outer.fields[1].name == "c");
  REQUIRE(outer.methods.size() == 1);
  REQUIRE(outer.methods[0].name == "Create");

  const auto& inner = unit.types[1];
  REQUIRE(inner.name == "Inner");
  REQUIRE(inner.enclosing_type == "Outer");
  REQUIRE(inner.fields.size() == 1);
  REQUIRE(inner.fields[0].name == "b");
  REQUIRE(inner.methods.size() == 1);
  REQUIRE(inner.methods[0].name == "Run");
}

TEST_CASE("A nested type written right after the brace is found",
          "[parser]") {
  auto unit = ParseOrFail(
      "public class A {public class B { public int b; } public int a; }",
      "A.cs");

  REQUIRE(unit.types.size() == 2);
  REQUIRE(unit.types[0].name == "A");
  REQUIRE(unit.types[0].fields.size() == 1);
  REQUIRE(unit.types[0].fields[0].name == "a");
  REQUIRE(unit.types[1].name == "B");
  REQUIRE(unit.types[1].enclosing_type == "A");
  REQUIRE(unit.types[1].fields.size() == 1);
  REQUIRE(unit.types[1].fields[0].name == "b");
}

TEST_CASE("Large nested types do not disturb the enclosing type",
          "[parser]") {
  std::string content =
      "public class Outer {\n"
      "  public int X;\n"
      "  private class Inner {\n";
  for (int i = 0; i < 3500; ++i) {
    content += "    private int fI = 1;\n";
  }
  content +=
      "  }\n"
      "  /// Set after the nested type.\n"
      "  public int Y;\n"
      "}\n";

  auto unit = ParseOrFail(content, "Outer.cs");

  REQUIRE(unit.types.size() == 2);
  const auto& outer = unit.types[0];
  REQUIRE(outer.fields.size() == 2);
  REQUIRE(outer.fields[0].name == "X");
  REQUIRE(outer.fields[1].name == "Y");
  REQUIRE(outer.fields[1].documentation == "Set after the nested type.");
  REQUIRE(unit.types[1].name == "Inner");
  REQUIRE(unit.types[1].fields.empty());
}

TEST_CASE("Large block comments inside a type are skipped", "[parser]") {
  std::string content =
      "public class Archive {\n"
      "  public int First;\n"
      "  /*\n";
  for (int i = 0; i < 2500; ++i) {
    content += "   * public int Hidden; retired record layout, kept for reference\n";
  }
  content +=
      "   */\n"
      "  /// Records stored so far.\n"
      "  public int Count;\n"
      "}\n";

  auto unit = ParseOrFail(content, "Archive.cs");

  REQUIRE(unit.types.size() == 1);
  const auto& archive = unit.types[0];
  REQUIRE(archive.fields.size() == 2);
  REQUIRE(archive.fields[0].name == "First");
  REQUIRE(archive.fields[1].name == "Count");
  REQUIRE(archive.fields[1].documentation == "Records stored so far.");
}

TEST_CASE("Commented-out declarations are ignored", "[parser]") {
  auto unit = ParseOrFail(
      "// public class Ghost { }\n"
      "public class Real {\n"
      "  // public int hidden;\n"
      "  /* public int blocked;\n"
      "     public void Gone() { } */\n"
      "  public int shown;\n"
      "}\n");

  REQUIRE(unit.types.size() == 1);
  REQUIRE(unit.types[0].name == "Real");
  REQUIRE(unit.types[0].fields.size() == 1);
  REQUIRE(unit.types[0].fields[0].name == "shown");
  REQUIRE(unit.types[0].methods.empty());
}

TEST_CASE("Documentation attaches to types and members", "[parser]") {
  auto unit = ParseOrFail(
      "/// A door that can be locked.\n"
      "public class Door : MonoBehaviour\n"
      "{\n"
      "    /// Whether the door refuses to open.\n"
      "    [SerializeField]\n"
      "    private bool locked;\n"
      "\n"
      "    // not documentation\n"
      "    public int width;\n"
      "\n"
      "    /// <summary>Opens the door.</summary>\n"
      "    public void Open() { }\n"
      "}\n",
      "Door.cs");

  REQUIRE(unit.types.size() == 1);
  const auto& door = unit.types[0];
  REQUIRE(door.documentation == "A door that can be locked.");

  REQUIRE(door.fields.size() == 2);
  REQUIRE(door.fields[0].name == "locked");
  REQUIRE(door.fields[0].documentation == "Whether the door refuses to open.");
  REQUIRE(door.fields[1].name == "width");
  REQUIRE_FALSE(door.fields[1].documentation.has_value());

  REQUIRE(door.methods.size() == 1);
  REQUIRE(door.methods[0].documentation == "Opens the door.");
}

TEST_CASE("Leading comment block becomes the file documentation",
          "[parser]") {
  std::string content =
      "// Spawns enemy waves and tracks how many are still alive.\n"
      "using UnityEngine;\n"
      "public class Spawner { }\n";

  auto unit = ParseOrFail(content);
  REQUIRE(
      unit.file_documentation ==
      "Spawns enemy waves and tracks how many are still alive.");

  ParserOptions strict;
  strict.min_file_doc_length = 200;
  REQUIRE_FALSE(
      ParseOrFail(content, "Test.cs", strict).file_documentation.has_value());
}

TEST_CASE("Conditional compilation guards mark restricted builds",
          "[parser]") {
  REQUIRE(ParseOrFail(
              "#if UNITY_EDITOR\n"
              "using UnityEditor;\n"
              "#endif\n"
              "public class Tool { }\n")
              .restricted_build);

  REQUIRE(ParseOrFail(
              "#if DEBUG && !UNITY_EDITOR\n"
              "#endif\n"
              "public class Tool { }\n")
              .restricted_build);

  REQUIRE_FALSE(ParseOrFail(
                    "#if DEBUG\n"
                    "#endif\n"
                    "public class Tool { }\n")
                    .restricted_build);

  REQUIRE_FALSE(ParseOrFail(
                    "// #if UNITY_EDITOR\n"
                    "public class Tool { }\n")
                    .restricted_build);
}

TEST_CASE("HasRestrictedBuildGuard matches whole symbols only", "[parser]") {
  std::vector<std::string> symbols = {"UNITY_EDITOR"};

  REQUIRE(SourceUnitParser::HasRestrictedBuildGuard(
      "  #elif UNITY_EDITOR\n", symbols));
  REQUIRE_FALSE(SourceUnitParser::HasRestrictedBuildGuard(
      "#if UNITY_EDITOR_WIN\n", symbols));
  REQUIRE_FALSE(SourceUnitParser::HasRestrictedBuildGuard(
      "var s = UNITY_EDITOR;\n", symbols));
}

TEST_CASE("Top-level and nested enums are kept apart", "[parser]") {
  auto unit = ParseOrFail(
      "public enum Team { Red, Blue }\n"
      "public class Player {\n"
      "  public enum State { Idle, Running }\n"
      "  public State state;\n"
      "}\n");

  REQUIRE(unit.enums.size() == 1);
  REQUIRE(unit.enums[0].name == "Team");
  REQUIRE(unit.types.size() == 1);
  REQUIRE(unit.types[0].enums.size() == 1);
  REQUIRE(unit.types[0].enums[0].name == "State");
  REQUIRE(unit.types[0].fields.size() == 1);
}

TEST_CASE("Byte order marks are skipped", "[parser]") {
  auto unit = ParseOrFail("\xEF\xBB\xBFpublic class Marked { }\n");

  REQUIRE(unit.types.size() == 1);
  REQUIRE(unit.types[0].name == "Marked");
}

TEST_CASE("Unsupported encodings are reported per file", "[parser]") {
  SourceUnitParser parser;

  auto utf16 = parser.Parse(
      SourceText{"Wide.cs", std::string("\xFF\xFEp\0u\0b\0", 8)});
  REQUIRE_FALSE(utf16.has_value());
  REQUIRE(utf16.error().Code() == CsmapErrorCode::kFileInvalidEncoding);

  auto nul = parser.Parse(
      SourceText{"Nul.cs", std::string("class A { }\0", 12)});
  REQUIRE_FALSE(nul.has_value());
  REQUIRE(nul.error().Code() == CsmapErrorCode::kFileInvalidEncoding);
}

TEST_CASE("Text without declarations yields an empty unit", "[parser]") {
  auto unit = ParseOrFail("// only a comment\n");

  REQUIRE(unit.types.empty());
  REQUIRE(unit.enums.empty());
  REQUIRE_FALSE(unit.namespace_name.has_value());
}
