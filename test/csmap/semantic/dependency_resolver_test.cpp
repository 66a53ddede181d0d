#include "csmap/semantic/dependency_resolver.hpp"

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "csmap/parse/source_unit_parser.hpp"

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

using csmap::parse::DependencyEdge;
using csmap::parse::SourceText;
using csmap::parse::SourceUnit;
using csmap::parse::SourceUnitParser;
using csmap::semantic::DependencyResolver;

namespace {

auto ParseAll(const std::vector<SourceText>& sources)
    -> std::vector<SourceUnit> {
  SourceUnitParser parser;
  std::vector<SourceUnit> units;
  for (const auto& source : sources) {
    auto unit = parser.Parse(source);
    REQUIRE(unit.has_value());
    units.push_back(std::move(*unit));
  }
  return units;
}

}  // namespace

TEST_CASE("A method return type creates one edge", "[dependencies]") {
  auto units = ParseAll({
      {"A.cs", "class A { public B MakeB(); }"},
      {"B.cs", "class B {}"},
  });

  auto edge_count = DependencyResolver().Resolve(units);

  REQUIRE(edge_count == 1);
  REQUIRE(
      units[0].dependencies ==
      std::vector<DependencyEdge>{{.from_unit = "A.cs", .to_type_name = "B"}});
  REQUIRE(units[1].dependencies.empty());
}

TEST_CASE("Mutual references produce a cycle", "[dependencies]") {
  auto units = ParseAll({
      {"Player.cs",
       "public class Player { public Inventory inventory; "
       "public void Equip(Item item) { } }"},
      {"Inventory.cs",
       "public class Inventory { public List<Player> Owners { get; } }"},
      {"Item.cs", "public class Item : ScriptableObject { }"},
  });

  DependencyResolver().Resolve(units);

  REQUIRE(
      units[0].dependencies ==
      std::vector<DependencyEdge>{{"Player.cs", "Inventory"},
                                  {"Player.cs", "Item"}});
  REQUIRE(
      units[1].dependencies ==
      std::vector<DependencyEdge>{{"Inventory.cs", "Player"}});
  REQUIRE(units[2].dependencies.empty());
}

TEST_CASE("Own types and unknown names yield no edges", "[dependencies]") {
  auto units = ParseAll({
      {"Enemy.cs",
       "public class Enemy : MonoBehaviour {\n"
       "  public Enemy Clone() { return null; }\n"
       "  public Stats stats;\n"
       "  public class Stats { }\n"
       "  public Dictionary<string, GameObject> lookup;\n"
       "}\n"},
      {"Spawner.cs",
       "public class Spawner { public Enemy[] enemies; public Enemy? Next() "
       "{ return null; } public List<Enemy> Pool { get; set; } }"},
  });

  DependencyResolver().Resolve(units);

  REQUIRE(units[0].dependencies.empty());
  REQUIRE(
      units[1].dependencies ==
      std::vector<DependencyEdge>{{"Spawner.cs", "Enemy"}});
}

TEST_CASE("Resolve replaces earlier edges", "[dependencies]") {
  auto units = ParseAll({
      {"A.cs", "public class A { }"},
      {"B.cs", "public class B { }"},
  });
  units[0].dependencies.push_back({"A.cs", "Stale"});

  REQUIRE(DependencyResolver().Resolve(units) == 0);
  REQUIRE(units[0].dependencies.empty());
}

TEST_CASE("The first unit keeps a duplicated short name", "[dependencies]") {
  auto units = ParseAll({
      {"UI/Button.cs", "namespace UI { public class Button { } }"},
      {"Input/Button.cs", "namespace Input { public class Button { } }"},
      {"Menu.cs", "public class Menu { public Button start; }"},
  });

  auto table = DependencyResolver::BuildNameTable(units);
  REQUIRE(table.at("Button") == "UI/Button.cs");
  REQUIRE(table.at("Menu") == "Menu.cs");

  DependencyResolver().Resolve(units);
  REQUIRE(
      units[2].dependencies ==
      std::vector<DependencyEdge>{{"Menu.cs", "Button"}});
}

TEST_CASE("BuildNameTable prefers the type named after the file",
          "[dependencies]") {
  auto units = ParseAll({
      {"Weapon.cs",
       "public enum Kind { A }\n"
       "public class Helper { }\n"
       "public class Weapon { }\n"},
      {"Loose.cs", "public class First { } public class Second { }"},
      {"Empty.cs", "// nothing\n"},
  });

  auto table = DependencyResolver::BuildNameTable(units);

  REQUIRE(table.size() == 2);
  REQUIRE(table.at("Weapon") == "Weapon.cs");
  REQUIRE(table.at("First") == "Loose.cs");
  REQUIRE_FALSE(table.contains("Helper"));
}

TEST_CASE("TypeTokens splits composite type expressions", "[dependencies]") {
  REQUIRE(
      DependencyResolver::TypeTokens("Dictionary<string, List<Enemy>>") ==
      std::vector<std::string>{"Dictionary", "string", "List", "Enemy"});
  REQUIRE(
      DependencyResolver::TypeTokens("Enemy[]?") ==
      std::vector<std::string>{"Enemy"});
  REQUIRE(
      DependencyResolver::TypeTokens("(Vector3 position, Quaternion rotation)") ==
      std::vector<std::string>{"Vector3", "position", "Quaternion",
                               "rotation"});
  REQUIRE(
      DependencyResolver::TypeTokens("UnityEngine.UI.Button") ==
      std::vector<std::string>{"UnityEngine", "UI", "Button"});
  REQUIRE(DependencyResolver::TypeTokens("").empty());
}
