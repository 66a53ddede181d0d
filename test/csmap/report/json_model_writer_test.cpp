#include "csmap/report/json_model_writer.hpp"

#include <filesystem>
#include <fstream>

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "csmap/utils/canonical_path.hpp"
#include "test/csmap/common/temp_directory.hpp"
#include "test/csmap/report/report_fixture.hpp"

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

using csmap::CanonicalPath;
using csmap::report::JsonModelWriter;
using csmap::test::SampleReportModel;
using csmap::test::TempDirectory;

TEST_CASE("ToJson exposes units, edges and diagnostics", "[json]") {
  auto json = JsonModelWriter::ToJson(SampleReportModel());

  REQUIRE(json["units"].size() == 2);
  REQUIRE(json["diagnostics"].size() == 1);
  REQUIRE(json["diagnostics"][0]["identifier"] == "Scripts/Broken.cs");
  REQUIRE(
      json["edges"] ==
      nlohmann::json::parse(R"([{"from": "Scripts/Player.cs", "to": "Weapon"}])"));

  const auto& player = json["units"][0];
  REQUIRE(player["identifier"] == "Scripts/Player.cs");
  REQUIRE(player["filename"] == "Player.cs");
  REQUIRE(player["namespace"] == "Game");
  REQUIRE(player["restrictedBuild"] == false);

  const auto& type = player["types"][0];
  REQUIRE(type["name"] == "Player");
  REQUIRE(type["kind"] == "class");
  REQUIRE(type["visibility"] == "public");
  REQUIRE(type["baseTypes"] == nlohmann::json::array({"MonoBehaviour"}));
  REQUIRE(type["documentation"] == "The player avatar.");
  REQUIRE_FALSE(type.contains("enclosingType"));

  const auto& speed = type["fields"][0];
  REQUIRE(speed["name"] == "speed");
  REQUIRE(speed["annotated"] == true);
  REQUIRE(speed["default"] == "5f");
  REQUIRE(speed["group"] == "Movement");

  const auto& move = type["methods"][1];
  REQUIRE(move["name"] == "Move");
  REQUIRE(move["returnType"] == "void");
  REQUIRE(
      move["parameters"] ==
      nlohmann::json::parse(R"([
        {"name": "direction", "type": "Vector3"},
        {"name": "scale", "type": "float", "default": "1f"}
      ])"));
}

TEST_CASE("Absent optional values are omitted", "[json]") {
  auto json = JsonModelWriter::ToJson(SampleReportModel());

  const auto& weapon = json["units"][1];
  REQUIRE(weapon["filename"] == "Weapon.cs");
  REQUIRE_FALSE(weapon.contains("namespace"));
  REQUIRE_FALSE(weapon.contains("documentation"));
  REQUIRE(weapon["dependencies"].empty());
}

TEST_CASE("Write stores the model as model.json", "[json]") {
  TempDirectory temp;
  CanonicalPath output_dir(temp.Path() / "maps");
  auto model = SampleReportModel();

  auto written = JsonModelWriter().Write(model, output_dir);

  REQUIRE(written.has_value());
  auto path = output_dir.Path() / JsonModelWriter::kFileName;
  REQUIRE(std::filesystem::file_size(path) == *written);

  std::ifstream file(path);
  auto parsed = nlohmann::json::parse(file);
  REQUIRE(parsed == JsonModelWriter::ToJson(model));
}
