#include "csmap/utils/canonical_path.hpp"

#include <chrono>
#include <filesystem>
#include <string>

#include <catch2/catch_all.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "csmap/utils/path_utils.hpp"
#include "csmap/utils/scoped_timer.hpp"
#include "test/csmap/common/temp_directory.hpp"

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
using csmap::test::TempDirectory;
using csmap::utils::ScopedTimer;

TEST_CASE("CanonicalPath resolves existing paths", "[canonical_path]") {
  TempDirectory temp;
  temp.WriteFile("Scripts/Player.cs", "class Player { }");

  CanonicalPath root(temp.Path());
  CanonicalPath indirect(temp.Path() / "Scripts" / ".." / "Scripts" / "Player.cs");

  REQUIRE(indirect == root / "Scripts/Player.cs");
  REQUIRE(indirect.Filename() == "Player.cs");
  REQUIRE(indirect.Stem() == "Player");
  REQUIRE(indirect.IsSubPathOf(root));
  REQUIRE(indirect.RelativeTo(root) == "Scripts/Player.cs");
}

TEST_CASE("CanonicalPath keeps synthetic paths", "[canonical_path]") {
  CanonicalPath path("/nonexistent/csmap/Assets/Enemy.cs");

  REQUIRE(path.String() == "/nonexistent/csmap/Assets/Enemy.cs");
  REQUIRE(fmt::format("{}", path) == "/nonexistent/csmap/Assets/Enemy.cs");
  REQUIRE_FALSE(path.Empty());
  REQUIRE(CanonicalPath().Empty());
}

TEST_CASE("IsSubPathOf compares whole components", "[canonical_path]") {
  CanonicalPath base("/nonexistent/project/Assets");

  REQUIRE(CanonicalPath("/nonexistent/project/Assets/A.cs").IsSubPathOf(base));
  REQUIRE_FALSE(
      CanonicalPath("/nonexistent/project/AssetsOld/A.cs").IsSubPathOf(base));
  REQUIRE_FALSE(CanonicalPath("/nonexistent/project").IsSubPathOf(base));
}

TEST_CASE("RelativeTo falls back to the full path", "[canonical_path]") {
  CanonicalPath base("/nonexistent/project/Assets");
  CanonicalPath outside("/nonexistent/other/B.cs");

  REQUIRE(outside.RelativeTo(base) == "/nonexistent/other/B.cs");
}

TEST_CASE("IsCSharpSourceFile matches the extension only", "[path_utils]") {
  REQUIRE(csmap::IsCSharpSourceFile("Assets/Player.cs"));
  REQUIRE(csmap::IsCSharpSourceFile("Assets/Player.CS"));
  REQUIRE_FALSE(csmap::IsCSharpSourceFile("Assets/Player.cs.meta"));
  REQUIRE_FALSE(csmap::IsCSharpSourceFile("Assets/cs"));
  REQUIRE_FALSE(csmap::IsCSharpSourceFile("Assets/Shader.csx"));
}

TEST_CASE("ScopedTimer formats durations", "[scoped_timer]") {
  using std::chrono::milliseconds;

  REQUIRE(ScopedTimer::FormatDuration(milliseconds(0)) == "0ms");
  REQUIRE(ScopedTimer::FormatDuration(milliseconds(850)) == "850ms");
  REQUIRE(ScopedTimer::FormatDuration(milliseconds(1000)) == "1.0s");
  REQUIRE(ScopedTimer::FormatDuration(milliseconds(12345)) == "12.3s");
}
