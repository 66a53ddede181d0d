#include "csmap/core/source_loader.hpp"

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "csmap/utils/canonical_path.hpp"
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
using csmap::CsmapErrorCode;
using csmap::SourceLoader;
using csmap::test::TempDirectory;

TEST_CASE("SourceLoader reads raw bytes with relative identifiers",
          "[source_loader]") {
  TempDirectory temp;
  std::string content = "\xEF\xBB\xBFpublic class Player { }\r\n";
  auto path = temp.WriteFile("Assets/Player.cs", content);

  SourceLoader loader(CanonicalPath(temp.Path()));
  auto source = loader.Load(CanonicalPath(path));

  REQUIRE(source.has_value());
  REQUIRE(source->identifier == "Assets/Player.cs");
  // Byte order mark and line endings are left to the parser
  REQUIRE(source->content == content);
}

TEST_CASE("SourceLoader reports missing files", "[source_loader]") {
  TempDirectory temp;
  SourceLoader loader(CanonicalPath(temp.Path()));

  auto missing = loader.Load(CanonicalPath(temp.Path() / "Missing.cs"));
  REQUIRE_FALSE(missing.has_value());
  REQUIRE(missing.error().Code() == CsmapErrorCode::kFileNotFound);

  // Directories are not source files
  auto directory = loader.Load(CanonicalPath(temp.Path()));
  REQUIRE_FALSE(directory.has_value());
  REQUIRE(directory.error().Code() == CsmapErrorCode::kFileNotFound);
}

TEST_CASE("SourceLoader LoadAll collects sources and diagnostics",
          "[source_loader]") {
  TempDirectory temp;
  auto a = temp.WriteFile("A.cs", "class A { }");
  auto b = temp.WriteFile("Sub/B.cs", "class B { }\n");
  auto empty = temp.WriteFile("Empty.cs", "");

  CanonicalPath root(temp.Path());
  SourceLoader loader(root);
  auto result = loader.LoadAll(
      {CanonicalPath(a), root / "Gone.cs", CanonicalPath(b),
       CanonicalPath(empty)});

  REQUIRE(result.sources.size() == 3);
  REQUIRE(result.sources[0].identifier == "A.cs");
  REQUIRE(result.sources[1].identifier == "Sub/B.cs");
  REQUIRE(result.sources[2].identifier == "Empty.cs");
  REQUIRE(result.sources[2].content.empty());
  REQUIRE(result.total_bytes == 11 + 12);

  REQUIRE(result.diagnostics.size() == 1);
  REQUIRE(result.diagnostics[0].identifier == "Gone.cs");
}
