#include <catch2/catch_test_macros.hpp>

#include "TempFiles.h"

#include <deskboot/DriverLinker.h>

using namespace deskboot;

namespace {

DriverConfig
makeConfig(const TemporaryDirectory& tmp) {
  DriverConfig config;
  config.searchDir = tmp.dir / "store";
  config.pattern = "*-graphics-drivers";
  config.alias = tmp.dir / "run" / "opengl-driver";
  std::filesystem::create_directories(config.searchDir);
  return config;
}

} // namespace

TEST_CASE("findDriverCandidates", "[driver]") {
  TemporaryDirectory tmp;
  const auto store = tmp.dir / "store";

  std::filesystem::create_directories(store / "c-graphics-drivers");
  std::filesystem::create_directories(store / "a-graphics-drivers");
  std::filesystem::create_directories(store / "b-graphics-drivers");
  std::filesystem::create_directories(store / "mesa-24.0");
  std::filesystem::create_directories(store / ".hidden-graphics-drivers");
  writeFile(store / "file-graphics-drivers", "not a directory");

  auto candidates = findDriverCandidates(store, "*-graphics-drivers");
  REQUIRE(candidates.has_value());
  CHECK(*candidates == std::vector<std::filesystem::path>{
                         store / "a-graphics-drivers",
                         store / "b-graphics-drivers",
                         store / "c-graphics-drivers",
                       });

  SECTION("Missing parent") {
    auto res = findDriverCandidates(tmp.dir / "nope", "*-graphics-drivers");
    REQUIRE_FALSE(res.has_value());
    CHECK(res.error().type == DriverError::Io);
  }
}

TEST_CASE("selectDriver", "[driver]") {
  auto empty = selectDriver({});
  REQUIRE_FALSE(empty.has_value());
  CHECK(empty.error().type == DriverError::NotFound);

  auto first = selectDriver({ "/nix/store/a-graphics-drivers",
                              "/nix/store/b-graphics-drivers" });
  REQUIRE(first.has_value());
  CHECK(*first == "/nix/store/a-graphics-drivers");
}

TEST_CASE("linkDriver", "[driver]") {
  TemporaryDirectory tmp;
  const auto config = makeConfig(tmp);

  SECTION("Single match") {
    std::filesystem::create_directories(config.searchDir /
                                        "abc123-graphics-drivers");

    auto target = linkDriver(config);
    REQUIRE(target.has_value());
    CHECK(*target == config.searchDir / "abc123-graphics-drivers");

    CHECK(std::filesystem::is_symlink(config.alias));
    CHECK(sys::readlink(config.alias) == target->string());
    CHECK(std::filesystem::is_directory(config.alias));
  }

  SECTION("First in lexical order wins") {
    std::filesystem::create_directories(config.searchDir /
                                        "b-graphics-drivers");
    std::filesystem::create_directories(config.searchDir /
                                        "a-graphics-drivers");

    for (int i = 0; i < 3; i++) {
      auto target = linkDriver(config);
      REQUIRE(target.has_value());
      CHECK(*target == config.searchDir / "a-graphics-drivers");
      CHECK(sys::readlink(config.alias) ==
            (config.searchDir / "a-graphics-drivers").string());
    }
  }

  SECTION("Existing alias is replaced") {
    std::filesystem::create_directories(tmp.dir / "old");
    std::filesystem::create_directories(config.alias.parent_path());
    std::filesystem::create_directory_symlink(tmp.dir / "old", config.alias);
    std::filesystem::create_directories(config.searchDir /
                                        "new-graphics-drivers");

    REQUIRE(linkDriver(config).has_value());
    CHECK(sys::readlink(config.alias) ==
          (config.searchDir / "new-graphics-drivers").string());

    // No temporary links are left behind.
    int entries = 0;
    for (const auto& entry :
         std::filesystem::directory_iterator(config.alias.parent_path())) {
      (void)entry;
      entries++;
    }
    CHECK(entries == 1);
  }

  SECTION("No matching entry") {
    std::filesystem::create_directories(config.searchDir / "mesa-24.0");
    std::filesystem::create_directories(config.searchDir / "graphics-drivers");

    auto res = linkDriver(config);
    REQUIRE_FALSE(res.has_value());
    CHECK(res.error().type == DriverError::NotFound);
    CHECK(to_string(res.error()).find("graphics drivers not found") !=
          std::string::npos);
    CHECK_FALSE(std::filesystem::exists(config.alias));
    CHECK_FALSE(std::filesystem::is_symlink(config.alias));
  }

  SECTION("Empty search directory") {
    auto res = linkDriver(config);
    REQUIRE_FALSE(res.has_value());
    CHECK(res.error().type == DriverError::NotFound);
    CHECK_FALSE(std::filesystem::is_symlink(config.alias));
    CHECK_FALSE(std::filesystem::exists(config.alias.parent_path()));
  }

  SECTION("Stale alias is left alone when nothing matches") {
    std::filesystem::create_directories(config.alias.parent_path());
    std::filesystem::create_directory_symlink(tmp.dir / "old", config.alias);

    REQUIRE_FALSE(linkDriver(config).has_value());
    CHECK(sys::readlink(config.alias) == (tmp.dir / "old").string());
  }
}
