#include <catch2/catch_test_macros.hpp>
#include "Packwright/pipeline/artifact_checksum.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace Packwright;
using namespace Packwright::pipeline;
namespace fs = std::filesystem;

static fs::path createTempDir() {
  fs::path tempPath =
      fs::temp_directory_path() /
      ("pw_checksum_test_" +
       std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  fs::create_directories(tempPath);
  return tempPath;
}

TEST_CASE("SHA-256 of known inputs", "[artifact_checksum]") {
  auto empty = sha256Data("");
  REQUIRE(empty.isOk());
  CHECK(toHex(empty.value()) ==
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

  auto abc = sha256Data("abc");
  REQUIRE(abc.isOk());
  CHECK(toHex(abc.value()) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("SHA-256 of a file matches the data digest", "[artifact_checksum]") {
  const fs::path dir = createTempDir();

  // Larger than one read chunk
  std::string content;
  for (int i = 0; i < 20000; ++i) {
    content += "packwright-" + std::to_string(i) + "\n";
  }
  std::ofstream(dir / "App.dmg", std::ios::binary) << content;

  auto fromFile = sha256File(dir / "App.dmg");
  auto fromData = sha256Data(content);
  REQUIRE(fromFile.isOk());
  REQUIRE(fromData.isOk());
  CHECK(fromFile.value() == fromData.value());

  CHECK(sha256File(dir / "missing.dmg").isError());

  fs::remove_all(dir);
}

TEST_CASE("Checksum file uses the shasum layout", "[artifact_checksum]") {
  const fs::path dir = createTempDir();
  std::ofstream(dir / "App.dmg", std::ios::binary) << "abc";

  auto hex = writeChecksumFile(dir / "App.dmg", dir / "App.dmg.sha256");
  REQUIRE(hex.isOk());
  CHECK(hex.value() == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  std::ifstream in(dir / "App.dmg.sha256");
  std::stringstream ss;
  ss << in.rdbuf();
  CHECK(ss.str() == hex.value() + "  App.dmg\n");

  SECTION("Missing artifact writes nothing") {
    CHECK(writeChecksumFile(dir / "none.dmg", dir / "none.dmg.sha256").isError());
    CHECK_FALSE(fs::exists(dir / "none.dmg.sha256"));
  }

  fs::remove_all(dir);
}
