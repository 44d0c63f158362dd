#include <catch2/catch_test_macros.hpp>
#include "Packwright/bundle/bundle_assembler.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace Packwright;
using namespace Packwright::bundle;
namespace fs = std::filesystem;

static fs::path createTempDir() {
  static int counter = 0;
  fs::path tempPath =
      fs::temp_directory_path() /
      ("pw_assembler_test_" +
       std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
       std::to_string(counter++));
  fs::create_directories(tempPath);
  return tempPath;
}

static void writeFile(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream(path, std::ios::binary) << content;
}

static std::string readFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

TEST_CASE("BundleTree layout", "[bundle_assembler][bundle_tree]") {
  BundleTree tree;
  tree.root = "/out/WebTvMux.app";

  CHECK(tree.executableDir() == fs::path("/out/WebTvMux.app/Contents/MacOS"));
  CHECK(tree.resourcesDir() == fs::path("/out/WebTvMux.app/Contents/Resources"));
  CHECK(tree.descriptorPath() == fs::path("/out/WebTvMux.app/Contents/Info.plist"));
  CHECK(BundleTree::bundleDirectoryName("WebTvMux") == "WebTvMux.app");
}

TEST_CASE("BundleAssembler creates the tree idempotently", "[bundle_assembler]") {
  const fs::path dir = createTempDir();
  BundleTree tree;
  tree.root = dir / "App.app";
  BundleAssembler assembler(tree);

  SECTION("Fresh tree") {
    REQUIRE(assembler.createTree().isOk());
    CHECK(fs::is_directory(tree.executableDir()));
    CHECK(fs::is_directory(tree.resourcesDir()));
  }

  SECTION("Second call succeeds and keeps content") {
    REQUIRE(assembler.createTree().isOk());
    writeFile(tree.resourcesDir() / "keep.txt", "x");
    REQUIRE(assembler.createTree().isOk());
    CHECK(fs::exists(tree.resourcesDir() / "keep.txt"));
  }

  SECTION("A file in the way is an error") {
    writeFile(tree.executableDir(), "not a directory");
    auto result = assembler.createTree();
    REQUIRE(result.isError());
    CHECK(result.error().find("not a directory") != std::string::npos);
  }

  SECTION("Empty root is an error") {
    BundleAssembler unrooted(BundleTree{});
    CHECK(unrooted.createTree().isError());
  }

  fs::remove_all(dir);
}

TEST_CASE("BundleAssembler copies the artifact directory", "[bundle_assembler]") {
  const fs::path dir = createTempDir();
  const fs::path artifact = dir / "build" / "App";
  writeFile(artifact / "App", "binary");
  writeFile(artifact / "lib" / "libcore.dylib", "library");
  fs::create_symlink("libcore.dylib", artifact / "lib" / "libcore.1.dylib");

  BundleTree tree;
  tree.root = dir / "App.app";
  BundleAssembler assembler(tree);
  REQUIRE(assembler.createTree().isOk());

  SECTION("All files land in the executable area") {
    auto copied = assembler.copyExecutable(artifact);
    REQUIRE(copied.isOk());
    CHECK(copied.value() == 3);
    CHECK(readFile(tree.executableDir() / "App") == "binary");
    CHECK(readFile(tree.executableDir() / "lib" / "libcore.dylib") == "library");
    CHECK(fs::is_symlink(tree.executableDir() / "lib" / "libcore.1.dylib"));
  }

  SECTION("Copying twice overwrites") {
    REQUIRE(assembler.copyExecutable(artifact).isOk());
    writeFile(artifact / "App", "binary v2");
    REQUIRE(assembler.copyExecutable(artifact).isOk());
    CHECK(readFile(tree.executableDir() / "App") == "binary v2");
  }

  SECTION("Missing artifact is fatal") {
    CHECK(assembler.copyExecutable(dir / "nowhere").isError());
  }

  fs::remove_all(dir);
}

TEST_CASE("BundleAssembler copies resources", "[bundle_assembler]") {
  const fs::path dir = createTempDir();
  writeFile(dir / "src" / "settings.json", "{\"a\":1}");
  writeFile(dir / "src" / "ffmpeg", "ff");
  fs::create_symlink("ffmpeg", dir / "src" / "ffmpeg-link");
  fs::create_directories(dir / "src" / "empty");

  BundleTree tree;
  tree.root = dir / "App.app";
  BundleAssembler assembler(tree);
  REQUIRE(assembler.createTree().isOk());

  std::vector<ResourceEntry> entries = {
      {dir / "src" / "settings.json", "config/settings.json", ResourceKind::File},
      {dir / "src" / "ffmpeg", "bin/ffmpeg", ResourceKind::File},
      {dir / "src" / "ffmpeg-link", "bin/ffmpeg-link", ResourceKind::File},
      {dir / "src" / "empty", "cache", ResourceKind::Directory},
  };

  SECTION("Every entry is copied to its destination") {
    auto report = assembler.copyResources(entries);
    CHECK(report.copiedCount == 4);
    CHECK(report.failedCount == 0);
    CHECK(readFile(tree.resourcesDir() / "config" / "settings.json") == "{\"a\":1}");
    CHECK(readFile(tree.resourcesDir() / "bin" / "ffmpeg") == "ff");
    CHECK(fs::is_symlink(tree.resourcesDir() / "bin" / "ffmpeg-link"));
    CHECK(fs::read_symlink(tree.resourcesDir() / "bin" / "ffmpeg-link") == fs::path("ffmpeg"));
    CHECK(fs::is_directory(tree.resourcesDir() / "cache"));
  }

  SECTION("Existing files are overwritten") {
    writeFile(tree.resourcesDir() / "config" / "settings.json", "stale");
    auto report = assembler.copyResources(entries);
    CHECK(report.failedCount == 0);
    CHECK(readFile(tree.resourcesDir() / "config" / "settings.json") == "{\"a\":1}");
  }

  SECTION("One bad entry does not stop the others") {
    std::vector<ResourceEntry> mixed = {
        {dir / "src" / "missing.json", "config/missing.json", ResourceKind::File},
        {dir / "src" / "settings.json", "config/settings.json", ResourceKind::File},
    };
    auto report = assembler.copyResources(mixed);
    CHECK(report.failedCount == 1);
    CHECK(report.copiedCount == 1);
    CHECK(report.failures.size() == 1);
    CHECK(fs::exists(tree.resourcesDir() / "config" / "settings.json"));
  }

  fs::remove_all(dir);
}

TEST_CASE("BundleAssembler copies the icon", "[bundle_assembler][icon]") {
  const fs::path dir = createTempDir();
  writeFile(dir / "icon.icns", "icns");

  BundleTree tree;
  tree.root = dir / "App.app";
  BundleAssembler assembler(tree);
  REQUIRE(assembler.createTree().isOk());

  REQUIRE(assembler.copyIcon(dir / "icon.icns").isOk());
  CHECK(readFile(tree.resourcesDir() / "icon.icns") == "icns");
  CHECK(assembler.copyIcon(dir / "missing.icns").isError());

  fs::remove_all(dir);
}
