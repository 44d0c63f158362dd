/**
 * @file test_pipeline_recovery.cpp
 * @brief Integration tests for failing and degraded packaging runs
 *
 * Fatal failures must leave the output as it was and clean the staging root.
 * Failures of the optional tools only produce warnings.
 */

#include <catch2/catch_test_macros.hpp>
#include "Packwright/core/clock.hpp"
#include "Packwright/pipeline/orchestrator.hpp"
#include "Packwright/platform/mock_process_runner.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace Packwright;
using namespace Packwright::pipeline;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

fs::path createTempDir() {
  static int counter = 0;
  fs::path tempPath =
      fs::temp_directory_path() /
      ("pw_recovery_test_" +
       std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
       std::to_string(counter++));
  fs::create_directories(tempPath);
  return tempPath;
}

void writeFile(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream(path, std::ios::binary) << content;
}

std::string readFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

PipelineConfig baseConfig(const fs::path& root) {
  PipelineConfig config;
  config.appName = "WebTvMux";
  config.identifier = "com.webtvmux.app";
  config.projectRoot = root;
  config.artifactDir = "build/WebTvMux";
  config.resources = {{"bin/*", "bin"}};
  config.readiness.maxAttempts = 4;
  config.readiness.intervalMs = 250;
  return config;
}

} // namespace

TEST_CASE("Artifact that never appears aborts the run", "[integration][recovery][timeout]") {
  ::unsetenv(kDefaultPostProcessingEnv);
  const fs::path root = createTempDir();
  writeFile(root / "bin" / "tool-a", "a");

  core::MockClock clock;
  platform::MockProcessRunner runner;
  Orchestrator orchestrator(baseConfig(root), clock, runner);

  auto report = orchestrator.run();

  CHECK_FALSE(report.success);
  CHECK(report.exitCode == ExitCode::PipelineFailure);
  CHECK(report.errorMessage.find("not ready after 4 attempts") != std::string::npos);
  CHECK(report.finalState.readiness.state == PollerState::TimedOut);
  CHECK(clock.getTotalSlept() == 750ms);

  SECTION("Later stages never ran") {
    REQUIRE(report.findStage(StageNames::kWait) != nullptr);
    CHECK_FALSE(report.findStage(StageNames::kWait)->success);
    CHECK(report.findStage(StageNames::kAssemble) == nullptr);
    CHECK(report.findStage(StageNames::kPublish) == nullptr);
    CHECK(runner.getInvocationCount() == 0);
  }

  SECTION("Nothing is left behind") {
    CHECK_FALSE(fs::exists(root / "dist" / "WebTvMux.app"));
    CHECK_FALSE(fs::exists(root / "dist" / ".staging"));
  }

  fs::remove_all(root);
}

TEST_CASE("Artifact that appears while waiting", "[integration][recovery][timeout]") {
  ::unsetenv(kDefaultPostProcessingEnv);
  const fs::path root = createTempDir();

  // Clock that finishes the build after the second sleep
  class BuildingClock : public core::MockClock {
  public:
    explicit BuildingClock(fs::path executable) : m_executable(std::move(executable)) {}

    void sleepFor(std::chrono::milliseconds duration) override {
      core::MockClock::sleepFor(duration);
      if (getSleepCount() == 2) {
        writeFile(m_executable, "binary");
      }
    }

  private:
    fs::path m_executable;
  };

  BuildingClock clock(root / "build" / "WebTvMux" / "WebTvMux");
  platform::MockProcessRunner runner;
  auto config = baseConfig(root);
  config.image.enabled = false;
  Orchestrator orchestrator(config, clock, runner);

  auto report = orchestrator.run();
  REQUIRE(report.success);
  CHECK(report.finalState.readiness.attempts == 3);
  CHECK(fs::exists(root / "dist" / "WebTvMux.app" / "Contents" / "MacOS" / "WebTvMux"));

  fs::remove_all(root);
}

TEST_CASE("Invalid configuration is reported before any work",
          "[integration][recovery][config]") {
  const fs::path root = createTempDir();
  writeFile(root / "build" / "WebTvMux" / "WebTvMux", "binary");

  auto config = baseConfig(root);
  config.identifier.clear();

  core::MockClock clock;
  platform::MockProcessRunner runner;
  Orchestrator orchestrator(config, clock, runner);
  auto report = orchestrator.run();

  CHECK(report.exitCode == ExitCode::ConfigurationError);
  CHECK(report.stages.empty());
  CHECK_FALSE(fs::exists(root / "dist"));

  fs::remove_all(root);
}

TEST_CASE("Overlapping directories are rejected before anything is removed",
          "[integration][recovery][layout]") {
  ::unsetenv(kDefaultPostProcessingEnv);
  const fs::path parent = createTempDir();
  const fs::path root = parent / "project";
  writeFile(parent / "keep.txt", "keep");
  writeFile(root / "build" / "WebTvMux" / "WebTvMux", "binary");
  writeFile(root / "bin" / "tool-a", "a");

  auto config = baseConfig(root);
  core::MockClock clock;
  platform::MockProcessRunner runner;

  SECTION("Staging root above the project") {
    config.stagingDir = "..";
    Orchestrator orchestrator(config, clock, runner);
    auto report = orchestrator.run();

    CHECK(report.exitCode == ExitCode::ConfigurationError);
    CHECK(report.errorMessage.find("would remove the project root") != std::string::npos);
    CHECK(report.stages.empty());
    CHECK(readFile(parent / "keep.txt") == "keep");
    CHECK(fs::exists(root / "build" / "WebTvMux" / "WebTvMux"));
    CHECK(fs::exists(root / "bin" / "tool-a"));
  }

  SECTION("Artifact directory shared with the output") {
    writeFile(root / "dist" / "WebTvMux", "binary");
    config.artifactDir = "dist";
    Orchestrator orchestrator(config, clock, runner);
    auto report = orchestrator.run();

    CHECK(report.exitCode == ExitCode::ConfigurationError);
    CHECK(report.errorMessage.find("contains the staging directory") != std::string::npos);
    CHECK_FALSE(fs::exists(root / "dist" / ".staging"));
    CHECK_FALSE(fs::exists(root / "dist" / "WebTvMux.app"));
    CHECK(fs::exists(root / "dist" / "WebTvMux"));
  }

  fs::remove_all(parent);
}

TEST_CASE("Missing or failing tools only produce warnings", "[integration][recovery][tools]") {
  ::unsetenv(kDefaultPostProcessingEnv);
  ::unsetenv(kCodesignPathEnv);
  ::unsetenv(kImageToolPathEnv);
  const fs::path root = createTempDir();
  writeFile(root / "build" / "WebTvMux" / "WebTvMux", "binary");
  writeFile(root / "bin" / "tool-a", "a");

  auto config = baseConfig(root);
  config.signing.enabled = true;

  core::MockClock clock;
  platform::MockProcessRunner runner;

  SECTION("Signing tool not installed") {
    Orchestrator orchestrator(config, clock, runner);
    auto report = orchestrator.run();

    REQUIRE(report.success);
    CHECK(report.exitCode == ExitCode::Success);
    CHECK(report.finalState.signing.status == ToolStatus::Skipped);
    CHECK(report.findStage(StageNames::kSign)->skipped);
    CHECK(fs::exists(root / "dist" / "WebTvMux.app"));
    CHECK_FALSE(report.finalState.warnings.empty());
  }

  SECTION("Signing tool rejects the bundle") {
    runner.setProgramPath("codesign", "/usr/bin/codesign");
    runner.setHandler("codesign", [](const platform::ProcessInvocation&) {
      return Result<platform::ProcessResult>::ok(platform::ProcessResult{1, "invalid identity"});
    });
    Orchestrator orchestrator(config, clock, runner);
    auto report = orchestrator.run();

    REQUIRE(report.success);
    CHECK(report.finalState.signing.status == ToolStatus::Failed);
    CHECK(report.finalState.published);
  }

  SECTION("Image tool fails") {
    config.signing.enabled = false;
    runner.setProgramPath("hdiutil", "/usr/bin/hdiutil");
    runner.setDefaultExitCode(1);
    writeFile(root / "dist" / "WebTvMux.dmg.sha256", "stale  WebTvMux.dmg\n");

    Orchestrator orchestrator(config, clock, runner);
    auto report = orchestrator.run();

    REQUIRE(report.success);
    CHECK(report.exitCode == ExitCode::Success);
    CHECK(report.finalState.image.status == ToolStatus::Failed);
    CHECK_FALSE(fs::exists(root / "dist" / "WebTvMux.dmg"));
    // The stale checksum must not survive next to a missing image
    CHECK_FALSE(fs::exists(root / "dist" / "WebTvMux.dmg.sha256"));
    CHECK(fs::exists(root / "dist" / "WebTvMux.app" / "Contents" / "Info.plist"));
  }

  fs::remove_all(root);
}

TEST_CASE("Previous bundle is replaced, not merged", "[integration][recovery][publish]") {
  ::unsetenv(kDefaultPostProcessingEnv);
  const fs::path root = createTempDir();
  writeFile(root / "build" / "WebTvMux" / "WebTvMux", "binary v2");
  writeFile(root / "bin" / "tool-a", "a");

  // Left over from an older release
  const fs::path old = root / "dist" / "WebTvMux.app";
  writeFile(old / "Contents" / "MacOS" / "WebTvMux", "binary v1");
  writeFile(old / "Contents" / "Resources" / "bin" / "removed-tool", "old");

  auto config = baseConfig(root);
  config.image.enabled = false;

  core::MockClock clock;
  platform::MockProcessRunner runner;

  SECTION("Successful run swaps the bundle") {
    Orchestrator orchestrator(config, clock, runner);
    REQUIRE(orchestrator.run().success);
    CHECK(readFile(old / "Contents" / "MacOS" / "WebTvMux") == "binary v2");
    CHECK_FALSE(fs::exists(old / "Contents" / "Resources" / "bin" / "removed-tool"));
    CHECK(fs::exists(old / "Contents" / "Resources" / "bin" / "tool-a"));
  }

  SECTION("Failed run keeps the old bundle") {
    fs::remove(root / "build" / "WebTvMux" / "WebTvMux");
    Orchestrator orchestrator(config, clock, runner);
    auto report = orchestrator.run();

    CHECK(report.exitCode == ExitCode::PipelineFailure);
    CHECK(readFile(old / "Contents" / "MacOS" / "WebTvMux") == "binary v1");
    CHECK_FALSE(fs::exists(root / "dist" / ".staging"));
  }

  fs::remove_all(root);
}
