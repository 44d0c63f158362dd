#include <catch2/catch_test_macros.hpp>
#include "Packwright/pipeline/pipeline_config.hpp"

#include <filesystem>

using namespace Packwright;
using namespace Packwright::pipeline;
namespace fs = std::filesystem;

static PipelineConfig validConfig() {
  PipelineConfig config;
  config.appName = "WebTvMux";
  config.identifier = "com.webtvmux.app";
  config.projectRoot = "/work/webtvmux";
  config.artifactDir = "build/WebTvMux";
  return config;
}

static bool errorMentions(const Result<void>& result, const std::string& text) {
  return result.isError() && result.error().find(text) != std::string::npos;
}

TEST_CASE("PipelineConfig defaults", "[pipeline_config]") {
  PipelineConfig config;

  CHECK(config.version == "1.0.0");
  CHECK(config.outputDir == fs::path("dist"));
  CHECK(config.helperDirectories == std::vector<std::string>{"bin"});
  CHECK(config.permissionBits == bundle::kDefaultHelperPermissions);
  CHECK(config.postProcessingEnv == "PACKWRIGHT_NESTED_BUILD");
  CHECK_FALSE(config.signing.enabled);
  CHECK(config.signing.identity == "-");
  CHECK(config.image.enabled);
  CHECK(config.image.format == "UDZO");
  CHECK(config.image.writeChecksum);
  CHECK(config.readiness.maxAttempts == 30);
  CHECK(config.readiness.intervalMs == 1000);
}

TEST_CASE("validateConfig accepts a complete configuration", "[pipeline_config]") {
  CHECK(validateConfig(validConfig()).isOk());
}

TEST_CASE("validateConfig rejects incomplete configurations", "[pipeline_config]") {
  auto config = validConfig();

  SECTION("Missing application name") {
    config.appName.clear();
    CHECK(errorMentions(validateConfig(config), "Application name"));
  }

  SECTION("Application name with a separator") {
    config.appName = "Web/TvMux";
    CHECK(errorMentions(validateConfig(config), "not a valid file name"));
  }

  SECTION("Dot names") {
    config.appName = "..";
    CHECK(validateConfig(config).isError());
  }

  SECTION("Missing identifier") {
    config.identifier.clear();
    CHECK(errorMentions(validateConfig(config), "identifier"));
  }

  SECTION("Missing version") {
    config.version.clear();
    CHECK(errorMentions(validateConfig(config), "version"));
  }

  SECTION("Missing artifact directory") {
    config.artifactDir.clear();
    CHECK(errorMentions(validateConfig(config), "Artifact directory"));
  }

  SECTION("Missing output directory") {
    config.outputDir.clear();
    CHECK(errorMentions(validateConfig(config), "Output directory"));
  }

  SECTION("Zero readiness attempts") {
    config.readiness.maxAttempts = 0;
    CHECK(errorMentions(validateConfig(config), "maxAttempts"));
  }

  SECTION("Unknown image format") {
    config.image.format = "ZIP";
    CHECK(errorMentions(validateConfig(config), "Unsupported image format 'ZIP'"));
  }

  SECTION("Unknown image format is ignored when imaging is off") {
    config.image.format = "ZIP";
    config.image.enabled = false;
    CHECK(validateConfig(config).isOk());
  }

  SECTION("Signing without identity") {
    config.signing.enabled = true;
    config.signing.identity.clear();
    CHECK(errorMentions(validateConfig(config), "signing identity"));
  }

  SECTION("Absolute helper directory") {
    config.helperDirectories = {"/usr/bin"};
    CHECK(errorMentions(validateConfig(config), "Helper directory"));
  }

  SECTION("Staging equal to output") {
    config.stagingDir = "dist";
    CHECK(errorMentions(validateConfig(config), "Staging directory"));
  }

  SECTION("Staging equal to project root") {
    config.stagingDir = ".";
    CHECK(errorMentions(validateConfig(config), "Staging directory"));
  }
}

TEST_CASE("validateConfig rejects overlapping directories", "[pipeline_config][layout]") {
  auto config = validConfig();

  SECTION("Staging above the project root") {
    config.stagingDir = "..";
    CHECK(errorMentions(validateConfig(config), "would remove the project root"));
  }

  SECTION("Staging above the output directory") {
    config.outputDir = "release/dist";
    config.stagingDir = "release";
    CHECK(errorMentions(validateConfig(config), "would remove the output directory"));
  }

  SECTION("Staging above the artifact directory") {
    config.stagingDir = "build";
    CHECK(errorMentions(validateConfig(config), "would remove the artifact directory"));
  }

  SECTION("Staging above a resource source") {
    config.stagingDir = "/shared";
    config.resources = {{"/shared/helpers/*", "bin"}};
    CHECK(errorMentions(validateConfig(config), "would remove the resource source"));
  }

  SECTION("Artifact directory equal to the output") {
    config.artifactDir = "dist";
    CHECK(errorMentions(validateConfig(config), "contains the staging directory"));
  }

  SECTION("Artifact directory containing a separate staging root") {
    config.artifactDir = ".";
    config.stagingDir = "/tmp/pw-stage";
    CHECK(errorMentions(validateConfig(config), "contains the output directory"));
  }

  SECTION("Artifact directory inside the published bundle") {
    config.artifactDir = "dist/WebTvMux.app/Contents/MacOS";
    CHECK(errorMentions(validateConfig(config), "inside the published bundle"));
  }

  SECTION("Default layout and a staging root beside the output") {
    CHECK(validateConfig(config).isOk());
    config.stagingDir = "tmp/stage";
    config.resources = {{"bin/*", "bin"}, {"config", "config"}};
    CHECK(validateConfig(config).isOk());
  }
}

TEST_CASE("resourceRoot drops a trailing glob", "[pipeline_config][layout]") {
  const auto config = validConfig();
  CHECK(resourceRoot(config, {"bin/*", "bin"}) == fs::path("/work/webtvmux/bin"));
  CHECK(resourceRoot(config, {"config", "config"}) == fs::path("/work/webtvmux/config"));
  CHECK(resourceRoot(config, {"/opt/tools/x?", ""}) == fs::path("/opt/tools"));
}

TEST_CASE("Permission bits parse from octal text", "[pipeline_config][permissions]") {
  SECTION("Valid forms") {
    auto bits = parsePermissionBits("0755");
    REQUIRE(bits.isOk());
    CHECK(bits.value() == bundle::kDefaultHelperPermissions);

    auto shortForm = parsePermissionBits(" 750 ");
    REQUIRE(shortForm.isOk());
    CHECK(formatPermissionBits(shortForm.value()) == "0750");
  }

  SECTION("Invalid forms") {
    CHECK(parsePermissionBits("").isError());
    CHECK(parsePermissionBits("0859").isError());
    CHECK(parsePermissionBits("rwx").isError());
    CHECK(parsePermissionBits("17777").isError());
  }

  SECTION("Formatting") {
    CHECK(formatPermissionBits(fs::perms::owner_all) == "0700");
    CHECK(formatPermissionBits(bundle::kDefaultHelperPermissions) == "0755");
    CHECK(formatPermissionBits(fs::perms::none) == "0000");
  }
}

TEST_CASE("Image formats", "[pipeline_config][image]") {
  CHECK(isSupportedImageFormat("UDZO"));
  CHECK(isSupportedImageFormat("UDBZ"));
  CHECK(isSupportedImageFormat("UDRW"));
  CHECK_FALSE(isSupportedImageFormat("udzo"));
  CHECK_FALSE(isSupportedImageFormat(""));
}

TEST_CASE("Paths resolve against the project root", "[pipeline_config][paths]") {
  auto config = validConfig();

  CHECK(resolvedProjectRoot(config) == fs::path("/work/webtvmux"));
  CHECK(resolvedOutputDir(config) == fs::path("/work/webtvmux/dist"));
  CHECK(resolvedStagingDir(config) == fs::path("/work/webtvmux/dist/.staging"));
  CHECK(resolvedArtifactDir(config) == fs::path("/work/webtvmux/build/WebTvMux"));
  CHECK(resolvePath(config, "/opt/out/../release") == fs::path("/opt/release"));

  CHECK(bundleDirectoryName(config) == "WebTvMux.app");
  CHECK(publishedBundlePath(config) == fs::path("/work/webtvmux/dist/WebTvMux.app"));
  CHECK(stagedBundlePath(config) == fs::path("/work/webtvmux/dist/.staging/WebTvMux.app"));
  CHECK(diskImagePath(config) == fs::path("/work/webtvmux/dist/WebTvMux.dmg"));
  CHECK(checksumPath(config) == fs::path("/work/webtvmux/dist/WebTvMux.dmg.sha256"));

  SECTION("Trailing separators on the root are ignored") {
    config.projectRoot = "/work/webtvmux/";
    CHECK(resolvedProjectRoot(config) == fs::path("/work/webtvmux"));
  }

  SECTION("Explicit staging directory") {
    config.stagingDir = "/tmp/pw-stage";
    CHECK(stagedBundlePath(config) == fs::path("/tmp/pw-stage/WebTvMux.app"));
  }
}

TEST_CASE("Effective names fall back to the application name", "[pipeline_config]") {
  auto config = validConfig();
  config.version = "2.1.0";

  CHECK(effectiveShortVersion(config) == "2.1.0");
  CHECK(effectiveExecutableName(config) == "WebTvMux");
  CHECK(effectiveVolumeName(config) == "WebTvMux");

  config.shortVersion = "2.1";
  config.executableName = "webtvmux-bin";
  config.image.volumeName = "WebTvMux Installer";

  CHECK(effectiveShortVersion(config) == "2.1");
  CHECK(effectiveExecutableName(config) == "webtvmux-bin");
  CHECK(effectiveVolumeName(config) == "WebTvMux Installer");
}
