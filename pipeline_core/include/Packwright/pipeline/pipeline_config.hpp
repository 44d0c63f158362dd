#pragma once

/**
 * @file pipeline_config.hpp
 * @brief Configuration of one packaging run
 *
 * Relative paths are resolved against projectRoot. Empty optional fields fall
 * back to values derived from the application name (see the effective*()
 * helpers).
 */

#include "Packwright/bundle/descriptor.hpp"
#include "Packwright/bundle/permission_normalizer.hpp"
#include "Packwright/bundle/resource_collector.hpp"
#include "Packwright/core/result.hpp"
#include "Packwright/core/types.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace Packwright::pipeline {

constexpr const char* kDefaultPostProcessingEnv = "PACKWRIGHT_NESTED_BUILD";
constexpr const char* kDefaultStagingDirName = ".staging";

struct SigningConfig {
  bool enabled = false;
  std::string identity = "-"; // "-" is an ad-hoc signature
  std::string entitlements;   // Optional entitlements plist
  bool hardenedRuntime = false;
  std::string toolPath; // Empty: environment override, then PATH
};

struct ImageConfig {
  bool enabled = true;
  std::string format = "UDZO";
  std::string volumeName; // Empty: application name
  std::string toolPath;
  bool writeChecksum = true;
};

struct ReadinessConfig {
  u32 maxAttempts = 30;
  u32 intervalMs = 1000;
  u32 deadlineMs = 0; // 0: bounded by maxAttempts only
};

/**
 * @brief Everything a packaging run needs to know
 */
struct PipelineConfig {
  // Application identity
  std::string appName;
  std::string identifier;
  std::string version = "1.0.0";
  std::string shortVersion;   // Empty: same as version
  std::string executableName; // Empty: same as appName
  std::string minimumSystemVersion = "10.14";
  bool highResolutionCapable = true;
  std::string iconPath; // Optional .icns copied into the resources area

  // Additional descriptor keys, in declaration order
  std::vector<std::pair<std::string, bundle::DescriptorValue>> extraDescriptorKeys;

  // Locations
  std::filesystem::path projectRoot = ".";
  std::filesystem::path outputDir = "dist";
  std::filesystem::path stagingDir; // Empty: <outputDir>/.staging
  std::filesystem::path artifactDir;

  // Resources
  std::vector<bundle::ResourceMapping> resources;
  std::vector<std::string> excludedResourceNames;
  std::vector<std::string> helperDirectories = {"bin"};
  std::filesystem::perms permissionBits = bundle::kDefaultHelperPermissions;

  // Post-processing
  SigningConfig signing;
  ImageConfig image;
  ReadinessConfig readiness;
  std::string postProcessingEnv = kDefaultPostProcessingEnv;
};

/**
 * @brief Reject configurations that cannot produce a bundle
 */
[[nodiscard]] Result<void> validateConfig(const PipelineConfig& config);

/**
 * @brief Reject directory layouts where one run would damage its own inputs
 *
 * The staging root may not contain the project root, the output or artifact
 * directory, or any resource source, since it is removed recursively. The
 * artifact directory may not contain the staging root or the output
 * directory, nor lie inside the published bundle, since it is copied into
 * the bundle. Called by validateConfig.
 */
[[nodiscard]] Result<void> validateLayout(const PipelineConfig& config);

/// Directory or file a mapping reads from, with a trailing glob removed
[[nodiscard]] std::filesystem::path resourceRoot(const PipelineConfig& config,
                                                 const bundle::ResourceMapping& mapping);

/**
 * @brief Parse an octal mode string such as "0755" or "755"
 */
[[nodiscard]] Result<std::filesystem::perms> parsePermissionBits(const std::string& text);

/**
 * @brief Render permission bits as a four-digit octal string
 */
[[nodiscard]] std::string formatPermissionBits(std::filesystem::perms bits);

[[nodiscard]] bool isSupportedImageFormat(const std::string& format);

// Path and name resolution

[[nodiscard]] std::filesystem::path resolvePath(const PipelineConfig& config,
                                                const std::filesystem::path& path);
[[nodiscard]] std::filesystem::path resolvedProjectRoot(const PipelineConfig& config);
[[nodiscard]] std::filesystem::path resolvedOutputDir(const PipelineConfig& config);
[[nodiscard]] std::filesystem::path resolvedStagingDir(const PipelineConfig& config);
[[nodiscard]] std::filesystem::path resolvedArtifactDir(const PipelineConfig& config);

[[nodiscard]] std::string bundleDirectoryName(const PipelineConfig& config);
[[nodiscard]] std::filesystem::path publishedBundlePath(const PipelineConfig& config);
[[nodiscard]] std::filesystem::path stagedBundlePath(const PipelineConfig& config);
[[nodiscard]] std::filesystem::path diskImagePath(const PipelineConfig& config);
[[nodiscard]] std::filesystem::path checksumPath(const PipelineConfig& config);

[[nodiscard]] std::string effectiveShortVersion(const PipelineConfig& config);
[[nodiscard]] std::string effectiveExecutableName(const PipelineConfig& config);
[[nodiscard]] std::string effectiveVolumeName(const PipelineConfig& config);

} // namespace Packwright::pipeline
