/**
 * @file pipeline_config.cpp
 * @brief Configuration validation and path resolution
 */

#include "Packwright/pipeline/pipeline_config.hpp"
#include "Packwright/bundle/bundle_tree.hpp"
#include "Packwright/bundle/recursion_guard.hpp"
#include "Packwright/core/string_utils.hpp"

#include <algorithm>
#include <utility>

namespace fs = std::filesystem;

namespace Packwright::pipeline {

namespace {

// "dir/." normalizes to "dir/"; drop the trailing separator
fs::path withoutTrailingSeparator(fs::path path) {
  if (!path.has_filename() && path.has_relative_path()) {
    path = path.parent_path();
  }
  return path;
}

const std::vector<std::string>& supportedImageFormats() {
  static const std::vector<std::string> formats = {"UDZO", "UDBZ", "ULFO", "ULMO", "UDRO", "UDRW"};
  return formats;
}

} // namespace

bool isSupportedImageFormat(const std::string& format) {
  const auto& formats = supportedImageFormats();
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

Result<void> validateConfig(const PipelineConfig& config) {
  if (config.appName.empty()) {
    return Result<void>::error("Application name is required");
  }
  if (config.appName.find('/') != std::string::npos || config.appName == "." ||
      config.appName == "..") {
    return Result<void>::error("Application name is not a valid file name: " + config.appName);
  }
  if (config.identifier.empty()) {
    return Result<void>::error("Bundle identifier is required");
  }
  if (config.version.empty()) {
    return Result<void>::error("Bundle version is required");
  }
  if (config.artifactDir.empty()) {
    return Result<void>::error("Artifact directory is required");
  }
  if (config.outputDir.empty()) {
    return Result<void>::error("Output directory is required");
  }
  if (config.readiness.maxAttempts == 0) {
    return Result<void>::error("Readiness maxAttempts must be at least 1");
  }
  if (config.image.enabled && !isSupportedImageFormat(config.image.format)) {
    std::string allowed;
    for (const auto& format : supportedImageFormats()) {
      if (!allowed.empty()) {
        allowed += ", ";
      }
      allowed += format;
    }
    return Result<void>::error("Unsupported image format '" + config.image.format +
                               "'. Supported formats: " + allowed);
  }
  if (config.signing.enabled && config.signing.identity.empty()) {
    return Result<void>::error("Signing is enabled but no signing identity is set");
  }

  for (const auto& helper : config.helperDirectories) {
    if (helper.empty() || fs::path(helper).is_absolute()) {
      return Result<void>::error("Helper directory must be relative to the resources area: '" +
                                 helper + "'");
    }
  }

  return validateLayout(config);
}

Result<void> validateLayout(const PipelineConfig& config) {
  using bundle::RecursionGuard;

  const fs::path staging = resolvedStagingDir(config);
  const fs::path output = resolvedOutputDir(config);
  const fs::path artifact = resolvedArtifactDir(config);

  // The staging root is removed recursively before and after every run
  const std::pair<const char*, fs::path> kept[] = {
      {"project root", resolvedProjectRoot(config)},
      {"output directory", output},
      {"artifact directory", artifact},
  };
  for (const auto& [label, path] : kept) {
    if (RecursionGuard::isWithin(path, staging)) {
      return Result<void>::error("Staging directory " + staging.string() + " would remove the " +
                                 label + " " + path.string());
    }
  }
  for (const auto& mapping : config.resources) {
    const fs::path root = resourceRoot(config, mapping);
    if (RecursionGuard::isWithin(root, staging)) {
      return Result<void>::error("Staging directory " + staging.string() +
                                 " would remove the resource source " + root.string());
    }
  }

  // The artifact directory is copied recursively into the staged bundle
  if (RecursionGuard::isWithin(staging, artifact)) {
    return Result<void>::error("Artifact directory " + artifact.string() +
                               " contains the staging directory " + staging.string());
  }
  if (RecursionGuard::isWithin(output, artifact)) {
    return Result<void>::error("Artifact directory " + artifact.string() +
                               " contains the output directory " + output.string());
  }
  if (RecursionGuard::isWithin(artifact, publishedBundlePath(config))) {
    return Result<void>::error("Artifact directory " + artifact.string() +
                               " lies inside the published bundle");
  }

  return Result<void>::ok();
}

fs::path resourceRoot(const PipelineConfig& config, const bundle::ResourceMapping& mapping) {
  const fs::path source = resolvePath(config, mapping.source);
  if (bundle::ResourceCollector::isGlobPattern(source.filename().string())) {
    return source.parent_path();
  }
  return source;
}

Result<fs::perms> parsePermissionBits(const std::string& text) {
  const std::string trimmed = core::trim(text);
  if (trimmed.empty() || trimmed.size() > 5) {
    return Result<fs::perms>::error("Invalid permission bits: '" + text + "'");
  }

  unsigned value = 0;
  for (char c : trimmed) {
    if (c < '0' || c > '7') {
      return Result<fs::perms>::error("Permission bits must be octal digits: '" + text + "'");
    }
    value = value * 8 + static_cast<unsigned>(c - '0');
  }

  if (value > 07777) {
    return Result<fs::perms>::error("Permission bits out of range: '" + text + "'");
  }
  return Result<fs::perms>::ok(static_cast<fs::perms>(value));
}

std::string formatPermissionBits(fs::perms bits) {
  const unsigned value = static_cast<unsigned>(bits) & 07777;
  std::string result(4, '0');
  unsigned remaining = value;
  for (int i = 3; i >= 0; --i) {
    result[static_cast<usize>(i)] = static_cast<char>('0' + (remaining & 7));
    remaining >>= 3;
  }
  return result;
}

fs::path resolvedProjectRoot(const PipelineConfig& config) {
  std::error_code ec;
  fs::path root = fs::absolute(config.projectRoot, ec);
  return withoutTrailingSeparator(ec ? config.projectRoot.lexically_normal()
                                     : root.lexically_normal());
}

fs::path resolvePath(const PipelineConfig& config, const fs::path& path) {
  if (path.is_absolute()) {
    return withoutTrailingSeparator(path.lexically_normal());
  }
  return withoutTrailingSeparator((resolvedProjectRoot(config) / path).lexically_normal());
}

fs::path resolvedOutputDir(const PipelineConfig& config) {
  return resolvePath(config, config.outputDir);
}

fs::path resolvedStagingDir(const PipelineConfig& config) {
  if (config.stagingDir.empty()) {
    return resolvedOutputDir(config) / kDefaultStagingDirName;
  }
  return resolvePath(config, config.stagingDir);
}

fs::path resolvedArtifactDir(const PipelineConfig& config) {
  return resolvePath(config, config.artifactDir);
}

std::string bundleDirectoryName(const PipelineConfig& config) {
  return bundle::BundleTree::bundleDirectoryName(config.appName);
}

fs::path publishedBundlePath(const PipelineConfig& config) {
  return resolvedOutputDir(config) / bundleDirectoryName(config);
}

fs::path stagedBundlePath(const PipelineConfig& config) {
  return resolvedStagingDir(config) / bundleDirectoryName(config);
}

fs::path diskImagePath(const PipelineConfig& config) {
  return resolvedOutputDir(config) / (config.appName + ".dmg");
}

fs::path checksumPath(const PipelineConfig& config) {
  return resolvedOutputDir(config) / (config.appName + ".dmg.sha256");
}

std::string effectiveShortVersion(const PipelineConfig& config) {
  return config.shortVersion.empty() ? config.version : config.shortVersion;
}

std::string effectiveExecutableName(const PipelineConfig& config) {
  return config.executableName.empty() ? config.appName : config.executableName;
}

std::string effectiveVolumeName(const PipelineConfig& config) {
  return config.image.volumeName.empty() ? config.appName : config.image.volumeName;
}

} // namespace Packwright::pipeline
