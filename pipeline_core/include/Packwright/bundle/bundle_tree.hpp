#pragma once

/**
 * @file bundle_tree.hpp
 * @brief Directory layout of an application bundle
 *
 * @code
 * <Name>.app/
 *   Contents/
 *     Info.plist      descriptor
 *     MacOS/          executable area
 *     Resources/      resources area
 * @endcode
 */

#include <filesystem>
#include <string>

namespace Packwright::bundle {

struct BundleTree {
  std::filesystem::path root;
  std::filesystem::path executableSubpath = "Contents/MacOS";
  std::filesystem::path resourcesSubpath = "Contents/Resources";
  std::filesystem::path descriptorSubpath = "Contents/Info.plist";

  [[nodiscard]] std::filesystem::path executableDir() const { return root / executableSubpath; }
  [[nodiscard]] std::filesystem::path resourcesDir() const { return root / resourcesSubpath; }
  [[nodiscard]] std::filesystem::path descriptorPath() const { return root / descriptorSubpath; }

  /**
   * @brief "<appName>.app"
   */
  [[nodiscard]] static std::string bundleDirectoryName(const std::string& appName) {
    return appName + ".app";
  }
};

} // namespace Packwright::bundle
