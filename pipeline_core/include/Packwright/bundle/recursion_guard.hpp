#pragma once

/**
 * @file recursion_guard.hpp
 * @brief Filters collected resources that would copy the bundle into itself
 *
 * A previous run leaves <Name>.app (and the disk image built from it) in the
 * output directory. When a resource root overlaps that directory, the stale
 * bundle would be copied into the new one, growing every rebuild. The guard
 * drops such entries before anything is copied.
 */

#include "Packwright/bundle/resource_collector.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace Packwright::bundle {

/**
 * @brief Locations the pipeline itself writes to
 */
struct RecursionRoots {
  std::filesystem::path publishedBundle; // <output>/<Name>.app
  std::filesystem::path stagingRoot;     // Where the new bundle is assembled
  std::string bundleName;                // "<Name>.app"
  std::vector<std::filesystem::path> ownArtifacts; // Disk image, checksum file
};

struct GuardResult {
  std::vector<ResourceEntry> entries;
  u32 rejectedCount = 0;
};

class RecursionGuard {
public:
  explicit RecursionGuard(RecursionRoots roots);

  /**
   * @brief Drop every entry that points into the pipeline's own output
   *
   * Rejected entries are logged at debug level; the relative order of the
   * surviving entries is kept.
   */
  [[nodiscard]] GuardResult filter(const std::vector<ResourceEntry>& entries) const;

  [[nodiscard]] bool isHazard(const ResourceEntry& entry) const;

  /**
   * @brief True when path equals root or lies below it (after normalization)
   *
   * The root is fully resolved. For the path only the parent directories are
   * resolved, so a symlink is judged by where it sits, not where it points.
   */
  [[nodiscard]] static bool isWithin(const std::filesystem::path& path,
                                     const std::filesystem::path& root);

  [[nodiscard]] const RecursionRoots& getRoots() const { return m_roots; }

private:
  RecursionRoots m_roots;
};

} // namespace Packwright::bundle
