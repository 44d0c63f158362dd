#pragma once

/**
 * @file bundle_assembler.hpp
 * @brief Creates the bundle tree and copies the artifact and resources into it
 */

#include "Packwright/bundle/bundle_tree.hpp"
#include "Packwright/bundle/resource_collector.hpp"
#include "Packwright/core/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace Packwright::bundle {

/**
 * @brief Per-entry outcome of a resource copy pass
 */
struct AssemblyReport {
  u32 copiedCount = 0;
  u32 failedCount = 0;
  std::vector<std::string> failures;
};

class BundleAssembler {
public:
  explicit BundleAssembler(BundleTree tree);

  /**
   * @brief Create the executable and resources areas
   *
   * Existing directories are reused. A non-directory sitting at either path
   * is an error.
   */
  [[nodiscard]] Result<void> createTree() const;

  /**
   * @brief Copy the whole artifact output directory into the executable area
   * @return Number of files copied
   */
  [[nodiscard]] Result<u32> copyExecutable(const std::filesystem::path& artifactDir) const;

  /**
   * @brief Copy every entry to resourcesDir()/destinationRelativePath
   *
   * Intermediate directories are created, existing files overwritten and
   * symlinks recreated as symlinks. One failing entry never stops the pass.
   */
  [[nodiscard]] AssemblyReport copyResources(const std::vector<ResourceEntry>& entries) const;

  /**
   * @brief Copy an icon file into the resources area under its own name
   */
  [[nodiscard]] Result<void> copyIcon(const std::filesystem::path& iconPath) const;

  [[nodiscard]] const BundleTree& getTree() const { return m_tree; }

private:
  [[nodiscard]] Result<void> copyEntry(const ResourceEntry& entry) const;

  BundleTree m_tree;
};

} // namespace Packwright::bundle
