#pragma once

/**
 * @file permission_normalizer.hpp
 * @brief Marks bundled helper binaries executable
 */

#include "Packwright/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace Packwright::bundle {

constexpr std::filesystem::perms kDefaultHelperPermissions =
    std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
    std::filesystem::perms::group_exec | std::filesystem::perms::others_read |
    std::filesystem::perms::others_exec;

struct NormalizeReport {
  u32 filesUpdated = 0;
  u32 entriesSkipped = 0; // Directories, symlinks and special files
  std::vector<std::string> failures;
};

class PermissionNormalizer {
public:
  explicit PermissionNormalizer(std::filesystem::perms bits = kDefaultHelperPermissions);

  /**
   * @brief Add the configured bits to every regular file below each directory
   *
   * Directories that do not exist are ignored. Symlinks are never followed
   * or changed.
   */
  [[nodiscard]] NormalizeReport
  normalize(const std::vector<std::filesystem::path>& directories) const;

  [[nodiscard]] std::filesystem::perms getBits() const { return m_bits; }

private:
  void normalizeDirectory(const std::filesystem::path& directory, NormalizeReport& report) const;

  std::filesystem::perms m_bits;
};

} // namespace Packwright::bundle
