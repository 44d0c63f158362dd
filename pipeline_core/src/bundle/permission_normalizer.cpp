/**
 * @file permission_normalizer.cpp
 * @brief Permission Normalizer implementation
 */

#include "Packwright/bundle/permission_normalizer.hpp"
#include "Packwright/core/logger.hpp"

namespace fs = std::filesystem;

namespace Packwright::bundle {

PermissionNormalizer::PermissionNormalizer(fs::perms bits) : m_bits(bits) {}

NormalizeReport PermissionNormalizer::normalize(const std::vector<fs::path>& directories) const {
  NormalizeReport report;
  for (const auto& directory : directories) {
    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(directory, ec))) {
      PACKWRIGHT_LOG_DEBUG("No helper directory at ", directory.string());
      continue;
    }
    normalizeDirectory(directory, report);
  }
  return report;
}

void PermissionNormalizer::normalizeDirectory(const fs::path& directory,
                                              NormalizeReport& report) const {
  std::error_code ec;
  fs::recursive_directory_iterator it(directory, ec);
  if (ec) {
    const std::string message = "Cannot walk " + directory.string() + ": " + ec.message();
    PACKWRIGHT_LOG_WARN(message);
    report.failures.push_back(message);
    return;
  }

  for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }

    std::error_code statusEc;
    const fs::file_status status = it->symlink_status(statusEc);
    if (statusEc || !fs::is_regular_file(status)) {
      ++report.entriesSkipped;
      continue;
    }

    std::error_code permEc;
    fs::permissions(it->path(), m_bits, fs::perm_options::add, permEc);
    if (permEc) {
      const std::string message =
          "Cannot set permissions on " + it->path().string() + ": " + permEc.message();
      PACKWRIGHT_LOG_WARN(message);
      report.failures.push_back(message);
      continue;
    }
    ++report.filesUpdated;
  }

  if (ec) {
    const std::string message = "Stopped walking " + directory.string() + ": " + ec.message();
    PACKWRIGHT_LOG_WARN(message);
    report.failures.push_back(message);
  }
}

} // namespace Packwright::bundle
