/**
 * @file bundle_assembler.cpp
 * @brief Bundle Tree Assembler implementation
 */

#include "Packwright/bundle/bundle_assembler.hpp"
#include "Packwright/core/logger.hpp"

namespace fs = std::filesystem;

namespace Packwright::bundle {

namespace {

Result<void> ensureDirectory(const fs::path& dir) {
  std::error_code ec;
  const fs::file_status status = fs::status(dir, ec);
  if (fs::exists(status)) {
    if (!fs::is_directory(status)) {
      return Result<void>::error("Path exists and is not a directory: " + dir.string());
    }
    return Result<void>::ok();
  }

  fs::create_directories(dir, ec);
  if (ec) {
    return Result<void>::error("Failed to create directory " + dir.string() + ": " +
                               ec.message());
  }
  return Result<void>::ok();
}

/// Remove a file or symlink that is about to be replaced
Result<void> clearDestination(const fs::path& destination) {
  std::error_code ec;
  const fs::file_status status = fs::symlink_status(destination, ec);
  if (!fs::exists(status)) {
    return Result<void>::ok();
  }
  if (fs::is_directory(status)) {
    return Result<void>::error("Destination is a directory: " + destination.string());
  }
  fs::remove(destination, ec);
  if (ec) {
    return Result<void>::error("Cannot replace " + destination.string() + ": " + ec.message());
  }
  return Result<void>::ok();
}

} // namespace

BundleAssembler::BundleAssembler(BundleTree tree) : m_tree(std::move(tree)) {}

Result<void> BundleAssembler::createTree() const {
  if (m_tree.root.empty()) {
    return Result<void>::error("Bundle root is not set");
  }

  auto executableResult = ensureDirectory(m_tree.executableDir());
  if (executableResult.isError()) {
    return executableResult;
  }

  auto resourcesResult = ensureDirectory(m_tree.resourcesDir());
  if (resourcesResult.isError()) {
    return resourcesResult;
  }

  PACKWRIGHT_LOG_DEBUG("Bundle tree ready at ", m_tree.root.string());
  return Result<void>::ok();
}

Result<u32> BundleAssembler::copyExecutable(const fs::path& artifactDir) const {
  std::error_code ec;
  if (!fs::is_directory(artifactDir, ec)) {
    return Result<u32>::error("Artifact directory not found: " + artifactDir.string());
  }

  const fs::path target = m_tree.executableDir();
  u32 copied = 0;

  fs::recursive_directory_iterator it(artifactDir, ec);
  if (ec) {
    return Result<u32>::error("Cannot read artifact directory " + artifactDir.string() + ": " +
                              ec.message());
  }

  for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }

    const fs::path destination = target / it->path().lexically_relative(artifactDir);
    const fs::file_status status = it->symlink_status(ec);
    if (ec) {
      return Result<u32>::error("Cannot stat " + it->path().string() + ": " + ec.message());
    }

    if (fs::is_directory(status)) {
      auto dirResult = ensureDirectory(destination);
      if (dirResult.isError()) {
        return Result<u32>::error(dirResult.error());
      }
      continue;
    }

    auto clearResult = clearDestination(destination);
    if (clearResult.isError()) {
      return Result<u32>::error(clearResult.error());
    }

    if (fs::is_symlink(status)) {
      fs::copy_symlink(it->path(), destination, ec);
    } else {
      fs::copy_file(it->path(), destination, fs::copy_options::overwrite_existing, ec);
    }
    if (ec) {
      return Result<u32>::error("Failed to copy " + it->path().string() + ": " + ec.message());
    }
    ++copied;
  }

  if (ec) {
    return Result<u32>::error("Failed to walk artifact directory " + artifactDir.string() + ": " +
                              ec.message());
  }

  PACKWRIGHT_LOG_DEBUG("Copied ", copied, " artifact files into ", target.string());
  return Result<u32>::ok(copied);
}

Result<void> BundleAssembler::copyEntry(const ResourceEntry& entry) const {
  const fs::path destination = m_tree.resourcesDir() / entry.destinationRelativePath;

  if (entry.kind == ResourceKind::Directory) {
    return ensureDirectory(destination);
  }

  auto parentResult = ensureDirectory(destination.parent_path());
  if (parentResult.isError()) {
    return parentResult;
  }

  auto clearResult = clearDestination(destination);
  if (clearResult.isError()) {
    return clearResult;
  }

  std::error_code ec;
  if (fs::is_symlink(fs::symlink_status(entry.sourcePath, ec))) {
    fs::copy_symlink(entry.sourcePath, destination, ec);
  } else {
    fs::copy_file(entry.sourcePath, destination, fs::copy_options::overwrite_existing, ec);
  }
  if (ec) {
    return Result<void>::error("Failed to copy " + entry.sourcePath.string() + ": " +
                               ec.message());
  }
  return Result<void>::ok();
}

AssemblyReport BundleAssembler::copyResources(const std::vector<ResourceEntry>& entries) const {
  AssemblyReport report;
  for (const auto& entry : entries) {
    auto result = copyEntry(entry);
    if (result.isError()) {
      PACKWRIGHT_LOG_WARN(result.error());
      report.failures.push_back(result.error());
      ++report.failedCount;
      continue;
    }
    ++report.copiedCount;
  }
  return report;
}

Result<void> BundleAssembler::copyIcon(const fs::path& iconPath) const {
  std::error_code ec;
  if (!fs::is_regular_file(iconPath, ec)) {
    return Result<void>::error("Icon file not found: " + iconPath.string());
  }

  const fs::path destination = m_tree.resourcesDir() / iconPath.filename();
  fs::copy_file(iconPath, destination, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    return Result<void>::error("Failed to copy icon " + iconPath.string() + ": " + ec.message());
  }
  return Result<void>::ok();
}

} // namespace Packwright::bundle
