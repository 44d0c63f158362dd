/**
 * @file recursion_guard.cpp
 * @brief Recursion Guard implementation
 */

#include "Packwright/bundle/recursion_guard.hpp"
#include "Packwright/core/logger.hpp"

namespace fs = std::filesystem;

namespace Packwright::bundle {

namespace {

fs::path normalize(const fs::path& path) {
  std::error_code ec;
  fs::path canonical = fs::weakly_canonical(path, ec);
  if (ec) {
    return fs::absolute(path, ec).lexically_normal();
  }
  return canonical;
}

// Where the entry itself lives; a final symlink is not followed
fs::path locate(const fs::path& path) {
  std::error_code ec;
  fs::path absolute = fs::absolute(path, ec);
  if (ec) {
    absolute = path;
  }
  absolute = absolute.lexically_normal();
  if (!absolute.has_filename() && absolute.has_relative_path()) {
    absolute = absolute.parent_path();
  }
  if (!absolute.has_filename() || !absolute.has_relative_path()) {
    return normalize(absolute);
  }
  return normalize(absolute.parent_path()) / absolute.filename();
}

} // namespace

RecursionGuard::RecursionGuard(RecursionRoots roots) : m_roots(std::move(roots)) {}

bool RecursionGuard::isWithin(const fs::path& path, const fs::path& root) {
  if (root.empty()) {
    return false;
  }

  const fs::path normalizedPath = locate(path);
  const fs::path normalizedRoot = normalize(root);

  auto pathIt = normalizedPath.begin();
  for (auto rootIt = normalizedRoot.begin(); rootIt != normalizedRoot.end(); ++rootIt) {
    // Trailing separator yields an empty final component
    if (rootIt->empty()) {
      continue;
    }
    if (pathIt == normalizedPath.end() || *pathIt != *rootIt) {
      return false;
    }
    ++pathIt;
  }
  return true;
}

bool RecursionGuard::isHazard(const ResourceEntry& entry) const {
  if (isWithin(entry.sourcePath, m_roots.publishedBundle) ||
      isWithin(entry.sourcePath, m_roots.stagingRoot)) {
    return true;
  }

  if (!m_roots.bundleName.empty()) {
    for (const auto& component : entry.destinationRelativePath) {
      if (component.string() == m_roots.bundleName) {
        return true;
      }
    }
  }

  for (const auto& artifact : m_roots.ownArtifacts) {
    if (isWithin(entry.sourcePath, artifact)) {
      return true;
    }
  }
  return false;
}

GuardResult RecursionGuard::filter(const std::vector<ResourceEntry>& entries) const {
  GuardResult result;
  result.entries.reserve(entries.size());

  for (const auto& entry : entries) {
    if (isHazard(entry)) {
      PACKWRIGHT_LOG_DEBUG("Recursion guard rejected ", entry.sourcePath.string(), " -> ",
                           entry.destinationRelativePath.generic_string());
      ++result.rejectedCount;
      continue;
    }
    result.entries.push_back(entry);
  }
  return result;
}

} // namespace Packwright::bundle
