/**
 * @file resource_collector.cpp
 * @brief Resource Collector implementation
 */

#include "Packwright/bundle/resource_collector.hpp"
#include "Packwright/core/logger.hpp"
#include "Packwright/core/string_utils.hpp"

#include <algorithm>

#include <fnmatch.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace Packwright::bundle {

namespace {

bool isReadable(const fs::path& path) { return ::access(path.c_str(), R_OK) == 0; }

void addWarning(CollectionResult& result, const std::string& message) {
  PACKWRIGHT_LOG_WARN(message);
  result.warnings.push_back(message);
}

} // namespace

// ============================================================================
// ExclusionSet
// ============================================================================

ExclusionSet::ExclusionSet(std::vector<std::string> prefixes) {
  for (const auto& prefix : prefixes) {
    add(prefix);
  }
}

void ExclusionSet::add(const std::string& prefix) {
  if (prefix.empty()) {
    return;
  }
  if (std::find(m_prefixes.begin(), m_prefixes.end(), prefix) == m_prefixes.end()) {
    m_prefixes.push_back(prefix);
  }
}

bool ExclusionSet::matches(const fs::path& relativePath) const {
  if (m_prefixes.empty() || relativePath.empty()) {
    return false;
  }

  const std::string generic = relativePath.generic_string();
  for (const auto& prefix : m_prefixes) {
    if (core::startsWith(generic, prefix)) {
      return true;
    }
    for (const auto& component : relativePath) {
      if (core::startsWith(component.string(), prefix)) {
        return true;
      }
    }
  }
  return false;
}

// ============================================================================
// ResourceCollector
// ============================================================================

ResourceCollector::ResourceCollector(fs::path projectRoot, ExclusionSet exclusions)
    : m_exclusions(std::move(exclusions)) {
  std::error_code ec;
  fs::path absolute = fs::absolute(projectRoot, ec);
  m_projectRoot = ec ? projectRoot.lexically_normal() : absolute.lexically_normal();
  if (!m_projectRoot.has_filename() && m_projectRoot.has_relative_path()) {
    m_projectRoot = m_projectRoot.parent_path();
  }
}

bool ResourceCollector::isGlobPattern(const std::string& component) {
  return component.find_first_of("*?[") != std::string::npos;
}

fs::path ResourceCollector::resolveSource(const std::string& source) const {
  fs::path path(source);
  if (path.is_relative()) {
    path = m_projectRoot / path;
  }
  path = path.lexically_normal();
  // "dir/." normalizes to "dir/"; drop the trailing separator
  if (!path.has_filename() && path.has_relative_path()) {
    path = path.parent_path();
  }
  return path;
}

CollectionResult ResourceCollector::collect(const std::vector<ResourceMapping>& mappings) const {
  CollectionResult result;
  for (const auto& mapping : mappings) {
    const usize before = result.entries.size();
    collectMapping(mapping, result);
    PACKWRIGHT_LOG_DEBUG("Collected ", result.entries.size() - before, " entries from ",
                         mapping.source);
  }
  return result;
}

void ResourceCollector::collectMapping(const ResourceMapping& mapping,
                                       CollectionResult& result) const {
  if (mapping.source.empty()) {
    addWarning(result, "Ignoring resource mapping with empty source");
    return;
  }

  const fs::path source = resolveSource(mapping.source);
  fs::path destination = fs::path(mapping.destination).relative_path().lexically_normal();
  if (destination == ".") {
    destination.clear();
  }

  const std::string lastComponent = source.filename().string();
  if (isGlobPattern(lastComponent)) {
    const fs::path parent = source.parent_path();
    std::error_code ec;
    if (!fs::is_directory(parent, ec)) {
      addWarning(result, "Resource source not found: " + parent.string());
      return;
    }

    std::vector<fs::path> matches;
    for (fs::directory_iterator it(parent, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
      const std::string name = it->path().filename().string();
      if (::fnmatch(lastComponent.c_str(), name.c_str(), FNM_PERIOD) == 0) {
        matches.push_back(it->path());
      }
    }
    if (ec) {
      addWarning(result, "Cannot list resource directory " + parent.string() + ": " + ec.message());
    }

    if (matches.empty()) {
      addWarning(result, "No resources match " + source.string());
      return;
    }

    std::sort(matches.begin(), matches.end());
    for (const auto& match : matches) {
      collectPath(match, destination / match.filename(), result);
    }
    return;
  }

  std::error_code ec;
  const fs::file_status status = fs::symlink_status(source, ec);
  if (ec || !fs::exists(status)) {
    addWarning(result, "Resource source not found: " + source.string());
    return;
  }

  if (fs::is_directory(status)) {
    if (!destination.empty() && m_exclusions.matches(destination)) {
      PACKWRIGHT_LOG_DEBUG("Excluded resource directory: ", destination.generic_string());
      ++result.excludedCount;
      return;
    }
    collectDirectory(source, destination, result);
  } else {
    collectPath(source, destination / source.filename(), result);
  }
}

void ResourceCollector::collectPath(const fs::path& source, const fs::path& destination,
                                    CollectionResult& result) const {
  if (m_exclusions.matches(destination)) {
    PACKWRIGHT_LOG_DEBUG("Excluded resource: ", destination.generic_string());
    ++result.excludedCount;
    return;
  }

  std::error_code ec;
  const fs::file_status status = fs::symlink_status(source, ec);
  if (ec || !fs::exists(status)) {
    addWarning(result, "Resource source not found: " + source.string());
    return;
  }

  if (fs::is_directory(status)) {
    collectDirectory(source, destination, result);
    return;
  }

  if (!fs::is_symlink(status) && !fs::is_regular_file(status)) {
    PACKWRIGHT_LOG_DEBUG("Skipping special file: ", source.string());
    return;
  }

  if (!fs::is_symlink(status) && !isReadable(source)) {
    addWarning(result, "Resource is not readable, skipping: " + source.string());
    return;
  }

  result.entries.push_back({source, destination, ResourceKind::File});
}

void ResourceCollector::collectDirectory(const fs::path& sourceDir, const fs::path& destinationDir,
                                         CollectionResult& result) const {
  std::vector<ResourceEntry> found;
  std::error_code ec;

  fs::recursive_directory_iterator it(sourceDir, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    addWarning(result, "Cannot read resource directory " + sourceDir.string() + ": " + ec.message());
    return;
  }

  for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }

    const fs::path& current = it->path();
    const fs::path destination = destinationDir / current.lexically_relative(sourceDir);

    std::error_code statusEc;
    const fs::file_status status = it->symlink_status(statusEc);
    if (statusEc) {
      addWarning(result, "Cannot stat resource " + current.string() + ": " + statusEc.message());
      continue;
    }

    if (m_exclusions.matches(destination)) {
      // Never descend into an excluded tree
      if (fs::is_directory(status)) {
        it.disable_recursion_pending();
      }
      PACKWRIGHT_LOG_DEBUG("Excluded resource: ", destination.generic_string());
      ++result.excludedCount;
      continue;
    }

    if (fs::is_directory(status)) {
      std::error_code emptyEc;
      if (fs::is_empty(current, emptyEc) && !emptyEc) {
        found.push_back({current, destination, ResourceKind::Directory});
      }
      continue;
    }

    if (fs::is_symlink(status)) {
      found.push_back({current, destination, ResourceKind::File});
      continue;
    }

    if (!fs::is_regular_file(status)) {
      PACKWRIGHT_LOG_DEBUG("Skipping special file: ", current.string());
      continue;
    }

    if (!isReadable(current)) {
      addWarning(result, "Resource is not readable, skipping: " + current.string());
      continue;
    }

    found.push_back({current, destination, ResourceKind::File});
  }

  if (ec) {
    addWarning(result, "Stopped walking " + sourceDir.string() + ": " + ec.message());
  }

  if (found.empty() && !destinationDir.empty()) {
    std::error_code emptyEc;
    if (fs::is_empty(sourceDir, emptyEc) && !emptyEc) {
      found.push_back({sourceDir, destinationDir, ResourceKind::Directory});
    }
  }

  std::sort(found.begin(), found.end(), [](const ResourceEntry& a, const ResourceEntry& b) {
    return a.destinationRelativePath < b.destinationRelativePath;
  });
  result.entries.insert(result.entries.end(), found.begin(), found.end());
}

} // namespace Packwright::bundle
