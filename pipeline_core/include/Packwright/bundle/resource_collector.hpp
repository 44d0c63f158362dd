#pragma once

/**
 * @file resource_collector.hpp
 * @brief Resource discovery for bundle assembly
 *
 * Turns declared (source, destination) pairs into concrete file entries:
 * - Directory sources are walked recursively, keeping relative subpaths
 * - File sources map straight to destination/<fileName>
 * - Sources whose last component is a glob ("bin/*") expand to each match
 * - Exclusion prefixes are tested before descending into any directory
 */

#include "Packwright/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace Packwright::bundle {

enum class ResourceKind : u8 { File, Directory };

/**
 * @brief One concrete item to place inside the bundle's resources area
 */
struct ResourceEntry {
  std::filesystem::path sourcePath;              // Absolute
  std::filesystem::path destinationRelativePath; // Relative to the resources area
  ResourceKind kind = ResourceKind::File;

  bool operator==(const ResourceEntry& other) const = default;
};

/**
 * @brief A declared (sourceRoot, destinationPrefix) pair
 */
struct ResourceMapping {
  std::string source;      // Absolute, or relative to the project root; may end in a glob
  std::string destination; // Prefix inside the resources area; empty means top level
};

/**
 * @brief Name prefixes that must never be collected or descended into
 *
 * A candidate path matches when its generic form starts with a prefix, or
 * when any single component of it does (so "tkinter" also rejects
 * "lib/tkinter/__init__.py").
 */
class ExclusionSet {
public:
  ExclusionSet() = default;
  explicit ExclusionSet(std::vector<std::string> prefixes);

  void add(const std::string& prefix);

  [[nodiscard]] bool matches(const std::filesystem::path& relativePath) const;

  [[nodiscard]] bool empty() const { return m_prefixes.empty(); }
  [[nodiscard]] usize size() const { return m_prefixes.size(); }
  [[nodiscard]] const std::vector<std::string>& prefixes() const { return m_prefixes; }

private:
  std::vector<std::string> m_prefixes;
};

/**
 * @brief Collection output
 */
struct CollectionResult {
  std::vector<ResourceEntry> entries;
  std::vector<std::string> warnings;
  u32 excludedCount = 0;
};

/**
 * @brief Resource Collector
 */
class ResourceCollector {
public:
  ResourceCollector(std::filesystem::path projectRoot, ExclusionSet exclusions);

  /**
   * @brief Collect entries for every mapping, in declaration order
   *
   * Missing sources and unreadable files produce warnings, never errors.
   */
  [[nodiscard]] CollectionResult collect(const std::vector<ResourceMapping>& mappings) const;

  [[nodiscard]] const ExclusionSet& getExclusions() const { return m_exclusions; }

  /**
   * @brief True when the last path component contains glob metacharacters
   */
  [[nodiscard]] static bool isGlobPattern(const std::string& component);

private:
  void collectMapping(const ResourceMapping& mapping, CollectionResult& result) const;
  void collectPath(const std::filesystem::path& source, const std::filesystem::path& destination,
                   CollectionResult& result) const;
  void collectDirectory(const std::filesystem::path& sourceDir,
                        const std::filesystem::path& destinationDir,
                        CollectionResult& result) const;

  [[nodiscard]] std::filesystem::path resolveSource(const std::string& source) const;

  std::filesystem::path m_projectRoot;
  ExclusionSet m_exclusions;
};

} // namespace Packwright::bundle
