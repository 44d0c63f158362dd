#pragma once

/**
 * @file descriptor.hpp
 * @brief Bundle descriptor (Info.plist) model and serializer
 *
 * Keys keep the order in which they were first set, so serializing the same
 * descriptor twice yields identical bytes.
 */

#include "Packwright/core/result.hpp"
#include "Packwright/core/types.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace Packwright::bundle {

using DescriptorValue = std::variant<std::string, bool>;

namespace DescriptorKeys {
inline constexpr const char* kBundleName = "CFBundleName";
inline constexpr const char* kDisplayName = "CFBundleDisplayName";
inline constexpr const char* kIdentifier = "CFBundleIdentifier";
inline constexpr const char* kVersion = "CFBundleVersion";
inline constexpr const char* kShortVersion = "CFBundleShortVersionString";
inline constexpr const char* kExecutable = "CFBundleExecutable";
inline constexpr const char* kPackageType = "CFBundlePackageType";
inline constexpr const char* kInfoDictionaryVersion = "CFBundleInfoDictionaryVersion";
inline constexpr const char* kIconFile = "CFBundleIconFile";
inline constexpr const char* kMinimumSystemVersion = "LSMinimumSystemVersion";
inline constexpr const char* kHighResolutionCapable = "NSHighResolutionCapable";
} // namespace DescriptorKeys

class Descriptor {
public:
  using Entry = std::pair<std::string, DescriptorValue>;

  Descriptor() = default;

  /**
   * @brief Set a key; an existing key keeps its position and takes the new value
   */
  void set(const std::string& key, DescriptorValue value);

  [[nodiscard]] const DescriptorValue* find(std::string_view key) const;
  [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

  [[nodiscard]] const std::vector<Entry>& entries() const { return m_entries; }
  [[nodiscard]] usize size() const { return m_entries.size(); }

  /**
   * @brief Names of required keys that are not set
   */
  [[nodiscard]] std::vector<std::string> missingRequiredKeys() const;

  /**
   * @brief Render as an XML property list (PLIST 1.0)
   */
  [[nodiscard]] std::string toPropertyList() const;

  /**
   * @brief Write the property list to path, replacing any existing file
   *
   * The content goes to a sibling temporary file first and is renamed over the
   * target, so readers never observe a half-written descriptor.
   */
  [[nodiscard]] Result<void> writeTo(const std::filesystem::path& path) const;

  [[nodiscard]] static std::string escapeXml(std::string_view text);

  [[nodiscard]] static const std::vector<std::string>& requiredKeys();

private:
  std::vector<Entry> m_entries;
};

} // namespace Packwright::bundle
