#pragma once

/**
 * @file string_utils.hpp
 * @brief Small string helpers shared by configuration and pipeline code
 */

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace Packwright::core {

inline std::string trim(std::string_view s) {
  auto start = s.find_first_not_of(" \t\n\r");
  if (start == std::string_view::npos)
    return "";
  auto end = s.find_last_not_of(" \t\n\r");
  return std::string(s.substr(start, end - start + 1));
}

inline std::string toLower(std::string_view s) {
  std::string result(s);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

/**
 * @brief Check whether an environment-style value is a truthy sentinel
 *
 * Accepts "1", "true", "yes" and "on" (case-insensitive, surrounding
 * whitespace ignored).
 */
inline bool isTruthy(std::string_view value) {
  const std::string normalized = toLower(trim(value));
  return normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on";
}

inline bool startsWith(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace Packwright::core
