#pragma once

/**
 * @file artifact_checksum.hpp
 * @brief SHA-256 checksum files for distributable artifacts
 *
 * The checksum file uses the shasum/sha256sum layout so it can be verified
 * with `shasum -a 256 -c <Name>.dmg.sha256` next to the image.
 */

#include "Packwright/core/result.hpp"
#include "Packwright/core/types.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <string_view>

namespace Packwright::pipeline {

using Sha256Digest = std::array<u8, 32>;

[[nodiscard]] Result<Sha256Digest> sha256Data(std::string_view data);
[[nodiscard]] Result<Sha256Digest> sha256File(const std::filesystem::path& path);

[[nodiscard]] std::string toHex(const Sha256Digest& digest);

/**
 * @brief Hash artifactPath and write "<hex>  <fileName>\n" to checksumPath
 * @return The hex digest
 */
[[nodiscard]] Result<std::string> writeChecksumFile(const std::filesystem::path& artifactPath,
                                                    const std::filesystem::path& checksumPath);

} // namespace Packwright::pipeline
