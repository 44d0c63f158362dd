#pragma once

/**
 * @file manifest_loader.hpp
 * @brief Reads a packaging manifest (packwright.json) into a PipelineConfig
 *
 * Manifest layout:
 * @code
 * {
 *   "app": { "name", "identifier", "version", "shortVersion", "executable",
 *            "minimumSystemVersion", "highResolutionCapable", "icon" },
 *   "paths": { "projectRoot", "output", "staging", "artifact" },
 *   "resources": [ { "source": "bin/*", "destination": "bin" } ],
 *   "exclude": [ "tkinter" ],
 *   "helperDirectories": [ "bin" ],
 *   "permissionBits": "0755",
 *   "signing": { "enabled", "identity", "entitlements", "hardenedRuntime", "tool" },
 *   "image": { "enabled", "format", "volumeName", "tool", "checksum" },
 *   "readiness": { "maxAttempts", "intervalMs", "deadlineMs" },
 *   "descriptor": { "<key>": "<string or bool>" },
 *   "postProcessingEnv": "PACKWRIGHT_NESTED_BUILD"
 * }
 * @endcode
 *
 * "projectRoot" is resolved against the manifest's directory; all other
 * relative paths stay relative to the project root.
 */

#include "Packwright/core/result.hpp"
#include "Packwright/pipeline/pipeline_config.hpp"

#include <string>

class QJsonObject;
class QString;

namespace Packwright::launcher {

constexpr const char* kDefaultManifestName = "packwright.json";

class ManifestLoader {
public:
  [[nodiscard]] static Result<pipeline::PipelineConfig> loadFromFile(const std::string& path);

  /**
   * @brief Parse manifest text
   * @param baseDir Directory that a relative "projectRoot" is resolved against
   */
  [[nodiscard]] static Result<pipeline::PipelineConfig> loadFromString(const std::string& json,
                                                                       const std::string& baseDir);

private:
  static Result<pipeline::PipelineConfig> fromJson(const QJsonObject& root,
                                                   const QString& baseDir);
};

} // namespace Packwright::launcher
