#pragma once

/**
 * @file pack_launcher.hpp
 * @brief Command-line front end for the packaging pipeline
 *
 * Usage:
 *   packwright                         # package using ./packwright.json
 *   packwright --manifest app.json     # explicit manifest
 *   packwright --no-sign --no-image    # bundle only
 *
 * Exit codes: 0 success (warnings allowed), 1 packaging failed,
 * 2 usage or configuration error.
 */

#include "Packwright/core/clock.hpp"
#include "Packwright/core/result.hpp"
#include "Packwright/core/types.hpp"
#include "Packwright/pipeline/pipeline_config.hpp"
#include "Packwright/platform/process_runner.hpp"

#include <string>

namespace Packwright::launcher {

/**
 * @brief Command-line options
 */
struct LaunchOptions {
  std::string manifestPath;     // Empty: ./packwright.json
  std::string artifactOverride; // Replaces paths.artifact
  std::string outputOverride;   // Replaces paths.output
  std::string logFile;
  bool noSign = false;
  bool noImage = false;
  bool verbose = false;
  bool quiet = false;
  bool help = false;
  bool version = false;
  std::string usageError; // Set when the arguments could not be parsed
};

class PackLauncher {
public:
  PackLauncher() = default;
  ~PackLauncher() = default;

  PackLauncher(const PackLauncher&) = delete;
  PackLauncher& operator=(const PackLauncher&) = delete;

  /**
   * @brief Parse arguments and package with the system clock and process runner
   * @return Process exit code
   */
  i32 run(int argc, char* argv[]);

  /**
   * @brief Package with explicit collaborators
   */
  i32 run(const LaunchOptions& options, core::IClock& clock, platform::IProcessRunner& runner,
          const char* programName = "packwright");

  [[nodiscard]] static LaunchOptions parseArgs(int argc, char* argv[]);

  /**
   * @brief Load the manifest and apply command-line overrides
   */
  [[nodiscard]] static Result<pipeline::PipelineConfig> loadConfig(const LaunchOptions& options);

  static void printHelp(const char* programName);
  static void printVersion();

private:
  Result<void> initializeLogging(const LaunchOptions& options);
};

} // namespace Packwright::launcher
