#pragma once

/**
 * @file external_tools.hpp
 * @brief Best-effort code signing and disk image creation
 *
 * Both steps shell out to platform tools (codesign, hdiutil). A tool that is
 * missing or fails never aborts the pipeline: the outcome is reported as
 * Skipped or Failed and the caller carries on with what it has.
 */

#include "Packwright/core/result.hpp"
#include "Packwright/platform/process_runner.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace Packwright::pipeline {

constexpr const char* kCodesignToolName = "codesign";
constexpr const char* kImageToolName = "hdiutil";
constexpr const char* kCodesignPathEnv = "PACKWRIGHT_CODESIGN_PATH";
constexpr const char* kImageToolPathEnv = "PACKWRIGHT_HDIUTIL_PATH";

enum class ToolStatus : u8 { Succeeded, Skipped, Failed };

struct ToolOutcome {
  ToolStatus status = ToolStatus::Skipped;
  std::string message;
  i32 exitCode = -1;
  std::string output;

  [[nodiscard]] bool succeeded() const { return status == ToolStatus::Succeeded; }
};

struct SigningOptions {
  std::string identity = "-";
  std::string entitlements;
  bool hardenedRuntime = false;
  std::string toolPath; // Explicit path; empty means environment, then PATH
};

struct ImageOptions {
  std::string volumeName;
  std::string format = "UDZO";
  std::string toolPath;
};

/**
 * @brief External Tool Invoker
 */
class ExternalToolInvoker {
public:
  explicit ExternalToolInvoker(platform::IProcessRunner& runner);

  /**
   * @brief Sign a bundle in place and verify the signature
   *
   * A failed verification is logged as a warning; the outcome stays Succeeded.
   */
  [[nodiscard]] ToolOutcome signBundle(const std::filesystem::path& bundlePath,
                                       const SigningOptions& options);

  /**
   * @brief Build a compressed disk image from the bundle, replacing imagePath
   */
  [[nodiscard]] ToolOutcome createDiskImage(const std::filesystem::path& bundlePath,
                                            const std::filesystem::path& imagePath,
                                            const ImageOptions& options);

  /**
   * @brief Locate a tool: explicit path, then environment override, then PATH
   *
   * Explicit and environment paths must pass validateToolPath().
   */
  [[nodiscard]] Result<std::string> resolveTool(const std::string& toolName,
                                                const std::string& configuredPath,
                                                const char* envVar) const;

  [[nodiscard]] static platform::ProcessInvocation
  buildSigningCommand(const std::string& toolPath, const std::filesystem::path& bundlePath,
                      const SigningOptions& options);

  [[nodiscard]] static platform::ProcessInvocation
  buildVerifyCommand(const std::string& toolPath, const std::filesystem::path& bundlePath);

  [[nodiscard]] static platform::ProcessInvocation
  buildImageCommand(const std::string& toolPath, const std::filesystem::path& bundlePath,
                    const std::filesystem::path& imagePath, const ImageOptions& options);

  /**
   * @brief Check that a user-supplied tool path is safe to execute
   *
   * The path must not contain shell metacharacters, must name an existing
   * regular file, and its file name must be one of allowedNames.
   */
  [[nodiscard]] static Result<void> validateToolPath(const std::string& toolPath,
                                                     const std::vector<std::string>& allowedNames);

  [[nodiscard]] static const char* statusToString(ToolStatus status);

private:
  platform::IProcessRunner& m_runner;
};

} // namespace Packwright::pipeline
