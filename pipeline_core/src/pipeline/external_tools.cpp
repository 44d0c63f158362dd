/**
 * @file external_tools.cpp
 * @brief External Tool Invoker implementation
 */

#include "Packwright/pipeline/external_tools.hpp"
#include "Packwright/core/logger.hpp"

#include <cstdlib>

namespace fs = std::filesystem;

namespace Packwright::pipeline {

namespace {

ToolOutcome makeOutcome(ToolStatus status, std::string message) {
  ToolOutcome outcome;
  outcome.status = status;
  outcome.message = std::move(message);
  return outcome;
}

} // namespace

ExternalToolInvoker::ExternalToolInvoker(platform::IProcessRunner& runner) : m_runner(runner) {}

const char* ExternalToolInvoker::statusToString(ToolStatus status) {
  switch (status) {
  case ToolStatus::Succeeded:
    return "Succeeded";
  case ToolStatus::Skipped:
    return "Skipped";
  case ToolStatus::Failed:
    return "Failed";
  }
  return "Unknown";
}

// =============================================================================
// Tool Resolution
// =============================================================================

Result<void> ExternalToolInvoker::validateToolPath(const std::string& toolPath,
                                                   const std::vector<std::string>& allowedNames) {
  if (toolPath.empty()) {
    return Result<void>::error("Tool path cannot be empty");
  }

  const std::string dangerousChars = "|&;<>$`\\\"'(){}[]!*?~";
  for (char c : toolPath) {
    if (dangerousChars.find(c) != std::string::npos) {
      return Result<void>::error("Tool path contains invalid character: '" + std::string(1, c) +
                                 "'. Paths with shell metacharacters are not allowed.");
    }
  }

  fs::path path(toolPath);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return Result<void>::error("Tool not found: " + toolPath);
  }
  if (!fs::is_regular_file(path, ec)) {
    return Result<void>::error("Tool path is not a regular file: " + toolPath);
  }

  const std::string filename = path.filename().string();
  for (const auto& allowedName : allowedNames) {
    if (filename == allowedName) {
      return Result<void>::ok();
    }
  }

  std::string allowedList;
  for (usize i = 0; i < allowedNames.size(); ++i) {
    allowedList += allowedNames[i];
    if (i < allowedNames.size() - 1) {
      allowedList += ", ";
    }
  }
  return Result<void>::error("Tool '" + filename +
                             "' is not in the allowlist. Allowed tools: " + allowedList);
}

Result<std::string> ExternalToolInvoker::resolveTool(const std::string& toolName,
                                                     const std::string& configuredPath,
                                                     const char* envVar) const {
  std::string candidate = configuredPath;
  if (candidate.empty() && envVar != nullptr) {
    const char* fromEnv = std::getenv(envVar);
    if (fromEnv != nullptr) {
      candidate = fromEnv;
    }
  }

  if (!candidate.empty()) {
    auto validation = validateToolPath(candidate, {toolName});
    if (validation.isError()) {
      return Result<std::string>::error(validation.error());
    }
    return Result<std::string>::ok(candidate);
  }

  auto found = m_runner.findProgram(toolName);
  if (!found) {
    return Result<std::string>::error("'" + toolName + "' was not found in PATH");
  }
  return Result<std::string>::ok(*found);
}

// =============================================================================
// Command Construction
// =============================================================================

platform::ProcessInvocation
ExternalToolInvoker::buildSigningCommand(const std::string& toolPath, const fs::path& bundlePath,
                                         const SigningOptions& options) {
  platform::ProcessInvocation invocation;
  invocation.program = toolPath;
  invocation.arguments = {"--force", "--deep", "--sign", options.identity};
  if (options.hardenedRuntime) {
    invocation.arguments.push_back("--options");
    invocation.arguments.push_back("runtime");
  }
  if (!options.entitlements.empty()) {
    invocation.arguments.push_back("--entitlements");
    invocation.arguments.push_back(options.entitlements);
  }
  invocation.arguments.push_back(bundlePath.string());
  return invocation;
}

platform::ProcessInvocation ExternalToolInvoker::buildVerifyCommand(const std::string& toolPath,
                                                                    const fs::path& bundlePath) {
  platform::ProcessInvocation invocation;
  invocation.program = toolPath;
  invocation.arguments = {"--verify", "--verbose", bundlePath.string()};
  return invocation;
}

platform::ProcessInvocation
ExternalToolInvoker::buildImageCommand(const std::string& toolPath, const fs::path& bundlePath,
                                       const fs::path& imagePath, const ImageOptions& options) {
  platform::ProcessInvocation invocation;
  invocation.program = toolPath;
  invocation.arguments = {"create",
                          "-volname",
                          options.volumeName,
                          "-srcfolder",
                          bundlePath.string(),
                          "-ov",
                          "-format",
                          options.format,
                          imagePath.string()};
  return invocation;
}

// =============================================================================
// Signing
// =============================================================================

ToolOutcome ExternalToolInvoker::signBundle(const fs::path& bundlePath,
                                            const SigningOptions& options) {
  auto tool = resolveTool(kCodesignToolName, options.toolPath, kCodesignPathEnv);
  if (tool.isError()) {
    PACKWRIGHT_LOG_WARN("Code signing skipped: ", tool.error());
    return makeOutcome(ToolStatus::Skipped, tool.error());
  }

  std::error_code ec;
  if (!fs::exists(bundlePath, ec)) {
    return makeOutcome(ToolStatus::Failed, "Bundle not found for signing: " + bundlePath.string());
  }
  if (!options.entitlements.empty() && !fs::exists(options.entitlements, ec)) {
    PACKWRIGHT_LOG_WARN("Code signing skipped: entitlements file not found: ",
                        options.entitlements);
    return makeOutcome(ToolStatus::Skipped,
                       "Entitlements file not found: " + options.entitlements);
  }

  const auto invocation = buildSigningCommand(tool.value(), bundlePath, options);
  PACKWRIGHT_LOG_DEBUG("Running: ", platform::describeInvocation(invocation));

  auto result = m_runner.run(invocation);
  if (result.isError()) {
    PACKWRIGHT_LOG_WARN("Failed to execute signing command: ", result.error());
    return makeOutcome(ToolStatus::Failed, result.error());
  }

  ToolOutcome outcome;
  outcome.exitCode = result.value().exitCode;
  outcome.output = result.value().output;
  if (outcome.exitCode != 0) {
    outcome.status = ToolStatus::Failed;
    outcome.message =
        "Signing failed with exit code " + std::to_string(outcome.exitCode) + ": " + outcome.output;
    PACKWRIGHT_LOG_WARN(outcome.message);
    return outcome;
  }

  outcome.status = ToolStatus::Succeeded;
  outcome.message = "Signed " + bundlePath.filename().string();
  PACKWRIGHT_LOG_INFO("Successfully signed bundle");

  auto verifyResult = m_runner.run(buildVerifyCommand(tool.value(), bundlePath));
  if (verifyResult.isError() || verifyResult.value().exitCode != 0) {
    const std::string detail =
        verifyResult.isError() ? verifyResult.error() : verifyResult.value().output;
    PACKWRIGHT_LOG_WARN("Code signature verification failed: ", detail);
  } else {
    PACKWRIGHT_LOG_INFO("Code signature verified successfully");
  }

  return outcome;
}

// =============================================================================
// Disk Image
// =============================================================================

ToolOutcome ExternalToolInvoker::createDiskImage(const fs::path& bundlePath,
                                                 const fs::path& imagePath,
                                                 const ImageOptions& options) {
  auto tool = resolveTool(kImageToolName, options.toolPath, kImageToolPathEnv);
  if (tool.isError()) {
    PACKWRIGHT_LOG_WARN("Disk image skipped: ", tool.error());
    return makeOutcome(ToolStatus::Skipped, tool.error());
  }

  std::error_code ec;
  if (!fs::is_directory(bundlePath, ec)) {
    return makeOutcome(ToolStatus::Failed,
                       "Bundle not found for disk image: " + bundlePath.string());
  }

  fs::create_directories(imagePath.parent_path(), ec);
  if (ec) {
    return makeOutcome(ToolStatus::Failed, "Cannot create image directory " +
                                               imagePath.parent_path().string() + ": " +
                                               ec.message());
  }

  const auto invocation = buildImageCommand(tool.value(), bundlePath, imagePath, options);
  PACKWRIGHT_LOG_DEBUG("Running: ", platform::describeInvocation(invocation));

  auto result = m_runner.run(invocation);
  if (result.isError()) {
    PACKWRIGHT_LOG_WARN("Failed to execute disk image command: ", result.error());
    return makeOutcome(ToolStatus::Failed, result.error());
  }

  ToolOutcome outcome;
  outcome.exitCode = result.value().exitCode;
  outcome.output = result.value().output;
  if (outcome.exitCode != 0) {
    outcome.status = ToolStatus::Failed;
    outcome.message = "Disk image creation failed with exit code " +
                      std::to_string(outcome.exitCode) + ": " + outcome.output;
    PACKWRIGHT_LOG_WARN(outcome.message);
    return outcome;
  }

  if (!fs::is_regular_file(imagePath, ec)) {
    outcome.status = ToolStatus::Failed;
    outcome.message = "Disk image tool reported success but produced no image at " +
                      imagePath.string();
    PACKWRIGHT_LOG_WARN(outcome.message);
    return outcome;
  }

  outcome.status = ToolStatus::Succeeded;
  outcome.message = "Created " + imagePath.filename().string();
  PACKWRIGHT_LOG_INFO("Disk image created: ", imagePath.string());
  return outcome;
}

} // namespace Packwright::pipeline
