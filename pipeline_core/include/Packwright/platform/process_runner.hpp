#pragma once

/**
 * @file process_runner.hpp
 * @brief Typed subprocess invocation without a shell
 *
 * Commands are described as a program plus an argument vector and executed
 * directly (fork + exec on POSIX), so paths containing spaces or shell
 * metacharacters never need quoting.
 */

#include "Packwright/core/result.hpp"
#include "Packwright/core/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Packwright::platform {

/**
 * @brief A single command to execute
 */
struct ProcessInvocation {
  std::string program; // Absolute path, or a bare name looked up in PATH
  std::vector<std::string> arguments;
  std::string workingDirectory; // Empty means inherit
};

/**
 * @brief Outcome of a process that ran to completion
 */
struct ProcessResult {
  i32 exitCode = -1;
  std::string output; // Combined stdout and stderr
};

/**
 * @brief Exit status reported when the program could not be executed at all
 */
constexpr i32 kExecFailureExitCode = 127;

/**
 * @brief Interface for running external programs
 */
class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  /**
   * @brief Run a program and wait for it to exit
   * @return Exit code and captured output, or an error when the process could
   *         not be started or did not exit normally
   */
  [[nodiscard]] virtual Result<ProcessResult> run(const ProcessInvocation& invocation) = 0;

  /**
   * @brief Locate an executable by bare name
   * @return Absolute path of the first executable match in PATH, if any
   */
  [[nodiscard]] virtual std::optional<std::string> findProgram(const std::string& name) const = 0;
};

/**
 * @brief Render an invocation as a single human-readable line for logs
 *
 * Arguments containing whitespace or quotes are wrapped in double quotes.
 * The result is for display only and is never handed to a shell.
 */
std::string describeInvocation(const ProcessInvocation& invocation);

/**
 * @brief Create the process runner for the current platform
 */
std::unique_ptr<IProcessRunner> createProcessRunner();

} // namespace Packwright::platform
