#pragma once

/**
 * @file mock_process_runner.hpp
 * @brief Mock implementation of IProcessRunner for testing
 *
 * Records every invocation instead of spawning processes. Per-program
 * handlers (keyed by the program's file name) can return scripted results
 * and simulate side effects such as a tool writing its output file.
 */

#include "Packwright/platform/process_runner.hpp"

#include <filesystem>
#include <functional>
#include <map>

namespace Packwright::platform {

class MockProcessRunner : public IProcessRunner {
public:
  using Handler = std::function<Result<ProcessResult>(const ProcessInvocation&)>;

  MockProcessRunner() = default;
  ~MockProcessRunner() override = default;

  // =========================================================================
  // IProcessRunner Implementation
  // =========================================================================

  Result<ProcessResult> run(const ProcessInvocation& invocation) override {
    m_invocations.push_back(invocation);

    const std::string name = std::filesystem::path(invocation.program).filename().string();
    auto it = m_handlers.find(name);
    if (it != m_handlers.end()) {
      return it->second(invocation);
    }

    ProcessResult result;
    result.exitCode = m_defaultExitCode;
    return Result<ProcessResult>::ok(result);
  }

  [[nodiscard]] std::optional<std::string> findProgram(const std::string& name) const override {
    auto it = m_programPaths.find(name);
    if (it != m_programPaths.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  // =========================================================================
  // Test Configuration
  // =========================================================================

  /**
   * @brief Make findProgram(name) report the given path
   */
  void setProgramPath(const std::string& name, const std::string& path) {
    m_programPaths[name] = path;
  }

  void setHandler(const std::string& programName, Handler handler) {
    m_handlers[programName] = std::move(handler);
  }

  void setDefaultExitCode(i32 exitCode) { m_defaultExitCode = exitCode; }

  void reset() {
    m_invocations.clear();
    m_handlers.clear();
    m_programPaths.clear();
    m_defaultExitCode = 0;
  }

  // =========================================================================
  // Verification
  // =========================================================================

  [[nodiscard]] const std::vector<ProcessInvocation>& getInvocations() const {
    return m_invocations;
  }

  [[nodiscard]] usize getInvocationCount() const { return m_invocations.size(); }

  [[nodiscard]] std::vector<ProcessInvocation> invocationsOf(const std::string& programName) const {
    std::vector<ProcessInvocation> matches;
    for (const auto& invocation : m_invocations) {
      if (std::filesystem::path(invocation.program).filename().string() == programName) {
        matches.push_back(invocation);
      }
    }
    return matches;
  }

private:
  std::vector<ProcessInvocation> m_invocations;
  std::map<std::string, Handler> m_handlers;
  std::map<std::string, std::string> m_programPaths;
  i32 m_defaultExitCode = 0;
};

} // namespace Packwright::platform
