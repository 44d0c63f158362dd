/**
 * @file process_runner.cpp
 * @brief POSIX process runner (fork + exec, no shell involved)
 */

#include "Packwright/platform/process_runner.hpp"
#include "Packwright/core/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>

#include <sys/types.h>
#include <sys/wait.h> // for WIFEXITED, WEXITSTATUS
#include <unistd.h>   // for fork, execv, pipe, dup2, read, close

namespace fs = std::filesystem;

namespace Packwright::platform {

namespace {

bool isExecutableFile(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return false;
  }
  return ::access(path.c_str(), X_OK) == 0;
}

/**
 * @brief fork/exec based runner
 *
 * stdout and stderr of the child are merged into one pipe and captured in
 * full. The child never goes through /bin/sh.
 */
class PosixProcessRunner : public IProcessRunner {
public:
  PosixProcessRunner() = default;
  ~PosixProcessRunner() override = default;

  Result<ProcessResult> run(const ProcessInvocation& invocation) override {
    if (invocation.program.empty()) {
      return Result<ProcessResult>::error("Cannot run process: program is empty");
    }

    // Build argv before forking; only async-signal-safe calls run in the child
    std::vector<std::string> tokens;
    tokens.reserve(invocation.arguments.size() + 1);
    tokens.push_back(invocation.program);
    tokens.insert(tokens.end(), invocation.arguments.begin(), invocation.arguments.end());

    std::vector<char*> argv;
    argv.reserve(tokens.size() + 1);
    for (auto& t : tokens) {
      argv.push_back(t.data());
    }
    argv.push_back(nullptr);

    const bool hasSlash = invocation.program.find('/') != std::string::npos;

    int pipefd[2];
    if (::pipe(pipefd) == -1) {
      return Result<ProcessResult>::error("Failed to create pipe for command output: " +
                                          std::string(std::strerror(errno)));
    }

    pid_t pid = ::fork();
    if (pid == -1) {
      ::close(pipefd[0]);
      ::close(pipefd[1]);
      return Result<ProcessResult>::error("Failed to fork process: " +
                                          std::string(std::strerror(errno)));
    }

    if (pid == 0) {
      // Child process
      ::close(pipefd[0]);
      ::dup2(pipefd[1], STDOUT_FILENO);
      ::dup2(pipefd[1], STDERR_FILENO);
      ::close(pipefd[1]);

      if (!invocation.workingDirectory.empty() &&
          ::chdir(invocation.workingDirectory.c_str()) != 0) {
        _exit(kExecFailureExitCode);
      }

      if (hasSlash) {
        ::execv(argv[0], argv.data());
      } else {
        ::execvp(argv[0], argv.data());
      }

      // If exec returns, it failed
      _exit(kExecFailureExitCode);
    }

    // Parent process
    ::close(pipefd[1]);

    ProcessResult result;
    char buffer[4096];
    for (;;) {
      ssize_t bytesRead = ::read(pipefd[0], buffer, sizeof(buffer));
      if (bytesRead > 0) {
        result.output.append(buffer, static_cast<usize>(bytesRead));
      } else if (bytesRead == -1 && errno == EINTR) {
        continue;
      } else {
        break;
      }
    }
    ::close(pipefd[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
      if (errno != EINTR) {
        return Result<ProcessResult>::error("Failed to wait for process: " +
                                            std::string(std::strerror(errno)));
      }
    }

    if (WIFEXITED(status)) {
      result.exitCode = WEXITSTATUS(status);
      return Result<ProcessResult>::ok(std::move(result));
    }
    if (WIFSIGNALED(status)) {
      return Result<ProcessResult>::error("Process terminated by signal " +
                                          std::to_string(WTERMSIG(status)));
    }
    return Result<ProcessResult>::error("Process did not exit normally");
  }

  std::optional<std::string> findProgram(const std::string& name) const override {
    if (name.empty()) {
      return std::nullopt;
    }

    if (name.find('/') != std::string::npos) {
      if (isExecutableFile(name)) {
        return name;
      }
      return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    if (pathEnv == nullptr) {
      return std::nullopt;
    }

    std::istringstream paths(pathEnv);
    std::string dir;
    while (std::getline(paths, dir, ':')) {
      if (dir.empty()) {
        continue;
      }
      fs::path candidate = fs::path(dir) / name;
      if (isExecutableFile(candidate)) {
        return candidate.string();
      }
    }
    return std::nullopt;
  }
};

} // namespace

std::string describeInvocation(const ProcessInvocation& invocation) {
  auto quote = [](const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"'") == std::string::npos) {
      return arg;
    }
    std::string quoted = "\"";
    for (char c : arg) {
      if (c == '"' || c == '\\') {
        quoted += '\\';
      }
      quoted += c;
    }
    quoted += '"';
    return quoted;
  };

  std::string line = quote(invocation.program);
  for (const auto& arg : invocation.arguments) {
    line += ' ';
    line += quote(arg);
  }
  return line;
}

std::unique_ptr<IProcessRunner> createProcessRunner() {
  return std::make_unique<PosixProcessRunner>();
}

} // namespace Packwright::platform
