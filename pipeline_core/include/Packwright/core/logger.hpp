#pragma once

/**
 * @file logger.hpp
 * @brief Process-wide logger used for console narration of pipeline stages
 *
 * Info and below go to stdout, warnings and above to stderr. An optional log
 * file receives every line that passes the level filter.
 */

#include <fstream>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Packwright::core {

enum class LogLevel { Trace, Debug, Info, Warning, Error, Fatal, Off };

class Logger {
public:
  static Logger& instance();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel level);
  [[nodiscard]] LogLevel getLevel() const;

  void setOutputFile(const std::string& path);
  void closeOutputFile();

  /// Disables writing to stdout/stderr (file output and callbacks still run)
  void setConsoleEnabled(bool enabled);

  using LogCallback = std::function<void(LogLevel, const std::string&)>;
  void addLogCallback(LogCallback callback);
  void clearLogCallbacks();

  void log(LogLevel level, std::string_view message);

  void trace(std::string_view message);
  void debug(std::string_view message);
  void info(std::string_view message);
  void warning(std::string_view message);
  void error(std::string_view message);
  void fatal(std::string_view message);

  // Variadic overloads; every argument is streamed into one message
  template <typename... Args>
    requires(sizeof...(Args) > 1)
  void trace(const Args&... args) {
    trace(std::string_view(concat(args...)));
  }

  template <typename... Args>
    requires(sizeof...(Args) > 1)
  void debug(const Args&... args) {
    debug(std::string_view(concat(args...)));
  }

  template <typename... Args>
    requires(sizeof...(Args) > 1)
  void info(const Args&... args) {
    info(std::string_view(concat(args...)));
  }

  template <typename... Args>
    requires(sizeof...(Args) > 1)
  void warning(const Args&... args) {
    warning(std::string_view(concat(args...)));
  }

  template <typename... Args>
    requires(sizeof...(Args) > 1)
  void error(const Args&... args) {
    error(std::string_view(concat(args...)));
  }

  template <typename... Args>
    requires(sizeof...(Args) > 1)
  void fatal(const Args&... args) {
    fatal(std::string_view(concat(args...)));
  }

  /// Streams each argument in order; pass paths as .string() to avoid quoting
  template <typename... Args> [[nodiscard]] static std::string concat(const Args&... args) {
    std::ostringstream stream;
    (stream << ... << args);
    return stream.str();
  }

  [[nodiscard]] static const char* levelToString(LogLevel level);

private:
  Logger();
  ~Logger();

  [[nodiscard]] std::string getCurrentTimestamp() const;
  [[nodiscard]] const char* levelColor(LogLevel level) const;

  LogLevel m_level;
  std::ofstream m_fileStream;
  mutable std::mutex m_mutex;
  bool m_useColors;
  bool m_consoleEnabled = true;
  std::vector<LogCallback> m_callbacks;
};

} // namespace Packwright::core

#define PACKWRIGHT_LOG_TRACE(...) ::Packwright::core::Logger::instance().trace(__VA_ARGS__)
#define PACKWRIGHT_LOG_DEBUG(...) ::Packwright::core::Logger::instance().debug(__VA_ARGS__)
#define PACKWRIGHT_LOG_INFO(...) ::Packwright::core::Logger::instance().info(__VA_ARGS__)
#define PACKWRIGHT_LOG_WARN(...) ::Packwright::core::Logger::instance().warning(__VA_ARGS__)
#define PACKWRIGHT_LOG_ERROR(...) ::Packwright::core::Logger::instance().error(__VA_ARGS__)
#define PACKWRIGHT_LOG_FATAL(...) ::Packwright::core::Logger::instance().fatal(__VA_ARGS__)
