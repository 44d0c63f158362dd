#pragma once

/**
 * @file result.hpp
 * @brief Value-or-error return type used by every fallible operation
 *
 * Result<T> holds either a value of type T or an error message. Result<void>
 * only carries success or an error message.
 *
 * @code
 * Result<i32> parsed = parseMode("0755");
 * if (parsed.isError()) {
 *   PACKWRIGHT_LOG_ERROR("Bad mode: " + parsed.error());
 * }
 * @endcode
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace Packwright {

template <typename T> class Result {
public:
  [[nodiscard]] static Result ok(T value) {
    Result result;
    result.m_value.emplace(std::move(value));
    return result;
  }

  [[nodiscard]] static Result error(std::string message) {
    Result result;
    result.m_error = std::move(message);
    return result;
  }

  [[nodiscard]] bool isOk() const { return m_value.has_value(); }
  [[nodiscard]] bool isError() const { return !m_value.has_value(); }

  [[nodiscard]] T& value() {
    if (!m_value) {
      throw std::logic_error("Result::value() called on error: " + m_error);
    }
    return *m_value;
  }

  [[nodiscard]] const T& value() const {
    if (!m_value) {
      throw std::logic_error("Result::value() called on error: " + m_error);
    }
    return *m_value;
  }

  [[nodiscard]] T valueOr(T fallback) const { return m_value ? *m_value : std::move(fallback); }

  [[nodiscard]] const std::string& error() const { return m_error; }

private:
  Result() = default;

  std::optional<T> m_value;
  std::string m_error;
};

template <> class Result<void> {
public:
  [[nodiscard]] static Result ok() { return Result(true, {}); }

  [[nodiscard]] static Result error(std::string message) {
    return Result(false, std::move(message));
  }

  [[nodiscard]] bool isOk() const { return m_ok; }
  [[nodiscard]] bool isError() const { return !m_ok; }

  [[nodiscard]] const std::string& error() const { return m_error; }

private:
  Result(bool ok, std::string message) : m_ok(ok), m_error(std::move(message)) {}

  bool m_ok = false;
  std::string m_error;
};

} // namespace Packwright
