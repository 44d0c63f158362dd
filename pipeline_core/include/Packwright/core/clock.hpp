#pragma once

/**
 * @file clock.hpp
 * @brief Monotonic clock abstraction so waits can be driven by virtual time
 */

#include <chrono>
#include <memory>

namespace Packwright::core {

/**
 * @brief Interface for time queries and blocking sleeps
 */
class IClock {
public:
  using TimePoint = std::chrono::steady_clock::time_point;

  virtual ~IClock() = default;

  [[nodiscard]] virtual TimePoint now() const = 0;

  /**
   * @brief Block the caller for the given duration
   */
  virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

/**
 * @brief Wall clock backed by std::chrono::steady_clock and std::this_thread
 */
class SystemClock : public IClock {
public:
  SystemClock() = default;
  ~SystemClock() override = default;

  [[nodiscard]] TimePoint now() const override;
  void sleepFor(std::chrono::milliseconds duration) override;
};

/**
 * @brief Manually advanced clock for tests
 *
 * sleepFor() returns immediately and moves virtual time forward, so bounded
 * waits can be exercised without real sleeps.
 */
class MockClock : public IClock {
public:
  MockClock() = default;
  ~MockClock() override = default;

  [[nodiscard]] TimePoint now() const override { return m_now; }

  void sleepFor(std::chrono::milliseconds duration) override {
    m_now += duration;
    m_totalSlept += duration;
    ++m_sleepCount;
  }

  void advance(std::chrono::milliseconds duration) { m_now += duration; }

  [[nodiscard]] int getSleepCount() const { return m_sleepCount; }
  [[nodiscard]] std::chrono::milliseconds getTotalSlept() const { return m_totalSlept; }

private:
  TimePoint m_now{};
  std::chrono::milliseconds m_totalSlept{0};
  int m_sleepCount = 0;
};

} // namespace Packwright::core
