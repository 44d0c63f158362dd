/**
 * @file clock.cpp
 * @brief SystemClock implementation
 */

#include "Packwright/core/clock.hpp"

#include <thread>

namespace Packwright::core {

IClock::TimePoint SystemClock::now() const { return std::chrono::steady_clock::now(); }

void SystemClock::sleepFor(std::chrono::milliseconds duration) {
  if (duration.count() > 0) {
    std::this_thread::sleep_for(duration);
  }
}

} // namespace Packwright::core
