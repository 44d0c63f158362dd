#pragma once

/**
 * @file readiness_poller.hpp
 * @brief Bounded wait for the build artifact to appear
 */

#include "Packwright/core/clock.hpp"
#include "Packwright/core/types.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

namespace Packwright::pipeline {

/**
 * @brief The compiled application the bundle is built around
 */
struct BuildArtifact {
  std::filesystem::path outputDirectory;
  std::string executableName;

  [[nodiscard]] std::filesystem::path executablePath() const {
    return outputDirectory / executableName;
  }

  /**
   * @brief True when the executable exists as a regular file
   */
  [[nodiscard]] bool isPresent() const;
};

struct PollPolicy {
  u32 maxAttempts = 30;
  std::chrono::milliseconds interval{1000};
  std::chrono::milliseconds deadline{0}; // Zero: no deadline beyond maxAttempts
};

enum class PollerState : u8 { Waiting, Ready, TimedOut };

struct PollOutcome {
  PollerState state = PollerState::Waiting;
  u32 attempts = 0;
  std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Readiness Poller
 *
 * Probes once per tick and sleeps for the policy interval between probes.
 * The wait ends as Ready on the first successful probe, or as TimedOut after
 * maxAttempts probes or when the next sleep would cross the deadline.
 */
class ReadinessPoller {
public:
  using Probe = std::function<bool()>;

  ReadinessPoller(PollPolicy policy, core::IClock& clock);

  [[nodiscard]] PollOutcome waitUntil(const Probe& probe);
  [[nodiscard]] PollOutcome waitFor(const BuildArtifact& artifact);

  [[nodiscard]] PollerState getState() const { return m_state; }
  [[nodiscard]] const PollPolicy& getPolicy() const { return m_policy; }

  [[nodiscard]] static const char* stateToString(PollerState state);

private:
  PollPolicy m_policy;
  core::IClock& m_clock;
  PollerState m_state = PollerState::Waiting;
};

} // namespace Packwright::pipeline
