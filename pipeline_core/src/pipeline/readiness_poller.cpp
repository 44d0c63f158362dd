/**
 * @file readiness_poller.cpp
 * @brief Readiness Poller implementation
 */

#include "Packwright/pipeline/readiness_poller.hpp"
#include "Packwright/core/logger.hpp"

namespace fs = std::filesystem;

namespace Packwright::pipeline {

bool BuildArtifact::isPresent() const {
  if (executableName.empty()) {
    return false;
  }
  std::error_code ec;
  return fs::is_regular_file(executablePath(), ec);
}

ReadinessPoller::ReadinessPoller(PollPolicy policy, core::IClock& clock)
    : m_policy(policy), m_clock(clock) {}

const char* ReadinessPoller::stateToString(PollerState state) {
  switch (state) {
  case PollerState::Waiting:
    return "Waiting";
  case PollerState::Ready:
    return "Ready";
  case PollerState::TimedOut:
    return "TimedOut";
  }
  return "Unknown";
}

PollOutcome ReadinessPoller::waitUntil(const Probe& probe) {
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;

  m_state = PollerState::Waiting;
  PollOutcome outcome;

  const auto start = m_clock.now();
  const u32 maxAttempts = m_policy.maxAttempts == 0 ? 1 : m_policy.maxAttempts;

  for (;;) {
    ++outcome.attempts;
    if (probe()) {
      m_state = PollerState::Ready;
      break;
    }

    if (outcome.attempts >= maxAttempts) {
      m_state = PollerState::TimedOut;
      break;
    }

    const auto elapsed = duration_cast<milliseconds>(m_clock.now() - start);
    if (m_policy.deadline.count() > 0 && elapsed + m_policy.interval > m_policy.deadline) {
      m_state = PollerState::TimedOut;
      break;
    }

    PACKWRIGHT_LOG_DEBUG("Not ready after attempt ", outcome.attempts, "/", maxAttempts);
    m_clock.sleepFor(m_policy.interval);
  }

  outcome.state = m_state;
  outcome.elapsed = duration_cast<milliseconds>(m_clock.now() - start);
  return outcome;
}

PollOutcome ReadinessPoller::waitFor(const BuildArtifact& artifact) {
  PACKWRIGHT_LOG_INFO("Waiting for build artifact ", artifact.executablePath().string());
  return waitUntil([&artifact]() { return artifact.isPresent(); });
}

} // namespace Packwright::pipeline
