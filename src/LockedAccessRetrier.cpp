#include "LockedAccessRetrier.hpp"
#include <algorithm>
#include <iostream>

namespace labxfer {

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::seconds;

const char *toString(LockPhase phase) {
  switch (phase) {
  case LockPhase::Idle:
    return "Idle";
  case LockPhase::Waiting:
    return "Waiting";
  case LockPhase::Retrying:
    return "Retrying";
  case LockPhase::Resolved:
    return "Resolved";
  case LockPhase::Exhausted:
    return "Exhausted";
  case LockPhase::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

LockedAccessRetrier::LockedAccessRetrier(LockRetrySettings settings)
    : m_settings(settings) {}

void LockedAccessRetrier::setProgressListener(ProgressListener listener) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_listener = std::move(listener);
}

Clock::time_point
LockedAccessRetrier::finalDeadline(const LockRetryState &state) const {
  int retriesAfterFirst = std::max(0, m_settings.maxAttempts - 2);
  return state.firstFailure + m_settings.initialWait +
         m_settings.retryInterval * retriesAfterFirst;
}

void LockedAccessRetrier::report(const std::string &path,
                                 const LockRetryState &state) {
  auto now = Clock::now();
  auto elapsed = duration_cast<milliseconds>(now - state.firstFailure);
  auto remaining = duration_cast<milliseconds>(finalDeadline(state) - now);
  if (remaining.count() < 0)
    remaining = milliseconds(0);

  std::cout << "[Lock] " << path << " is locked (" << toString(state.phase)
            << ", attempt " << state.attemptCount << "/"
            << m_settings.maxAttempts << ", elapsed "
            << duration_cast<seconds>(elapsed).count() << "s, remaining "
            << duration_cast<seconds>(remaining).count() << "s)" << std::endl;

  ProgressListener listener;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    listener = m_listener;
  }
  if (listener)
    listener(path, state, elapsed, remaining);
}

LockRetryOutcome LockedAccessRetrier::finish(const std::string &path,
                                             LockPhase phase,
                                             std::string reason) {
  int attempts = 0;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_states.find(path);
    if (it != m_states.end()) {
      attempts = it->second.attemptCount;
      m_states.erase(it);
    }
  }
  if (phase == LockPhase::Resolved) {
    std::cout << "[Lock] " << path << " accessible again after " << attempts
              << " attempts" << std::endl;
  } else {
    std::cerr << "[Lock] " << path << " " << toString(phase) << ": " << reason
              << std::endl;
  }
  return LockRetryOutcome{phase, attempts, std::move(reason)};
}

LockRetryOutcome LockedAccessRetrier::run(const std::string &path,
                                          const Attempt &attempt) {
  LockRetryState snapshot;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto now = Clock::now();
    snapshot = LockRetryState{1, now, now + m_settings.initialWait,
                              LockPhase::Waiting};
    m_states[path] = snapshot;
  }
  report(path, snapshot);

  if (m_settings.maxAttempts <= 1)
    return finish(path, LockPhase::Exhausted, "file locked, no retries allowed");

  while (true) {
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      auto deadline = m_states[path].nextRetryDeadline;
      m_cv.wait_until(lock, deadline, [this] { return m_cancelled; });
      if (m_cancelled) {
        lock.unlock();
        return finish(path, LockPhase::Cancelled, "shutdown while waiting");
      }
      auto &state = m_states[path];
      state.phase = LockPhase::Retrying;
      ++state.attemptCount;
      snapshot = state;
    }

    AccessStatus status = AccessStatus::IOError;
    try {
      status = attempt();
    } catch (const std::exception &e) {
      std::cerr << "[Lock] Retry attempt for " << path
                << " threw: " << e.what() << std::endl;
    }

    switch (status) {
    case AccessStatus::Ok:
      return finish(path, LockPhase::Resolved, "");
    case AccessStatus::Missing:
      return finish(path, LockPhase::Resolved, "file disappeared");
    case AccessStatus::IOError:
      return finish(path, LockPhase::Exhausted,
                    "I/O error while retrying locked file");
    case AccessStatus::Locked:
      break;
    }

    if (snapshot.attemptCount >= m_settings.maxAttempts) {
      return finish(path, LockPhase::Exhausted,
                    "file still locked after " +
                        std::to_string(snapshot.attemptCount) + " attempts");
    }

    {
      std::lock_guard<std::mutex> lock(m_mutex);
      auto &state = m_states[path];
      state.nextRetryDeadline = Clock::now() + m_settings.retryInterval;
      snapshot = state;
    }
    report(path, snapshot);
  }
}

void LockedAccessRetrier::cancel() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cancelled = true;
  }
  m_cv.notify_all();
}

void LockedAccessRetrier::reset() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_cancelled = false;
}

LockPhase LockedAccessRetrier::phase(const std::string &path) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_states.find(path);
  return it == m_states.end() ? LockPhase::Idle : it->second.phase;
}

std::optional<LockRetryState>
LockedAccessRetrier::state(const std::string &path) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_states.find(path);
  if (it == m_states.end())
    return std::nullopt;
  return it->second;
}

} // namespace labxfer
