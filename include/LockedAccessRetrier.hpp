#pragma once
#include "Config.hpp"
#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace labxfer {

enum class LockPhase { Idle, Waiting, Retrying, Resolved, Exhausted, Cancelled };

struct LockRetryState {
  int attemptCount; // includes the access that first failed
  Clock::time_point firstFailure;
  Clock::time_point nextRetryDeadline;
  LockPhase phase;
};

struct LockRetryOutcome {
  LockPhase phase;
  int attempts;
  std::string reason;
};

/**
 * LockedAccessRetrier drives a file that an external writer still holds
 * through Waiting (initialWait) and Retrying (every retryInterval, up to
 * maxAttempts). run() blocks the calling worker; cancel() wakes it.
 */
class LockedAccessRetrier {
public:
  using Attempt = std::function<AccessStatus()>;
  using ProgressListener = std::function<void(
      const std::string &path, const LockRetryState &state,
      std::chrono::milliseconds elapsed, std::chrono::milliseconds remaining)>;

  explicit LockedAccessRetrier(LockRetrySettings settings);

  // Called after the first access failed with AccessStatus::Locked.
  LockRetryOutcome run(const std::string &path, const Attempt &attempt);

  void cancel();
  void reset();

  LockPhase phase(const std::string &path) const;
  std::optional<LockRetryState> state(const std::string &path) const;

  void setProgressListener(ProgressListener listener);

  const LockRetrySettings &settings() const { return m_settings; }

private:
  LockRetrySettings m_settings;
  ProgressListener m_listener;

  std::map<std::string, LockRetryState> m_states;
  bool m_cancelled = false;
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;

  Clock::time_point finalDeadline(const LockRetryState &state) const;
  void report(const std::string &path, const LockRetryState &state);
  LockRetryOutcome finish(const std::string &path, LockPhase phase,
                          std::string reason);
};

const char *toString(LockPhase phase);

} // namespace labxfer
