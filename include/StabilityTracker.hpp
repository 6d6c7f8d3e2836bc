#pragma once
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace labxfer {

/**
 * StabilityTracker holds candidate files until their size has stopped
 * changing for the stability window. Deadlines are only evaluated in
 * tick(), which the tracker's own thread calls every poll interval.
 */
class StabilityTracker {
public:
  using ReadyCallback = std::function<void(const std::string &path)>;

  StabilityTracker(std::chrono::milliseconds window,
                   std::chrono::milliseconds pollInterval,
                   ReadyCallback onReady);
  ~StabilityTracker();

  void observe(const std::string &path);
  void observe(const std::string &path, Clock::time_point now);

  // Returns the number of files that became ready.
  std::size_t tick(Clock::time_point now);

  void start();
  void stop();

  bool isPending(const std::string &path) const;
  std::size_t pendingCount() const;

private:
  std::chrono::milliseconds m_window;
  std::chrono::milliseconds m_pollInterval;
  ReadyCallback m_onReady;

  std::map<std::string, PendingEntry> m_pending;
  mutable std::mutex m_mutex;

  std::thread m_thread;
  std::atomic<bool> m_running{false};
  std::mutex m_sleepMutex;
  std::condition_variable m_sleepCv;

  void tickLoop();
  static std::optional<int64_t> currentSize(const std::string &path);
};

} // namespace labxfer
