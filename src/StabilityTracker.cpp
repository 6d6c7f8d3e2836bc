#include "StabilityTracker.hpp"
#include <filesystem>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

namespace labxfer {

StabilityTracker::StabilityTracker(std::chrono::milliseconds window,
                                   std::chrono::milliseconds pollInterval,
                                   ReadyCallback onReady)
    : m_window(window), m_pollInterval(pollInterval),
      m_onReady(std::move(onReady)) {}

StabilityTracker::~StabilityTracker() { stop(); }

std::optional<int64_t> StabilityTracker::currentSize(const std::string &path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec) || ec)
    return std::nullopt;
  auto size = fs::file_size(path, ec);
  if (ec)
    return std::nullopt;
  return static_cast<int64_t>(size);
}

void StabilityTracker::observe(const std::string &path) {
  observe(path, Clock::now());
}

void StabilityTracker::observe(const std::string &path, Clock::time_point now) {
  auto size = currentSize(path);

  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_pending.find(path);
  if (!size) {
    // Vanished between the notification and the stat
    if (it != m_pending.end())
      m_pending.erase(it);
    return;
  }

  if (it == m_pending.end()) {
    m_pending.emplace(path, PendingEntry{*size, now});
    std::cout << "[Stability] Started monitoring: " << path
              << " (size: " << *size << " bytes)" << std::endl;
  } else if (it->second.lastObservedSize != *size) {
    it->second = PendingEntry{*size, now};
  }
}

std::size_t StabilityTracker::tick(Clock::time_point now) {
  std::vector<std::pair<std::string, PendingEntry>> snapshot;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    snapshot.assign(m_pending.begin(), m_pending.end());
  }

  std::vector<std::string> ready;
  for (const auto &candidate : snapshot) {
    const std::string &path = candidate.first;
    auto size = currentSize(path);

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pending.find(path);
    if (it == m_pending.end())
      continue;
    if (!size) {
      m_pending.erase(it);
      continue;
    }
    if (*size != it->second.lastObservedSize) {
      it->second = PendingEntry{*size, now};
      continue;
    }
    if (now - it->second.lastChange >= m_window) {
      m_pending.erase(it);
      ready.push_back(path);
    }
  }

  for (const auto &path : ready) {
    std::cout << "[Stability] File is stable: " << path << std::endl;
    try {
      if (m_onReady)
        m_onReady(path);
    } catch (const std::exception &e) {
      std::cerr << "[Stability] Error handing off " << path << ": " << e.what()
                << std::endl;
    }
  }
  return ready.size();
}

void StabilityTracker::tickLoop() {
  while (m_running) {
    {
      std::unique_lock<std::mutex> lock(m_sleepMutex);
      m_sleepCv.wait_for(lock, m_pollInterval, [this] { return !m_running; });
    }
    if (!m_running)
      break;
    try {
      tick(Clock::now());
    } catch (const std::exception &e) {
      std::cerr << "[Stability] Tick failed: " << e.what() << std::endl;
    }
  }
}

void StabilityTracker::start() {
  if (m_running)
    return;
  m_running = true;
  m_thread = std::thread(&StabilityTracker::tickLoop, this);
}

void StabilityTracker::stop() {
  {
    std::lock_guard<std::mutex> lock(m_sleepMutex);
    m_running = false;
  }
  m_sleepCv.notify_all();
  if (m_thread.joinable())
    m_thread.join();
}

bool StabilityTracker::isPending(const std::string &path) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_pending.count(path) != 0;
}

std::size_t StabilityTracker::pendingCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_pending.size();
}

} // namespace labxfer
