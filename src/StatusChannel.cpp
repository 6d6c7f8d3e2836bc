#include "StatusChannel.hpp"

namespace labxfer {

StatusChannel::StatusChannel(std::size_t maxBacklog)
    : m_maxBacklog(maxBacklog) {}

void StatusChannel::publish(StatusEvent event) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    // A consumer that stopped polling must not grow the backlog unbounded
    if (m_events.size() >= m_maxBacklog)
      m_events.pop_front();
    m_events.push_back(std::move(event));
  }
  m_cv.notify_one();
}

std::optional<StatusEvent> StatusChannel::poll() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_events.empty())
    return std::nullopt;
  StatusEvent event = std::move(m_events.front());
  m_events.pop_front();
  return event;
}

std::optional<StatusEvent>
StatusChannel::waitFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(m_mutex);
  if (!m_cv.wait_for(lock, timeout, [this] { return !m_events.empty(); }))
    return std::nullopt;
  StatusEvent event = std::move(m_events.front());
  m_events.pop_front();
  return event;
}

std::vector<StatusEvent> StatusChannel::drain() {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::vector<StatusEvent> events(std::make_move_iterator(m_events.begin()),
                                  std::make_move_iterator(m_events.end()));
  m_events.clear();
  return events;
}

std::size_t StatusChannel::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_events.size();
}

} // namespace labxfer
