#pragma once
#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <vector>

namespace labxfer {

/**
 * StatusChannel carries typed pipeline events to consumers on other
 * threads. publish() never blocks on a consumer.
 */
class StatusChannel {
public:
  explicit StatusChannel(std::size_t maxBacklog = 10000);

  void publish(StatusEvent event);

  std::optional<StatusEvent> poll();
  std::optional<StatusEvent> waitFor(std::chrono::milliseconds timeout);
  std::vector<StatusEvent> drain();

  std::size_t size() const;

private:
  std::size_t m_maxBacklog;
  std::deque<StatusEvent> m_events;
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
};

} // namespace labxfer
