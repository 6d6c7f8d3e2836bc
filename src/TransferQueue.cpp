#include "TransferQueue.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

namespace labxfer {

// Clears the processing entry on every exit path of runItem.
struct TransferQueue::ProcessingGuard {
  TransferQueue &queue;
  QueueItem item;
  ProcessOutcome outcome = ProcessOutcome::Failed;

  ~ProcessingGuard() { queue.finishProcessing(item, outcome); }
};

TransferQueue::TransferQueue(StatusChannel *channel, std::size_t finishedLimit)
    : m_channel(channel), m_finishedLimit(finishedLimit) {}

TransferQueue::~TransferQueue() { stop(); }

void TransferQueue::setProcessor(Processor processor) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_processor = std::move(processor);
}

void TransferQueue::setUploadedCheck(UploadedCheck check) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_uploadedCheck = std::move(check);
}

void TransferQueue::setRequeueHandler(RequeueHandler handler) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_requeueHandler = std::move(handler);
}

bool TransferQueue::isBusyLocked(const std::string &localPath) const {
  return m_queued.count(localPath) || m_processing.count(localPath) ||
         m_suspended.count(localPath);
}

void TransferQueue::setStatusLocked(const std::string &localPath,
                                    QueueStatus status) {
  m_statuses[localPath] = status;
  auto it = std::find(m_finished.begin(), m_finished.end(), localPath);
  if (it != m_finished.end())
    m_finished.erase(it);
  if (status != QueueStatus::Complete && status != QueueStatus::Failed)
    return;

  m_finished.push_back(localPath);
  while (m_finished.size() > m_finishedLimit) {
    m_statuses.erase(m_finished.front());
    m_finished.pop_front();
  }
}

bool TransferQueue::admit(const std::string &localPath,
                          const std::string &remotePath) {
  UploadedCheck check;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (isBusyLocked(localPath)) {
      if (m_processing.count(localPath))
        m_retriggered.insert(localPath);
      std::cout << "[Queue] Already tracked: " << localPath << std::endl;
      return false;
    }
    check = m_uploadedCheck;
  }

  // Hashing may happen here, so it runs without the queue lock
  if (check && check(localPath, remotePath)) {
    std::cout << "[Queue] Unchanged since last upload: " << localPath
              << std::endl;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      setStatusLocked(localPath, QueueStatus::Complete);
    }
    QueueItem item{localPath, remotePath, QueueStatus::Complete, std::nullopt};
    publish(StatusType::Skipped, item, "already uploaded, unchanged");
    return false;
  }

  QueueItem item{localPath, remotePath, QueueStatus::Queued, std::nullopt};
  std::size_t depth = 0;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (isBusyLocked(localPath)) {
      if (m_processing.count(localPath))
        m_retriggered.insert(localPath);
      return false;
    }
    m_queue.push_back(item);
    m_queued.insert(localPath);
    setStatusLocked(localPath, QueueStatus::Queued);
    depth = m_queue.size();
  }
  m_cv.notify_one();

  std::cout << "[Queue] Queued " << localPath << " -> " << remotePath
            << " (depth " << depth << ")" << std::endl;
  publish(StatusType::Queued, item, "queued for upload");
  return true;
}

bool TransferQueue::resume(const std::string &localPath,
                           ConflictAction action) {
  if (action == ConflictAction::DeferToExternal)
    return false;

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_suspended.find(localPath);
    if (it == m_suspended.end())
      return false;
    QueueItem item = it->second;
    m_suspended.erase(it);
    item.status = QueueStatus::Queued;
    item.resolution = action;
    m_queue.push_back(item);
    m_queued.insert(localPath);
    setStatusLocked(localPath, QueueStatus::Queued);
  }
  m_cv.notify_one();

  std::cout << "[Queue] Resumed " << localPath << " with "
            << toString(action) << std::endl;
  return true;
}

void TransferQueue::start() {
  if (m_running.exchange(true))
    return;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopping = false;
  }
  m_worker = std::thread(&TransferQueue::workerLoop, this);
}

void TransferQueue::stop() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopping = true;
  }
  m_cv.notify_all();
  if (m_worker.joinable())
    m_worker.join();

  if (m_running.exchange(false)) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_queue.empty())
      std::cout << "[Queue] Stopped with " << m_queue.size()
                << " item(s) still queued" << std::endl;
  }
}

std::optional<QueueItem> TransferQueue::takeNext(bool wait) {
  std::unique_lock<std::mutex> lock(m_mutex);
  if (wait)
    m_cv.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
  if (m_stopping && wait)
    return std::nullopt;
  if (m_queue.empty())
    return std::nullopt;

  QueueItem item = std::move(m_queue.front());
  m_queue.pop_front();
  m_queued.erase(item.localPath);
  m_processing.insert(item.localPath);
  setStatusLocked(item.localPath, QueueStatus::Processing);
  item.status = QueueStatus::Processing;
  return item;
}

void TransferQueue::workerLoop() {
  while (auto item = takeNext(true))
    runItem(std::move(*item));
}

bool TransferQueue::processNext() {
  auto item = takeNext(false);
  if (!item)
    return false;
  runItem(std::move(*item));
  return true;
}

void TransferQueue::runItem(QueueItem item) {
  ProcessingGuard guard{*this, item};
  Processor processor;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    processor = m_processor;
  }
  if (!processor) {
    std::cerr << "[Queue] No processor set, dropping " << item.localPath
              << std::endl;
    publish(StatusType::Failed, item, "no processor configured");
    return;
  }

  try {
    ProcessResult result = processor(item);
    guard.outcome = result.outcome;
  } catch (const std::exception &e) {
    std::cerr << "[Queue] Error processing " << item.localPath << ": "
              << e.what() << std::endl;
    publish(StatusType::Failed, item, std::string("internal error: ") + e.what());
    guard.outcome = ProcessOutcome::Failed;
  }
}

void TransferQueue::finishProcessing(const QueueItem &item,
                                     ProcessOutcome outcome) {
  RequeueHandler handler;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_processing.erase(item.localPath);
    bool retriggered = m_retriggered.erase(item.localPath) > 0;
    switch (outcome) {
    case ProcessOutcome::Complete:
    case ProcessOutcome::Failed:
      setStatusLocked(item.localPath, outcome == ProcessOutcome::Complete
                                          ? QueueStatus::Complete
                                          : QueueStatus::Failed);
      if (retriggered) {
        std::cout << "[Queue] " << item.localPath
                  << " changed while processing, handing back" << std::endl;
        handler = m_requeueHandler;
      }
      break;
    case ProcessOutcome::Suspended: {
      // Resuming reads the file again, so a pending change is not lost
      QueueItem suspended = item;
      suspended.status = QueueStatus::Queued;
      suspended.resolution.reset();
      m_suspended[item.localPath] = suspended;
      setStatusLocked(item.localPath, QueueStatus::Queued);
      break;
    }
    case ProcessOutcome::Requeue:
      m_statuses.erase(item.localPath);
      handler = m_requeueHandler;
      break;
    }
  }
  m_idleCv.notify_all();

  if (handler) {
    try {
      handler(item.localPath);
    } catch (const std::exception &e) {
      std::cerr << "[Queue] Requeue of " << item.localPath
                << " failed: " << e.what() << std::endl;
    }
  }
}

bool TransferQueue::waitUntilIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(m_mutex);
  return m_idleCv.wait_for(lock, timeout, [this] {
    return m_queue.empty() && m_processing.empty();
  });
}

bool TransferQueue::isQueued(const std::string &localPath) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_queued.count(localPath) > 0;
}

bool TransferQueue::isProcessing(const std::string &localPath) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_processing.count(localPath) > 0;
}

bool TransferQueue::isSuspended(const std::string &localPath) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_suspended.count(localPath) > 0;
}

std::optional<QueueStatus>
TransferQueue::status(const std::string &localPath) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_statuses.find(localPath);
  if (it == m_statuses.end())
    return std::nullopt;
  return it->second;
}

std::size_t TransferQueue::queuedCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_queue.size();
}

std::vector<std::string> TransferQueue::suspendedPaths() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::vector<std::string> paths;
  for (const auto &entry : m_suspended)
    paths.push_back(entry.first);
  return paths;
}

void TransferQueue::publish(StatusType type, const QueueItem &item,
                            const std::string &message) {
  if (!m_channel)
    return;
  StatusEvent event;
  event.type = type;
  event.path = item.localPath;
  event.remotePath = item.remotePath;
  event.message = message;
  m_channel->publish(std::move(event));
}

} // namespace labxfer
