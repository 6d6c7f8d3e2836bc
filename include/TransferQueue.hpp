#pragma once
#include "StatusChannel.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace labxfer {

enum class ProcessOutcome {
  Complete,
  Failed,
  Suspended, // waiting for an external conflict decision
  Requeue    // hand the path back to stability tracking
};

struct ProcessResult {
  ProcessOutcome outcome;
  std::string reason;
};

/**
 * TransferQueue admits files in detection order and drains them with a
 * single worker thread. A path is in at most one of the queued, processing
 * and suspended sets at any time.
 *
 * An admission refused because the path is processing is remembered; once
 * the item completes or fails the path goes to the requeue handler, so a
 * write that lands during an upload is picked up again.
 */
class TransferQueue {
public:
  using Processor = std::function<ProcessResult(const QueueItem &item)>;
  // Returns true when the file was already uploaded unchanged.
  using UploadedCheck = std::function<bool(const std::string &localPath,
                                           const std::string &remotePath)>;
  using RequeueHandler = std::function<void(const std::string &localPath)>;

  // Statuses of finished paths kept for status(); older ones are dropped
  static constexpr std::size_t kDefaultFinishedLimit = 4096;

  explicit TransferQueue(StatusChannel *channel = nullptr,
                         std::size_t finishedLimit = kDefaultFinishedLimit);
  ~TransferQueue();

  void setProcessor(Processor processor);
  void setUploadedCheck(UploadedCheck check);
  void setRequeueHandler(RequeueHandler handler);

  bool admit(const std::string &localPath, const std::string &remotePath);

  // Moves a suspended item back to the tail with the decided action.
  bool resume(const std::string &localPath, ConflictAction action);

  void start();
  void stop();

  // Runs one item on the calling thread; false when the queue was empty.
  bool processNext();

  bool waitUntilIdle(std::chrono::milliseconds timeout);

  bool isQueued(const std::string &localPath) const;
  bool isProcessing(const std::string &localPath) const;
  bool isSuspended(const std::string &localPath) const;
  std::optional<QueueStatus> status(const std::string &localPath) const;
  std::size_t queuedCount() const;
  std::vector<std::string> suspendedPaths() const;

private:
  StatusChannel *m_channel;
  Processor m_processor;
  UploadedCheck m_uploadedCheck;
  RequeueHandler m_requeueHandler;

  std::deque<QueueItem> m_queue;
  std::set<std::string> m_queued;
  std::set<std::string> m_processing;
  std::map<std::string, QueueItem> m_suspended;
  std::set<std::string> m_retriggered; // refused while processing
  std::map<std::string, QueueStatus> m_statuses;
  std::deque<std::string> m_finished; // oldest first
  std::size_t m_finishedLimit;

  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::condition_variable m_idleCv;
  std::thread m_worker;
  bool m_stopping = false;
  std::atomic<bool> m_running{false};

  struct ProcessingGuard;

  void workerLoop();
  std::optional<QueueItem> takeNext(bool wait);
  void runItem(QueueItem item);
  void finishProcessing(const QueueItem &item, ProcessOutcome outcome);
  bool isBusyLocked(const std::string &localPath) const;
  void setStatusLocked(const std::string &localPath, QueueStatus status);
  void publish(StatusType type, const QueueItem &item,
               const std::string &message);
};

} // namespace labxfer
