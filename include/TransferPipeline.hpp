#pragma once
#include "ChecksumCache.hpp"
#include "Config.hpp"
#include "ConflictResolver.hpp"
#include "FileSystemScanner.hpp"
#include "FilesystemWatcher.hpp"
#include "IntegrityVerifier.hpp"
#include "LockedAccessRetrier.hpp"
#include "RemoteStore.hpp"
#include "StabilityTracker.hpp"
#include "StatusChannel.hpp"
#include "SyncWorker.hpp"
#include "TransferQueue.hpp"
#include "UploadEngine.hpp"
#include "UploadHistoryStore.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace labxfer {

// Outcome of walking the upload history against the server.
struct IntegrityReport {
  std::size_t total = 0;
  std::size_t verified = 0;
  std::size_t missing = 0; // gone remotely, handed back for upload
  std::size_t changed = 0; // present but different, reported only
  std::size_t errors = 0;
};

/**
 * TransferPipeline wires the components together and owns their threads:
 * the efsw listener, the stability tick, the upload worker and the
 * persistence timer. External collaborators talk to it through enqueue(),
 * resolveConflict() and the status channel.
 */
class TransferPipeline {
public:
  // A null cache makes the pipeline create one under the state directory.
  TransferPipeline(const PipelineConfig &config, RemoteStore &store,
                   std::unique_ptr<ChecksumCache> cache = nullptr);
  ~TransferPipeline();

  bool start();
  void stop();
  bool isRunning() const { return m_running.load(); }

  // Feeds every candidate on disk to the stability tracker.
  std::size_t scanExisting();

  // Direct admission, bypassing stability tracking.
  bool enqueue(const std::string &localPath);

  bool resolveConflict(const std::string &localPath, ConflictAction action,
                       bool applyToAll = false);

  // Re-checks every uploaded file on the server. Runs at start when
  // verifyRemoteOnStart is set; one check at a time.
  IntegrityReport checkRemoteIntegrity();

  std::string remotePathFor(const std::string &localPath) const;

  // Saves the checksum cache and retries unsaved history records.
  void persist();

  const PipelineConfig &config() const { return m_config; }
  StatusChannel &channel() { return m_channel; }
  TransferQueue &queue() { return m_queue; }
  StabilityTracker &tracker() { return m_tracker; }
  ChecksumCache &cache() { return *m_cache; }
  UploadHistoryStore &history() { return m_history; }
  ConflictResolver &resolver() { return m_resolver; }
  LockedAccessRetrier &retrier() { return m_retrier; }

private:
  PipelineConfig m_config;
  RemoteStore &m_store;
  StatusChannel m_channel;
  FileSystemScanner m_scanner;
  std::unique_ptr<ChecksumCache> m_cache;
  UploadHistoryStore m_history;
  LockedAccessRetrier m_retrier;
  ConflictResolver m_resolver;
  UploadEngine m_engine;
  IntegrityVerifier m_verifier;
  SyncWorker m_worker;
  TransferQueue m_queue;
  StabilityTracker m_tracker;
  FilesystemWatcher m_watcher;

  std::atomic<bool> m_running{false};
  std::atomic<bool> m_cancelled{false};
  std::thread m_persistThread;
  std::thread m_integrityThread;
  std::mutex m_integrityMutex;
  std::mutex m_persistMutex;
  std::condition_variable m_persistCv;

  void persistLoop();
  void publishIntegrity(StatusType type, const UploadRecord &record,
                        const std::string &message);
};

} // namespace labxfer
