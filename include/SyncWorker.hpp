#ifndef LABXFER_SYNCWORKER_HPP
#define LABXFER_SYNCWORKER_HPP

#include "ChecksumCache.hpp"
#include "ConflictResolver.hpp"
#include "IntegrityVerifier.hpp"
#include "LockedAccessRetrier.hpp"
#include "RemoteStore.hpp"
#include "StatusChannel.hpp"
#include "TransferQueue.hpp"
#include "UploadEngine.hpp"
#include "UploadHistoryStore.hpp"
#include <cstdint>
#include <map>
#include <string>

namespace labxfer {

/**
 * SyncWorker drives one queue item through the pipeline:
 * digest -> history -> remote stat -> upload -> verify -> history.
 *
 * A lock on the local file blocks this worker in LockedAccessRetrier and
 * the item is handed back to stability tracking once the lock clears.
 * Divergent remote content goes to ConflictResolver unless it is the
 * previous upload of the same file; after an upload at
 * most one more upload is attempted for the same item.
 */
class SyncWorker {
public:
  SyncWorker(RemoteStore &store, ChecksumCache &cache, UploadEngine &engine,
             IntegrityVerifier &verifier, ConflictResolver &resolver,
             UploadHistoryStore &history, LockedAccessRetrier &retrier,
             StatusChannel &channel);
  ~SyncWorker();

  ProcessResult process(const QueueItem &item);

private:
  RemoteStore &m_store;
  ChecksumCache &m_cache;
  UploadEngine &m_engine;
  IntegrityVerifier &m_verifier;
  ConflictResolver &m_resolver;
  UploadHistoryStore &m_history;
  LockedAccessRetrier &m_retrier;
  StatusChannel &m_channel;
  // Remote path -> bytes written by an upload the local file outgrew
  std::map<std::string, int64_t> m_interrupted;

  // Remote content still matches what this pipeline last uploaded
  bool isPreviousUpload(const QueueItem &item, const RemoteFileInfo &remote,
                        const VerifyResult &existing);
  ProcessResult apply(const QueueItem &item, ConflictAction action,
                      const std::string &target, const std::string &digest,
                      int reuploadsLeft);
  ProcessResult transfer(const QueueItem &item, const std::string &target,
                         int reuploadsLeft);
  ProcessResult waitForLock(const QueueItem &item, const std::string &reason);
  ProcessResult complete(const QueueItem &item, const std::string &target,
                         const std::string &digest, int64_t size,
                         const std::string &reason);
  ProcessResult fail(const QueueItem &item, const std::string &target,
                     const std::string &reason);
  void emit(StatusType type, const QueueItem &item, const std::string &target,
            const std::string &message, int64_t bytes = 0, int64_t total = 0);
};

} // namespace labxfer
#endif
