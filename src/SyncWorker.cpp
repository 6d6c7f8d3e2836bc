#include "SyncWorker.hpp"
#include "FileSystemScanner.hpp"
#include <ctime>
#include <fstream>
#include <iostream>

namespace labxfer {

namespace {

// Drops a per-file override that the item did not consume.
struct OverrideScope {
  ConflictResolver &resolver;
  const std::string &path;

  ~OverrideScope() { resolver.clearOverride(path); }
};

} // namespace

SyncWorker::SyncWorker(RemoteStore &store, ChecksumCache &cache,
                       UploadEngine &engine, IntegrityVerifier &verifier,
                       ConflictResolver &resolver, UploadHistoryStore &history,
                       LockedAccessRetrier &retrier, StatusChannel &channel)
    : m_store(store), m_cache(cache), m_engine(engine), m_verifier(verifier),
      m_resolver(resolver), m_history(history), m_retrier(retrier),
      m_channel(channel) {}
SyncWorker::~SyncWorker() = default;

ProcessResult SyncWorker::process(const QueueItem &item) {
  std::cout << "[SyncWorker] Processing " << item.localPath << std::endl;

  DigestResult digest = m_cache.digest(item.localPath);
  if (digest.status == AccessStatus::Locked)
    return waitForLock(item, digest.error);
  if (digest.status == AccessStatus::Missing)
    return fail(item, item.remotePath, "file disappeared before upload");
  if (!digest.ok())
    return fail(item, item.remotePath, "cannot hash file: " + digest.error);

  // Resumed after an external conflict decision; a divergence after the
  // upload gets the same answer instead of a second prompt
  if (item.resolution) {
    m_resolver.setOverride(item.localPath, *item.resolution);
    OverrideScope scope{m_resolver, item.localPath};
    return apply(item, *item.resolution, item.remotePath, digest.digest, 1);
  }

  // Admission only trusts cached digests; this is the full check
  if (m_history.isUnchanged(item.localPath, item.remotePath, m_cache)) {
    emit(StatusType::Skipped, item, item.remotePath,
         "already uploaded, unchanged");
    return ProcessResult{ProcessOutcome::Complete, "unchanged"};
  }

  auto remote = m_store.stat(item.remotePath);
  if (!remote)
    return fail(item, item.remotePath, "remote stat failed");

  if (remote->exists) {
    VerifyResult existing = m_verifier.compareExisting(
        item.localPath, item.remotePath, digest.digest, *remote);
    switch (existing.outcome) {
    case VerifyOutcome::Verified:
      return complete(item, item.remotePath, digest.digest, remote->size,
                      "already on server: " + existing.reason);
    case VerifyOutcome::Divergent: {
      std::cout << "[SyncWorker] " << existing.reason << std::endl;
      if (isPreviousUpload(item, *remote, existing)) {
        std::cout << "[SyncWorker] Remote " << item.remotePath
                  << " holds our previous upload, replacing it" << std::endl;
        return transfer(item, item.remotePath, 1);
      }
      ConflictAction action =
          m_resolver.resolve(item.localPath, digest.digest,
                             existing.remoteIdentifier, existing.remoteMtime);
      return apply(item, action, item.remotePath, digest.digest, 1);
    }
    case VerifyOutcome::Failed:
    case VerifyOutcome::SizeMismatch:
      return fail(item, item.remotePath, existing.reason);
    case VerifyOutcome::Accessible:
      // Nothing comparable on the server; the local copy wins
      std::cout << "[SyncWorker] Remote " << item.remotePath
                << " exists without a comparable identifier, overwriting"
                << std::endl;
      break;
    }
  }

  return transfer(item, item.remotePath, 1);
}

bool SyncWorker::isPreviousUpload(const QueueItem &item,
                                  const RemoteFileInfo &remote,
                                  const VerifyResult &existing) {
  auto interrupted = m_interrupted.find(item.remotePath);
  if (interrupted != m_interrupted.end()) {
    bool ours = remote.size == interrupted->second;
    m_interrupted.erase(interrupted);
    if (ours)
      return true;
  }

  auto previous = m_history.find(item.localPath);
  if (!previous || previous->outcome != UploadHistoryStore::kUploaded ||
      previous->remotePath != item.remotePath)
    return false;
  switch (IntegrityVerifier::compareIdentifier(existing.remoteIdentifier,
                                               previous->digest)) {
  case IdentityMatch::Equal:
    return true;
  case IdentityMatch::Different:
    return false;
  case IdentityMatch::Inconclusive:
    break;
  }
  return remote.size == previous->size;
}

ProcessResult SyncWorker::apply(const QueueItem &item, ConflictAction action,
                                const std::string &target,
                                const std::string &digest, int reuploadsLeft) {
  switch (action) {
  case ConflictAction::Skip: {
    std::cout << "[SyncWorker] Keeping remote version of " << target
              << std::endl;
    // Remembered so the same content is not offered again
    auto local = FileSystemScanner::statFile(item.localPath);
    if (local &&
        !m_history.record(item.localPath, target, digest, local->size,
                          item.remotePath, UploadHistoryStore::kKeptRemote)) {
      std::cerr << "[SyncWorker] History write for " << item.localPath
                << " deferred to next flush" << std::endl;
    }
    emit(StatusType::Skipped, item, target, "conflict: remote version kept");
    return ProcessResult{ProcessOutcome::Complete, "skipped"};
  }
  case ConflictAction::UploadOverwrite:
    return transfer(item, target, reuploadsLeft);
  case ConflictAction::RenameAndUpload: {
    std::string renamed = ConflictResolver::renamedPath(
        target, static_cast<int64_t>(std::time(nullptr)));
    std::cout << "[SyncWorker] Uploading " << item.localPath << " as "
              << renamed << std::endl;
    return transfer(item, renamed, reuploadsLeft);
  }
  case ConflictAction::DeferToExternal:
    emit(StatusType::ConflictPending, item, target,
         "remote content differs, waiting for a decision");
    return ProcessResult{ProcessOutcome::Suspended, "conflict pending"};
  }
  return fail(item, target, "unknown conflict action");
}

ProcessResult SyncWorker::transfer(const QueueItem &item,
                                   const std::string &target,
                                   int reuploadsLeft) {
  UploadResult upload = m_engine.upload(
      item.localPath, target, [&](int64_t bytes, int64_t total) {
        emit(StatusType::Progress, item, target, "uploading", bytes, total);
      });
  if (upload.status == UploadStatus::Locked)
    return waitForLock(item, upload.reason);
  if (upload.status == UploadStatus::Changed) {
    std::cout << "[SyncWorker] " << item.localPath
              << " is still being written, back to stability tracking"
              << std::endl;
    m_interrupted[target] = upload.size;
    emit(StatusType::LockWait, item, target,
         upload.reason + ", waiting for stability");
    return ProcessResult{ProcessOutcome::Requeue, upload.reason};
  }
  if (upload.status != UploadStatus::Ok)
    return fail(item, target, upload.reason);
  m_interrupted.erase(target);

  VerifyResult verified =
      m_verifier.verify(item.localPath, target, upload.digest);
  if (verified.ok())
    return complete(item, target, upload.digest, upload.size, verified.reason);

  if (verified.outcome != VerifyOutcome::Divergent)
    return fail(item, target, "verification failed: " + verified.reason);

  if (reuploadsLeft <= 0)
    return fail(item, target,
                "remote content still differs after re-upload: " +
                    verified.reason);

  ConflictAction action = m_resolver.resolve(
      item.localPath, upload.digest, verified.remoteIdentifier,
      verified.remoteMtime);
  return apply(item, action, target, upload.digest, reuploadsLeft - 1);
}

ProcessResult SyncWorker::waitForLock(const QueueItem &item,
                                      const std::string &reason) {
  emit(StatusType::LockWait, item, item.remotePath, reason);

  const std::string path = item.localPath;
  LockRetryOutcome outcome = m_retrier.run(path, [&path] {
    std::ifstream in;
    std::string error;
    return FileSystemScanner::openForRead(path, in, error);
  });

  switch (outcome.phase) {
  case LockPhase::Resolved:
    // Size may have changed while the writer held the file
    emit(StatusType::LockWait, item, item.remotePath,
         "lock released after " + std::to_string(outcome.attempts) +
             " attempts, waiting for stability");
    return ProcessResult{ProcessOutcome::Requeue, "lock released"};
  case LockPhase::Cancelled:
    return fail(item, item.remotePath, "cancelled while waiting for lock");
  default:
    return fail(item, item.remotePath, outcome.reason);
  }
}

ProcessResult SyncWorker::complete(const QueueItem &item,
                                   const std::string &target,
                                   const std::string &digest, int64_t size,
                                   const std::string &reason) {
  const char *outcome = target == item.remotePath
                            ? UploadHistoryStore::kUploaded
                            : UploadHistoryStore::kRenamed;
  if (!m_history.record(item.localPath, target, digest, size, item.remotePath,
                        outcome)) {
    std::cerr << "[SyncWorker] History write for " << item.localPath
              << " deferred to next flush" << std::endl;
  }
  std::cout << "[SyncWorker] Done " << item.localPath << " -> " << target
            << " (" << reason << ")" << std::endl;
  emit(StatusType::Verified, item, target, reason, size, size);
  return ProcessResult{ProcessOutcome::Complete, reason};
}

ProcessResult SyncWorker::fail(const QueueItem &item, const std::string &target,
                               const std::string &reason) {
  std::cerr << "[SyncWorker] Failed " << item.localPath << ": " << reason
            << std::endl;
  emit(StatusType::Failed, item, target, reason);
  return ProcessResult{ProcessOutcome::Failed, reason};
}

void SyncWorker::emit(StatusType type, const QueueItem &item,
                      const std::string &target, const std::string &message,
                      int64_t bytes, int64_t total) {
  StatusEvent event;
  event.type = type;
  event.path = item.localPath;
  event.remotePath = target;
  event.bytes = bytes;
  event.total = total;
  event.message = message;
  m_channel.publish(std::move(event));
}

} // namespace labxfer
