#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace labxfer {

using Clock = std::chrono::steady_clock;

struct WatchedFile {
  std::string path; // Absolute local path
  std::string extension;
  int64_t size;
  int64_t mtime; // UTC timestamp, whole seconds
};

struct PendingEntry {
  int64_t lastObservedSize;
  Clock::time_point lastChange;
};

enum class AccessStatus { Ok, Locked, Missing, IOError };

struct DigestResult {
  AccessStatus status = AccessStatus::IOError;
  std::string digest; // lowercase hex, set when status == Ok
  std::string error;

  bool ok() const { return status == AccessStatus::Ok; }
};

enum class QueueStatus { Queued, Processing, Complete, Failed };

enum class ConflictPolicy { AskExternal, AlwaysUpload, AlwaysSkip, PreferNewer };

enum class ConflictAction { UploadOverwrite, Skip, RenameAndUpload, DeferToExternal };

struct QueueItem {
  std::string localPath;
  std::string remotePath;
  QueueStatus status = QueueStatus::Queued;
  // Decided by an external party after a DeferToExternal suspension
  std::optional<ConflictAction> resolution;
};

struct UploadRecord {
  std::string localPath;
  std::string remotePath;  // where the content went
  std::string destination; // where it was meant to go before any rename
  std::string outcome;     // see UploadHistoryStore::kUploaded and friends
  std::string digest;
  int64_t size;
  int64_t uploadedAt;
};

struct RemoteFileInfo {
  bool exists = false;
  int64_t size = 0;
  std::string etag;
  std::optional<int64_t> lastModified; // UTC timestamp
};

enum class UploadStatus {
  Ok,
  Locked,
  Changed, // the local file was written to while it was being sent
  Failed
};

struct UploadResult {
  UploadStatus status = UploadStatus::Failed;
  std::string digest;
  int64_t size = 0;
  std::string reason;
};

enum class VerifyOutcome {
  Verified,   // strong identity matched
  Accessible, // existence and readability only
  Divergent,
  SizeMismatch,
  Failed
};

struct VerifyResult {
  VerifyOutcome outcome = VerifyOutcome::Failed;
  std::string reason;
  std::string remoteIdentifier;
  std::optional<int64_t> remoteMtime;

  bool ok() const {
    return outcome == VerifyOutcome::Verified ||
           outcome == VerifyOutcome::Accessible;
  }
};

enum class StatusType {
  Queued,
  Progress,
  Verified,
  Skipped,
  Failed,
  ConflictPending,
  LockWait,
  RemoteMissing, // an uploaded copy is gone from the server
  RemoteChanged  // an uploaded copy no longer matches its record
};

struct StatusEvent {
  StatusType type;
  std::string path;
  std::string remotePath;
  int64_t bytes = 0;
  int64_t total = 0;
  std::string message;
};

const char *toString(QueueStatus status);
const char *toString(ConflictPolicy policy);
const char *toString(ConflictAction action);
const char *toString(StatusType type);
const char *toString(VerifyOutcome outcome);

} // namespace labxfer
