#include "types.hpp"

namespace labxfer {

const char *toString(QueueStatus status) {
  switch (status) {
  case QueueStatus::Queued:
    return "Queued";
  case QueueStatus::Processing:
    return "Processing";
  case QueueStatus::Complete:
    return "Complete";
  case QueueStatus::Failed:
    return "Failed";
  }
  return "Unknown";
}

const char *toString(ConflictPolicy policy) {
  switch (policy) {
  case ConflictPolicy::AskExternal:
    return "ask";
  case ConflictPolicy::AlwaysUpload:
    return "upload";
  case ConflictPolicy::AlwaysSkip:
    return "skip";
  case ConflictPolicy::PreferNewer:
    return "newer";
  }
  return "ask";
}

const char *toString(ConflictAction action) {
  switch (action) {
  case ConflictAction::UploadOverwrite:
    return "UploadOverwrite";
  case ConflictAction::Skip:
    return "Skip";
  case ConflictAction::RenameAndUpload:
    return "RenameAndUpload";
  case ConflictAction::DeferToExternal:
    return "DeferToExternal";
  }
  return "Unknown";
}

const char *toString(StatusType type) {
  switch (type) {
  case StatusType::Queued:
    return "Queued";
  case StatusType::Progress:
    return "Progress";
  case StatusType::Verified:
    return "Verified";
  case StatusType::Skipped:
    return "Skipped";
  case StatusType::Failed:
    return "Failed";
  case StatusType::ConflictPending:
    return "ConflictPending";
  case StatusType::LockWait:
    return "LockWait";
  case StatusType::RemoteMissing:
    return "RemoteMissing";
  case StatusType::RemoteChanged:
    return "RemoteChanged";
  }
  return "Unknown";
}

const char *toString(VerifyOutcome outcome) {
  switch (outcome) {
  case VerifyOutcome::Verified:
    return "Verified";
  case VerifyOutcome::Accessible:
    return "Accessible";
  case VerifyOutcome::Divergent:
    return "Divergent";
  case VerifyOutcome::SizeMismatch:
    return "SizeMismatch";
  case VerifyOutcome::Failed:
    return "Failed";
  }
  return "Unknown";
}

} // namespace labxfer
