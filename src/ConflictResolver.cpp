#include "ConflictResolver.hpp"
#include "FileSystemScanner.hpp"
#include <iostream>

namespace labxfer {

ConflictResolver::ConflictResolver(ConflictPolicy policy) : m_policy(policy) {}

ConflictAction ConflictResolver::resolve(const std::string &path,
                                         const std::string &localDigest,
                                         const std::string &remoteIdentifier,
                                         std::optional<int64_t> remoteMtime) {
  return resolve(path, localDigest, remoteIdentifier, policy(), remoteMtime);
}

ConflictAction ConflictResolver::resolve(const std::string &path,
                                         const std::string &localDigest,
                                         const std::string &remoteIdentifier,
                                         ConflictPolicy policy,
                                         std::optional<int64_t> remoteMtime) {
  std::optional<ConflictAction> batch;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_overrides.find(path);
    if (it != m_overrides.end()) {
      ConflictAction action = it->second;
      m_overrides.erase(it);
      return action;
    }
    batch = m_applyToAll;
  }

  ConflictAction action = ConflictAction::DeferToExternal;
  switch (policy) {
  case ConflictPolicy::AlwaysUpload:
    action = ConflictAction::UploadOverwrite;
    break;
  case ConflictPolicy::AlwaysSkip:
    action = ConflictAction::Skip;
    break;
  case ConflictPolicy::PreferNewer: {
    auto local = FileSystemScanner::statFile(path);
    if (!local || !remoteMtime)
      break;
    if (local->mtime > *remoteMtime + kMtimeToleranceSeconds)
      action = ConflictAction::UploadOverwrite;
    else
      action = ConflictAction::Skip;
    break;
  }
  case ConflictPolicy::AskExternal:
    break;
  }

  if (action == ConflictAction::DeferToExternal && batch)
    action = *batch;

  std::cout << "[Conflict] " << path << " (local "
            << localDigest.substr(0, 8) << ", remote "
            << (remoteIdentifier.empty() ? std::string("?")
                                         : remoteIdentifier.substr(0, 8))
            << ", policy " << toString(policy) << ") -> " << toString(action)
            << std::endl;
  return action;
}

void ConflictResolver::setOverride(const std::string &path,
                                   ConflictAction action) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_overrides[path] = action;
}

void ConflictResolver::clearOverride(const std::string &path) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_overrides.erase(path);
}

void ConflictResolver::applyToAll(ConflictAction action) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (action == ConflictAction::DeferToExternal)
    m_applyToAll.reset();
  else
    m_applyToAll = action;
}

void ConflictResolver::clearApplyToAll() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_applyToAll.reset();
}

std::optional<ConflictAction> ConflictResolver::batchOverride() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_applyToAll;
}

ConflictPolicy ConflictResolver::policy() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_policy;
}

void ConflictResolver::setPolicy(ConflictPolicy policy) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_policy = policy;
}

std::string ConflictResolver::renamedPath(const std::string &remotePath,
                                          int64_t unixSeconds) {
  auto slash = remotePath.find_last_of('/');
  std::string dir =
      slash == std::string::npos ? std::string() : remotePath.substr(0, slash);
  std::string name =
      slash == std::string::npos ? remotePath : remotePath.substr(slash + 1);
  return dir + "/conflict_" + std::to_string(unixSeconds) + "_" + name;
}

} // namespace labxfer
