#include "TransferPipeline.hpp"
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace labxfer {

namespace {

std::string stateDirOf(const PipelineConfig &config) {
  return config.stateDirectory.empty() ? defaultStateDirectory()
                                       : config.stateDirectory;
}

std::string statePath(const PipelineConfig &config, const std::string &name) {
  return (fs::path(stateDirOf(config)) / name).string();
}

} // namespace

TransferPipeline::TransferPipeline(const PipelineConfig &config,
                                   RemoteStore &store,
                                   std::unique_ptr<ChecksumCache> cache)
    : m_config(config), m_store(store),
      m_scanner(config.localDirectory, config.extensions, config.recursive),
      m_cache(cache ? std::move(cache)
                    : std::make_unique<ChecksumCache>(
                          statePath(config, "checksum_cache.json"),
                          config.cacheCapacity, config.cacheEvictBatch)),
      m_history(statePath(config, "upload_history.db")),
      m_retrier(config.lockRetry), m_resolver(config.conflictPolicy),
      m_engine(store, *m_cache, m_config), m_verifier(store, m_config),
      m_worker(store, *m_cache, m_engine, m_verifier, m_resolver, m_history,
               m_retrier, m_channel),
      m_queue(&m_channel),
      m_tracker(config.stabilityWindow, config.stabilityPollInterval,
                [this](const std::string &path) {
                  m_queue.admit(path, remotePathFor(path));
                }),
      m_watcher(m_scanner, config.rescanInterval,
                [this](const std::string &path) { m_tracker.observe(path); }) {
  m_engine.setCancelFlag(&m_cancelled);

  m_queue.setProcessor(
      [this](const QueueItem &item) { return m_worker.process(item); });
  m_queue.setUploadedCheck(
      [this](const std::string &localPath, const std::string &remotePath) {
        // Cache only; hashing here would stall the stability thread
        return m_history.isUnchanged(localPath, remotePath, *m_cache, false);
      });
  m_queue.setRequeueHandler(
      [this](const std::string &localPath) { m_tracker.observe(localPath); });

  m_retrier.setProgressListener(
      [this](const std::string &path, const LockRetryState &state,
             std::chrono::milliseconds elapsed,
             std::chrono::milliseconds remaining) {
        StatusEvent event;
        event.type = StatusType::LockWait;
        event.path = path;
        event.remotePath = remotePathFor(path);
        event.message = std::string(toString(state.phase)) + ", attempt " +
                        std::to_string(state.attemptCount) + ", elapsed " +
                        std::to_string(elapsed.count() / 1000) +
                        "s, remaining " +
                        std::to_string(remaining.count() / 1000) + "s";
        m_channel.publish(std::move(event));
      });
}

TransferPipeline::~TransferPipeline() { stop(); }

bool TransferPipeline::start() {
  if (m_running.load())
    return true;

  std::error_code ec;
  if (!fs::is_directory(m_config.localDirectory, ec)) {
    std::cerr << "[Pipeline] Local directory does not exist: "
              << m_config.localDirectory << std::endl;
    return false;
  }
  fs::create_directories(stateDirOf(m_config), ec);
  if (ec) {
    std::cerr << "[Pipeline] Cannot create state directory "
              << stateDirOf(m_config) << ": " << ec.message() << std::endl;
    return false;
  }

  m_cache->load();
  if (!m_history.open()) {
    std::cerr << "[Pipeline] Upload history unavailable" << std::endl;
    return false;
  }

  m_cancelled.store(false);
  m_retrier.reset();
  m_engine.forgetDirectories();

  m_queue.start();
  m_tracker.start();
  if (!m_watcher.start()) {
    std::cerr << "[Pipeline] Watcher failed to start for "
              << m_config.localDirectory << std::endl;
    m_tracker.stop();
    m_queue.stop();
    m_history.close();
    return false;
  }
  m_running.store(true);
  m_persistThread = std::thread(&TransferPipeline::persistLoop, this);

  std::size_t found = scanExisting();
  std::cout << "[Pipeline] Monitoring " << m_config.localDirectory << " -> "
            << m_config.remotePath << " (" << found << " existing files)"
            << std::endl;

  if (m_config.verifyRemoteOnStart && m_history.size() > 0) {
    m_integrityThread = std::thread([this] {
      try {
        checkRemoteIntegrity();
      } catch (const std::exception &e) {
        std::cerr << "[Integrity] Startup check failed: " << e.what()
                  << std::endl;
      }
    });
  }
  return true;
}

void TransferPipeline::stop() {
  if (!m_running.exchange(false))
    return;

  std::cout << "[Pipeline] Stopping..." << std::endl;
  m_watcher.stop();
  m_tracker.stop();

  // Abort a lock wait or an upload in flight; neither reaches history
  m_cancelled.store(true);
  m_retrier.cancel();
  m_queue.stop();
  if (m_integrityThread.joinable())
    m_integrityThread.join();

  m_persistCv.notify_all();
  if (m_persistThread.joinable())
    m_persistThread.join();

  persist();
  m_history.close();
  std::cout << "[Pipeline] Stopped." << std::endl;
}

std::size_t TransferPipeline::scanExisting() {
  return m_scanner.scan(
      [this](const WatchedFile &file) { m_tracker.observe(file.path); });
}

bool TransferPipeline::enqueue(const std::string &localPath) {
  if (!m_scanner.isInScope(localPath)) {
    std::cerr << "[Pipeline] Not under " << m_scanner.rootPath() << ": "
              << localPath << std::endl;
    return false;
  }
  return m_queue.admit(localPath, remotePathFor(localPath));
}

bool TransferPipeline::resolveConflict(const std::string &localPath,
                                       ConflictAction action, bool applyToAll) {
  if (applyToAll) {
    m_resolver.applyToAll(action);
    for (const auto &path : m_queue.suspendedPaths()) {
      if (path != localPath)
        m_queue.resume(path, action);
    }
  }
  return m_queue.resume(localPath, action);
}

IntegrityReport TransferPipeline::checkRemoteIntegrity() {
  std::lock_guard<std::mutex> guard(m_integrityMutex);
  IntegrityReport report;

  for (const auto &record : m_history.all()) {
    if (m_cancelled.load())
      break;
    // Nothing of ours was written for a conflict settled in favour of the server
    if (record.outcome == UploadHistoryStore::kKeptRemote)
      continue;
    if (!FileSystemScanner::statFile(record.localPath)) {
      std::cout << "[Integrity] Local file gone, not checked: "
                << record.localPath << std::endl;
      continue;
    }
    ++report.total;

    auto remote = m_store.stat(record.remotePath);
    if (!remote) {
      ++report.errors;
      std::cerr << "[Integrity] Cannot reach " << record.remotePath
                << std::endl;
      continue;
    }
    if (!remote->exists) {
      ++report.missing;
      publishIntegrity(StatusType::RemoteMissing, record,
                       "remote copy not found, uploading again");
      if (!m_history.forget(record.localPath))
        std::cerr << "[Integrity] History entry for " << record.localPath
                  << " not removed from disk" << std::endl;
      m_tracker.observe(record.localPath);
      continue;
    }

    VerifyResult result = m_verifier.verifyExisting(
        record.remotePath, *remote, record.size, record.digest);
    switch (result.outcome) {
    case VerifyOutcome::Verified:
    case VerifyOutcome::Accessible:
      ++report.verified;
      break;
    case VerifyOutcome::Divergent:
    case VerifyOutcome::SizeMismatch:
      // Someone else may have replaced it on purpose; never called corrupt
      ++report.changed;
      publishIntegrity(StatusType::RemoteChanged, record,
                       "remote copy changed since upload: " + result.reason);
      break;
    case VerifyOutcome::Failed:
      ++report.errors;
      std::cerr << "[Integrity] " << record.remotePath << ": "
                << result.reason << std::endl;
      break;
    }
  }

  std::cout << "[Integrity] Checked " << report.total << ": "
            << report.verified << " verified, " << report.missing
            << " missing, " << report.changed << " changed, "
            << report.errors << " errors" << std::endl;
  return report;
}

void TransferPipeline::publishIntegrity(StatusType type,
                                        const UploadRecord &record,
                                        const std::string &message) {
  std::cout << "[Integrity] " << record.remotePath << ": " << message
            << std::endl;
  StatusEvent event;
  event.type = type;
  event.path = record.localPath;
  event.remotePath = record.remotePath;
  event.message = message;
  m_channel.publish(std::move(event));
}

std::string TransferPipeline::remotePathFor(const std::string &localPath) const {
  std::string relative;
  if (m_config.preserveStructure && m_scanner.isInScope(localPath))
    relative = m_scanner.toRelativePath(localPath);
  else
    relative = fs::path(localPath).filename().generic_string();

  std::string base = m_config.remotePath.empty() ? "/" : m_config.remotePath;
  if (base.front() != '/')
    base.insert(base.begin(), '/');
  while (base.size() > 1 && base.back() == '/')
    base.pop_back();
  while (!relative.empty() && relative.front() == '/')
    relative.erase(relative.begin());

  return base == "/" ? "/" + relative : base + "/" + relative;
}

void TransferPipeline::persist() {
  if (!m_cache->save())
    std::cerr << "[Pipeline] Checksum cache not saved" << std::endl;
  if (!m_history.flush())
    std::cerr << "[Pipeline] " << m_history.dirtyCount()
              << " history records still unsaved" << std::endl;
}

void TransferPipeline::persistLoop() {
  std::unique_lock<std::mutex> lock(m_persistMutex);
  while (m_running.load()) {
    m_persistCv.wait_for(lock, m_config.persistInterval,
                         [this] { return !m_running.load(); });
    if (!m_running.load())
      break;
    lock.unlock();
    persist();
    lock.lock();
  }
}

} // namespace labxfer
