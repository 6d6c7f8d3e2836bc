#include "UploadEngine.hpp"
#include "FileSystemScanner.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

namespace labxfer {

namespace {

// Emits progress only when another progress step has been crossed, plus
// the final update.
class ProgressThrottle {
public:
  ProgressThrottle(const UploadEngine::ProgressCallback &callback,
                   int64_t total, int stepPercent)
      : m_callback(callback), m_total(total),
        m_step(std::max<int64_t>(1, total * stepPercent / 100)),
        m_next(m_step) {}

  void start() {
    if (m_callback)
      m_callback(0, m_total);
  }

  void update(int64_t bytes) {
    if (!m_callback || m_finished)
      return;
    if (bytes >= m_total) {
      m_finished = true;
      m_callback(m_total, m_total);
      return;
    }
    if (bytes < m_next)
      return;
    while (m_next <= bytes)
      m_next += m_step;
    m_callback(bytes, m_total);
  }

private:
  const UploadEngine::ProgressCallback &m_callback;
  int64_t m_total;
  int64_t m_step;
  int64_t m_next;
  bool m_finished = false;
};

UploadResult failed(std::string reason) {
  UploadResult result;
  result.status = UploadStatus::Failed;
  result.reason = std::move(reason);
  return result;
}

} // namespace

UploadEngine::UploadEngine(RemoteStore &store, ChecksumCache &cache,
                           const PipelineConfig &config)
    : m_store(store), m_cache(cache), m_config(config) {}

int64_t UploadEngine::chunkSizeFor(int64_t fileSize) const {
  return m_config.chunkSizeFor(fileSize);
}

bool UploadEngine::usesRangeUpload(int64_t fileSize) const {
  return fileSize >= m_config.rangeUploadThreshold;
}

std::string UploadEngine::parentOf(const std::string &remotePath) {
  auto slash = remotePath.find_last_of('/');
  if (slash == std::string::npos || slash == 0)
    return "/";
  return remotePath.substr(0, slash);
}

void UploadEngine::forgetDirectories() { m_knownDirectories.clear(); }

bool UploadEngine::ensureDirectory(const std::string &remoteDir) {
  if (remoteDir.empty() || remoteDir == "/")
    return true;
  if (m_knownDirectories.count(remoteDir))
    return true;

  std::vector<std::string> segments;
  std::stringstream ss(remoteDir);
  std::string item;
  while (std::getline(ss, item, '/')) {
    if (!item.empty())
      segments.push_back(item);
  }

  std::string current;
  for (const auto &segment : segments) {
    current += "/" + segment;
    if (m_knownDirectories.count(current))
      continue;
    RemoteResponse response =
        sendWithRetry("MKCOL " + current,
                      [&] { return m_store.makeCollection(current); });
    // 405 Method Not Allowed: the collection already exists
    if (!response.ok() && response.status != 405) {
      std::cerr << "[Upload] Cannot create remote directory " << current
                << ": " << response.describe() << std::endl;
      return false;
    }
    m_knownDirectories.insert(current);
  }
  return true;
}

RemoteResponse
UploadEngine::sendWithRetry(const std::string &what,
                            const std::function<RemoteResponse()> &send) {
  RemoteResponse response;
  for (int attempt = 0; attempt <= m_config.chunkRetries; ++attempt) {
    if (isCancelled()) {
      response = RemoteResponse{};
      response.error = "cancelled";
      return response;
    }
    response = send();
    if (response.ok() || !response.transient())
      return response;
    if (attempt < m_config.chunkRetries) {
      auto backoff = std::chrono::milliseconds(200 << std::min(attempt, 4));
      std::cout << "[Upload] " << what << " failed (" << response.describe()
                << "), retry " << attempt + 1 << "/" << m_config.chunkRetries
                << std::endl;
      std::this_thread::sleep_for(backoff);
    }
  }
  return response;
}

UploadResult UploadEngine::uploadSingle(std::istream &in,
                                        const std::string &remotePath,
                                        int64_t size,
                                        const ProgressCallback &progress) {
  ProgressThrottle throttle(progress, size, m_config.progressStepPercent);
  throttle.start();
  RemoteResponse response = sendWithRetry("PUT " + remotePath, [&] {
    in.clear();
    in.seekg(0);
    return m_store.putStream(remotePath, in, size);
  });
  if (!response.ok())
    return failed("upload failed: " + response.describe());
  throttle.update(size);

  UploadResult result;
  result.status = UploadStatus::Ok;
  return result;
}

UploadResult UploadEngine::uploadRanges(std::istream &in,
                                        const std::string &remotePath,
                                        int64_t size,
                                        const ProgressCallback &progress) {
  int64_t chunkSize = chunkSizeFor(size);
  std::vector<char> buffer(static_cast<std::size_t>(chunkSize));
  ProgressThrottle throttle(progress, size, m_config.progressStepPercent);
  throttle.start();

  int64_t offset = 0;
  while (offset < size) {
    if (isCancelled())
      return failed("cancelled");

    auto want = static_cast<std::streamsize>(std::min(chunkSize, size - offset));
    errno = 0;
    in.read(buffer.data(), want);
    if (in.gcount() != want) {
      int err = errno;
      UploadResult result;
      result.status = FileSystemScanner::classifyErrno(err) == AccessStatus::Locked
                          ? UploadStatus::Locked
                          : UploadStatus::Failed;
      result.reason = "local read failed at offset " + std::to_string(offset) +
                      (err ? std::string(": ") + std::strerror(err) : "");
      return result;
    }

    RemoteResponse response = sendWithRetry(
        "PUT " + remotePath + " @" + std::to_string(offset), [&] {
          return m_store.putRange(remotePath, buffer.data(),
                                  static_cast<std::size_t>(want), offset, size);
        });
    if (!response.ok()) {
      return failed("chunk at offset " + std::to_string(offset) +
                    " failed: " + response.describe());
    }
    offset += want;
    throttle.update(offset);
  }

  UploadResult result;
  result.status = UploadStatus::Ok;
  return result;
}

UploadResult UploadEngine::upload(const std::string &localPath,
                                  const std::string &remotePath,
                                  const ProgressCallback &progress) {
  DigestResult digest = m_cache.digest(localPath);
  if (digest.status == AccessStatus::Locked) {
    UploadResult result;
    result.status = UploadStatus::Locked;
    result.reason = "file locked while hashing: " + digest.error;
    return result;
  }
  if (!digest.ok())
    return failed("cannot hash file: " + digest.error);

  auto before = FileSystemScanner::statFile(localPath);
  if (!before)
    return failed("file disappeared before upload");

  std::ifstream in;
  std::string error;
  AccessStatus access = FileSystemScanner::openForRead(localPath, in, error);
  if (access == AccessStatus::Locked) {
    UploadResult result;
    result.status = UploadStatus::Locked;
    result.reason = "file locked: " + error;
    return result;
  }
  if (access != AccessStatus::Ok)
    return failed("cannot open file: " + error);

  if (!ensureDirectory(parentOf(remotePath)))
    return failed("cannot create remote directory " + parentOf(remotePath));

  bool ranged = usesRangeUpload(before->size);
  std::cout << "[Upload] " << localPath << " -> " << remotePath << " ("
            << before->size << " bytes, "
            << (ranged ? "ranged, chunk " + std::to_string(chunkSizeFor(before->size))
                       : std::string("single request"))
            << ")" << std::endl;

  UploadResult result = ranged
                            ? uploadRanges(in, remotePath, before->size, progress)
                            : uploadSingle(in, remotePath, before->size, progress);
  if (result.status != UploadStatus::Ok)
    return result;

  auto after = FileSystemScanner::statFile(localPath);
  if (!after || after->size != before->size || after->mtime != before->mtime) {
    UploadResult changed;
    changed.status = UploadStatus::Changed;
    changed.reason = "file changed during upload";
    changed.size = before->size;
    return changed;
  }

  RemoteResponse sidecar = m_store.putText(remotePath + ".checksum", digest.digest);
  if (!sidecar.ok()) {
    std::cerr << "[Upload] Failed to store checksum for " << remotePath << ": "
              << sidecar.describe() << std::endl;
  }

  result.digest = digest.digest;
  result.size = before->size;
  return result;
}

} // namespace labxfer
