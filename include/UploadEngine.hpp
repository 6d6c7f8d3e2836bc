#pragma once
#include "ChecksumCache.hpp"
#include "Config.hpp"
#include "RemoteStore.hpp"
#include "types.hpp"
#include <atomic>
#include <functional>
#include <set>
#include <string>

namespace labxfer {

/**
 * UploadEngine sends one local file to the remote store. Small files go
 * out as a single streamed PUT; files at or above the range threshold are
 * sent as sequential Content-Range PUTs sized by the chunk tiers.
 *
 * Only the transfer worker uses an engine, so it is not synchronized.
 */
class UploadEngine {
public:
  using ProgressCallback = std::function<void(int64_t bytes, int64_t total)>;

  UploadEngine(RemoteStore &store, ChecksumCache &cache,
               const PipelineConfig &config);

  UploadResult upload(const std::string &localPath,
                      const std::string &remotePath,
                      const ProgressCallback &progress);

  // MKCOL for every missing segment; remembers what already exists.
  bool ensureDirectory(const std::string &remoteDir);
  void forgetDirectories();

  int64_t chunkSizeFor(int64_t fileSize) const;
  bool usesRangeUpload(int64_t fileSize) const;

  void setCancelFlag(const std::atomic<bool> *cancelled) {
    m_cancelled = cancelled;
  }

  static std::string parentOf(const std::string &remotePath);

private:
  RemoteStore &m_store;
  ChecksumCache &m_cache;
  const PipelineConfig &m_config;
  std::set<std::string> m_knownDirectories;
  const std::atomic<bool> *m_cancelled = nullptr;

  bool isCancelled() const { return m_cancelled && m_cancelled->load(); }

  RemoteResponse sendWithRetry(const std::string &what,
                               const std::function<RemoteResponse()> &send);
  UploadResult uploadSingle(std::istream &in, const std::string &remotePath,
                            int64_t size, const ProgressCallback &progress);
  UploadResult uploadRanges(std::istream &in, const std::string &remotePath,
                            int64_t size, const ProgressCallback &progress);
};

} // namespace labxfer
