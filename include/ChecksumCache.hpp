#pragma once
#include "types.hpp"
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace labxfer {

/**
 * ChecksumCache memoizes SHA-256 digests keyed by path|size|mtime.
 *
 * A changed file produces a new key, so stale entries are never updated in
 * place; they age out through FIFO batch eviction. The cache persists to a
 * JSON file so that a restart does not re-hash unchanged files.
 */
class ChecksumCache {
public:
  static constexpr std::size_t kBlockSize = 256 * 1024;

  ChecksumCache(std::string cacheFile, std::size_t capacity = 1000,
                std::size_t evictBatch = 100);
  virtual ~ChecksumCache();

  virtual DigestResult digest(const std::string &path);

  // Hashes without consulting or populating the cache.
  static DigestResult computeDigest(const std::string &path);
  static std::string makeKey(const std::string &path, int64_t size,
                             int64_t mtime);

  std::optional<std::string> lookup(const std::string &key) const;
  void insert(const std::string &key, const std::string &digest);

  bool load();
  bool save();

  std::size_t size() const;
  std::size_t evictionCount() const;
  std::size_t hitCount() const;

private:
  std::string m_cacheFile;
  std::size_t m_capacity;
  std::size_t m_evictBatch;

  std::map<std::string, std::string> m_entries;
  std::deque<std::string> m_order; // insertion order, oldest first
  std::size_t m_evictions = 0;
  std::size_t m_hits = 0;
  bool m_dirty = false;
  mutable std::mutex m_mutex;

  void insertLocked(const std::string &key, const std::string &digest);
};

} // namespace labxfer
