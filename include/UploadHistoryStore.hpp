#pragma once
#include "ChecksumCache.hpp"
#include "types.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace labxfer {

/**
 * UploadHistoryStore keeps one record per local file that was uploaded and
 * verified, or whose conflict was settled by keeping the remote copy.
 * Records are written through to SQLite (sqlite_orm) right away; a failed
 * write stays dirty until the next flush().
 */
class UploadHistoryStore {
public:
  static constexpr const char *kUploaded = "uploaded";
  static constexpr const char *kRenamed = "renamed";
  static constexpr const char *kKeptRemote = "kept-remote";

  explicit UploadHistoryStore(const std::string &dbPath);
  ~UploadHistoryStore();

  // Connection management
  bool open();
  void close();

  // An empty destination means the content went where it was meant to.
  bool record(const std::string &localPath, const std::string &remotePath,
              const std::string &digest, int64_t size,
              const std::string &destination = std::string(),
              const std::string &outcome = kUploaded);
  bool forget(const std::string &localPath);
  std::optional<UploadRecord> find(const std::string &localPath) const;
  std::vector<UploadRecord> all() const;

  // True when the file on disk still has the recorded size and digest and
  // was settled for the same destination. Without hashOnMiss a digest that
  // is not cached counts as changed.
  bool isUnchanged(const std::string &localPath, const std::string &destination,
                   ChecksumCache &cache, bool hashOnMiss = true) const;

  bool flush();

  std::size_t size() const;
  std::size_t dirtyCount() const;

private:
  std::string m_dbPath;
  struct Impl;
  std::unique_ptr<Impl> m_impl;

  std::map<std::string, UploadRecord> m_records;
  std::set<std::string> m_dirty;
  mutable std::mutex m_mutex;

  bool writeThrough(const UploadRecord &record);
};

} // namespace labxfer
