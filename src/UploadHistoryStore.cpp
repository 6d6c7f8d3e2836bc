#include "UploadHistoryStore.hpp"
#include "FileSystemScanner.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <sqlite3.h>
#include <sqlite_orm/sqlite_orm.h>

using namespace sqlite_orm;

namespace labxfer {

// We define a helper function to create the storage.
// This helps us deduce the complex template type of the storage.
inline auto create_storage_impl(const std::string &path) {
  return make_storage(
      path, make_table<UploadRecord>(
                "UploadHistory",
                make_column("localPath", &UploadRecord::localPath,
                            primary_key()),
                make_column("remotePath", &UploadRecord::remotePath),
                make_column("destination", &UploadRecord::destination,
                            default_value("")),
                make_column("outcome", &UploadRecord::outcome,
                            default_value("uploaded")),
                make_column("digest", &UploadRecord::digest),
                make_column("size", &UploadRecord::size),
                make_column("uploadedAt", &UploadRecord::uploadedAt)));
}

// Typedef for easier access within the Impl
using Storage = decltype(create_storage_impl(""));

struct UploadHistoryStore::Impl {
  Storage storage;
  std::mutex storageMutex;
  Impl(const std::string &path) : storage(create_storage_impl(path)) {}
};

UploadHistoryStore::UploadHistoryStore(const std::string &dbPath)
    : m_dbPath(dbPath), m_impl(std::make_unique<Impl>(dbPath)) {}

UploadHistoryStore::~UploadHistoryStore() = default;

bool UploadHistoryStore::open() {
  try {
    std::vector<UploadRecord> rows;
    {
      std::lock_guard<std::mutex> lock(m_impl->storageMutex);
      m_impl->storage.sync_schema();
      rows = m_impl->storage.get_all<UploadRecord>();
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.clear();
    for (auto &row : rows) {
      // Rows written before destinations were tracked
      if (row.destination.empty())
        row.destination = row.remotePath;
      std::string key = row.localPath;
      m_records.emplace(std::move(key), std::move(row));
    }
    std::cout << "[History] Loaded " << m_records.size()
              << " upload records from " << m_dbPath << std::endl;
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[History] Failed to open " << m_dbPath << ": " << e.what()
              << std::endl;
    return false;
  }
}

void UploadHistoryStore::close() { flush(); }

bool UploadHistoryStore::writeThrough(const UploadRecord &record) {
  try {
    std::lock_guard<std::mutex> lock(m_impl->storageMutex);
    m_impl->storage.replace(record);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[History] Write failed for " << record.localPath << ": "
              << e.what() << std::endl;
    return false;
  }
}

bool UploadHistoryStore::record(const std::string &localPath,
                                const std::string &remotePath,
                                const std::string &digest, int64_t size,
                                const std::string &destination,
                                const std::string &outcome) {
  UploadRecord rec;
  rec.localPath = localPath;
  rec.remotePath = remotePath;
  rec.destination = destination.empty() ? remotePath : destination;
  rec.outcome = outcome;
  rec.digest = digest;
  rec.size = size;
  rec.uploadedAt = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records[localPath] = rec;
    m_dirty.insert(localPath);
  }

  if (!writeThrough(rec))
    return false;

  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_records.find(localPath);
  // A newer record written meanwhile stays dirty
  if (it != m_records.end() && it->second.uploadedAt == rec.uploadedAt &&
      it->second.digest == rec.digest)
    m_dirty.erase(localPath);
  return true;
}

std::optional<UploadRecord>
UploadHistoryStore::find(const std::string &localPath) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_records.find(localPath);
  if (it == m_records.end())
    return std::nullopt;
  return it->second;
}

std::vector<UploadRecord> UploadHistoryStore::all() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::vector<UploadRecord> records;
  records.reserve(m_records.size());
  for (const auto &entry : m_records)
    records.push_back(entry.second);
  return records;
}

bool UploadHistoryStore::forget(const std::string &localPath) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.erase(localPath);
    m_dirty.erase(localPath);
  }
  try {
    std::lock_guard<std::mutex> lock(m_impl->storageMutex);
    m_impl->storage.remove<UploadRecord>(localPath);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[History] Delete failed for " << localPath << ": "
              << e.what() << std::endl;
    return false;
  }
}

bool UploadHistoryStore::isUnchanged(const std::string &localPath,
                                     const std::string &destination,
                                     ChecksumCache &cache,
                                     bool hashOnMiss) const {
  auto rec = find(localPath);
  if (!rec || rec->destination != destination)
    return false;

  auto current = FileSystemScanner::statFile(localPath);
  if (!current || current->size != rec->size)
    return false;

  if (!hashOnMiss) {
    auto cached = cache.lookup(
        ChecksumCache::makeKey(localPath, current->size, current->mtime));
    return cached && *cached == rec->digest;
  }

  // Size matched; the digest is usually a cache hit
  DigestResult digest = cache.digest(localPath);
  return digest.ok() && digest.digest == rec->digest;
}

bool UploadHistoryStore::flush() {
  std::vector<UploadRecord> pending;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto &path : m_dirty) {
      auto it = m_records.find(path);
      if (it != m_records.end())
        pending.push_back(it->second);
    }
  }
  if (pending.empty())
    return true;

  bool allWritten = true;
  for (const auto &rec : pending) {
    if (!writeThrough(rec)) {
      allWritten = false;
      continue;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_dirty.erase(rec.localPath);
  }
  std::cout << "[History] Flushed " << pending.size() << " pending records"
            << std::endl;
  return allWritten;
}

std::size_t UploadHistoryStore::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_records.size();
}

std::size_t UploadHistoryStore::dirtyCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_dirty.size();
}

} // namespace labxfer
