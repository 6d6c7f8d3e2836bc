#include "ChecksumCache.hpp"
#include "FileSystemScanner.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <picosha2.h>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace labxfer {

ChecksumCache::ChecksumCache(std::string cacheFile, std::size_t capacity,
                             std::size_t evictBatch)
    : m_cacheFile(std::move(cacheFile)), m_capacity(capacity),
      m_evictBatch(evictBatch == 0 ? 1 : evictBatch) {}

ChecksumCache::~ChecksumCache() = default;

std::string ChecksumCache::makeKey(const std::string &path, int64_t size,
                                   int64_t mtime) {
  return path + "|" + std::to_string(size) + "|" + std::to_string(mtime);
}

DigestResult ChecksumCache::computeDigest(const std::string &path) {
  DigestResult result;
  std::ifstream stream;
  result.status = FileSystemScanner::openForRead(path, stream, result.error);
  if (result.status != AccessStatus::Ok)
    return result;

  picosha2::hash256_one_by_one hasher;
  std::vector<char> buffer(kBlockSize);
  errno = 0;
  while (stream.read(buffer.data(), buffer.size()) || stream.gcount() > 0) {
    hasher.process(buffer.begin(), buffer.begin() + stream.gcount());
  }
  if (stream.bad()) {
    int err = errno;
    result.status = FileSystemScanner::classifyErrno(err);
    if (result.status == AccessStatus::Ok)
      result.status = AccessStatus::IOError;
    result.error = err ? std::strerror(err) : "read failed";
    return result;
  }
  hasher.finish();

  picosha2::get_hash_hex_string(hasher, result.digest);
  result.status = AccessStatus::Ok;
  result.error.clear();
  return result;
}

DigestResult ChecksumCache::digest(const std::string &path) {
  auto before = FileSystemScanner::statFile(path);
  if (!before) {
    DigestResult result;
    std::error_code ec;
    result.status = fs::exists(path, ec) ? AccessStatus::IOError
                                         : AccessStatus::Missing;
    result.error = "cannot stat file";
    return result;
  }

  std::string key = makeKey(path, before->size, before->mtime);
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it != m_entries.end()) {
      ++m_hits;
      DigestResult hit;
      hit.status = AccessStatus::Ok;
      hit.digest = it->second;
      return hit;
    }
  }

  DigestResult result = computeDigest(path);
  if (!result.ok())
    return result;

  // Only cache a digest that belongs to a file that did not change while
  // it was being hashed
  auto after = FileSystemScanner::statFile(path);
  if (after && after->size == before->size && after->mtime == before->mtime) {
    std::lock_guard<std::mutex> lock(m_mutex);
    insertLocked(key, result.digest);
  }
  return result;
}

std::optional<std::string> ChecksumCache::lookup(const std::string &key) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_entries.find(key);
  if (it == m_entries.end())
    return std::nullopt;
  return it->second;
}

void ChecksumCache::insert(const std::string &key, const std::string &digest) {
  std::lock_guard<std::mutex> lock(m_mutex);
  insertLocked(key, digest);
}

void ChecksumCache::insertLocked(const std::string &key,
                                 const std::string &digest) {
  auto inserted = m_entries.emplace(key, digest);
  if (!inserted.second)
    return;
  m_order.push_back(key);
  m_dirty = true;

  if (m_entries.size() > m_capacity) {
    std::size_t toRemove = std::min(m_evictBatch, m_order.size() - 1);
    for (std::size_t i = 0; i < toRemove; ++i) {
      m_entries.erase(m_order.front());
      m_order.pop_front();
    }
    ++m_evictions;
    std::cout << "[Cache] Evicted " << toRemove << " oldest entries ("
              << m_entries.size() << " remain)" << std::endl;
  }
}

bool ChecksumCache::load() {
  std::ifstream ifs(m_cacheFile);
  if (!ifs) {
    std::cout << "[Cache] No checksum cache at " << m_cacheFile << std::endl;
    return false;
  }

  try {
    auto data = json::parse(ifs);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    m_order.clear();
    for (const auto &entry : data.at("entries")) {
      insertLocked(entry.at("key").get<std::string>(),
                   entry.at("digest").get<std::string>());
    }
    m_dirty = false;
    std::cout << "[Cache] Loaded " << m_entries.size()
              << " cached checksums from " << m_cacheFile << std::endl;
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[Cache] Ignoring unreadable cache " << m_cacheFile << ": "
              << e.what() << std::endl;
    return false;
  }
}

bool ChecksumCache::save() {
  json data;
  data["version"] = 1;
  data["entries"] = json::array();
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_dirty && fs::exists(m_cacheFile))
      return true;
    for (const auto &key : m_order) {
      data["entries"].push_back({{"key", key}, {"digest", m_entries.at(key)}});
    }
    m_dirty = false;
  }

  // Write-then-rename keeps the previous file intact if we die mid-write
  std::string tmpFile = m_cacheFile + ".tmp";
  try {
    auto dir = fs::path(m_cacheFile).parent_path();
    if (!dir.empty())
      fs::create_directories(dir);
    {
      std::ofstream ofs(tmpFile, std::ios::trunc);
      ofs << data.dump(1) << std::endl;
      if (!ofs)
        throw std::runtime_error("write failed");
    }
    fs::rename(tmpFile, m_cacheFile);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[Cache] Failed to save " << m_cacheFile << ": " << e.what()
              << std::endl;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_dirty = true;
    return false;
  }
}

std::size_t ChecksumCache::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_entries.size();
}

std::size_t ChecksumCache::evictionCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_evictions;
}

std::size_t ChecksumCache::hitCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_hits;
}

} // namespace labxfer
