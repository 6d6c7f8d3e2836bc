#ifndef LABXFER_FILESYSTEMSCANNER_HPP
#define LABXFER_FILESYSTEMSCANNER_HPP

#include "types.hpp"
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace labxfer {

/**
 * FileSystemScanner holds the local filesystem helpers shared by the
 * watcher, the checksum cache and the upload engine: candidate filtering,
 * stat, timestamp conversion and lock-aware opening.
 */
class FileSystemScanner {
public:
  FileSystemScanner(std::string rootPath, std::vector<std::string> extensions,
                    bool recursive);
  ~FileSystemScanner();

  using Visitor = std::function<void(const WatchedFile &file)>;

  // Walks the root and returns every candidate; per-entry errors are
  // logged and skipped.
  std::vector<WatchedFile> scan() const;
  // Streams candidates to the visitor as they are found; returns how many.
  std::size_t scan(const Visitor &visitor) const;

  bool isCandidate(const std::string &absPath) const;
  bool isInScope(const std::string &absPath) const;
  std::string toRelativePath(const std::string &absPath) const;

  const std::string &rootPath() const { return m_rootPath; }
  bool isRecursive() const { return m_recursive; }

  static bool isHiddenName(const std::string &filename);
  static std::string normalizeExtension(const std::string &ext);
  static std::optional<WatchedFile> statFile(const std::string &absPath);
  static std::int64_t
  getUnixTimeStamp(const std::filesystem::file_time_type &ftime);

  static AccessStatus classifyErrno(int err);
  static AccessStatus openForRead(const std::string &absPath,
                                  std::ifstream &stream, std::string &error);

private:
  std::string m_rootPath;
  std::vector<std::string> m_extensions; // lowercase, leading dot
  bool m_recursive;

  bool matchesExtension(const std::string &filename) const;
};

} // namespace labxfer

#endif // LABXFER_FILESYSTEMSCANNER_HPP
