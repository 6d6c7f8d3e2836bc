#pragma once
#include "FileSystemScanner.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace labxfer {

/**
 * FilesystemWatcher turns efsw notifications, plus an optional periodic
 * rescan, into candidate paths. It never touches file contents.
 */
class FilesystemWatcher {
public:
  using Callback = std::function<void(const std::string &path)>;

  FilesystemWatcher(const FileSystemScanner &scanner,
                    std::chrono::seconds rescanInterval, Callback callback);
  ~FilesystemWatcher();

  bool start();
  void stop();
  bool isRunning() const;

  // Emits every candidate currently on disk; returns how many.
  std::size_t rescanNow();

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
  const FileSystemScanner &m_scanner;
  std::chrono::seconds m_rescanInterval;
};

} // namespace labxfer
