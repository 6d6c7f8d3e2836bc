#include "FilesystemWatcher.hpp"
#include <atomic>
#include <condition_variable>
#include <efsw/efsw.hpp>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace labxfer {

struct FilesystemWatcher::Impl : public efsw::FileWatchListener {
  efsw::FileWatcher watcher;
  efsw::WatchID watchId = 0;
  std::atomic<bool> running{false};
  std::atomic<bool> accepting{false};

  const FileSystemScanner &scanner;
  FilesystemWatcher::Callback callback;

  // Secondary rescan for mounts where notifications are unreliable
  std::thread rescanThread;
  std::mutex rescanMutex;
  std::condition_variable rescanCv;

  Impl(const FileSystemScanner &s, FilesystemWatcher::Callback cb)
      : scanner(s), callback(std::move(cb)) {}

  void emit(const std::string &path) {
    if (!accepting || !callback)
      return;
    callback(path);
  }

  std::size_t rescan() {
    if (!accepting)
      return 0;
    return scanner.scan([this](const WatchedFile &file) {
      try {
        emit(file.path);
      } catch (const std::exception &e) {
        std::cerr << "[Watcher] Error forwarding " << file.path << ": "
                  << e.what() << std::endl;
      }
    });
  }

  void rescanLoop(std::chrono::seconds interval) {
    while (running) {
      {
        std::unique_lock<std::mutex> lock(rescanMutex);
        rescanCv.wait_for(lock, interval, [this] { return !running; });
      }
      if (!running)
        break;
      try {
        auto found = rescan();
        std::cout << "[Watcher] Periodic rescan found " << found
                  << " candidate files" << std::endl;
      } catch (const std::exception &e) {
        std::cerr << "[Watcher] Periodic rescan failed: " << e.what()
                  << std::endl;
      }
    }
  }

  // Implement FileWatchListener
  void handleFileAction(efsw::WatchID watchid, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string oldFilename) override {
    try {
      std::string fullPath = dir + filename;
      if (!dir.empty() && dir.back() != '/' && dir.back() != '\\')
        fullPath = dir + "/" + filename;
      fullPath = fs::path(fullPath).lexically_normal().generic_string();

      switch (action) {
      case efsw::Actions::Add:
      case efsw::Actions::Modified:
      case efsw::Actions::Moved:
        if (fs::is_directory(fullPath) || !scanner.isCandidate(fullPath))
          return;
        emit(fullPath);
        break;
      case efsw::Actions::Delete:
        // The stability tracker drops entries whose file vanished
        break;
      default:
        break;
      }
    } catch (const std::exception &e) {
      std::cerr << "[Watcher] Error handling event for " << dir << filename
                << ": " << e.what() << std::endl;
    }
  }
};

FilesystemWatcher::FilesystemWatcher(const FileSystemScanner &scanner,
                                     std::chrono::seconds rescanInterval,
                                     Callback callback)
    : m_impl(std::make_unique<Impl>(scanner, std::move(callback))),
      m_scanner(scanner), m_rescanInterval(rescanInterval) {}

FilesystemWatcher::~FilesystemWatcher() { stop(); }

bool FilesystemWatcher::start() {
  if (m_impl->running)
    return true;

  const std::string &root = m_scanner.rootPath();
  try {
    m_impl->accepting = true;
    m_impl->watchId =
        m_impl->watcher.addWatch(root, m_impl.get(), m_scanner.isRecursive());
    if (m_impl->watchId < 0) {
      std::cerr << "[Watcher] Error starting watcher: "
                << efsw::Errors::Log::getLastErrorLog() << std::endl;
      m_impl->accepting = false;
      return false;
    }
    m_impl->watcher.watch();
    m_impl->running = true;
    if (m_rescanInterval.count() > 0) {
      m_impl->rescanThread =
          std::thread(&Impl::rescanLoop, m_impl.get(), m_rescanInterval);
    }
    std::cout << "[Watcher] Started monitoring: " << root
              << (m_rescanInterval.count() > 0
                      ? " (rescan every " +
                            std::to_string(m_rescanInterval.count()) + "s)"
                      : std::string())
              << std::endl;
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[Watcher] Error starting watcher: " << e.what() << std::endl;
    m_impl->accepting = false;
    return false;
  }
}

void FilesystemWatcher::stop() {
  m_impl->accepting = false;
  if (!m_impl->running)
    return;

  m_impl->watcher.removeWatch(m_impl->watchId);
  {
    std::lock_guard<std::mutex> lock(m_impl->rescanMutex);
    m_impl->running = false;
  }
  m_impl->rescanCv.notify_all();
  if (m_impl->rescanThread.joinable())
    m_impl->rescanThread.join();

  std::cout << "[Watcher] Stopped monitoring: " << m_scanner.rootPath()
            << std::endl;
}

bool FilesystemWatcher::isRunning() const { return m_impl->running; }

std::size_t FilesystemWatcher::rescanNow() { return m_impl->rescan(); }

} // namespace labxfer
