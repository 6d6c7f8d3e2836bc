#include "FileSystemScanner.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace fs = std::filesystem;

namespace labxfer {

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

} // namespace

FileSystemScanner::FileSystemScanner(std::string rootPath,
                                     std::vector<std::string> extensions,
                                     bool recursive)
    : m_rootPath(fs::path(rootPath).lexically_normal().generic_string()),
      m_recursive(recursive) {
  while (m_rootPath.size() > 1 && m_rootPath.back() == '/')
    m_rootPath.pop_back();
  for (const auto &ext : extensions) {
    auto normalized = normalizeExtension(ext);
    if (normalized.size() > 1)
      m_extensions.push_back(normalized);
  }
}

FileSystemScanner::~FileSystemScanner() = default;

std::string FileSystemScanner::normalizeExtension(const std::string &ext) {
  std::string lower = toLower(ext);
  if (lower.empty() || lower.front() != '.')
    lower = "." + lower;
  return lower;
}

bool FileSystemScanner::isHiddenName(const std::string &filename) {
  return !filename.empty() && (filename.front() == '.' || filename.front() == '~');
}

bool FileSystemScanner::matchesExtension(const std::string &filename) const {
  if (m_extensions.empty())
    return true;
  std::string lower = toLower(filename);
  for (const auto &ext : m_extensions) {
    if (lower.size() > ext.size() &&
        lower.compare(lower.size() - ext.size(), ext.size(), ext) == 0)
      return true;
  }
  return false;
}

bool FileSystemScanner::isInScope(const std::string &absPath) const {
  fs::path rel = fs::path(absPath).lexically_relative(m_rootPath);
  if (rel.empty() || *rel.begin() == "..")
    return false;
  // Non-recursive monitoring only covers direct children of the root
  return m_recursive || !rel.has_parent_path();
}

bool FileSystemScanner::isCandidate(const std::string &absPath) const {
  fs::path p(absPath);
  std::string filename = p.filename().string();
  return !isHiddenName(filename) && matchesExtension(filename) &&
         isInScope(absPath);
}

std::string FileSystemScanner::toRelativePath(const std::string &absPath) const {
  fs::path rel = fs::path(absPath).lexically_relative(m_rootPath);
  return rel.generic_string();
}

std::int64_t
FileSystemScanner::getUnixTimeStamp(const fs::file_time_type &ftime) {
  auto now_file = fs::file_time_type::clock::now();
  auto now_sys = std::chrono::system_clock::now();
  auto file_duration = ftime - now_file;
  auto sys_time =
      now_sys + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                    file_duration);
  return std::chrono::duration_cast<std::chrono::seconds>(
             sys_time.time_since_epoch())
      .count();
}

std::optional<WatchedFile> FileSystemScanner::statFile(const std::string &absPath) {
  std::error_code ec;
  fs::path p(absPath);
  if (!fs::is_regular_file(p, ec) || ec)
    return std::nullopt;
  auto size = fs::file_size(p, ec);
  if (ec)
    return std::nullopt;
  auto mtime = fs::last_write_time(p, ec);
  if (ec)
    return std::nullopt;

  WatchedFile file;
  file.path = absPath;
  file.extension = toLower(p.extension().string());
  file.size = static_cast<int64_t>(size);
  file.mtime = getUnixTimeStamp(mtime);
  return file;
}

AccessStatus FileSystemScanner::classifyErrno(int err) {
  switch (err) {
  case 0:
    return AccessStatus::Ok;
  case EACCES:
  case EPERM:
  case EBUSY:
  case ETXTBSY:
  case EAGAIN:
#if EWOULDBLOCK != EAGAIN
  case EWOULDBLOCK:
#endif
    return AccessStatus::Locked;
  case ENOENT:
  case ENOTDIR:
    return AccessStatus::Missing;
  default:
    return AccessStatus::IOError;
  }
}

AccessStatus FileSystemScanner::openForRead(const std::string &absPath,
                                            std::ifstream &stream,
                                            std::string &error) {
  errno = 0;
  stream.open(absPath, std::ios::binary);
  if (stream.is_open())
    return AccessStatus::Ok;

  int err = errno;
  error = err ? std::strerror(err) : "unable to open file";
  AccessStatus status = classifyErrno(err);
  // The stream layer does not always preserve errno
  if (status == AccessStatus::Ok)
    status = fs::exists(absPath) ? AccessStatus::IOError : AccessStatus::Missing;
  return status;
}

std::vector<WatchedFile> FileSystemScanner::scan() const {
  std::vector<WatchedFile> result;
  scan([&result](const WatchedFile &file) { result.push_back(file); });
  return result;
}

std::size_t FileSystemScanner::scan(const Visitor &visitor) const {
  std::size_t count = 0;
  fs::directory_options opts = fs::directory_options::skip_permission_denied;

  auto visit = [&](const fs::directory_entry &entry) {
    try {
      std::error_code ec;
      if (!entry.is_regular_file(ec) || ec)
        return;
      std::string absPath = entry.path().generic_string();
      if (!isCandidate(absPath))
        return;
      if (auto file = statFile(absPath)) {
        visitor(*file);
        ++count;
      }
    } catch (const std::exception &e) {
      std::cerr << "[Scanner] Error scanning item: " << entry.path() << " - "
                << e.what() << std::endl;
    }
  };

  std::error_code ec;
  if (!fs::exists(m_rootPath, ec))
    return count;

  if (m_recursive) {
    const fs::recursive_directory_iterator end;
    fs::recursive_directory_iterator it(m_rootPath, opts, ec);
    while (!ec && it != end) {
      visit(*it);
      it.increment(ec);
      if (ec && it != end) {
        // A directory that vanished or cannot be opened is left out
        std::cerr << "[Scanner] Skipping entry under " << m_rootPath << ": "
                  << ec.message() << std::endl;
        ec.clear();
        it.disable_recursion_pending();
        it.increment(ec);
      }
    }
  } else {
    const fs::directory_iterator end;
    fs::directory_iterator it(m_rootPath, opts, ec);
    while (!ec && it != end) {
      visit(*it);
      it.increment(ec);
    }
  }
  if (ec) {
    std::cerr << "[Scanner] FileSystem Error under " << m_rootPath << ": "
              << ec.message() << std::endl;
  }
  return count;
}

} // namespace labxfer
