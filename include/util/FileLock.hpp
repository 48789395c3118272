#pragma once

#include <chrono>
#include <string>

namespace dockhand::util {

// Exclusive flock(2) on a lock file, held until destruction.
// Separate FileLock objects conflict even within one process, since each
// opens its own file description.
class FileLock {
public:
  explicit FileLock(std::string path);
  ~FileLock();
  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  // Poll for the lock until 'timeout' elapses. Creates the lock file (and its
  // parent directory) if needed. Returns false on timeout or I/O error.
  [[nodiscard]] bool acquire(std::chrono::milliseconds timeout,
                             std::chrono::milliseconds poll = std::chrono::milliseconds(10));

  void release();

  [[nodiscard]] bool held() const { return fd_ >= 0; }
  [[nodiscard]] const std::string& path() const { return path_; }

private:
  std::string path_;
  int fd_{-1};
};

} // namespace dockhand::util
