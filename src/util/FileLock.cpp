#include "util/FileLock.hpp"
#include "util/Diag.hpp"

#include <sys/file.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <thread>

namespace dockhand::util {

FileLock::FileLock(std::string path) : path_(std::move(path)) {}

FileLock::~FileLock() { release(); }

bool FileLock::acquire(std::chrono::milliseconds timeout, std::chrono::milliseconds poll) {
  if (fd_ >= 0) return true;

  auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      diag("FileLock", "failed to create %s: %s", parent.c_str(), ec.message().c_str());
      return false;
    }
  }

  int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    diag("FileLock", "failed to open %s: %s", path_.c_str(), std::strerror(errno));
    return false;
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
      fd_ = fd;
      return true;
    }
    if (errno != EWOULDBLOCK && errno != EINTR) {
      diag("FileLock", "flock %s: %s", path_.c_str(), std::strerror(errno));
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      diag("FileLock", "timed out after %lldms waiting for %s",
           static_cast<long long>(timeout.count()), path_.c_str());
      break;
    }
    std::this_thread::sleep_for(poll);
  }
  if (::close(fd) != 0) diag("FileLock", "close %s: %s", path_.c_str(), std::strerror(errno));
  return false;
}

void FileLock::release() {
  if (fd_ < 0) return;
  // Closing the descriptor drops the flock
  if (::close(fd_) != 0) diag("FileLock", "close %s: %s", path_.c_str(), std::strerror(errno));
  fd_ = -1;
}

} // namespace dockhand::util
