#include "minitest.hpp"
#include "util/FileLock.hpp"
#include <chrono>
#include <filesystem>
#include <unistd.h>

using dockhand::util::FileLock;
using namespace std::chrono_literals;

static std::string lock_path(const char* suffix) {
  return (std::filesystem::temp_directory_path() /
          ("dockhand_test_lock_" + std::to_string(::getpid())) / (std::string(suffix) + ".lock")).string();
}

TEST(file_lock_exclusive_between_holders) {
  auto path = lock_path("excl");
  FileLock a(path), b(path);
  ASSERT_TRUE(a.acquire(100ms));
  ASSERT_TRUE(a.held());
  ASSERT_FALSE(b.acquire(30ms));
  ASSERT_FALSE(b.held());
  a.release();
  ASSERT_TRUE(b.acquire(100ms));
  std::filesystem::remove_all(std::filesystem::path(path).parent_path());
}

TEST(file_lock_released_on_destruction) {
  auto path = lock_path("raii");
  {
    FileLock a(path);
    ASSERT_TRUE(a.acquire(100ms));
  }
  FileLock b(path);
  ASSERT_TRUE(b.acquire(0ms));
  std::filesystem::remove_all(std::filesystem::path(path).parent_path());
}

TEST(file_lock_unwritable_location) {
  FileLock a("/proc/dockhand-cannot-create/x.lock");
  ASSERT_FALSE(a.acquire(10ms));
}
