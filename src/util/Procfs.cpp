#include "util/Procfs.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace dockhand::util {

static std::string proc_root() {
  const char* env = std::getenv("DOCKHAND_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  auto root = proc_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_proc_path(abs));
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  // File disappeared or became unreadable between open and read
  if (in.bad()) return std::nullopt;
  return s;
}

bool path_exists(const std::string& abs) {
  std::error_code ec;
  return std::filesystem::exists(map_proc_path(abs), ec);
}

} // namespace dockhand::util
