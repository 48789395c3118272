#include "host/ProcessTable.hpp"
#include "util/Diag.hpp"
#include "util/Procfs.hpp"

#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <string>

namespace dockhand::host {

ProcfsProcessTable::ProcfsProcessTable() {
  if (!util::path_exists("/proc/self")) {
    util::diag("ProcessTable", "/proc not mounted, probing pids with kill(0)");
    probe_ = true;
  }
}

bool ProcfsProcessTable::is_alive(pid_t pid) const {
  if (pid <= 0) return false;
  if (pid == ::getpid()) return true;
  if (probe_) return ::kill(pid, 0) == 0 || errno == EPERM;
  auto dir = "/proc/" + std::to_string(pid);
  if (!util::path_exists(dir)) return false;
  // A zombie keeps its /proc entry until reaped but holds no cpus
  if (auto stat = util::read_file_string(dir + "/stat")) {
    auto rp = stat->rfind(')');
    if (rp != std::string::npos && rp + 2 < stat->size()) {
      char state = (*stat)[rp + 2];
      if (state == 'Z' || state == 'X') return false;
    }
  }
  return true;
}

} // namespace dockhand::host
