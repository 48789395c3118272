#include "app/Config.hpp"
#include "app/Exec.hpp"
#include "app/Wrapper.hpp"
#include "host/Fqdn.hpp"
#include "host/ProcessTable.hpp"
#include "host/TopologyReader.hpp"
#include "util/Diag.hpp"

#include <unistd.h>

#include <cstdlib>
#include <string>
#include <vector>

// Installed in place of the container runtime binary. Rewrites "run"
// invocations (hostname, NUMA cpuset) and execs the real runtime with the
// remaining arguments; anything else passes through untouched.
int main(int argc, char** argv) {
  std::vector<std::string> args(argv, argv + argc);

  auto cfg = dockhand::app::load_config(dockhand::app::config_file_path());
  dockhand::util::set_quiet(cfg.log.quiet);

  dockhand::host::TopologyReader topology;
  dockhand::host::ProcfsProcessTable procs;
  dockhand::app::WrapperDeps deps{
    topology,
    procs,
    []{ return dockhand::host::local_fqdn(); },
    [](const char* name) -> const char* { return std::getenv(name); },
    ::getpid(),
  };

  auto out = dockhand::app::rewrite_invocation(args, cfg, deps);
  return dockhand::app::exec_runtime(cfg.runtime.binary, out);
}
