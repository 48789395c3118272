#pragma once

#include "app/Config.hpp"
#include "app/LaunchContext.hpp"
#include "app/Rewriter.hpp"
#include "host/ProcessTable.hpp"
#include "host/TopologyReader.hpp"
#include "model/Placement.hpp"

#include <sys/types.h>

#include <functional>
#include <optional>
#include <string>

namespace dockhand::app {

// Host-facing collaborators of one invocation; swapped out in tests.
struct WrapperDeps {
  const host::TopologyReader& topology;
  const host::IProcessTable& procs;
  std::function<std::string()> fqdn;
  EnvLookup process_env;
  pid_t self_pid;
};

// NUMA stage: a zone for this launch, or nullopt when pinning is disabled,
// not requested, already specified on the command line, or unavailable.
[[nodiscard]] std::optional<model::Pinning> pinning_stage(const Args& args, const LaunchContext& ctx,
                                                          const Config& cfg, const WrapperDeps& deps);

// Hostname stage: see derive_hostname().
[[nodiscard]] std::optional<std::string> hostname_stage(const Args& args, const LaunchContext& ctx,
                                                        const Config& cfg, const WrapperDeps& deps);

// Both stages plus the rewrite. 'args' includes the program name at [0].
[[nodiscard]] Args rewrite_invocation(const Args& args, const Config& cfg, const WrapperDeps& deps);

} // namespace dockhand::app
