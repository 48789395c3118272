#pragma once

#include "app/ArgScanner.hpp"
#include "app/Config.hpp"

#include <functional>
#include <optional>
#include <string>

namespace dockhand::app {

// Scheduler-provided inputs for one launch.
struct LaunchContext {
  std::optional<std::string> task_id;
  std::optional<double> requested_cpu;  // only set for positive finite values
  bool pin_requested{false};
};

using EnvLookup = std::function<const char*(const char*)>;

// Each name is looked up in the container environment carried on the command
// line first, then in this process's environment (via 'process_env').
// The task id is the first non-empty of task_id_var, task_id_alt_var.
[[nodiscard]] LaunchContext resolve_launch_context(const EnvMap& container_env,
                                                   const Config::Env& names,
                                                   const EnvLookup& process_env);

// "1", "true", "yes", "on" in any case.
[[nodiscard]] bool is_truthy(const std::string& v);

} // namespace dockhand::app
