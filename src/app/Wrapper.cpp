#include "app/Wrapper.hpp"
#include "app/ArgScanner.hpp"
#include "app/NumaPlanner.hpp"
#include "util/Diag.hpp"

namespace dockhand::app {

std::optional<model::Pinning> pinning_stage(const Args& args, const LaunchContext& ctx,
                                            const Config& cfg, const WrapperDeps& deps) {
  if (!cfg.numa.enabled || !ctx.pin_requested) return std::nullopt;
  if (!find_run(args)) return std::nullopt;
  if (has_flag(args, "--cpuset-cpus") || has_flag(args, "--cpuset-mems")) {
    util::diag("Numa", "cpuset already given on the command line, not pinning");
    return std::nullopt;
  }
  if (!ctx.requested_cpu) {
    util::diag("Numa", "%s missing or invalid, launching unpinned", cfg.env.cpus_var.c_str());
    return std::nullopt;
  }

  NumaPlanner planner(deps.topology, deps.procs, cfg.ledger.path, cfg.lock_timeout());
  return planner.plan(model::PlacementRequest{deps.self_pid, *ctx.requested_cpu});
}

std::optional<std::string> hostname_stage(const Args& args, const LaunchContext& ctx,
                                          const Config& cfg, const WrapperDeps& deps) {
  std::function<std::string()> fqdn = deps.fqdn;
  if (!cfg.host.fqdn.empty()) {
    fqdn = [&cfg]{ return cfg.host.fqdn; };
  }
  return derive_hostname(args, ctx.task_id, fqdn);
}

Args rewrite_invocation(const Args& args, const Config& cfg, const WrapperDeps& deps) {
  auto ctx = resolve_launch_context(parse_env_args(args), cfg.env, deps.process_env);
  auto pin = pinning_stage(args, ctx, cfg, deps);
  auto hostname = hostname_stage(args, ctx, cfg, deps);
  return rewrite(args, pin, hostname);
}

} // namespace dockhand::app
