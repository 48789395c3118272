#include "app/LaunchContext.hpp"
#include "util/TomlReader.hpp"

#include <cctype>

namespace dockhand::app {

static std::optional<std::string> lookup(const EnvMap& container_env, const std::string& name,
                                         const EnvLookup& process_env) {
  if (name.empty()) return std::nullopt;
  auto it = container_env.find(name);
  if (it != container_env.end() && !it->second.empty()) return it->second;
  if (process_env) {
    const char* v = process_env(name.c_str());
    if (v && *v) return std::string(v);
  }
  return std::nullopt;
}

bool is_truthy(const std::string& v) {
  std::string s = v;
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s == "1" || s == "true" || s == "yes" || s == "on";
}

LaunchContext resolve_launch_context(const EnvMap& container_env, const Config::Env& names,
                                     const EnvLookup& process_env) {
  LaunchContext ctx;
  ctx.task_id = lookup(container_env, names.task_id_var, process_env);
  if (!ctx.task_id) ctx.task_id = lookup(container_env, names.task_id_alt_var, process_env);

  if (auto cpus = lookup(container_env, names.cpus_var, process_env)) {
    auto v = util::TomlReader::parse_double(*cpus);
    if (v && *v > 0.0) ctx.requested_cpu = *v;
  }
  if (auto pin = lookup(container_env, names.pin_var, process_env)) {
    ctx.pin_requested = is_truthy(*pin);
  }
  return ctx;
}

} // namespace dockhand::app
