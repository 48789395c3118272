#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <cstdlib>
#include <string>

namespace dockhand::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("DOCKHAND_", 0) == 0) {
    alt = std::string("dockhand_") + n.substr(9);
  } else if (n.rfind("dockhand_", 0) == 0) {
    alt = std::string("DOCKHAND_") + n.substr(9);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  auto parsed = util::TomlReader::parse_int(v);
  return parsed ? static_cast<int>(*parsed) : defv;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* p = getenv_compat("DOCKHAND_CONFIG")) return std::string(p);
  return "/etc/dockhand/config.toml";
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  // --- [runtime] ---
  c.runtime.binary = resolve_string(toml, have_toml, "runtime", "binary", "DOCKHAND_RUNTIME", "docker");

  // --- [ledger] ---
  c.ledger.path            = resolve_string(toml, have_toml, "ledger", "path",            "DOCKHAND_LEDGER_PATH", "/var/run/dockhand/placement.toml");
  c.ledger.lock_timeout_ms = resolve_int(toml, have_toml,    "ledger", "lock_timeout_ms", "DOCKHAND_LOCK_TIMEOUT_MS", 2000);

  // --- [numa] ---
  c.numa.enabled = resolve_bool(toml, have_toml, "numa", "enabled", "DOCKHAND_NUMA", true);

  // --- [env] ---
  c.env.task_id_var     = resolve_string(toml, have_toml, "env", "task_id_var",     nullptr, "MESOS_TASK_ID");
  c.env.task_id_alt_var = resolve_string(toml, have_toml, "env", "task_id_alt_var", nullptr, "mesos_task_id");
  c.env.cpus_var        = resolve_string(toml, have_toml, "env", "cpus_var",        nullptr, "MARATHON_APP_RESOURCE_CPUS");
  c.env.pin_var         = resolve_string(toml, have_toml, "env", "pin_var",         nullptr, "PIN_TO_NUMA_NODE");

  // --- [host] ---
  c.host.fqdn = resolve_string(toml, have_toml, "host", "fqdn", "DOCKHAND_FQDN", "");

  // --- [log] ---
  c.log.quiet = resolve_bool(toml, have_toml, "log", "quiet", "DOCKHAND_QUIET", false);

  return c;
}

} // namespace dockhand::app
