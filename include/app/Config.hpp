#pragma once

#include <chrono>
#include <string>

namespace dockhand::app {

struct Config {
  struct Runtime {
    std::string binary;         // execvp target
  } runtime;

  struct Ledger {
    std::string path;
    int lock_timeout_ms;
  } ledger;

  struct Numa {
    bool enabled;               // global kill switch for pinning
  } numa;

  // Container environment variable names consulted for each input
  struct Env {
    std::string task_id_var;
    std::string task_id_alt_var;
    std::string cpus_var;
    std::string pin_var;
  } env;

  struct Host {
    std::string fqdn;           // empty => resolve at runtime
  } host;

  struct Log {
    bool quiet;
  } log;

  [[nodiscard]] std::chrono::milliseconds lock_timeout() const {
    return std::chrono::milliseconds(ledger.lock_timeout_ms < 0 ? 0 : ledger.lock_timeout_ms);
  }
};

// DOCKHAND_CONFIG, else /etc/dockhand/config.toml
[[nodiscard]] std::string config_file_path();

// Resolve every setting TOML -> env -> compiled default. A missing or
// unreadable file just means defaults.
[[nodiscard]] Config load_config(const std::string& path);

// getenv accepting both DOCKHAND_X and dockhand_X spellings.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace dockhand::app
