#pragma once
#include <sys/types.h>
#include <unordered_set>
#include <utility>

namespace dockhand::host {

// Liveness probe for placement ledger owners. Swappable so the ledger can be
// exercised against a fake process table.
class IProcessTable {
public:
  virtual ~IProcessTable() = default;

  [[nodiscard]] virtual bool is_alive(pid_t pid) const = 0;

  // Optional: human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

// Probes /proc/<pid> at call time, so answers stay current inside the ledger
// lock. Zombies count as dead. Falls back to kill(pid, 0) when /proc is not
// mounted.
// Liveness is by pid only: if an owner dies and its pid is reused by an
// unrelated long-lived process, the entry is not reclaimed until that
// process exits too.
class ProcfsProcessTable final : public IProcessTable {
public:
  ProcfsProcessTable();
  [[nodiscard]] bool is_alive(pid_t pid) const override;
  [[nodiscard]] const char* name() const override { return probe_ ? "kill" : "procfs"; }

private:
  bool probe_{false};
};

// Fixed pid set; tests and dry runs.
class StaticProcessTable final : public IProcessTable {
public:
  StaticProcessTable() = default;
  explicit StaticProcessTable(std::unordered_set<pid_t> pids) : pids_(std::move(pids)) {}
  [[nodiscard]] bool is_alive(pid_t pid) const override { return pids_.count(pid) != 0; }
  [[nodiscard]] const char* name() const override { return "static"; }
  void add(pid_t pid) { pids_.insert(pid); }
  void remove(pid_t pid) { pids_.erase(pid); }

private:
  std::unordered_set<pid_t> pids_;
};

} // namespace dockhand::host
