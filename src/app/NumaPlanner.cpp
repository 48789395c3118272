#include "app/NumaPlanner.hpp"
#include "app/ZonePacker.hpp"
#include "util/Diag.hpp"
#include "util/FileLock.hpp"

namespace dockhand::app {

NumaPlanner::NumaPlanner(const host::TopologyReader& topology, const host::IProcessTable& procs,
                         std::filesystem::path ledger_path, std::chrono::milliseconds lock_timeout)
    : topology_(topology), procs_(procs), store_(std::move(ledger_path), topology),
      lock_timeout_(lock_timeout) {}

std::filesystem::path NumaPlanner::lock_path() const {
  auto p = store_.path();
  p += ".lock";
  return p;
}

std::optional<model::Pinning> NumaPlanner::plan(const model::PlacementRequest& request) const {
  if (!topology_.is_numa_capable()) {
    util::diag("Numa", "host is not NUMA capable, launching unpinned");
    return std::nullopt;
  }
  if (topology_.zone_ids().empty()) {
    util::diag("Numa", "cpu topology unreadable, launching unpinned");
    return std::nullopt;
  }

  util::FileLock lock(lock_path().string());
  if (!lock.acquire(lock_timeout_)) {
    util::diag("Numa", "ledger busy, launching unpinned");
    return std::nullopt;
  }

  auto ledger = reclaim_dead(store_.load(), procs_);
  auto zone = place(ledger, request);
  if (!zone) {
    util::diag("Numa", "no zone has %.2f cpus free, launching unpinned", request.requested_cpu);
    // Still persist what reclamation freed
    if (!store_.store(ledger)) util::diag("Numa", "ledger not updated");
    return std::nullopt;
  }

  model::Pinning pin;
  pin.zone = *zone;
  pin.cores = topology_.cores_for_zone(*zone);
  if (pin.cores.empty()) {
    // Cores vanished since load (hotplug); give the capacity back
    util::diag("Numa", "zone %d has no cores, launching unpinned", *zone);
    if (auto* z = ledger.find(*zone)) {
      std::erase_if(z->entries, [&](const model::PlacementEntry& e){ return e.owner_pid == request.owner_pid; });
    }
    if (!store_.store(ledger)) util::diag("Numa", "ledger not updated");
    return std::nullopt;
  }
  if (!store_.store(ledger)) {
    util::diag("Numa", "placement not persisted, launching unpinned");
    return std::nullopt;
  }

  const auto* z = ledger.find(*zone);
  util::diag("Numa", "pid %d pinned to zone %d (%.2f/%.0f cpus committed)",
             static_cast<int>(request.owner_pid), *zone, z ? z->committed() : 0.0,
             z ? z->core_capacity : 0.0);
  return pin;
}

} // namespace dockhand::app
