#pragma once

#include "host/ProcessTable.hpp"
#include "host/TopologyReader.hpp"
#include "model/Placement.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace dockhand::app {

// Persisted per-zone CPU commitments. Not synchronized: callers hold the
// ledger FileLock around load/store.
//
// On-disk format (TOML subset):
//   [zone.0]
//   capacity = 8
//   4123 = 1.5      # owner pid = committed cpu
class LedgerStore {
public:
  LedgerStore(std::filesystem::path path, const host::TopologyReader& topology);

  // Persisted state reconciled against live topology. Missing, unreadable or
  // corrupt state yields fresh().
  [[nodiscard]] model::PlacementLedger load() const;

  // Durable write: temp file, fsync, rename. Returns false on I/O error.
  [[nodiscard]] bool store(const model::PlacementLedger& ledger) const;

  // One empty zone per topology zone, capacity = core count.
  [[nodiscard]] model::PlacementLedger fresh() const;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

  [[nodiscard]] static std::string encode(const model::PlacementLedger& ledger);
  [[nodiscard]] static std::optional<model::PlacementLedger> decode(const std::string& text);

private:
  std::filesystem::path path_;
  const host::TopologyReader& topology_;
};

// Drop entries whose owner is no longer alive. Idempotent.
[[nodiscard]] model::PlacementLedger reclaim_dead(model::PlacementLedger ledger,
                                                  const host::IProcessTable& procs);

} // namespace dockhand::app
