#pragma once

#include "app/PlacementLedger.hpp"
#include "host/ProcessTable.hpp"
#include "host/TopologyReader.hpp"
#include "model/Placement.hpp"

#include <chrono>
#include <filesystem>
#include <optional>

namespace dockhand::app {

// Runs one placement decision against the shared ledger:
// lock, load, reclaim dead owners, first-fit, store, unlock.
// Every failure degrades to "no pinning".
class NumaPlanner {
public:
  NumaPlanner(const host::TopologyReader& topology, const host::IProcessTable& procs,
              std::filesystem::path ledger_path,
              std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(2000));

  [[nodiscard]] std::optional<model::Pinning> plan(const model::PlacementRequest& request) const;

  // Lock file guarding the ledger: "<ledger>.lock"
  [[nodiscard]] std::filesystem::path lock_path() const;

private:
  const host::TopologyReader& topology_;
  const host::IProcessTable& procs_;
  LedgerStore store_;
  std::chrono::milliseconds lock_timeout_;
};

} // namespace dockhand::app
