#include "app/ZonePacker.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace dockhand::app {

auto place(model::PlacementLedger& ledger, const model::PlacementRequest& request)
    -> std::optional<model::ZoneId> {
  if (!std::isfinite(request.requested_cpu) || request.requested_cpu <= 0.0) return std::nullopt;

  for (auto& z : ledger.zones) {
    std::erase_if(z.entries, [&](const model::PlacementEntry& e){ return e.owner_pid == request.owner_pid; });
  }

  std::vector<model::Zone*> order;
  order.reserve(ledger.zones.size());
  for (auto& z : ledger.zones) order.push_back(&z);
  std::stable_sort(order.begin(), order.end(),
                   [](const model::Zone* a, const model::Zone* b){ return a->id < b->id; });

  for (auto* z : order) {
    if (z->core_capacity <= 0.0) continue;
    if (z->committed() + request.requested_cpu <= z->core_capacity + kCapacityEpsilon) {
      z->entries.push_back(model::PlacementEntry{request.owner_pid, request.requested_cpu});
      return z->id;
    }
  }
  return std::nullopt;
}

} // namespace dockhand::app
