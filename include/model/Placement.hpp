#pragma once
#include <sys/types.h>
#include <vector>

namespace dockhand::model {

using ZoneId = int;
using CoreSet = std::vector<int>; // ascending logical core indices

struct PlacementEntry {
  pid_t owner_pid{0};
  double committed_cpu{0.0};
  bool operator==(const PlacementEntry&) const = default;
};

struct Zone {
  ZoneId id{0};
  double core_capacity{0.0};      // == number of cores in the zone
  std::vector<PlacementEntry> entries;

  double committed() const {
    double sum = 0.0;
    for (const auto& e : entries) sum += e.committed_cpu;
    return sum;
  }
  bool operator==(const Zone&) const = default;
};

// One Zone per ZoneId, ascending.
struct PlacementLedger {
  std::vector<Zone> zones;

  Zone* find(ZoneId id) {
    for (auto& z : zones) if (z.id == id) return &z;
    return nullptr;
  }
  const Zone* find(ZoneId id) const {
    for (const auto& z : zones) if (z.id == id) return &z;
    return nullptr;
  }
  bool operator==(const PlacementLedger&) const = default;
};

struct PlacementRequest {
  pid_t owner_pid{0};
  double requested_cpu{0.0};
};

// Decision handed to the rewriter.
struct Pinning {
  ZoneId zone{0};
  CoreSet cores;
};

} // namespace dockhand::model
