#pragma once
#include "model/Placement.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace dockhand::host {

// Reads NUMA capability and per-zone core lists from /proc.
// Zones are the distinct "physical id" values of /proc/cpuinfo.
class TopologyReader {
public:
  TopologyReader() = default;

  // True if /proc/1/numa_maps exists. Absence is not an error.
  [[nodiscard]] bool is_numa_capable() const;

  // Ascending logical core indices of a zone; empty if the zone is unknown
  // or the topology is unreadable/malformed.
  [[nodiscard]] model::CoreSet cores_for_zone(model::ZoneId zone) const;

  // Ascending distinct zone ids; empty on unreadable/malformed topology.
  [[nodiscard]] std::vector<model::ZoneId> zone_ids() const;

private:
  // (processor, physical id) per cpuinfo block, or nullopt if malformed.
  using CpuMap = std::vector<std::pair<int, int>>;
  [[nodiscard]] std::optional<CpuMap> read_cpu_map() const;
};

} // namespace dockhand::host
