#include "host/TopologyReader.hpp"
#include "util/Procfs.hpp"
#include "util/TomlReader.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <string_view>

namespace dockhand::host {

static std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
  return s;
}

// Value after ':' on a "key : value" line, parsed as a non-negative int.
static std::optional<int> field_int(const std::string& line) {
  auto pos = line.find(':');
  if (pos == std::string::npos) return std::nullopt;
  auto v = util::TomlReader::parse_int(trim(std::string_view(line).substr(pos + 1)));
  if (!v || *v < 0 || *v > 1 << 20) return std::nullopt;
  return static_cast<int>(*v);
}

bool TopologyReader::is_numa_capable() const {
  return util::path_exists("/proc/1/numa_maps");
}

auto TopologyReader::read_cpu_map() const -> std::optional<CpuMap> {
  auto txt_opt = util::read_file_string("/proc/cpuinfo");
  if (!txt_opt) return std::nullopt;

  CpuMap out;
  std::istringstream ss(*txt_opt);
  std::string line;
  std::optional<int> cur_proc, cur_phys;
  bool bad = false;

  auto end_block = [&]{
    if (cur_proc) {
      if (!cur_phys) bad = true; // e.g. arm: no socket grouping exposed
      else out.emplace_back(*cur_proc, *cur_phys);
    }
    cur_proc.reset(); cur_phys.reset();
  };

  while (std::getline(ss, line)) {
    if (trim(line).empty()) { end_block(); continue; }
    if (line.rfind("processor", 0) == 0) {
      cur_proc = field_int(line);
      if (!cur_proc) bad = true;
    } else if (line.rfind("physical id", 0) == 0) {
      cur_phys = field_int(line);
      if (!cur_phys) bad = true;
    }
  }
  end_block();

  if (bad || out.empty()) return std::nullopt;
  return out;
}

model::CoreSet TopologyReader::cores_for_zone(model::ZoneId zone) const {
  model::CoreSet cores;
  auto map = read_cpu_map();
  if (!map) return cores;
  for (const auto& [proc, phys] : *map) {
    if (phys == zone) cores.push_back(proc);
  }
  std::sort(cores.begin(), cores.end());
  cores.erase(std::unique(cores.begin(), cores.end()), cores.end());
  return cores;
}

std::vector<model::ZoneId> TopologyReader::zone_ids() const {
  std::vector<model::ZoneId> ids;
  auto map = read_cpu_map();
  if (!map) return ids;
  for (const auto& [proc, phys] : *map) ids.push_back(phys);
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  return ids;
}

} // namespace dockhand::host
