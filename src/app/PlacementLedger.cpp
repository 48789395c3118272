#include "app/PlacementLedger.hpp"
#include "util/Diag.hpp"
#include "util/TomlReader.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

namespace dockhand::app {

static constexpr const char* kZonePrefix = "zone.";

LedgerStore::LedgerStore(std::filesystem::path path, const host::TopologyReader& topology)
    : path_(std::move(path)), topology_(topology) {}

model::PlacementLedger LedgerStore::fresh() const {
  model::PlacementLedger ledger;
  for (auto id : topology_.zone_ids()) {
    model::Zone z;
    z.id = id;
    z.core_capacity = static_cast<double>(topology_.cores_for_zone(id).size());
    ledger.zones.push_back(std::move(z));
  }
  return ledger;
}

model::PlacementLedger LedgerStore::load() const {
  auto ledger = fresh();

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) return ledger;

  std::ifstream in(path_);
  std::string text;
  if (in.is_open()) text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (!in.is_open() || in.bad()) {
    util::diag("Ledger", "cannot read %s, starting empty", path_.c_str());
    return ledger;
  }
  auto persisted = decode(text);
  if (!persisted) {
    util::diag("Ledger", "corrupt ledger %s, starting empty", path_.c_str());
    return ledger;
  }
  for (auto& z : ledger.zones) {
    if (const auto* p = persisted->find(z.id)) z.entries = p->entries;
  }
  return ledger;
}

std::string LedgerStore::encode(const model::PlacementLedger& ledger) {
  util::TomlReader toml;
  for (const auto& z : ledger.zones) {
    auto section = kZonePrefix + std::to_string(z.id);
    toml.set(section, "capacity", z.core_capacity);
    for (const auto& e : z.entries) {
      toml.set(section, std::to_string(e.owner_pid), e.committed_cpu);
    }
  }
  return "# dockhand placement ledger\n" + toml.serialize();
}

auto LedgerStore::decode(const std::string& text) -> std::optional<model::PlacementLedger> {
  util::TomlReader toml;
  toml.parse(text);

  model::PlacementLedger ledger;
  for (const auto& name : toml.section_names()) {
    if (name.empty() && toml.entries(name).empty()) continue;
    if (name.rfind(kZonePrefix, 0) != 0) return std::nullopt;
    auto id = util::TomlReader::parse_int(std::string_view(name).substr(std::strlen(kZonePrefix)));
    if (!id || *id < 0) return std::nullopt;

    model::Zone z;
    z.id = static_cast<model::ZoneId>(*id);
    if (ledger.find(z.id)) return std::nullopt;
    for (const auto& [k, v] : toml.entries(name)) {
      auto cpu = util::TomlReader::parse_double(v);
      if (!cpu || *cpu < 0.0) return std::nullopt;
      if (k == "capacity") { z.core_capacity = *cpu; continue; }
      auto pid = util::TomlReader::parse_int(k);
      if (!pid || *pid <= 0) return std::nullopt;
      z.entries.push_back(model::PlacementEntry{static_cast<pid_t>(*pid), *cpu});
    }
    ledger.zones.push_back(std::move(z));
  }
  std::sort(ledger.zones.begin(), ledger.zones.end(),
            [](const model::Zone& a, const model::Zone& b){ return a.id < b.id; });
  return ledger;
}

// Write all of 'data' to fd, retrying short writes and EINTR.
static bool write_all(int fd, const std::string& data) {
  const char* p = data.data();
  size_t left = data.size();
  while (left > 0) {
    ssize_t n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    p += n;
    left -= static_cast<size_t>(n);
  }
  return true;
}

bool LedgerStore::store(const model::PlacementLedger& ledger) const {
  std::error_code ec;
  auto dir = path_.parent_path();
  if (!dir.empty()) {
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      util::diag("Ledger", "failed to create %s: %s", dir.c_str(), ec.message().c_str());
      return false;
    }
  }

  auto tmp = path_;
  tmp += ".tmp." + std::to_string(::getpid());
  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    util::diag("Ledger", "failed to open %s: %s", tmp.c_str(), std::strerror(errno));
    return false;
  }
  bool ok = write_all(fd, encode(ledger)) && ::fsync(fd) == 0;
  int saved = errno;
  if (::close(fd) != 0 && ok) { ok = false; saved = errno; }
  if (!ok) {
    util::diag("Ledger", "failed to write %s: %s", tmp.c_str(), std::strerror(saved));
    std::filesystem::remove(tmp, ec);
    return false;
  }

  std::filesystem::rename(tmp, path_, ec);
  if (ec) {
    util::diag("Ledger", "failed to replace %s: %s", path_.c_str(), ec.message().c_str());
    std::filesystem::remove(tmp, ec);
    return false;
  }

  // Make the rename itself durable
  if (!dir.empty()) {
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd >= 0) {
      if (::fsync(dfd) != 0) util::diag("Ledger", "fsync %s: %s", dir.c_str(), std::strerror(errno));
      if (::close(dfd) != 0) util::diag("Ledger", "close %s: %s", dir.c_str(), std::strerror(errno));
    }
  }
  return true;
}

model::PlacementLedger reclaim_dead(model::PlacementLedger ledger, const host::IProcessTable& procs) {
  for (auto& z : ledger.zones) {
    std::erase_if(z.entries, [&](const model::PlacementEntry& e){ return !procs.is_alive(e.owner_pid); });
  }
  return ledger;
}

} // namespace dockhand::app
