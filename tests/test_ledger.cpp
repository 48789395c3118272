#include "minitest.hpp"
#include "fake_host.hpp"
#include "app/PlacementLedger.hpp"
#include "host/ProcessTable.hpp"
#include "host/TopologyReader.hpp"
#include <fstream>

using dockhand::app::LedgerStore;
using dockhand::app::reclaim_dead;
using dockhand::host::StaticProcessTable;
using dockhand::host::TopologyReader;
using dockhand::model::PlacementEntry;
using dockhand::model::PlacementLedger;

TEST(ledger_fresh_when_absent) {
  auto root = fake_host::make_root("ledger_fresh");
  fake_host::write_cpuinfo(root, {0, 0, 1, 1});
  TopologyReader topo;
  LedgerStore store(root / "state/placement.toml", topo);
  auto l = store.load();
  ASSERT_EQ(l.zones.size(), 2u);
  ASSERT_EQ(l.zones[0].id, 0);
  ASSERT_EQ(l.zones[1].id, 1);
  ASSERT_EQ(l.zones[0].core_capacity, 2.0);
  ASSERT_TRUE(l.zones[0].entries.empty());
  fake_host::cleanup(root);
}

TEST(ledger_store_then_load_exact) {
  auto root = fake_host::make_root("ledger_roundtrip");
  fake_host::write_cpuinfo(root, {0, 0, 1, 1});
  TopologyReader topo;
  LedgerStore store(root / "state/placement.toml", topo);
  auto l = store.fresh();
  l.zones[0].entries.push_back(PlacementEntry{101, 0.1});
  l.zones[0].entries.push_back(PlacementEntry{102, 1.0 / 3.0});
  l.zones[1].entries.push_back(PlacementEntry{103, 1.25});
  ASSERT_TRUE(store.store(l));
  ASSERT_TRUE(fake_host::fs::exists(root / "state/placement.toml"));
  auto back = store.load();
  ASSERT_TRUE(back == l);
  fake_host::cleanup(root);
}

TEST(ledger_file_format) {
  PlacementLedger l;
  l.zones.push_back({0, 4.0, {PlacementEntry{77, 1.5}}});
  auto text = LedgerStore::encode(l);
  ASSERT_TRUE(text.find("[zone.0]") != std::string::npos);
  ASSERT_TRUE(text.find("capacity = 4") != std::string::npos);
  ASSERT_TRUE(text.find("77 = 1.5") != std::string::npos);
  auto back = LedgerStore::decode(text);
  ASSERT_TRUE(back.has_value());
  ASSERT_TRUE(*back == l);
}

TEST(ledger_decode_rejects_garbage) {
  ASSERT_FALSE(LedgerStore::decode("[zone.x]\n1 = 1\n").has_value());
  ASSERT_FALSE(LedgerStore::decode("[zone.0]\nabc = 1\n").has_value());
  ASSERT_FALSE(LedgerStore::decode("[zone.0]\n12 = lots\n").has_value());
  ASSERT_FALSE(LedgerStore::decode("[zone.0]\n12 = -1\n").has_value());
  ASSERT_FALSE(LedgerStore::decode("[other]\nk = 1\n").has_value());
  ASSERT_FALSE(LedgerStore::decode("stray = 1\n").has_value());
  ASSERT_TRUE(LedgerStore::decode("").has_value());
}

TEST(ledger_corrupt_file_yields_fresh) {
  auto root = fake_host::make_root("ledger_corrupt");
  fake_host::write_cpuinfo(root, {0, 1});
  fake_host::fs::create_directories(root / "state");
  std::ofstream(root / "state/placement.toml") << "[zone.0]\n4123 = \x01\x02garbage\n";
  TopologyReader topo;
  LedgerStore store(root / "state/placement.toml", topo);
  auto l = store.load();
  ASSERT_TRUE(l == store.fresh());
  fake_host::cleanup(root);
}

TEST(ledger_reconciles_with_topology) {
  auto root = fake_host::make_root("ledger_reconcile");
  fake_host::write_cpuinfo(root, {0, 0, 0, 1});
  fake_host::fs::create_directories(root / "state");
  std::ofstream(root / "state/placement.toml") << "[zone.0]\ncapacity = 8\n11 = 2\n\n"
                                                  "[zone.5]\ncapacity = 8\n12 = 1\n";
  TopologyReader topo;
  LedgerStore store(root / "state/placement.toml", topo);
  auto l = store.load();
  ASSERT_EQ(l.zones.size(), 2u);
  ASSERT_EQ(l.zones[0].core_capacity, 3.0);
  ASSERT_EQ(l.zones[0].entries.size(), 1u);
  ASSERT_EQ(l.zones[0].entries[0].owner_pid, 11);
  ASSERT_EQ(l.zones[1].core_capacity, 1.0);
  ASSERT_TRUE(l.zones[1].entries.empty());
  fake_host::cleanup(root);
}

TEST(ledger_reclaim_removes_dead_owners) {
  PlacementLedger l;
  l.zones.push_back({0, 4.0, {PlacementEntry{1, 1.0}, PlacementEntry{2, 1.0}}});
  l.zones.push_back({1, 4.0, {PlacementEntry{3, 2.0}}});
  StaticProcessTable procs({2});
  auto once = reclaim_dead(l, procs);
  ASSERT_EQ(once.zones[0].entries.size(), 1u);
  ASSERT_EQ(once.zones[0].entries[0].owner_pid, 2);
  ASSERT_TRUE(once.zones[1].entries.empty());
  auto twice = reclaim_dead(once, procs);
  ASSERT_TRUE(twice == once);
  // A pid coming back later does not resurrect its entry
  procs.add(1);
  ASSERT_TRUE(reclaim_dead(twice, procs) == once);
}
