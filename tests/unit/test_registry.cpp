/**
 * @file test_registry.cpp
 * @brief Unit tests for the device registry
 */

#include <atomic>
#include <clipsync/registry.h>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace clipsync;
using namespace std::chrono_literals;

namespace {

DeviceInfo make_peer(const std::string &name, Timestamp seen) {
  DeviceInfo info;
  info.id = Uuid::generate();
  info.name = name;
  info.address = "10.0.0.5";
  info.port = 8765;
  info.last_seen = seen;
  return info;
}

} // namespace

class RegistryTest : public ::testing::Test {
protected:
  DeviceRegistry registry{15000ms};
  Timestamp t0 = from_millis(1700000000000ull);
};

TEST_F(RegistryTest, UpsertReportsNewPeers) {
  auto peer = make_peer("desk", t0);

  EXPECT_TRUE(registry.upsert(peer));
  EXPECT_FALSE(registry.upsert(peer));
  EXPECT_EQ(registry.size(), 1u);
  EXPECT_TRUE(registry.contains(peer.id));
}

TEST_F(RegistryTest, UpsertReplacesFieldsButNotOlderTimestamp) {
  auto peer = make_peer("desk", t0 + 10s);
  registry.upsert(peer);

  auto renamed = peer;
  renamed.name = "desk-2";
  renamed.port = 9000;
  renamed.last_seen = t0;
  registry.upsert(renamed);

  auto stored = registry.get(peer.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->name, "desk-2");
  EXPECT_EQ(stored->port, 9000);
  EXPECT_EQ(stored->last_seen, t0 + 10s);
}

TEST_F(RegistryTest, RemoveReportsPresence) {
  auto peer = make_peer("desk", t0);
  registry.upsert(peer);

  EXPECT_TRUE(registry.remove(peer.id));
  EXPECT_FALSE(registry.remove(peer.id));
  EXPECT_FALSE(registry.get(peer.id).has_value());
}

TEST_F(RegistryTest, SweepEvictsStalePeers) {
  auto stale = make_peer("stale", t0);
  auto fresh = make_peer("fresh", t0 + 10s);
  registry.upsert(stale);
  registry.upsert(fresh);

  auto evicted = registry.sweep(t0 + 16s);
  ASSERT_EQ(evicted.size(), 1u);
  EXPECT_EQ(evicted[0], stale.id);
  EXPECT_TRUE(registry.contains(fresh.id));
}

TEST_F(RegistryTest, SweepAtExactTtlKeepsPeer) {
  auto peer = make_peer("edge", t0);
  registry.upsert(peer);

  EXPECT_TRUE(registry.sweep(t0 + 15s).empty());
  EXPECT_EQ(registry.sweep(t0 + 15001ms).size(), 1u);
}

TEST_F(RegistryTest, StaticPeersSurviveSweep) {
  auto pinned = make_peer("pinned", t0);
  auto discovered = make_peer("discovered", t0);
  EXPECT_TRUE(registry.add_static(pinned));
  registry.upsert(discovered);

  auto evicted = registry.sweep(t0 + 1h);
  ASSERT_EQ(evicted.size(), 1u);
  EXPECT_EQ(evicted[0], discovered.id);
  EXPECT_TRUE(registry.contains(pinned.id));
  EXPECT_TRUE(registry.is_static(pinned.id));
  EXPECT_FALSE(registry.is_static(discovered.id));
}

TEST_F(RegistryTest, RemovedStaticPeerIsNoLongerPinned) {
  auto pinned = make_peer("pinned", t0);
  registry.add_static(pinned);

  EXPECT_TRUE(registry.remove(pinned.id));
  EXPECT_FALSE(registry.is_static(pinned.id));

  registry.upsert(pinned);
  EXPECT_EQ(registry.sweep(t0 + 1h).size(), 1u);
}

TEST_F(RegistryTest, FresherAnnouncementRetainsPeer) {
  auto peer = make_peer("desk", t0);
  registry.upsert(peer);

  // Announcement arrives every 5 s
  for (int i = 1; i <= 6; ++i) {
    auto refreshed = peer;
    refreshed.last_seen = t0 + std::chrono::seconds(5 * i);
    registry.upsert(refreshed);
    EXPECT_TRUE(registry.sweep(t0 + std::chrono::seconds(5 * i + 4)).empty());
  }
  EXPECT_TRUE(registry.contains(peer.id));
}

TEST_F(RegistryTest, CallbacksFireOutsideLock) {
  std::vector<DeviceId> added;
  std::vector<DeviceId> removed;

  registry.on_device_added([&](const DeviceInfo &info) {
    added.push_back(info.id);
    // Re-entering the registry must not deadlock
    EXPECT_TRUE(registry.contains(info.id));
  });
  registry.on_device_removed([&](const DeviceId &id) {
    removed.push_back(id);
    EXPECT_FALSE(registry.contains(id));
  });

  auto a = make_peer("a", t0);
  auto b = make_peer("b", t0 + 20s);
  registry.upsert(a);
  registry.upsert(a);
  registry.upsert(b);
  registry.remove(b.id);
  registry.sweep(t0 + 60s);

  ASSERT_EQ(added.size(), 2u);
  ASSERT_EQ(removed.size(), 2u);
  EXPECT_EQ(removed[0], b.id);
  EXPECT_EQ(removed[1], a.id);
}

TEST_F(RegistryTest, ClearDoesNotNotify) {
  int removed = 0;
  registry.on_device_removed([&](const DeviceId &) { ++removed; });

  registry.upsert(make_peer("a", t0));
  registry.clear();

  EXPECT_EQ(registry.size(), 0u);
  EXPECT_EQ(removed, 0);
}

TEST_F(RegistryTest, SnapshotIsACopy) {
  auto peer = make_peer("desk", t0);
  registry.upsert(peer);

  auto snapshot = registry.snapshot();
  ASSERT_EQ(snapshot.size(), 1u);
  snapshot[0].name = "changed";

  EXPECT_EQ(registry.get(peer.id)->name, "desk");
}

TEST_F(RegistryTest, ConcurrentReadersAndWriter) {
  std::atomic<bool> done{false};
  auto peer = make_peer("busy", t0);

  std::thread writer([&] {
    for (int i = 0; i < 2000; ++i) {
      auto update = peer;
      update.last_seen = t0 + std::chrono::milliseconds(i);
      update.name = "busy-" + std::to_string(i);
      registry.upsert(update);
    }
    done = true;
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 3; ++r) {
    readers.emplace_back([&] {
      while (!done) {
        for (const auto &info : registry.snapshot()) {
          EXPECT_EQ(info.id, peer.id);
          EXPECT_EQ(info.name.rfind("busy-", 0), 0u);
        }
      }
    });
  }

  writer.join();
  for (auto &t : readers) {
    t.join();
  }
  EXPECT_EQ(registry.get(peer.id)->last_seen, t0 + 1999ms);
}
