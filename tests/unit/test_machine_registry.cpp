/**
 * @file test_machine_registry.cpp
 * @brief Unit tests for the machine table and liveness expiry.
 * @author BeaconMesh contributors
 */

#include "discovery/machine_registry.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace beacon_mesh;
using namespace std::chrono_literals;

namespace {

MachineDescriptor machine(const std::string& id, const std::string& host,
                          const std::string& ip, SteadyTime seen) {
    MachineDescriptor d;
    d.machine_id = id;
    d.hostname = host;
    d.primary_ip = ip;
    d.websocket_port = 8080;
    d.last_seen = seen;
    return d;
}

}  // namespace

class MachineRegistryTest : public ::testing::Test {
protected:
    SteadyTime t0_ = std::chrono::steady_clock::now();
    MachineRegistry registry_{"m-self", 60s};
};

TEST_F(MachineRegistryTest, InsertThenRefresh) {
    EXPECT_EQ(registry_.upsert(machine("m-bbb", "beta", "10.0.0.2", t0_)), RegistryEvent::Inserted);
    EXPECT_EQ(registry_.upsert(machine("m-bbb", "beta", "10.0.0.2", t0_ + 1s)), RegistryEvent::Refreshed);
    EXPECT_EQ(registry_.size(), 1u);

    auto got = registry_.get("m-bbb");
    ASSERT_TRUE(got);
    EXPECT_EQ(got->last_seen, t0_ + 1s);
    EXPECT_EQ(got->status, MachineStatus::Online);
}

TEST_F(MachineRegistryTest, UnknownIdIsNotFound) {
    auto got = registry_.get("m-zzz");
    ASSERT_FALSE(got);
    EXPECT_EQ(got.error().kind, ErrorKind::NotFound);
    EXPECT_TRUE(registry_.is_offline("m-zzz"));
}

TEST_F(MachineRegistryTest, LastSeenNeverMovesBackwards) {
    registry_.upsert(machine("m-bbb", "beta", "10.0.0.2", t0_ + 5s));
    registry_.upsert(machine("m-bbb", "beta", "10.0.0.2", t0_));
    EXPECT_EQ(registry_.get("m-bbb")->last_seen, t0_ + 5s);

    registry_.touch("m-bbb", t0_ + 1s);
    EXPECT_EQ(registry_.get("m-bbb")->last_seen, t0_ + 5s);
}

TEST_F(MachineRegistryTest, SilentPeerGoesOffline) {
    registry_.upsert(machine("m-bbb", "beta", "10.0.0.2", t0_));
    registry_.upsert(machine("m-ccc", "gamma", "10.0.0.3", t0_ + 30s));

    EXPECT_TRUE(registry_.expire_stale(t0_ + 59s).empty());

    auto expired = registry_.expire_stale(t0_ + 60s);
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired[0], "m-bbb");
    EXPECT_TRUE(registry_.is_offline("m-bbb"));
    EXPECT_FALSE(registry_.is_offline("m-ccc"));

    // Offline entries are kept but not listed as online
    EXPECT_EQ(registry_.size(), 2u);
    auto online = registry_.list_online();
    ASSERT_EQ(online.size(), 1u);
    EXPECT_EQ(online[0].machine_id, "m-ccc");

    // A second sweep reports nothing new
    EXPECT_TRUE(registry_.expire_stale(t0_ + 61s).empty());
}

TEST_F(MachineRegistryTest, SelfNeverExpiresOrLists) {
    registry_.upsert(machine("m-self", "self", "10.0.0.1", t0_));
    EXPECT_TRUE(registry_.expire_stale(t0_ + 1h).empty());
    EXPECT_FALSE(registry_.is_offline("m-self"));
    EXPECT_TRUE(registry_.list_online().empty());
    EXPECT_EQ(registry_.snapshot().size(), 1u);
}

TEST_F(MachineRegistryTest, BeaconRevivesOfflinePeer) {
    registry_.upsert(machine("m-bbb", "beta", "10.0.0.2", t0_));
    registry_.expire_stale(t0_ + 60s);

    // Link traffic alone does not revive
    registry_.touch("m-bbb", t0_ + 61s);
    EXPECT_TRUE(registry_.is_offline("m-bbb"));
    EXPECT_FALSE(registry_.set_status("m-bbb", MachineStatus::Online));

    EXPECT_EQ(registry_.upsert(machine("m-bbb", "beta", "10.0.0.2", t0_ + 62s)),
              RegistryEvent::Revived);
    EXPECT_EQ(registry_.get("m-bbb")->status, MachineStatus::Online);
}

TEST_F(MachineRegistryTest, IdentityChangeOnLivePeerIsCollision) {
    registry_.upsert(machine("m-bbb", "beta", "10.0.0.2", t0_));

    std::vector<std::pair<RegistryEvent, std::string>> seen;
    registry_.set_listener([&](const MachineDescriptor&, RegistryEvent e, const std::string& prev) {
        seen.emplace_back(e, prev);
    });

    EXPECT_EQ(registry_.upsert(machine("m-bbb", "beta-clone", "10.0.0.9", t0_ + 1s)),
              RegistryEvent::Collision);
    EXPECT_EQ(registry_.collision_count(), 1u);
    // Last write wins
    EXPECT_EQ(registry_.get("m-bbb")->hostname, "beta-clone");

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].first, RegistryEvent::Collision);
    EXPECT_EQ(seen[0].second, "beta");
}

TEST_F(MachineRegistryTest, ListenerSkipsRefresh) {
    int calls = 0;
    registry_.set_listener([&](const MachineDescriptor&, RegistryEvent, const std::string&) {
        ++calls;
    });
    registry_.upsert(machine("m-bbb", "beta", "10.0.0.2", t0_));
    registry_.upsert(machine("m-bbb", "beta", "10.0.0.2", t0_ + 1s));
    registry_.expire_stale(t0_ + 2min);
    EXPECT_EQ(calls, 2);  // inserted, went offline
}

TEST_F(MachineRegistryTest, DegradedStatusSurvivesRefresh) {
    registry_.upsert(machine("m-bbb", "beta", "10.0.0.2", t0_));
    EXPECT_TRUE(registry_.set_status("m-bbb", MachineStatus::Degraded));
    registry_.upsert(machine("m-bbb", "beta", "10.0.0.2", t0_ + 1s));
    EXPECT_EQ(registry_.get("m-bbb")->status, MachineStatus::Degraded);

    EXPECT_FALSE(registry_.set_status("m-bbb", MachineStatus::Offline));
}

TEST_F(MachineRegistryTest, DefaultLastSeenMeansNow) {
    auto before = std::chrono::steady_clock::now();
    MachineDescriptor d = machine("m-bbb", "beta", "10.0.0.2", SteadyTime{});
    registry_.upsert(d);
    EXPECT_GE(registry_.get("m-bbb")->last_seen, before);
}

TEST_F(MachineRegistryTest, ConcurrentWritersAndSweep) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 200; ++i) {
                auto id = "m-" + std::to_string(t) + "-" + std::to_string(i % 10);
                registry_.upsert(machine(id, "h", "10.0.0.1", std::chrono::steady_clock::now()));
                registry_.touch(id, std::chrono::steady_clock::now());
            }
        });
    }
    threads.emplace_back([&] {
        for (int i = 0; i < 50; ++i) {
            registry_.expire_stale(std::chrono::steady_clock::now());
            (void)registry_.list_online();
        }
    });
    for (auto& th : threads) th.join();
    EXPECT_EQ(registry_.size(), 40u);
}
