/**
 * @file test_discovery_e2e.cpp
 * @brief Two coordinators on loopback: discovery, links, messaging, expiry.
 * @author BeaconMesh contributors
 */

#include "discovery/discovery_coordinator.hpp"
#include "telemetry/event_journal.hpp"
#include "telemetry/json_sink.hpp"
#include "../support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <vector>

using namespace beacon_mesh;
using namespace std::chrono_literals;
using beacon_mesh::testing::CapturedLogger;
using beacon_mesh::testing::FakePortProbe;
using beacon_mesh::testing::fast_mesh_config;
using beacon_mesh::testing::free_tcp_port;
using beacon_mesh::testing::free_udp_port;
using beacon_mesh::testing::wait_until;

namespace {

MachineDescriptor node(const std::string& id) {
    MachineDescriptor d;
    d.machine_id = id;
    d.hostname = id + "-host";
    d.primary_ip = "127.0.0.1";
    d.cluster_name = "e2e";
    return d;
}

struct Inbox {
    std::mutex mutex;
    std::vector<ClusterMessage> messages;

    DiscoveryCoordinator::MessageHandler handler() {
        return [this](const ClusterMessage& m) {
            std::lock_guard lock(mutex);
            messages.push_back(m);
        };
    }
    size_t size() {
        std::lock_guard lock(mutex);
        return messages.size();
    }
};

bool established(const DiscoveryCoordinator& c, const MachineId& peer) {
    auto state = c.link_state(peer);
    return state && *state == LinkState::Established;
}

}  // namespace

// ═══════════════════════════════════════════════
// Two-Node Mesh
// ═══════════════════════════════════════════════

class TwoNodeMesh : public ::testing::Test {
protected:
    CapturedLogger log_a_;
    CapturedLogger log_b_;
    MemorySink* journal_sink_ = nullptr;
    std::unique_ptr<EventJournal> journal_;
    std::unique_ptr<DiscoveryCoordinator> a_;
    std::unique_ptr<DiscoveryCoordinator> b_;

    void SetUp() override {
        uint16_t udp_a = free_udp_port();
        uint16_t udp_b = free_udp_port();
        uint16_t tcp_a = free_tcp_port();
        uint16_t tcp_b = free_tcp_port();
        if (udp_a == 0 || udp_b == 0 || udp_a == udp_b || tcp_a == 0 || tcp_b == 0 || tcp_a == tcp_b) {
            GTEST_SKIP() << "No free loopback ports";
        }

        auto sink = std::make_unique<MemorySink>();
        journal_sink_ = sink.get();
        journal_ = std::make_unique<EventJournal>(std::move(sink));

        a_ = std::make_unique<DiscoveryCoordinator>(
            fast_mesh_config(udp_a, tcp_a, udp_b), node("m-aaaa"), *log_a_.logger,
            journal_.get(), std::make_shared<FakePortProbe>());
        b_ = std::make_unique<DiscoveryCoordinator>(
            fast_mesh_config(udp_b, tcp_b, udp_a), node("m-bbbb"), *log_b_.logger,
            nullptr, std::make_shared<FakePortProbe>());

        auto started_a = a_->start();
        if (!started_a) GTEST_SKIP() << "Node A failed to start: " << started_a.error().message;
        auto started_b = b_->start();
        if (!started_b) GTEST_SKIP() << "Node B failed to start: " << started_b.error().message;
    }

    void TearDown() override {
        if (a_) a_->stop();
        if (b_) b_->stop();
    }

    bool linked() {
        return wait_until([&] {
            return established(*a_, "m-bbbb") && established(*b_, "m-aaaa");
        }, 5s);
    }
};

TEST_F(TwoNodeMesh, PeersDiscoverEachOther) {
    ASSERT_TRUE(wait_until([&] {
        return a_->registry().get("m-bbbb").has_value() && b_->registry().get("m-aaaa").has_value();
    }, 3s));

    auto peer = a_->registry().get("m-bbbb");
    ASSERT_TRUE(peer);
    EXPECT_EQ(peer->websocket_port, b_->config().cluster.port);
    EXPECT_EQ(peer->cluster_name, "e2e");

    auto peers = a_->list_peers();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].descriptor.machine_id, "m-bbbb");
}

TEST_F(TwoNodeMesh, LinkEstablishesOncePerPair) {
    ASSERT_TRUE(linked());

    // Let any duplicate resolution settle
    std::this_thread::sleep_for(500ms);
    auto peers_a = a_->list_peers();
    auto peers_b = b_->list_peers();
    ASSERT_EQ(peers_a.size(), 1u);
    ASSERT_EQ(peers_b.size(), 1u);
    ASSERT_TRUE(peers_a[0].link_direction.has_value());
    ASSERT_TRUE(peers_b[0].link_direction.has_value());
    EXPECT_NE(*peers_a[0].link_direction, *peers_b[0].link_direction);
    EXPECT_TRUE(journal_sink_->contains("\"peer_discovered\""));
}

TEST_F(TwoNodeMesh, ClusterPortIsClaimed) {
    auto allocation = a_->ports().lookup(a_->config().cluster.port);
    ASSERT_TRUE(allocation);
    EXPECT_EQ(allocation->service, "cluster-websocket");
}

TEST_F(TwoNodeMesh, SendToDeliversToHandler) {
    Inbox inbox;
    b_->on_message(inbox.handler());
    ASSERT_TRUE(linked());

    auto message = ClusterMessage::make(MessageType::StatusUpdate, "", {{"load", 0.25}});
    auto sent = a_->send_to("m-bbbb", message);
    ASSERT_TRUE(sent) << sent.error().message;

    ASSERT_TRUE(wait_until([&] { return inbox.size() == 1; }, 2s));
    std::lock_guard lock(inbox.mutex);
    const auto& received = inbox.messages.front();
    EXPECT_EQ(received.type, MessageType::StatusUpdate);
    EXPECT_EQ(received.source_machine_id, "m-aaaa");
    EXPECT_EQ(received.target_machine_id.value_or(""), "m-bbbb");
    EXPECT_DOUBLE_EQ(received.payload["load"].get<double>(), 0.25);
}

TEST_F(TwoNodeMesh, BroadcastReachesConnectedPeers) {
    Inbox inbox;
    a_->on_message(inbox.handler());
    ASSERT_TRUE(linked());

    auto message = ClusterMessage::make(MessageType::TaskCoordination, "m-bbbb", {{"task", "t-1"}});
    EXPECT_EQ(b_->broadcast(message), 1u);
    ASSERT_TRUE(wait_until([&] { return inbox.size() == 1; }, 2s));
}

TEST_F(TwoNodeMesh, SendToUnknownPeerIsNotFound) {
    auto sent = a_->send_to("m-nobody", ClusterMessage::make(MessageType::StatusUpdate, "m-aaaa"));
    ASSERT_FALSE(sent);
    EXPECT_EQ(sent.error().kind, ErrorKind::NotFound);
}

TEST_F(TwoNodeMesh, StoppedPeerGoesOffline) {
    ASSERT_TRUE(linked());
    b_->stop();

    // Link loss shows first, registry expiry after the silence window
    ASSERT_TRUE(wait_until([&] { return !established(*a_, "m-bbbb"); }, 2s));
    ASSERT_TRUE(wait_until([&] { return a_->registry().is_offline("m-bbbb"); }, 4s));
    EXPECT_TRUE(a_->registry().list_online().size() == 1);
    EXPECT_TRUE(journal_sink_->contains("\"peer_offline\""));
}

TEST_F(TwoNodeMesh, RestartedPeerIsRevived) {
    ASSERT_TRUE(linked());
    b_->stop();
    ASSERT_TRUE(wait_until([&] { return a_->registry().is_offline("m-bbbb"); }, 4s));

    auto restarted = b_->start();
    ASSERT_TRUE(restarted) << restarted.error().message;
    ASSERT_TRUE(wait_until([&] { return !a_->registry().is_offline("m-bbbb"); }, 3s));
    EXPECT_TRUE(linked());
    EXPECT_TRUE(journal_sink_->contains("\"peer_revived\""));
}

TEST_F(TwoNodeMesh, DiscoverNowReportsNothingNewOnceSettled) {
    ASSERT_TRUE(wait_until([&] { return a_->registry().get("m-bbbb").has_value(); }, 3s));
    EXPECT_TRUE(a_->discover_now().empty());
}

// ═══════════════════════════════════════════════
// Startup Failures
// ═══════════════════════════════════════════════

TEST(CoordinatorStartup, TakenClusterPortFailsStart) {
    CapturedLogger log;
    auto probe = std::make_shared<FakePortProbe>();
    uint16_t udp = free_udp_port();
    uint16_t tcp = free_tcp_port();
    if (udp == 0 || tcp == 0) GTEST_SKIP() << "No free loopback ports";
    probe->set_busy(tcp, "nginx");

    DiscoveryCoordinator coordinator(fast_mesh_config(udp, tcp, udp), node("m-aaaa"),
                                     *log.logger, nullptr, probe);
    auto started = coordinator.start();
    ASSERT_FALSE(started);
    EXPECT_EQ(started.error().kind, ErrorKind::ResourceConflict);
    EXPECT_FALSE(coordinator.is_running());
}

TEST(CoordinatorStartup, InvalidConfigFailsStart) {
    CapturedLogger log;
    auto config = fast_mesh_config(18181, 18080, 18181);
    config.discovery.targets.clear();

    DiscoveryCoordinator coordinator(config, node("m-aaaa"), *log.logger, nullptr,
                                     std::make_shared<FakePortProbe>());
    auto started = coordinator.start();
    ASSERT_FALSE(started);
    EXPECT_EQ(started.error().kind, ErrorKind::ConfigurationError);
}
