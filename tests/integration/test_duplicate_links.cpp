/**
 * @file test_duplicate_links.cpp
 * @brief Duplicate-connection tie-break against a running coordinator.
 * @author BeaconMesh contributors
 *
 * The test plays machine "m-aaaa" with raw ClusterLinks so it controls
 * exactly which connections exist when the coordinator resolves them.
 */

#include "cluster/cluster_link.hpp"
#include "discovery/beacon_broadcaster.hpp"
#include "discovery/discovery_coordinator.hpp"
#include "../support/test_helpers.hpp"

#include <gtest/gtest.h>

using namespace beacon_mesh;
using namespace std::chrono_literals;
using beacon_mesh::testing::CapturedLogger;
using beacon_mesh::testing::FakePortProbe;
using beacon_mesh::testing::fast_mesh_config;
using beacon_mesh::testing::free_tcp_port;
using beacon_mesh::testing::free_udp_port;
using beacon_mesh::testing::wait_until;

namespace {

constexpr const char* TEST_ID = "m-aaaa";
constexpr const char* NODE_ID = "m-bbbb";

MachineDescriptor machine(const std::string& id, uint16_t cluster_port) {
    MachineDescriptor d;
    d.machine_id = id;
    d.hostname = id + "-host";
    d.primary_ip = "127.0.0.1";
    d.cluster_name = "dup";
    d.websocket_port = cluster_port;
    return d;
}

LinkOptions test_options() {
    return LinkOptions{
        .local_id = TEST_ID,
        .heartbeat_interval_ms = 100,
        .handshake_timeout_ms = 1000,
        .connect_timeout_ms = 500,
        .max_message_size = FramedSocket::DEFAULT_MAX_FRAME,
    };
}

ClusterLink::Callbacks no_callbacks() {
    return ClusterLink::Callbacks{
        .on_state = [](ClusterLink&, LinkState, LinkState) {},
        .on_message = [](ClusterLink&, const ClusterMessage&) {},
    };
}

bool is_established(const ClusterLink& link) {
    return link.state() == LinkState::Established;
}

}  // namespace

class DuplicateLinks : public ::testing::Test {
protected:
    CapturedLogger log_;
    CapturedLogger test_log_;
    std::unique_ptr<DiscoveryCoordinator> node_;
    uint16_t node_udp_ = 0;
    uint16_t node_tcp_ = 0;
    uint16_t test_tcp_ = 0;
    FrameServer test_server_;

    void SetUp() override {
        node_udp_ = free_udp_port();
        node_tcp_ = free_tcp_port();
        uint16_t sink_udp = free_udp_port();
        if (node_udp_ == 0 || node_tcp_ == 0 || sink_udp == 0 || sink_udp == node_udp_) {
            GTEST_SKIP() << "No free loopback ports";
        }
        if (!test_server_.listen("127.0.0.1", 0)) GTEST_SKIP() << "Cannot bind test server";
        test_tcp_ = test_server_.port();

        node_ = std::make_unique<DiscoveryCoordinator>(
            fast_mesh_config(node_udp_, node_tcp_, sink_udp), machine(NODE_ID, 0),
            *log_.logger, nullptr, std::make_shared<FakePortProbe>());
        auto started = node_->start();
        if (!started) GTEST_SKIP() << "Coordinator failed to start: " << started.error().message;
    }

    void TearDown() override {
        if (node_) node_->stop();
        test_server_.close();
    }

    std::unique_ptr<ClusterLink> dial_node() {
        return std::make_unique<ClusterLink>(
            test_options(), NODE_ID, "127.0.0.1", node_tcp_,
            [this] { return machine(TEST_ID, test_tcp_); }, no_callbacks(), *test_log_.logger);
    }
};

TEST_F(DuplicateLinks, SameInitiatorKeepsNewestLink) {
    auto first = dial_node();
    first->start();
    ASSERT_TRUE(wait_until([&] { return is_established(*first); }, 3s));

    auto second = dial_node();
    second->start();
    ASSERT_TRUE(wait_until([&] { return is_established(*second); }, 3s));

    // The node drops its side of the older connection
    ASSERT_TRUE(wait_until([&] { return first->state() == LinkState::Closed; }, 3s));
    EXPECT_TRUE(is_established(*second));

    auto state = node_->link_state(TEST_ID);
    ASSERT_TRUE(state);
    EXPECT_EQ(*state, LinkState::Established);
    EXPECT_TRUE(log_.sink->contains("Duplicate link"));

    second->close(CloseReason::LocalShutdown);
}

TEST_F(DuplicateLinks, LowerInitiatorWinsCrossDial) {
    // Announce ourselves so the node dials in first
    BeaconBroadcaster beacon({"127.0.0.1:" + std::to_string(node_udp_)}, node_udp_, *test_log_.logger);
    ASSERT_TRUE(beacon.run([this] { return machine(TEST_ID, test_tcp_); }, 60s));

    auto accepted = test_server_.accept(3000);
    ASSERT_TRUE(accepted);
    ASSERT_NE(accepted.value().get(), nullptr);
    beacon.stop();

    ClusterLink inbound(test_options(), std::move(accepted.value()),
                        [this] { return machine(TEST_ID, test_tcp_); }, no_callbacks(),
                        *test_log_.logger);
    inbound.start();
    ASSERT_TRUE(wait_until([&] { return is_established(inbound); }, 3s));
    EXPECT_EQ(inbound.initiator_id(), NODE_ID);

    // Our own dial has the lower initiator id and must survive
    auto outbound = dial_node();
    outbound->start();
    ASSERT_TRUE(wait_until([&] { return is_established(*outbound); }, 3s));
    ASSERT_TRUE(wait_until([&] { return inbound.state() == LinkState::Closed; }, 3s));
    EXPECT_TRUE(is_established(*outbound));

    auto peers = node_->list_peers();
    ASSERT_EQ(peers.size(), 1u);
    ASSERT_TRUE(peers[0].link_direction.has_value());
    EXPECT_EQ(*peers[0].link_direction, LinkDirection::Inbound);

    outbound->close(CloseReason::LocalShutdown);
}

TEST_F(DuplicateLinks, DroppedPeerIsRedialed) {
    auto link = dial_node();
    link->start();
    ASSERT_TRUE(wait_until([&] { return is_established(*link); }, 3s));

    // The node sees a transport loss and redials the advertised endpoint
    link->close(CloseReason::LocalShutdown);
    link.reset();
    auto redial = test_server_.accept(3000);
    ASSERT_TRUE(redial);
    EXPECT_NE(redial.value().get(), nullptr);
}
