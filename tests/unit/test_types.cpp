/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 * @author BeaconMesh contributors
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace beacon_mesh;

TEST(MachineDescriptorTest, FindService) {
    MachineDescriptor d;
    d.advertised_services = {{"analytics-dashboard", 8090}, {"metrics-api", 8001}};

    auto* svc = d.find_service("metrics-api");
    ASSERT_NE(svc, nullptr);
    EXPECT_EQ(svc->port, 8001);
    EXPECT_EQ(d.find_service("missing"), nullptr);
}

TEST(MachineDescriptorTest, LiveUnlessOffline) {
    MachineDescriptor d;
    EXPECT_TRUE(d.is_live());
    d.status = MachineStatus::Degraded;
    EXPECT_TRUE(d.is_live());
    d.status = MachineStatus::Offline;
    EXPECT_FALSE(d.is_live());
}

TEST(ServiceEndpointTest, UniqueNames) {
    EXPECT_TRUE(has_unique_service_names({}));
    EXPECT_TRUE(has_unique_service_names({{"a", 1}, {"b", 1}}));
    EXPECT_FALSE(has_unique_service_names({{"a", 1}, {"b", 2}, {"a", 3}}));
}

TEST(MachineStatusTest, ToString) {
    EXPECT_EQ(to_string(MachineStatus::Online), "online");
    EXPECT_EQ(to_string(MachineStatus::Degraded), "degraded");
    EXPECT_EQ(to_string(MachineStatus::Offline), "offline");
}

TEST(LinkStateTest, LiveAndConnected) {
    EXPECT_FALSE(is_live(LinkState::Disconnected));
    EXPECT_TRUE(is_live(LinkState::Connecting));
    EXPECT_TRUE(is_live(LinkState::HandshakePending));
    EXPECT_TRUE(is_live(LinkState::Degraded));
    EXPECT_FALSE(is_live(LinkState::Closed));

    EXPECT_FALSE(is_connected(LinkState::HandshakePending));
    EXPECT_TRUE(is_connected(LinkState::Established));
    EXPECT_TRUE(is_connected(LinkState::Degraded));
}

TEST(LinkStateTest, ToString) {
    EXPECT_EQ(to_string(LinkState::HandshakePending), "handshake_pending");
    EXPECT_EQ(to_string(LinkState::Closed), "closed");
    EXPECT_EQ(to_string(LinkDirection::Inbound), "inbound");
}

TEST(TimestampTest, Iso8601Format) {
    Timestamp ts{std::chrono::milliseconds(1700000000123)};
    EXPECT_EQ(format_iso8601(ts), "2023-11-14T22:13:20.123Z");
}
