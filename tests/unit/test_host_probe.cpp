/**
 * @file test_host_probe.cpp
 * @brief Unit tests for host identity and capability probing.
 * @author BeaconMesh contributors
 */

#include "host/host_probe.hpp"

#include <gtest/gtest.h>

#include <cctype>

using namespace beacon_mesh;

TEST(PrimaryIpTest, PrefersTenNetwork) {
    EXPECT_EQ(select_primary_ip({"127.0.0.1", "192.168.1.5", "10.0.0.7", "172.16.0.2"}),
              "10.0.0.7");
}

TEST(PrimaryIpTest, PrefersHomeNetworkOverDocker) {
    EXPECT_EQ(select_primary_ip({"172.17.0.1", "192.168.1.5"}), "192.168.1.5");
}

TEST(PrimaryIpTest, LowestSecondOctetAmongPrivate172) {
    EXPECT_EQ(select_primary_ip({"172.20.0.1", "172.17.0.1", "172.18.5.5"}), "172.17.0.1");
}

TEST(PrimaryIpTest, AnyExternalBeforeLoopback) {
    EXPECT_EQ(select_primary_ip({"127.0.0.1", "203.0.113.9"}), "203.0.113.9");
}

TEST(PrimaryIpTest, FallsBackToLoopback) {
    EXPECT_EQ(select_primary_ip({}), "127.0.0.1");
    EXPECT_EQ(select_primary_ip({"127.0.0.1"}), "127.0.0.1");
}

TEST(MachineIdTest, LowercaseHostnameWithHexSuffix) {
    auto id = generate_machine_id("Build-Box");
    ASSERT_EQ(id.size(), std::string("build-box-").size() + 8);
    EXPECT_EQ(id.rfind("build-box-", 0), 0u);
    for (char c : id.substr(10)) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)));
    }
}

TEST(MachineIdTest, FreshPerCall) {
    // 32 random bits; a collision here is a one in four billion event
    EXPECT_NE(generate_machine_id("alpha"), generate_machine_id("alpha"));
}

TEST(MeminfoTest, ParsesTotalAndAvailable) {
    auto caps = parse_meminfo(
        "MemTotal:        8000000 kB\n"
        "MemFree:         1000000 kB\n"
        "MemAvailable:    4000000 kB\n");
    EXPECT_EQ(caps.memory_total_bytes, 8000000ULL * 1024);
    EXPECT_EQ(caps.memory_available_bytes, 4000000ULL * 1024);
}

TEST(MeminfoTest, MissingLinesLeaveZero) {
    auto caps = parse_meminfo("SwapTotal: 0 kB\n");
    EXPECT_EQ(caps.memory_total_bytes, 0u);
    EXPECT_EQ(caps.memory_available_bytes, 0u);
}

TEST(DescribeLocalTest, ConfiguredIdentityWins) {
    NodeConfig node;
    node.machine_id = "m-aaa";
    node.hostname = "alpha";
    node.services = {{"analytics-dashboard", 8090}};

    auto local = describe_local_machine(node);
    EXPECT_EQ(local.machine_id, "m-aaa");
    EXPECT_EQ(local.hostname, "alpha");
    EXPECT_EQ(local.cluster_name, "mesh-alpha");
    EXPECT_FALSE(local.primary_ip.empty());
    ASSERT_EQ(local.advertised_services.size(), 1u);
    EXPECT_TRUE(local.capabilities.has_value());
}

TEST(DescribeLocalTest, GeneratesIdFromHostname) {
    NodeConfig node;
    node.hostname = "beta";
    auto local = describe_local_machine(node);
    EXPECT_EQ(local.machine_id.rfind("beta-", 0), 0u);
}
