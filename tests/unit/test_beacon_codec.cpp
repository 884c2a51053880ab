/**
 * @file test_beacon_codec.cpp
 * @brief Unit tests for the beacon wire format.
 * @author BeaconMesh contributors
 */

#include "discovery/beacon_codec.hpp"
#include "discovery/descriptor_json.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace beacon_mesh;

namespace {

MachineDescriptor sample_local() {
    MachineDescriptor d;
    d.machine_id = "m-aaa";
    d.hostname = "alpha";
    d.primary_ip = "10.0.0.1";
    d.cluster_name = "mesh-alpha";
    d.advertised_services = {{"analytics-dashboard", 8090}};
    d.websocket_port = 8080;
    d.capabilities = Capabilities{4, 8ULL << 30, 4ULL << 30, "Linux 6.1 x86_64"};
    return d;
}

}  // namespace

TEST(BeaconCodecTest, CarriesIdentityAndServices) {
    auto encoded = BeaconCodec::encode(make_beacon(sample_local(), 7));
    EXPECT_LT(encoded.size(), MAX_BEACON_SIZE);

    auto j = nlohmann::json::parse(encoded);
    EXPECT_EQ(j["type"], "beacon");
    EXPECT_EQ(j["protocol_version"], PROTOCOL_VERSION);
    EXPECT_EQ(j["sequence"], 7);

    auto decoded = BeaconCodec::decode(encoded);
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded->machine_id, "m-aaa");
    EXPECT_EQ(decoded->websocket_port, 8080);
    ASSERT_EQ(decoded->services.size(), 1u);
    EXPECT_EQ(decoded->services[0].port, 8090);
    ASSERT_TRUE(decoded->capabilities.has_value());
    EXPECT_EQ(decoded->capabilities->cpu_cores, 4u);
    EXPECT_FALSE(decoded->timestamp.empty());
}

TEST(BeaconCodecTest, CapabilitiesAreOptional) {
    auto local = sample_local();
    local.capabilities.reset();
    auto encoded = BeaconCodec::encode(make_beacon(local, 1));
    EXPECT_EQ(encoded.find("capabilities"), std::string::npos);

    auto decoded = BeaconCodec::decode(encoded);
    ASSERT_TRUE(decoded);
    EXPECT_FALSE(decoded->capabilities.has_value());
}

TEST(BeaconCodecTest, RejectsGarbage) {
    for (std::string_view bad : {"", "not json", "[1,2,3]", "{\"type\":\"beacon\"", "{}"}) {
        auto decoded = BeaconCodec::decode(bad);
        ASSERT_FALSE(decoded) << bad;
        EXPECT_EQ(decoded.error().kind, ErrorKind::ProtocolViolation);
    }
}

TEST(BeaconCodecTest, RejectsWrongTypeOrVersion) {
    auto j = nlohmann::json::parse(BeaconCodec::encode(make_beacon(sample_local(), 1)));

    auto wrong_type = j;
    wrong_type["type"] = "registration";
    EXPECT_FALSE(BeaconCodec::decode(wrong_type.dump()));

    auto wrong_version = j;
    wrong_version["protocol_version"] = PROTOCOL_VERSION + 1;
    auto decoded = BeaconCodec::decode(wrong_version.dump());
    ASSERT_FALSE(decoded);
    EXPECT_NE(decoded.error().message.find("protocol_version"), std::string::npos);
}

TEST(BeaconCodecTest, RejectsMissingOrInvalidFields) {
    auto j = nlohmann::json::parse(BeaconCodec::encode(make_beacon(sample_local(), 1)));

    auto no_id = j;
    no_id.erase("machine_id");
    EXPECT_FALSE(BeaconCodec::decode(no_id.dump()));

    auto empty_id = j;
    empty_id["machine_id"] = "";
    EXPECT_FALSE(BeaconCodec::decode(empty_id.dump()));

    auto bad_port = j;
    bad_port["websocket_port"] = 70000;
    EXPECT_FALSE(BeaconCodec::decode(bad_port.dump()));

    auto duplicate_services = j;
    duplicate_services["services"] = {{{"name", "a"}, {"port", 1}}, {{"name", "a"}, {"port", 2}}};
    EXPECT_FALSE(BeaconCodec::decode(duplicate_services.dump()));
}

TEST(BeaconCodecTest, DescriptorUsesSourceIpWhenUnset) {
    auto beacon = make_beacon(sample_local(), 1);
    beacon.primary_ip.clear();
    auto now = std::chrono::steady_clock::now();

    auto d = to_descriptor(beacon, now, "192.168.1.44");
    EXPECT_EQ(d.primary_ip, "192.168.1.44");
    EXPECT_EQ(d.last_seen, now);
    EXPECT_EQ(d.status, MachineStatus::Online);

    beacon.primary_ip = "10.0.0.1";
    EXPECT_EQ(to_descriptor(beacon, now, "192.168.1.44").primary_ip, "10.0.0.1");
}

TEST(DescriptorJsonTest, ServicesRoundTripPreservesOrder) {
    std::vector<ServiceEndpoint> services = {{"b", 2}, {"a", 1}};
    auto parsed = services_from_json(services_to_json(services));
    ASSERT_TRUE(parsed);
    EXPECT_EQ(*parsed, services);
}
