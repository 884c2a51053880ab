/**
 * @file test_telemetry.cpp
 * @brief Unit tests for log sinks, the logger and the event journal.
 * @author BeaconMesh contributors
 */

#include "core/logger.hpp"
#include "telemetry/event_journal.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using namespace beacon_mesh;

namespace {

std::vector<nlohmann::json> parse_lines(const MemorySink& sink) {
    std::vector<nlohmann::json> out;
    for (const auto& line : sink.lines()) {
        out.push_back(nlohmann::json::parse(line));
    }
    return out;
}

}  // namespace

TEST(LoggerTest, RecordLayout) {
    auto sink = std::make_unique<MemorySink>();
    auto* lines = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    logger.info("listener", "Beacon from \"m-bbb\"");

    auto records = parse_lines(*lines);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["level"], "info");
    EXPECT_EQ(records[0]["component"], "listener");
    EXPECT_EQ(records[0]["msg"], "Beacon from \"m-bbb\"");
    EXPECT_TRUE(records[0]["ts"].get<std::string>().ends_with("Z"));
}

TEST(LoggerTest, LevelFilter) {
    auto sink = std::make_unique<MemorySink>();
    auto* lines = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.debug("x", "dropped");
    logger.info("x", "dropped");
    logger.warn("x", "kept");
    logger.set_level(LogLevel::Debug);
    logger.debug("x", "kept too");

    EXPECT_EQ(lines->lines().size(), 2u);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
}

TEST(LoggerTest, InvalidUtf8IsReplaced) {
    auto sink = std::make_unique<MemorySink>();
    auto* lines = sink.get();
    Logger logger(std::move(sink));

    logger.info("listener", std::string("bad \xff byte"));
    ASSERT_EQ(lines->lines().size(), 1u);
    EXPECT_NO_THROW((void)nlohmann::json::parse(lines->lines()[0]));
}

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(parse_log_level("warn").value_or(LogLevel::Debug), LogLevel::Warn);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "bm_test_sink";
        std::filesystem::remove_all(dir_);
    }
    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
};

TEST_F(JsonFileSinkTest, WritesLines) {
    {
        JsonFileSink sink(dir_, "mesh");
        sink.write(R"({"a":1})");
        sink.write(R"({"a":2})");
        sink.flush();
    }

    std::ifstream in(dir_ / "mesh.ndjson");
    std::string line;
    int count = 0;
    while (std::getline(in, line)) ++count;
    EXPECT_EQ(count, 2);
}

TEST_F(JsonFileSinkTest, RotatesAtSizeLimit) {
    const std::string payload(1024, 'x');
    {
        JsonFileSink sink(dir_, "mesh", 1, 2);
        for (int i = 0; i < 2200; ++i) sink.write(payload);
        sink.flush();
    }

    EXPECT_TRUE(std::filesystem::exists(dir_ / "mesh.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "mesh.1.ndjson"));
    EXPECT_LE(std::filesystem::file_size(dir_ / "mesh.1.ndjson"), 1024u * 1024u + 2048u);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "mesh.3.ndjson"));
}

TEST(EventJournalTest, PeerAndLinkEvents) {
    auto sink = std::make_unique<MemorySink>();
    auto* lines = sink.get();
    EventJournal journal(std::move(sink));

    MachineDescriptor peer;
    peer.machine_id = "m-bbb";
    peer.hostname = "beta";
    peer.primary_ip = "10.0.0.2";
    peer.websocket_port = 8080;
    peer.advertised_services = {{"analytics-dashboard", 8090}};

    journal.record_peer_discovered(peer);
    journal.record_peer_collision("m-bbb", "beta", "beta-2");
    journal.record_link_transition("m-bbb", LinkDirection::Outbound,
                                   LinkState::Established, LinkState::Closed, "duplicate");
    journal.record_peer_offline("m-bbb");

    auto records = parse_lines(*lines);
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(journal.events_recorded(), 4u);

    EXPECT_EQ(records[0]["event"], "peer_discovered");
    EXPECT_EQ(records[0]["services"][0]["port"], 8090);
    EXPECT_EQ(records[1]["previous_hostname"], "beta");
    EXPECT_EQ(records[2]["to"], "closed");
    EXPECT_EQ(records[2]["reason"], "duplicate");
    EXPECT_EQ(records[3]["event"], "peer_offline");
}

TEST(EventJournalTest, TransitionWithoutReasonOmitsField) {
    auto sink = std::make_unique<MemorySink>();
    auto* lines = sink.get();
    EventJournal journal(std::move(sink));

    journal.record_link_transition("m-bbb", LinkDirection::Inbound,
                                   LinkState::HandshakePending, LinkState::Established, "");
    auto records = parse_lines(*lines);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_FALSE(records[0].contains("reason"));
}
