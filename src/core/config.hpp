/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 * @author BeaconMesh contributors
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace beacon_mesh {

struct NodeConfig {
    std::string machine_id;                 ///< Empty = generated per process
    std::string hostname;                   ///< Empty = gethostname()
    std::string cluster_name;               ///< Empty = "mesh-<hostname>"
    std::vector<ServiceEndpoint> services;  ///< Advertised in beacons
};

struct DiscoveryConfig {
    uint16_t port = 8181;
    std::vector<std::string> targets = {"239.255.43.21", "255.255.255.255"};
    std::string multicast_group = "239.255.43.21";
    uint32_t beacon_interval_ms = 15000;
    uint32_t silence_window_ms = 60000;
    uint32_t sweep_interval_ms = 15000;
    uint32_t discover_window_ms = 3000;
};

struct ClusterConfig {
    uint16_t port = 8080;
    uint32_t heartbeat_interval_ms = 15000;
    uint32_t handshake_timeout_ms = 5000;
    uint32_t connect_timeout_ms = 3000;
    uint32_t reconnect_initial_ms = 1000;
    uint32_t reconnect_max_ms = 60000;
    uint32_t max_message_size_bytes = 1048576;
    uint32_t shutdown_deadline_ms = 2000;
};

struct PortRange {
    uint16_t start{0};
    uint16_t end{0};

    [[nodiscard]] constexpr bool contains(uint16_t port) const noexcept {
        return port >= start && port <= end;
    }
};

struct PortRangesConfig {
    PortRange web{8090, 8099};
    PortRange api{8001, 8089};
    PortRange tool{8100, 8199};
    PortRange generic{8200, 8999};
};

struct ReservedPort {
    uint16_t port{0};
    std::string service;
};

struct PortsConfig {
    uint16_t control_port = 8182;
    std::string cluster_service = "cluster-websocket";
    std::vector<ReservedPort> reserved = default_reserved_ports();
    PortRangesConfig ranges;

    static std::vector<ReservedPort> default_reserved_ports();
};

struct TelemetryConfig {
    std::filesystem::path log_dir;          ///< Empty = stdout
    std::string log_level = "info";
    std::filesystem::path event_log;        ///< Empty = events discarded
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    NodeConfig node;
    DiscoveryConfig discovery;
    ClusterConfig cluster;
    PortsConfig ports;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. The result is validated; any failure
 * is reported as ErrorKind::ConfigurationError.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Check intervals, timeouts, the reserved table and the ranges.
 */
Result<void> validate_config(const Config& config);

}  // namespace beacon_mesh
