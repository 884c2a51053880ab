/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author BeaconMesh contributors
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <limits>
#include <set>

namespace beacon_mesh {

namespace {

Error config_error(std::string message) {
    return Error{ErrorKind::ConfigurationError, std::move(message)};
}

/// Reads `key = [start, end]` into a range; absent keys keep the default.
Result<void> read_range(const toml::node_view<toml::node>& ranges,
                        std::string_view key, PortRange& out) {
    auto node = ranges[key];
    if (!node) return Result<void>{};

    auto* arr = node.as_array();
    if (arr == nullptr || arr->size() != 2) {
        return config_error("ports.ranges." + std::string{key}
                            + " must be a two-element array [start, end]");
    }
    auto start = (*arr)[0].value<int64_t>();
    auto end = (*arr)[1].value<int64_t>();
    if (!start || !end || *start <= 0 || *end > 65535) {
        return config_error("ports.ranges." + std::string{key} + " holds invalid port numbers");
    }
    out.start = static_cast<uint16_t>(*start);
    out.end = static_cast<uint16_t>(*end);
    return Result<void>{};
}

uint16_t read_port(const toml::node_view<toml::node>& node, uint16_t fallback) {
    auto value = node.value_or(int64_t{fallback});
    if (value < 0 || value > 65535) return 0;  // rejected by validate_config
    return static_cast<uint16_t>(value);
}

/// Reads `section.key` into `out`; absent keys keep the current value.
Result<void> read_u32(const toml::node_view<toml::node>& section,
                      std::string_view section_name, std::string_view key, uint32_t& out) {
    auto node = section[key];
    if (!node) return Result<void>{};

    auto value = node.value<int64_t>();
    if (!value || *value < 0 || *value > int64_t{std::numeric_limits<uint32_t>::max()}) {
        return config_error(std::string{section_name} + "." + std::string{key}
                            + " must be an integer in 0.." + std::to_string(std::numeric_limits<uint32_t>::max()));
    }
    out = static_cast<uint32_t>(*value);
    return Result<void>{};
}

}  // anonymous namespace

std::vector<ReservedPort> PortsConfig::default_reserved_ports() {
    return {
        {5432, "postgresql"},
        {6379, "redis"},
        {8086, "influxdb"},
        {9090, "prometheus"},
        {3000, "grafana"},
        {8080, "cluster-websocket"},
        {8000, "api-gateway"},
    };
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return config_error("Configuration file not found: " + path.string());
    }

    Config config;

    try {
        auto tbl = toml::parse_file(path.string());

        // [node]
        if (auto node = tbl["node"]; node.is_table()) {
            config.node.machine_id = node["machine_id"].value_or(std::string{});
            config.node.hostname = node["hostname"].value_or(std::string{});
            config.node.cluster_name = node["cluster_name"].value_or(std::string{});

            if (auto* services = node["services"].as_array()) {
                for (auto& entry : *services) {
                    auto* svc = entry.as_table();
                    if (svc == nullptr) {
                        return config_error("node.services entries must be tables");
                    }
                    ServiceEndpoint endpoint;
                    endpoint.name = (*svc)["name"].value_or(std::string{});
                    endpoint.port = read_port((*svc)["port"], 0);
                    config.node.services.push_back(std::move(endpoint));
                }
            }
        }

        // [discovery]
        if (auto discovery = tbl["discovery"]; discovery.is_table()) {
            config.discovery.port = read_port(discovery["port"], 8181);
            if (auto* targets = discovery["targets"].as_array()) {
                config.discovery.targets.clear();
                for (auto& target : *targets) {
                    if (auto value = target.value<std::string>()) {
                        config.discovery.targets.push_back(*value);
                    }
                }
            }
            config.discovery.multicast_group =
                discovery["multicast_group"].value_or(std::string{"239.255.43.21"});
            auto& d = config.discovery;
            for (auto [key, target] : {std::pair{"beacon_interval_ms", &d.beacon_interval_ms},
                                       std::pair{"silence_window_ms", &d.silence_window_ms},
                                       std::pair{"discover_window_ms", &d.discover_window_ms}}) {
                auto result = read_u32(discovery, "discovery", key, *target);
                if (!result) return result.error();
            }
            // Sweep follows the beacon interval unless set explicitly
            d.sweep_interval_ms = d.beacon_interval_ms;
            auto sweep = read_u32(discovery, "discovery", "sweep_interval_ms", d.sweep_interval_ms);
            if (!sweep) return sweep.error();
        }

        // [cluster]
        if (auto cluster = tbl["cluster"]; cluster.is_table()) {
            config.cluster.port = read_port(cluster["port"], 8080);
            auto& c = config.cluster;
            for (auto [key, target] : {std::pair{"heartbeat_interval_ms", &c.heartbeat_interval_ms},
                                       std::pair{"handshake_timeout_ms", &c.handshake_timeout_ms},
                                       std::pair{"connect_timeout_ms", &c.connect_timeout_ms},
                                       std::pair{"reconnect_initial_ms", &c.reconnect_initial_ms},
                                       std::pair{"reconnect_max_ms", &c.reconnect_max_ms},
                                       std::pair{"max_message_size_bytes", &c.max_message_size_bytes},
                                       std::pair{"shutdown_deadline_ms", &c.shutdown_deadline_ms}}) {
                auto result = read_u32(cluster, "cluster", key, *target);
                if (!result) return result.error();
            }
        }

        // [ports]
        if (auto ports = tbl["ports"]; ports.is_table()) {
            config.ports.control_port = read_port(ports["control_port"], 8182);
            config.ports.cluster_service =
                ports["cluster_service"].value_or(std::string{"cluster-websocket"});

            if (auto* reserved = ports["reserved"].as_array()) {
                config.ports.reserved.clear();
                for (auto& entry : *reserved) {
                    auto* row = entry.as_table();
                    if (row == nullptr) {
                        return config_error("ports.reserved entries must be tables");
                    }
                    config.ports.reserved.push_back(ReservedPort{
                        .port = read_port((*row)["port"], 0),
                        .service = (*row)["service"].value_or(std::string{})
                    });
                }
            }

            // [ports.ranges]
            if (auto ranges = ports["ranges"]; ranges.is_table()) {
                for (auto [key, target] : {std::pair{"web", &config.ports.ranges.web},
                                           std::pair{"api", &config.ports.ranges.api},
                                           std::pair{"tool", &config.ports.ranges.tool},
                                           std::pair{"generic", &config.ports.ranges.generic}}) {
                    auto result = read_range(ranges, key, *target);
                    if (!result) return result.error();
                }
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.event_log = telemetry["event_log"].value_or(std::string{});
            for (auto [key, target] : {std::pair{"max_file_size_mb", &config.telemetry.max_file_size_mb},
                                       std::pair{"rotate_count", &config.telemetry.rotate_count}}) {
                auto result = read_u32(telemetry, "telemetry", key, *target);
                if (!result) return result.error();
            }
        }

    } catch (const toml::parse_error& err) {
        return config_error(std::string{"TOML parse error: "} + std::string{err.description()});
    }

    auto valid = validate_config(config);
    if (!valid) return valid.error();
    return config;
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    const auto& d = config.discovery;
    const auto& c = config.cluster;

    if (d.port == 0) return config_error("discovery.port must be in 1..65535");
    if (c.port == 0) return config_error("cluster.port must be in 1..65535");
    if (config.ports.control_port == 0) return config_error("ports.control_port must be in 1..65535");
    if (d.targets.empty()) return config_error("discovery.targets must not be empty");

    if (d.beacon_interval_ms == 0 || d.sweep_interval_ms == 0 || d.discover_window_ms == 0) {
        return config_error("discovery intervals must be positive");
    }
    if (d.silence_window_ms <= d.beacon_interval_ms) {
        return config_error("discovery.silence_window_ms must exceed beacon_interval_ms");
    }
    if (c.heartbeat_interval_ms == 0 || c.handshake_timeout_ms == 0
        || c.connect_timeout_ms == 0 || c.shutdown_deadline_ms == 0) {
        return config_error("cluster intervals and timeouts must be positive");
    }
    if (c.reconnect_initial_ms == 0 || c.reconnect_initial_ms > c.reconnect_max_ms) {
        return config_error("cluster.reconnect_initial_ms must be in 1..reconnect_max_ms");
    }
    if (c.max_message_size_bytes < 1024) {
        return config_error("cluster.max_message_size_bytes must be at least 1024");
    }

    std::set<std::string> service_names;
    for (const auto& svc : config.node.services) {
        if (svc.name.empty() || svc.port == 0) {
            return config_error("node.services entries need a name and a port");
        }
        if (!service_names.insert(svc.name).second) {
            return config_error("node.services has duplicate name: " + svc.name);
        }
    }

    std::set<uint16_t> reserved_ports;
    for (const auto& row : config.ports.reserved) {
        if (row.port == 0) {
            return config_error("ports.reserved entry has an invalid port");
        }
        if (row.service.empty()) {
            return config_error("ports.reserved entry for port "
                                + std::to_string(row.port) + " has no service name");
        }
        if (!reserved_ports.insert(row.port).second) {
            return config_error("ports.reserved lists port "
                                + std::to_string(row.port) + " twice");
        }
    }

    const auto& r = config.ports.ranges;
    for (const auto* range : {&r.web, &r.api, &r.tool, &r.generic}) {
        if (range->start == 0 || range->start > range->end) {
            return config_error("ports.ranges entries must satisfy 0 < start <= end");
        }
    }

    const auto& level = config.telemetry.log_level;
    if (level != "debug" && level != "info" && level != "warn" && level != "error") {
        return config_error("telemetry.log_level must be debug, info, warn or error");
    }

    return Result<void>{};
}

}  // namespace beacon_mesh
