/**
 * @file types.hpp
 * @brief Fundamental types used throughout BeaconMesh.
 * @author BeaconMesh contributors
 *
 * Defines MachineId, MachineDescriptor, ServiceEndpoint, link and machine
 * status enums, and other shared vocabulary types. All types are plain
 * values; ownership of live state sits in the registries.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace beacon_mesh {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using MachineId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;
using Millis = std::chrono::milliseconds;

/// Version of both the beacon payload and the cluster handshake.
inline constexpr int PROTOCOL_VERSION = 1;

// ─────────────────────────────────────────────
// Services and Capabilities
// ─────────────────────────────────────────────

struct ServiceEndpoint {
    std::string name;
    uint16_t port{0};

    bool operator==(const ServiceEndpoint&) const = default;
};

/**
 * @brief Optional resource hints a machine advertises about itself.
 *
 * Read once from /proc and uname at startup by the host probe.
 */
struct Capabilities {
    uint32_t cpu_cores{0};
    uint64_t memory_total_bytes{0};
    uint64_t memory_available_bytes{0};
    std::string platform;                 ///< "Linux 6.1.0 x86_64"

    bool operator==(const Capabilities&) const = default;
};

// ─────────────────────────────────────────────
// Machine Status
// ─────────────────────────────────────────────

enum class MachineStatus : uint8_t {
    Online,
    Degraded,      ///< Link heartbeat overdue, still reachable
    Offline        ///< Silent for at least the silence window
};

[[nodiscard]] constexpr std::string_view to_string(MachineStatus status) noexcept {
    switch (status) {
        case MachineStatus::Online:   return "online";
        case MachineStatus::Degraded: return "degraded";
        case MachineStatus::Offline:  return "offline";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Machine Descriptor
// ─────────────────────────────────────────────

/**
 * @brief Structured record of a machine's identity, address and services.
 *
 * `last_seen` uses the steady clock: liveness is a local measurement and
 * must not jump with wall-clock adjustments.
 */
struct MachineDescriptor {
    MachineId machine_id;
    std::string hostname;
    std::string primary_ip;
    std::string cluster_name;
    std::vector<ServiceEndpoint> advertised_services;
    uint16_t websocket_port{0};
    std::optional<Capabilities> capabilities;

    SteadyTime last_seen{};
    MachineStatus status{MachineStatus::Online};

    [[nodiscard]] const ServiceEndpoint* find_service(std::string_view name) const noexcept {
        for (const auto& svc : advertised_services) {
            if (svc.name == name) return &svc;
        }
        return nullptr;
    }

    [[nodiscard]] bool is_live() const noexcept {
        return status != MachineStatus::Offline;
    }
};

/**
 * @brief True when every service name in the list is distinct.
 */
[[nodiscard]] inline bool has_unique_service_names(const std::vector<ServiceEndpoint>& services) {
    for (size_t i = 0; i < services.size(); ++i) {
        for (size_t j = i + 1; j < services.size(); ++j) {
            if (services[i].name == services[j].name) return false;
        }
    }
    return true;
}

// ─────────────────────────────────────────────
// Cluster Link State
// ─────────────────────────────────────────────

enum class LinkState : uint8_t {
    Disconnected,
    Connecting,
    HandshakePending,
    Established,
    Degraded,      ///< Socket alive, heartbeat overdue
    Closed
};

[[nodiscard]] constexpr std::string_view to_string(LinkState state) noexcept {
    switch (state) {
        case LinkState::Disconnected:     return "disconnected";
        case LinkState::Connecting:       return "connecting";
        case LinkState::HandshakePending: return "handshake_pending";
        case LinkState::Established:      return "established";
        case LinkState::Degraded:         return "degraded";
        case LinkState::Closed:           return "closed";
    }
    return "unknown";
}

/// Connecting, HandshakePending, Established or Degraded.
[[nodiscard]] constexpr bool is_live(LinkState state) noexcept {
    return state == LinkState::Connecting
        || state == LinkState::HandshakePending
        || state == LinkState::Established
        || state == LinkState::Degraded;
}

/// A live socket with a completed handshake.
[[nodiscard]] constexpr bool is_connected(LinkState state) noexcept {
    return state == LinkState::Established || state == LinkState::Degraded;
}

enum class LinkDirection : uint8_t {
    Outbound,      ///< We dialed the peer
    Inbound        ///< The peer dialed us
};

[[nodiscard]] constexpr std::string_view to_string(LinkDirection dir) noexcept {
    return dir == LinkDirection::Outbound ? "outbound" : "inbound";
}

// ─────────────────────────────────────────────
// Time helpers
// ─────────────────────────────────────────────

/**
 * @brief ISO-8601 UTC rendering with millisecond precision.
 */
std::string format_iso8601(Timestamp ts);

}  // namespace beacon_mesh
