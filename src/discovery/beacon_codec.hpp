/**
 * @file beacon_codec.hpp
 * @brief Beacon wire format: one JSON object per UDP datagram.
 * @author BeaconMesh contributors
 *
 * {"type":"beacon","protocol_version":1,"machine_id":..,"hostname":..,
 *  "primary_ip":..,"cluster_name":..,"services":[{"name":..,"port":..}],
 *  "websocket_port":..,"timestamp":"2026-01-01T00:00:00.000Z","sequence":..}
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace beacon_mesh {

/// Largest datagram the listener reads; larger beacons are truncated and dropped.
inline constexpr size_t MAX_BEACON_SIZE = 8192;

struct BeaconMessage {
    int protocol_version = PROTOCOL_VERSION;
    MachineId machine_id;
    std::string hostname;
    std::string primary_ip;
    std::string cluster_name;
    std::vector<ServiceEndpoint> services;
    uint16_t websocket_port{0};
    std::optional<Capabilities> capabilities;
    std::string timestamp;
    uint64_t sequence{0};
};

struct BeaconCodec {
    static std::string encode(const BeaconMessage& beacon);

    /// ProtocolViolation for malformed JSON, missing fields or a version mismatch.
    static Result<BeaconMessage> decode(std::string_view data);
};

static_assert(WireCodecLike<BeaconCodec, BeaconMessage>);

[[nodiscard]] BeaconMessage make_beacon(const MachineDescriptor& local, uint64_t sequence);

/**
 * @brief Registry entry for a received beacon.
 *
 * An empty primary_ip falls back to the datagram's source address.
 */
[[nodiscard]] MachineDescriptor to_descriptor(const BeaconMessage& beacon,
                                              SteadyTime received_at,
                                              std::string_view source_ip = {});

}  // namespace beacon_mesh
