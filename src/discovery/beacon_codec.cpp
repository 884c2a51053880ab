/**
 * @file beacon_codec.cpp
 * @brief BeaconCodec implementation on nlohmann::json.
 * @author BeaconMesh contributors
 */

#include "discovery/beacon_codec.hpp"
#include "discovery/descriptor_json.hpp"

#include <nlohmann/json.hpp>

#include <chrono>

namespace beacon_mesh {

std::string BeaconCodec::encode(const BeaconMessage& beacon) {
    MachineDescriptor identity;
    identity.machine_id = beacon.machine_id;
    identity.hostname = beacon.hostname;
    identity.primary_ip = beacon.primary_ip;
    identity.cluster_name = beacon.cluster_name;
    identity.advertised_services = beacon.services;
    identity.websocket_port = beacon.websocket_port;
    identity.capabilities = beacon.capabilities;

    auto j = descriptor_to_json(identity);
    j["type"] = "beacon";
    j["protocol_version"] = beacon.protocol_version;
    j["timestamp"] = beacon.timestamp;
    j["sequence"] = beacon.sequence;
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Result<BeaconMessage> BeaconCodec::decode(std::string_view data) {
    auto j = nlohmann::json::parse(data.begin(), data.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return make_error<BeaconMessage>(ErrorKind::ProtocolViolation, "beacon is not a JSON object");
    }

    auto type = j.find("type");
    if (type == j.end() || !type->is_string() || type->get<std::string>() != "beacon") {
        return make_error<BeaconMessage>(ErrorKind::ProtocolViolation, "not a beacon");
    }

    auto descriptor = descriptor_from_json(j);
    if (!descriptor) {
        return descriptor.error();
    }

    BeaconMessage beacon;
    beacon.protocol_version = j["protocol_version"].get<int>();
    beacon.machine_id = std::move(descriptor->machine_id);
    beacon.hostname = std::move(descriptor->hostname);
    beacon.primary_ip = std::move(descriptor->primary_ip);
    beacon.cluster_name = std::move(descriptor->cluster_name);
    beacon.services = std::move(descriptor->advertised_services);
    beacon.websocket_port = descriptor->websocket_port;
    beacon.capabilities = descriptor->capabilities;

    if (auto it = j.find("timestamp"); it != j.end() && it->is_string()) {
        beacon.timestamp = it->get<std::string>();
    }
    if (auto it = j.find("sequence"); it != j.end() && it->is_number_unsigned()) {
        beacon.sequence = it->get<uint64_t>();
    }
    return beacon;
}

BeaconMessage make_beacon(const MachineDescriptor& local, uint64_t sequence) {
    BeaconMessage beacon;
    beacon.machine_id = local.machine_id;
    beacon.hostname = local.hostname;
    beacon.primary_ip = local.primary_ip;
    beacon.cluster_name = local.cluster_name;
    beacon.services = local.advertised_services;
    beacon.websocket_port = local.websocket_port;
    beacon.capabilities = local.capabilities;
    beacon.timestamp = format_iso8601(std::chrono::system_clock::now());
    beacon.sequence = sequence;
    return beacon;
}

MachineDescriptor to_descriptor(const BeaconMessage& beacon,
                                SteadyTime received_at,
                                std::string_view source_ip) {
    MachineDescriptor descriptor;
    descriptor.machine_id = beacon.machine_id;
    descriptor.hostname = beacon.hostname;
    descriptor.primary_ip = beacon.primary_ip.empty() ? std::string(source_ip) : beacon.primary_ip;
    descriptor.cluster_name = beacon.cluster_name;
    descriptor.advertised_services = beacon.services;
    descriptor.websocket_port = beacon.websocket_port;
    descriptor.capabilities = beacon.capabilities;
    descriptor.last_seen = received_at;
    descriptor.status = MachineStatus::Online;
    return descriptor;
}

}  // namespace beacon_mesh
