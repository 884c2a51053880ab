/**
 * @file descriptor_json.cpp
 * @brief Descriptor <-> JSON mapping with field validation.
 * @author BeaconMesh contributors
 */

#include "discovery/descriptor_json.hpp"

#include <limits>
#include <string>

namespace beacon_mesh {

namespace {

Error violation(std::string message) {
    return Error{ErrorKind::ProtocolViolation, std::move(message)};
}

bool is_port(const nlohmann::json& j) {
    return j.is_number_integer() && j.get<int64_t>() > 0
        && j.get<int64_t>() <= std::numeric_limits<uint16_t>::max();
}

}  // anonymous namespace

nlohmann::json services_to_json(const std::vector<ServiceEndpoint>& services) {
    auto arr = nlohmann::json::array();
    for (const auto& svc : services) {
        arr.push_back({{"name", svc.name}, {"port", svc.port}});
    }
    return arr;
}

Result<std::vector<ServiceEndpoint>> services_from_json(const nlohmann::json& j) {
    if (!j.is_array()) {
        return violation("services must be an array");
    }

    std::vector<ServiceEndpoint> services;
    for (const auto& entry : j) {
        if (!entry.is_object()
            || !entry.contains("name") || !entry["name"].is_string()
            || !entry.contains("port") || !is_port(entry["port"])) {
            return violation("service entries need a string name and a valid port");
        }
        services.push_back(ServiceEndpoint{
            entry["name"].get<std::string>(),
            static_cast<uint16_t>(entry["port"].get<int64_t>())});
    }

    if (!has_unique_service_names(services)) {
        return violation("duplicate service name");
    }
    return services;
}

nlohmann::json capabilities_to_json(const Capabilities& caps) {
    return {
        {"cpu_cores", caps.cpu_cores},
        {"memory_total_bytes", caps.memory_total_bytes},
        {"memory_available_bytes", caps.memory_available_bytes},
        {"platform", caps.platform},
    };
}

Result<Capabilities> capabilities_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return violation("capabilities must be an object");
    }

    Capabilities caps;
    if (auto it = j.find("cpu_cores"); it != j.end() && it->is_number_unsigned()) {
        caps.cpu_cores = it->get<uint32_t>();
    }
    if (auto it = j.find("memory_total_bytes"); it != j.end() && it->is_number_unsigned()) {
        caps.memory_total_bytes = it->get<uint64_t>();
    }
    if (auto it = j.find("memory_available_bytes"); it != j.end() && it->is_number_unsigned()) {
        caps.memory_available_bytes = it->get<uint64_t>();
    }
    if (auto it = j.find("platform"); it != j.end() && it->is_string()) {
        caps.platform = it->get<std::string>();
    }
    return caps;
}

nlohmann::json descriptor_to_json(const MachineDescriptor& descriptor) {
    nlohmann::json j = {
        {"protocol_version", PROTOCOL_VERSION},
        {"machine_id", descriptor.machine_id},
        {"hostname", descriptor.hostname},
        {"primary_ip", descriptor.primary_ip},
        {"cluster_name", descriptor.cluster_name},
        {"services", services_to_json(descriptor.advertised_services)},
        {"websocket_port", descriptor.websocket_port},
    };
    if (descriptor.capabilities) {
        j["capabilities"] = capabilities_to_json(*descriptor.capabilities);
    }
    return j;
}

Result<MachineDescriptor> descriptor_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return violation("descriptor must be an object");
    }

    auto version = j.find("protocol_version");
    if (version == j.end() || !version->is_number_integer()) {
        return violation("missing protocol_version");
    }
    if (version->get<int64_t>() != PROTOCOL_VERSION) {
        return violation("unsupported protocol_version " + std::to_string(version->get<int64_t>()));
    }

    for (const char* field : {"machine_id", "hostname", "primary_ip"}) {
        if (!j.contains(field) || !j[field].is_string()) {
            return violation(std::string("missing or non-string field: ") + field);
        }
    }
    if (j["machine_id"].get<std::string>().empty()) {
        return violation("empty machine_id");
    }
    if (!j.contains("websocket_port") || !is_port(j["websocket_port"])) {
        return violation("missing or invalid websocket_port");
    }

    MachineDescriptor descriptor;
    descriptor.machine_id = j["machine_id"].get<std::string>();
    descriptor.hostname = j["hostname"].get<std::string>();
    descriptor.primary_ip = j["primary_ip"].get<std::string>();
    descriptor.websocket_port = static_cast<uint16_t>(j["websocket_port"].get<int64_t>());

    if (auto it = j.find("cluster_name"); it != j.end() && it->is_string()) {
        descriptor.cluster_name = it->get<std::string>();
    }

    if (j.contains("services")) {
        auto services = services_from_json(j["services"]);
        if (!services) return services.error();
        descriptor.advertised_services = std::move(services.value());
    }

    if (j.contains("capabilities")) {
        auto caps = capabilities_from_json(j["capabilities"]);
        if (!caps) return caps.error();
        descriptor.capabilities = caps.value();
    }

    return descriptor;
}

}  // namespace beacon_mesh
