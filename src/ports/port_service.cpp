/**
 * @file port_service.cpp
 * @brief PortService request dispatch.
 * @author BeaconMesh contributors
 */

#include "ports/port_service.hpp"

#include <array>

namespace beacon_mesh {

namespace {

constexpr std::array<std::string_view, 6> PORT_OPS = {
    "check_port", "claim_port", "release_port",
    "validate_service", "suggest_port", "get_port_status",
};

Result<uint16_t> port_field(const nlohmann::json& request) {
    auto it = request.find("port");
    if (it == request.end() || !it->is_number_integer()) {
        return Error{ErrorKind::ProtocolViolation, "Request needs an integer 'port'"};
    }
    auto value = it->get<int64_t>();
    if (value < 1 || value > 65535) {
        return Error{ErrorKind::ProtocolViolation,
                     "Port " + std::to_string(value) + " is outside 1-65535"};
    }
    return static_cast<uint16_t>(value);
}

Result<std::string> service_field(const nlohmann::json& request) {
    auto it = request.find("service");
    if (it == request.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        return Error{ErrorKind::ProtocolViolation, "Request needs a non-empty 'service'"};
    }
    return it->get<std::string>();
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Serialization
// ─────────────────────────────────────────────

nlohmann::json allocation_to_json(const PortAllocation& allocation) {
    nlohmann::json j = {
        {"port", allocation.port},
        {"service", allocation.service},
        {"status", std::string{to_string(allocation.status)}},
    };
    if (allocation.pid) j["pid"] = *allocation.pid;
    if (allocation.status == AllocationStatus::Active) {
        j["start_time"] = format_iso8601(allocation.start_time);
    }
    return j;
}

nlohmann::json status_to_json(const PortStatus& status) {
    nlohmann::json j;
    j["reserved"] = nlohmann::json::array();
    for (const auto& a : status.reserved) j["reserved"].push_back(allocation_to_json(a));
    j["active"] = nlohmann::json::array();
    for (const auto& a : status.active) j["active"].push_back(allocation_to_json(a));
    j["ranges"] = nlohmann::json::object();
    for (const auto& r : status.ranges) {
        j["ranges"][std::string{to_string(r.category)}] = {r.range.start, r.range.end};
    }
    return j;
}

nlohmann::json decision_to_json(const PortDecision& decision) {
    nlohmann::json j = {
        {"success", decision.success},
        {"port", decision.port},
        {"message", decision.message},
    };
    if (decision.suggested_port) j["suggested_port"] = *decision.suggested_port;
    return j;
}

nlohmann::json error_to_json(const Error& error) {
    return {{"error", error.message}, {"kind", std::string{to_string(error.kind)}}};
}

// ─────────────────────────────────────────────
// PortService
// ─────────────────────────────────────────────

PortService::PortService(PortRegistry& registry) : registry_(registry) {}

bool PortService::handles(std::string_view op) {
    for (auto known : PORT_OPS) {
        if (known == op) return true;
    }
    return false;
}

nlohmann::json PortService::handle(const nlohmann::json& request) {
    if (!request.is_object() || !request.contains("op") || !request["op"].is_string()) {
        return error_to_json({ErrorKind::ProtocolViolation, "Request needs a string 'op'"});
    }
    const auto& op = request["op"].get_ref<const std::string&>();

    if (op == "check_port")       return check_port(request);
    if (op == "claim_port")       return claim_port(request);
    if (op == "release_port")     return release_port(request);
    if (op == "validate_service") return validate_service(request);
    if (op == "suggest_port")     return suggest_port(request);
    if (op == "get_port_status")  return status_to_json(registry_.status());

    return error_to_json({ErrorKind::NotFound, "Unknown op '" + op + "'"});
}

nlohmann::json PortService::check_port(const nlohmann::json& request) {
    auto port = port_field(request);
    if (!port) return error_to_json(port.error());

    nlohmann::json j = {{"port", *port}, {"available", registry_.check(*port)}};
    if (auto allocation = registry_.lookup(*port)) {
        j["allocation"] = allocation_to_json(*allocation);
    }
    return j;
}

nlohmann::json PortService::claim_port(const nlohmann::json& request) {
    auto port = port_field(request);
    if (!port) return error_to_json(port.error());
    auto service = service_field(request);
    if (!service) return error_to_json(service.error());

    std::optional<int> pid;
    if (auto it = request.find("pid"); it != request.end() && it->is_number_integer()) {
        pid = it->get<int>();
    }
    return decision_to_json(registry_.claim(*port, *service, pid));
}

nlohmann::json PortService::release_port(const nlohmann::json& request) {
    auto port = port_field(request);
    if (!port) return error_to_json(port.error());
    return decision_to_json(registry_.release(*port));
}

nlohmann::json PortService::validate_service(const nlohmann::json& request) {
    auto service = service_field(request);
    if (!service) return error_to_json(service.error());

    std::optional<uint16_t> requested;
    if (request.contains("port") && !request["port"].is_null()) {
        auto port = port_field(request);
        if (!port) return error_to_json(port.error());
        requested = *port;
    }

    auto validation = registry_.validate_service(*service, requested);
    return {
        {"valid", validation.valid},
        {"port", validation.port},
        {"message", validation.message},
    };
}

nlohmann::json PortService::suggest_port(const nlohmann::json& request) {
    auto service = service_field(request);
    if (!service) return error_to_json(service.error());

    auto suggestion = registry_.suggest_alternative(*service);
    if (!suggestion) return error_to_json(suggestion.error());
    return {
        {"service", *service},
        {"category", std::string{to_string(categorize_service(*service))}},
        {"port", *suggestion},
    };
}

}  // namespace beacon_mesh
