/**
 * @file port_service.hpp
 * @brief JSON request surface over the PortRegistry.
 * @author BeaconMesh contributors
 *
 * Requests are objects of the form {"op": "<name>", ...}:
 *   check_port       {port}
 *   claim_port       {port, service, pid?}
 *   release_port     {port}
 *   validate_service {service, port?}
 *   suggest_port     {service}
 *   get_port_status  {}
 *
 * Rejected claims are not errors; they come back as {"success": false, ...}
 * with a suggested port. Malformed requests answer {"error": ..., "kind": ...}.
 */

#pragma once

#include "ports/port_registry.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace beacon_mesh {

[[nodiscard]] nlohmann::json allocation_to_json(const PortAllocation& allocation);
[[nodiscard]] nlohmann::json status_to_json(const PortStatus& status);
[[nodiscard]] nlohmann::json decision_to_json(const PortDecision& decision);

/// Wire shape for a failed request.
[[nodiscard]] nlohmann::json error_to_json(const Error& error);

class PortService {
public:
    explicit PortService(PortRegistry& registry);

    /// True for every op name handle() understands.
    [[nodiscard]] static bool handles(std::string_view op);

    [[nodiscard]] nlohmann::json handle(const nlohmann::json& request);

private:
    nlohmann::json check_port(const nlohmann::json& request);
    nlohmann::json claim_port(const nlohmann::json& request);
    nlohmann::json release_port(const nlohmann::json& request);
    nlohmann::json validate_service(const nlohmann::json& request);
    nlohmann::json suggest_port(const nlohmann::json& request);

    PortRegistry& registry_;
};

}  // namespace beacon_mesh
