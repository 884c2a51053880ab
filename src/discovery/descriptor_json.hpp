/**
 * @file descriptor_json.hpp
 * @brief JSON mapping of machine descriptors, shared by beacons and registration.
 * @author BeaconMesh contributors
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace beacon_mesh {

[[nodiscard]] nlohmann::json services_to_json(const std::vector<ServiceEndpoint>& services);

/**
 * @brief Parse `[{name, port}, ...]`.
 * @return ProtocolViolation for a malformed entry or a duplicate name.
 */
[[nodiscard]] Result<std::vector<ServiceEndpoint>> services_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json capabilities_to_json(const Capabilities& caps);
[[nodiscard]] Result<Capabilities> capabilities_from_json(const nlohmann::json& j);

/**
 * @brief Identity fields of a descriptor plus `protocol_version`.
 *
 * Liveness (`last_seen`, `status`) is local knowledge and never serialized.
 */
[[nodiscard]] nlohmann::json descriptor_to_json(const MachineDescriptor& descriptor);

/**
 * @brief Inverse of descriptor_to_json(); checks required fields and the
 *        protocol version.
 */
[[nodiscard]] Result<MachineDescriptor> descriptor_from_json(const nlohmann::json& j);

}  // namespace beacon_mesh
