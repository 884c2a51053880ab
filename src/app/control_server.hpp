/**
 * @file control_server.hpp
 * @brief Loopback request/reply endpoint for local collaborators.
 * @author BeaconMesh contributors
 *
 * One JSON request frame per connection, one JSON reply frame back. Answers
 * list_peers and discover_now from the coordinator and forwards the port
 * operations to PortService.
 */

#pragma once

#include "cluster/frame_transport.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "discovery/discovery_coordinator.hpp"
#include "ports/port_service.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace beacon_mesh {

/// Service name the control port is claimed under.
inline constexpr std::string_view CONTROL_SERVICE = "beaconmesh-control";

[[nodiscard]] nlohmann::json peer_view_to_json(const PeerView& peer, SteadyTime now);

class ControlServer {
public:
    ControlServer(DiscoveryCoordinator& coordinator, Logger& logger);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    /**
     * @brief Claim `port` in the coordinator's PortRegistry, then bind
     *        127.0.0.1 only.
     * @return ResourceConflict when the claim is rejected. Port 0 picks an
     *         ephemeral port and is not claimed.
     */
    Result<void> start(uint16_t port);
    void stop();

    [[nodiscard]] uint16_t port() const noexcept { return server_.port(); }

    /// Decode one request, dispatch it and encode the reply.
    [[nodiscard]] std::string dispatch(std::string_view request);

private:
    nlohmann::json list_peers() const;
    nlohmann::json discover_now();
    void release_claim();

    DiscoveryCoordinator& coordinator_;
    PortService port_service_;
    Logger& logger_;
    FrameServer server_;
    uint16_t claimed_port_{0};
};

}  // namespace beacon_mesh
