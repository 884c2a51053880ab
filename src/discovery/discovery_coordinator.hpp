/**
 * @file discovery_coordinator.hpp
 * @brief DiscoveryCoordinator: the one surface the rest of the process touches.
 * @author BeaconMesh contributors
 *
 * Wires beacons, the machine registry, the port registry and cluster links
 * into a running subsystem:
 *   1. Beacons from the listener refresh the registry and trigger dials
 *   2. Links handshake, heartbeat and feed liveness back into the registry
 *   3. Duplicate links to one peer are resolved by machine-id tie-break
 *   4. Non-intentional closes are redialed with exponential back-off
 */

#pragma once

#include "cluster/cluster_link.hpp"
#include "cluster/cluster_message.hpp"
#include "cluster/frame_transport.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "discovery/beacon_broadcaster.hpp"
#include "discovery/beacon_listener.hpp"
#include "discovery/machine_registry.hpp"
#include "ports/port_probe.hpp"
#include "ports/port_registry.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace beacon_mesh {

class EventJournal;

/**
 * @brief A registry entry joined with the state of its best link.
 */
struct PeerView {
    MachineDescriptor descriptor;
    std::optional<LinkState> link_state;
    std::optional<LinkDirection> link_direction;
};

class DiscoveryCoordinator {
public:
    using MessageHandler = std::function<void(const ClusterMessage&)>;

    /**
     * @param local  Identity to announce; websocket_port is taken from
     *               config.cluster.port.
     * @param probe  OS port probe; nullptr selects SystemPortProbe.
     */
    DiscoveryCoordinator(Config config,
                         MachineDescriptor local,
                         Logger& logger,
                         EventJournal* journal = nullptr,
                         std::shared_ptr<IPortProbe> probe = nullptr);
    ~DiscoveryCoordinator();

    // Non-copyable, non-movable
    DiscoveryCoordinator(const DiscoveryCoordinator&) = delete;
    DiscoveryCoordinator& operator=(const DiscoveryCoordinator&) = delete;

    // ── Lifecycle ────────────────────────────

    /**
     * @brief Claim the cluster port, then start the server, listener,
     *        broadcaster, sweep and link maintenance.
     * @return ConfigurationError or ResourceConflict; nothing keeps running
     *         after a failed start.
     */
    Result<void> start();

    /// Bounded by cluster.shutdown_deadline_ms.
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Discovery surface ────────────────────

    /**
     * @brief Broadcast now, listen for discovery.discover_window_ms.
     * @return Peers that became visible during the window.
     */
    std::vector<MachineDescriptor> discover_now();

    /// Remote registry entries, offline ones included.
    [[nodiscard]] std::vector<PeerView> list_peers() const;

    [[nodiscard]] std::optional<LinkState> link_state(const MachineId& peer) const;

    // ── Messaging ────────────────────────────

    /// NotFound when no connected link to the peer exists.
    Result<void> send_to(const MachineId& peer, ClusterMessage message);

    /// @return Number of peers the message was written to.
    size_t broadcast(const ClusterMessage& message);

    /// Receives status_update and task_coordination traffic.
    void on_message(MessageHandler handler);

    // ── Accessors ────────────────────────────
    PortRegistry& ports() { return ports_; }
    MachineRegistry& registry() { return registry_; }
    const MachineDescriptor& local() const { return local_; }
    const Config& config() const { return config_; }

private:
    struct Backoff {
        std::chrono::milliseconds delay;
        SteadyTime next_attempt;
    };

    void handle_beacon(const MachineDescriptor& peer, RegistryEvent event);
    void dial_locked(const MachineDescriptor& peer);
    void adopt_locked(std::shared_ptr<ClusterLink> link);
    ClusterLink::Callbacks link_callbacks();
    LinkOptions link_options() const;

    void on_link_state(ClusterLink& link, LinkState from, LinkState to);
    void on_link_message(ClusterLink& link, const ClusterMessage& message);
    void resolve_duplicates(const MachineId& peer);
    void schedule_reconnect(const MachineId& peer);

    void accept_loop(std::stop_token stop);
    void sweep_loop(std::stop_token stop);
    void maintenance_loop(std::stop_token stop);

    [[nodiscard]] bool has_live_link_locked(const MachineId& peer) const;
    [[nodiscard]] bool has_connected_link_locked(const MachineId& peer) const;
    [[nodiscard]] std::shared_ptr<ClusterLink> connected_link_locked(const MachineId& peer) const;

    void shutdown_components();

    Config config_;
    Logger& logger_;
    EventJournal* journal_;
    MachineDescriptor local_;

    MachineRegistry registry_;
    PortRegistry ports_;
    BeaconBroadcaster broadcaster_;
    BeaconListener listener_;
    FrameServer server_;

    mutable std::mutex links_mutex_;
    std::vector<std::shared_ptr<ClusterLink>> links_;
    std::unordered_map<MachineId, Backoff> backoff_;

    std::mutex handler_mutex_;
    MessageHandler message_handler_;

    std::atomic<bool> running_{false};
    bool cluster_port_claimed_ = false;

    std::jthread accept_thread_;
    std::jthread sweep_thread_;
    std::jthread maintenance_thread_;
};

}  // namespace beacon_mesh
