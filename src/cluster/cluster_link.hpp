/**
 * @file cluster_link.hpp
 * @brief One bidirectional command channel to one peer.
 * @author BeaconMesh contributors
 *
 * State machine:
 *   Disconnected → Connecting → HandshakePending → Established ⇄ Degraded
 *   any state → Closed
 *
 * Both ends send their registration as soon as the transport is up; a link
 * is Established only once the peer's registration has been received and
 * validated. Every link runs on its own std::jthread; callbacks are invoked
 * on that thread with no link lock held.
 */

#pragma once

#include "cluster/cluster_message.hpp"
#include "cluster/frame_transport.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace beacon_mesh {

enum class CloseReason : uint8_t {
    None,
    LocalShutdown,
    Duplicate,            ///< Lost the duplicate-connection tie-break
    TransportError,
    HandshakeTimeout,
    ProtocolViolation
};

[[nodiscard]] constexpr std::string_view to_string(CloseReason reason) noexcept {
    switch (reason) {
        case CloseReason::None:              return "none";
        case CloseReason::LocalShutdown:     return "local_shutdown";
        case CloseReason::Duplicate:         return "duplicate";
        case CloseReason::TransportError:    return "transport_error";
        case CloseReason::HandshakeTimeout:  return "handshake_timeout";
        case CloseReason::ProtocolViolation: return "protocol_violation";
    }
    return "unknown";
}

/// Intentional closes never trigger a reconnect.
[[nodiscard]] constexpr bool is_intentional(CloseReason reason) noexcept {
    return reason == CloseReason::LocalShutdown || reason == CloseReason::Duplicate;
}

struct LinkOptions {
    MachineId local_id;
    uint32_t heartbeat_interval_ms = 15000;
    uint32_t handshake_timeout_ms = 5000;
    uint32_t connect_timeout_ms = 3000;
    uint32_t max_message_size = FramedSocket::DEFAULT_MAX_FRAME;
};

class ClusterLink {
public:
    using DescriptorProvider = std::function<MachineDescriptor()>;
    using StateCallback = std::function<void(ClusterLink&, LinkState from, LinkState to)>;
    using MessageCallback = std::function<void(ClusterLink&, const ClusterMessage&)>;

    struct Callbacks {
        StateCallback on_state;
        MessageCallback on_message;
    };

    /// Outbound link; dials address:port on start().
    ClusterLink(LinkOptions options, MachineId expected_peer,
                std::string address, uint16_t port,
                DescriptorProvider local_descriptor, Callbacks callbacks, Logger& logger);

    /// Inbound link over an accepted socket.
    ClusterLink(LinkOptions options, std::unique_ptr<FramedSocket> socket,
                DescriptorProvider local_descriptor, Callbacks callbacks, Logger& logger);

    /// Requests stop and joins; never destroy a link from its own callback.
    ~ClusterLink();

    // Non-copyable
    ClusterLink(const ClusterLink&) = delete;
    ClusterLink& operator=(const ClusterLink&) = delete;

    void start();

    /**
     * @brief Close without waiting for the link thread. The first reason wins.
     */
    void close(CloseReason reason);

    /// NetworkTransient unless the link is Established or Degraded.
    Result<void> send(const ClusterMessage& message);

    [[nodiscard]] LinkState state() const;
    [[nodiscard]] CloseReason close_reason() const;
    [[nodiscard]] LinkDirection direction() const noexcept { return direction_; }
    [[nodiscard]] uint64_t serial() const noexcept { return serial_; }

    /// Expected id for outbound links; empty for inbound links until registration.
    [[nodiscard]] MachineId peer_id() const;

    /// Machine that dialed this connection.
    [[nodiscard]] MachineId initiator_id() const;

    [[nodiscard]] std::optional<MachineDescriptor> peer_descriptor() const;
    [[nodiscard]] const std::string& remote_address() const noexcept { return address_; }

private:
    void run(std::stop_token stop);
    bool handshake(std::stop_token& stop, const std::shared_ptr<FramedSocket>& socket);
    void serve(std::stop_token& stop, const std::shared_ptr<FramedSocket>& socket);
    Result<void> validate_registration(const ClusterMessage& message,
                                       MachineDescriptor& out) const;

    void transition(LinkState to);
    void finish(CloseReason reason, const std::string& detail);
    static CloseReason reason_for(const Error& error);

    const uint64_t serial_;
    const LinkOptions options_;
    const LinkDirection direction_;
    std::string address_;
    uint16_t port_{0};
    DescriptorProvider local_descriptor_;
    Callbacks callbacks_;
    Logger& logger_;

    mutable std::mutex mutex_;
    LinkState state_{LinkState::Disconnected};
    CloseReason close_reason_{CloseReason::None};
    MachineId peer_id_;
    std::optional<MachineDescriptor> peer_descriptor_;
    std::shared_ptr<FramedSocket> socket_;

    std::jthread thread_;
};

}  // namespace beacon_mesh
