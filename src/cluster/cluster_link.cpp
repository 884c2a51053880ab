/**
 * @file cluster_link.cpp
 * @brief ClusterLink state machine, handshake and heartbeat loop.
 * @author BeaconMesh contributors
 */

#include "cluster/cluster_link.hpp"
#include "discovery/descriptor_json.hpp"

#include <algorithm>
#include <chrono>

namespace beacon_mesh {

namespace {

constexpr std::string_view COMPONENT = "link";
constexpr uint32_t POLL_SLICE_MS = 100;

std::atomic<uint64_t> next_serial{1};

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

ClusterLink::ClusterLink(LinkOptions options, MachineId expected_peer,
                         std::string address, uint16_t port,
                         DescriptorProvider local_descriptor, Callbacks callbacks, Logger& logger)
    : serial_(next_serial.fetch_add(1))
    , options_(std::move(options))
    , direction_(LinkDirection::Outbound)
    , address_(std::move(address))
    , port_(port)
    , local_descriptor_(std::move(local_descriptor))
    , callbacks_(std::move(callbacks))
    , logger_(logger)
    , peer_id_(std::move(expected_peer)) {}

ClusterLink::ClusterLink(LinkOptions options, std::unique_ptr<FramedSocket> socket,
                         DescriptorProvider local_descriptor, Callbacks callbacks, Logger& logger)
    : serial_(next_serial.fetch_add(1))
    , options_(std::move(options))
    , direction_(LinkDirection::Inbound)
    , address_(socket ? socket->peer_address() : std::string{})
    , local_descriptor_(std::move(local_descriptor))
    , callbacks_(std::move(callbacks))
    , logger_(logger)
    , socket_(std::move(socket)) {}

ClusterLink::~ClusterLink() {
    close(CloseReason::LocalShutdown);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ClusterLink::start() {
    if (thread_.joinable()) return;
    thread_ = std::jthread([this](std::stop_token stop) {
        run(stop);
    });
}

void ClusterLink::close(CloseReason reason) {
    std::shared_ptr<FramedSocket> socket;
    bool never_started = false;
    {
        std::lock_guard lock(mutex_);
        if (close_reason_ == CloseReason::None) {
            close_reason_ = reason;
        }
        socket = socket_;
        never_started = !thread_.joinable() && state_ != LinkState::Closed;
        if (never_started) state_ = LinkState::Closed;
    }
    if (thread_.joinable()) {
        thread_.request_stop();
    }
    if (socket) {
        socket->shutdown();
    }
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

LinkState ClusterLink::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

CloseReason ClusterLink::close_reason() const {
    std::lock_guard lock(mutex_);
    return close_reason_;
}

MachineId ClusterLink::peer_id() const {
    std::lock_guard lock(mutex_);
    return peer_id_;
}

MachineId ClusterLink::initiator_id() const {
    if (direction_ == LinkDirection::Outbound) {
        return options_.local_id;
    }
    std::lock_guard lock(mutex_);
    return peer_id_;
}

std::optional<MachineDescriptor> ClusterLink::peer_descriptor() const {
    std::lock_guard lock(mutex_);
    return peer_descriptor_;
}

Result<void> ClusterLink::send(const ClusterMessage& message) {
    std::shared_ptr<FramedSocket> socket;
    {
        std::lock_guard lock(mutex_);
        if (!is_connected(state_)) {
            return Error{ErrorKind::NetworkTransient,
                         "Link to " + peer_id_ + " is " + std::string(to_string(state_))};
        }
        socket = socket_;
    }
    return socket->send_frame(ClusterMessageCodec::encode(message));
}

// ─────────────────────────────────────────────
// Link thread
// ─────────────────────────────────────────────

void ClusterLink::run(std::stop_token stop) {
    transition(LinkState::Connecting);

    std::shared_ptr<FramedSocket> socket;
    if (direction_ == LinkDirection::Outbound) {
        auto conn = FramedSocket::connect(address_, port_, options_.connect_timeout_ms,
                                          options_.max_message_size, stop);
        if (!conn) {
            finish(stop.stop_requested() ? CloseReason::LocalShutdown : CloseReason::TransportError,
                   conn.error().message);
            return;
        }
        socket = std::move(conn.value());
        std::lock_guard lock(mutex_);
        socket_ = socket;
    } else {
        std::lock_guard lock(mutex_);
        socket = socket_;
    }

    if (!socket || stop.stop_requested()) {
        finish(CloseReason::LocalShutdown, {});
        return;
    }

    transition(LinkState::HandshakePending);

    auto sent = socket->send_frame(ClusterMessageCodec::encode(make_registration(local_descriptor_())));
    if (!sent) {
        finish(reason_for(sent.error()), sent.error().message);
        return;
    }

    if (!handshake(stop, socket)) return;
    serve(stop, socket);
}

bool ClusterLink::handshake(std::stop_token& stop, const std::shared_ptr<FramedSocket>& socket) {
    auto deadline = std::chrono::steady_clock::now()
                  + std::chrono::milliseconds(options_.handshake_timeout_ms);

    while (!stop.stop_requested()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            finish(CloseReason::HandshakeTimeout,
                   "no registration within " + std::to_string(options_.handshake_timeout_ms) + " ms");
            return false;
        }

        auto frame = socket->receive_frame(POLL_SLICE_MS);
        if (!frame) {
            finish(reason_for(frame.error()), frame.error().message);
            return false;
        }
        if (!frame.value()) continue;

        auto message = ClusterMessageCodec::decode(*frame.value());
        if (!message) {
            logger_.warn(COMPONENT, "Dropped malformed frame from " + address_ + ": "
                                    + message.error().message);
            continue;
        }
        if (message->type != MessageType::Registration) {
            logger_.debug(COMPONENT, "Ignoring " + std::string(to_string(message->type))
                                     + " before registration from " + address_);
            continue;
        }

        MachineDescriptor peer;
        auto valid = validate_registration(message.value(), peer);
        if (!valid) {
            finish(CloseReason::ProtocolViolation, valid.error().message);
            return false;
        }

        {
            std::lock_guard lock(mutex_);
            peer_id_ = peer.machine_id;
            peer_descriptor_ = std::move(peer);
        }
        transition(LinkState::Established);
        return true;
    }

    finish(CloseReason::LocalShutdown, {});
    return false;
}

void ClusterLink::serve(std::stop_token& stop, const std::shared_ptr<FramedSocket>& socket) {
    const auto heartbeat_interval = std::chrono::milliseconds(options_.heartbeat_interval_ms);
    const auto degrade_after = heartbeat_interval * 2;
    auto last_received = std::chrono::steady_clock::now();
    auto last_heartbeat = last_received;

    while (!stop.stop_requested()) {
        auto now = std::chrono::steady_clock::now();

        if (now - last_heartbeat >= heartbeat_interval) {
            auto sent = socket->send_frame(ClusterMessageCodec::encode(make_heartbeat(options_.local_id)));
            if (!sent) {
                finish(reason_for(sent.error()), sent.error().message);
                return;
            }
            last_heartbeat = now;
        }

        if (state() == LinkState::Established && now - last_received >= degrade_after) {
            logger_.warn(COMPONENT, "No traffic from " + peer_id() + " for "
                                    + std::to_string(options_.heartbeat_interval_ms * 2) + " ms");
            transition(LinkState::Degraded);
        }

        auto frame = socket->receive_frame(POLL_SLICE_MS);
        if (!frame) {
            finish(stop.stop_requested() ? CloseReason::LocalShutdown : reason_for(frame.error()),
                   frame.error().message);
            return;
        }
        if (!frame.value()) continue;

        auto message = ClusterMessageCodec::decode(*frame.value());
        if (!message) {
            logger_.warn(COMPONENT, "Dropped malformed frame from " + peer_id() + ": "
                                    + message.error().message);
            continue;
        }

        last_received = std::chrono::steady_clock::now();
        if (state() == LinkState::Degraded) {
            transition(LinkState::Established);
        }

        if (message->type == MessageType::Registration) {
            MachineDescriptor peer;
            if (validate_registration(message.value(), peer)) {
                std::lock_guard lock(mutex_);
                peer_descriptor_ = std::move(peer);
            } else {
                logger_.warn(COMPONENT, "Ignored invalid re-registration from " + peer_id());
            }
        }

        if (callbacks_.on_message) {
            callbacks_.on_message(*this, message.value());
        }
    }

    finish(CloseReason::LocalShutdown, {});
}

Result<void> ClusterLink::validate_registration(const ClusterMessage& message,
                                                MachineDescriptor& out) const {
    auto descriptor = descriptor_from_json(message.payload);
    if (!descriptor) {
        return descriptor.error();
    }
    if (descriptor->machine_id != message.source_machine_id) {
        return Error{ErrorKind::ProtocolViolation,
                     "registration source " + message.source_machine_id
                     + " does not match descriptor " + descriptor->machine_id};
    }
    if (descriptor->machine_id == options_.local_id) {
        return Error{ErrorKind::ProtocolViolation, "registration carries the local machine id"};
    }

    auto expected = peer_id();
    if (!expected.empty() && descriptor->machine_id != expected) {
        return Error{ErrorKind::ProtocolViolation,
                     "expected " + expected + " but peer registered as " + descriptor->machine_id};
    }

    out = std::move(descriptor.value());
    if (out.primary_ip.empty() && direction_ == LinkDirection::Outbound) {
        out.primary_ip = address_;
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// State transitions
// ─────────────────────────────────────────────

void ClusterLink::transition(LinkState to) {
    LinkState from;
    {
        std::lock_guard lock(mutex_);
        from = state_;
        if (from == to || from == LinkState::Closed) return;
        state_ = to;
    }

    logger_.info(COMPONENT, std::string(to_string(direction_)) + " link #" + std::to_string(serial_)
                            + " " + (peer_id().empty() ? address_ : peer_id()) + ": "
                            + std::string(to_string(from)) + " -> " + std::string(to_string(to)));

    if (callbacks_.on_state) {
        callbacks_.on_state(*this, from, to);
    }
}

void ClusterLink::finish(CloseReason reason, const std::string& detail) {
    std::shared_ptr<FramedSocket> socket;
    {
        std::lock_guard lock(mutex_);
        if (close_reason_ == CloseReason::None) {
            close_reason_ = reason;
        }
        reason = close_reason_;
        socket = socket_;
    }
    if (socket) {
        socket->shutdown();
    }

    if (!detail.empty()) {
        auto level = is_intentional(reason) ? LogLevel::Debug : LogLevel::Warn;
        logger_.log(level, COMPONENT, "Link #" + std::to_string(serial_) + " closing ("
                                      + std::string(to_string(reason)) + "): " + detail);
    }
    transition(LinkState::Closed);
}

CloseReason ClusterLink::reason_for(const Error& error) {
    return error.is(ErrorKind::ProtocolViolation) ? CloseReason::ProtocolViolation
                                                  : CloseReason::TransportError;
}

}  // namespace beacon_mesh
