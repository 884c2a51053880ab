/**
 * @file beacon_listener.cpp
 * @brief BeaconListener implementation using a poll()-driven UDP socket.
 * @author BeaconMesh contributors
 */

#include "discovery/beacon_listener.hpp"
#include "discovery/beacon_codec.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace beacon_mesh {

namespace {

constexpr std::string_view COMPONENT = "listener";

}  // anonymous namespace

BeaconListener::BeaconListener(MachineRegistry& registry, MachineId local_id, Logger& logger)
    : registry_(registry), local_id_(std::move(local_id)), logger_(logger) {}

BeaconListener::~BeaconListener() {
    stop();
}

Result<void> BeaconListener::listen(const std::string& bind_address, uint16_t port,
                                    const std::string& multicast_group) {
    if (thread_.joinable()) {
        return Error{ErrorKind::Internal, "Listener already running"};
    }

    sockaddr_in bind_addr{};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, bind_address.c_str(), &bind_addr.sin_addr) != 1) {
        return Error{ErrorKind::ConfigurationError, "Invalid listen address: " + bind_address};
    }

    fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK, 0);
    if (fd_ < 0) {
        return Error{ErrorKind::NetworkTransient,
                     std::string("Failed to create listener socket: ") + std::strerror(errno)};
    }

    int optval = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    if (::bind(fd_, reinterpret_cast<const sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        return Error{err == EADDRINUSE ? ErrorKind::ResourceConflict : ErrorKind::NetworkTransient,
                     "Bind to discovery port " + std::to_string(port) + " failed: "
                     + std::strerror(err)};
    }

    if (!multicast_group.empty()) {
        ip_mreq mreq{};
        mreq.imr_interface.s_addr = htonl(INADDR_ANY);
        if (::inet_pton(AF_INET, multicast_group.c_str(), &mreq.imr_multiaddr) != 1
            || ::setsockopt(fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
            logger_.debug(COMPONENT, "Multicast join for " + multicast_group
                                     + " failed; relying on broadcast");
        }
    }

    thread_ = std::jthread([this](std::stop_token stop) {
        listen_loop(stop);
    });

    logger_.info(COMPONENT, "Listening for beacons on " + bind_address + ":" + std::to_string(port));
    return Result<void>{};
}

void BeaconListener::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void BeaconListener::on_beacon(BeaconCallback callback) {
    std::lock_guard lock(callback_mutex_);
    callback_ = std::move(callback);
}

void BeaconListener::listen_loop(std::stop_token stop) {
    std::string buffer(MAX_BEACON_SIZE + 1, '\0');

    while (!stop.stop_requested()) {
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, 100);
        if (ready <= 0) continue;

        sockaddr_in sender{};
        socklen_t addr_len = sizeof(sender);
        auto bytes = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                reinterpret_cast<sockaddr*>(&sender), &addr_len);
        if (bytes < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                logger_.warn(COMPONENT, std::string("recvfrom failed: ") + std::strerror(errno));
            }
            continue;
        }

        char ip_buf[INET_ADDRSTRLEN] = {};
        ::inet_ntop(AF_INET, &sender.sin_addr, ip_buf, sizeof(ip_buf));

        if (static_cast<size_t>(bytes) > MAX_BEACON_SIZE) {
            dropped_.fetch_add(1);
            logger_.warn(COMPONENT, std::string("Oversized datagram from ") + ip_buf + " dropped");
            continue;
        }

        handle_datagram(std::string_view(buffer.data(), static_cast<size_t>(bytes)), ip_buf);
    }
}

void BeaconListener::handle_datagram(std::string_view data, const std::string& source_ip) {
    auto beacon = BeaconCodec::decode(data);
    if (!beacon) {
        dropped_.fetch_add(1);
        logger_.warn(COMPONENT, "Dropped datagram from " + source_ip + ": "
                                + std::string(to_string(beacon.error().kind)) + ": "
                                + beacon.error().message);
        return;
    }

    if (beacon->machine_id == local_id_) {
        self_filtered_.fetch_add(1);
        return;
    }

    auto descriptor = to_descriptor(beacon.value(), std::chrono::steady_clock::now(), source_ip);
    auto event = registry_.upsert(descriptor);
    accepted_.fetch_add(1);

    if (event == RegistryEvent::Inserted || event == RegistryEvent::Revived) {
        logger_.info(COMPONENT, "Peer " + descriptor.machine_id + " at " + descriptor.primary_ip
                                + " (" + std::string(to_string(event)) + ")");
    }

    BeaconCallback callback;
    {
        std::lock_guard lock(callback_mutex_);
        callback = callback_;
    }
    if (callback) callback(descriptor, event);
}

}  // namespace beacon_mesh
