/**
 * @file beacon_broadcaster.cpp
 * @brief BeaconBroadcaster implementation using a SO_BROADCAST UDP socket.
 * @author BeaconMesh contributors
 */

#include "discovery/beacon_broadcaster.hpp"
#include "discovery/beacon_codec.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace beacon_mesh {

namespace {

constexpr std::string_view COMPONENT = "broadcaster";

}  // anonymous namespace

Result<sockaddr_in> parse_beacon_target(const std::string& target, uint16_t default_port) {
    std::string host = target;
    uint16_t port = default_port;

    if (auto colon = target.find(':'); colon != std::string::npos) {
        host = target.substr(0, colon);
        unsigned long parsed = 0;
        try {
            parsed = std::stoul(target.substr(colon + 1));
        } catch (const std::exception&) {
            parsed = 0;
        }
        if (parsed == 0 || parsed > 65535) {
            return make_error<sockaddr_in>(ErrorKind::ConfigurationError,
                                           "Invalid beacon target port: " + target);
        }
        port = static_cast<uint16_t>(parsed);
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        return make_error<sockaddr_in>(ErrorKind::ConfigurationError,
                                       "Invalid beacon target address: " + target);
    }
    return addr;
}

BeaconBroadcaster::BeaconBroadcaster(std::vector<std::string> targets,
                                     uint16_t discovery_port,
                                     Logger& logger)
    : targets_(std::move(targets)), discovery_port_(discovery_port), logger_(logger) {}

BeaconBroadcaster::~BeaconBroadcaster() {
    stop();
}

Result<void> BeaconBroadcaster::run(DescriptorProvider provider, std::chrono::milliseconds interval) {
    if (thread_.joinable()) {
        return Error{ErrorKind::Internal, "Broadcaster already running"};
    }

    destinations_.clear();
    for (const auto& target : targets_) {
        auto addr = parse_beacon_target(target, discovery_port_);
        if (!addr) return addr.error();
        destinations_.push_back(addr.value());
    }

    fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK, 0);
    if (fd_ < 0) {
        return Error{ErrorKind::NetworkTransient,
                     std::string("Failed to create beacon socket: ") + std::strerror(errno)};
    }
    int optval = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &optval, sizeof(optval));
    unsigned char loop = 1;
    ::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop));

    provider_ = std::move(provider);
    interval_ = interval;

    thread_ = std::jthread([this](std::stop_token stop) {
        broadcast_loop(stop);
    });
    return Result<void>{};
}

void BeaconBroadcaster::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void BeaconBroadcaster::send_now() {
    {
        std::lock_guard lock(wake_mutex_);
        send_requested_ = true;
    }
    wake_cv_.notify_all();
}

void BeaconBroadcaster::broadcast_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        send_once();

        std::unique_lock lock(wake_mutex_);
        wake_cv_.wait_for(lock, stop, interval_, [this] { return send_requested_; });
        send_requested_ = false;
    }
}

void BeaconBroadcaster::send_once() {
    auto beacon = make_beacon(provider_(), sequence_.fetch_add(1) + 1);
    auto payload = BeaconCodec::encode(beacon);

    for (size_t i = 0; i < destinations_.size(); ++i) {
        const auto& dest = destinations_[i];
        auto sent = ::sendto(fd_, payload.data(), payload.size(), 0,
                             reinterpret_cast<const sockaddr*>(&dest), sizeof(dest));
        if (sent < 0) {
            logger_.warn(COMPONENT, "Beacon to " + targets_[i] + " failed: " + std::strerror(errno));
        }
    }
    logger_.debug(COMPONENT, "Beacon #" + std::to_string(beacon.sequence) + " sent");
}

}  // namespace beacon_mesh
