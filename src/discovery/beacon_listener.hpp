/**
 * @file beacon_listener.hpp
 * @brief Receives beacons and feeds the machine registry.
 * @author BeaconMesh contributors
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "discovery/machine_registry.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace beacon_mesh {

/**
 * @brief UDP receive loop on the discovery port.
 *
 * Malformed datagrams are dropped and logged. Beacons carrying the local
 * machine id never reach the registry. Every accepted beacon is upserted
 * and then reported to the beacon callback.
 *
 * listen() may be called again after stop().
 */
class BeaconListener {
public:
    using BeaconCallback = std::function<void(const MachineDescriptor&, RegistryEvent)>;

    BeaconListener(MachineRegistry& registry, MachineId local_id, Logger& logger);
    ~BeaconListener();

    // Non-copyable
    BeaconListener(const BeaconListener&) = delete;
    BeaconListener& operator=(const BeaconListener&) = delete;

    /**
     * @brief Bind and start receiving.
     * @param multicast_group Joined best effort; empty skips the join.
     */
    Result<void> listen(const std::string& bind_address, uint16_t port,
                        const std::string& multicast_group = {});
    void stop();

    void on_beacon(BeaconCallback callback);

    [[nodiscard]] bool is_listening() const noexcept { return thread_.joinable(); }
    [[nodiscard]] uint64_t accepted_count() const noexcept { return accepted_.load(); }
    [[nodiscard]] uint64_t dropped_count() const noexcept { return dropped_.load(); }
    [[nodiscard]] uint64_t self_filtered_count() const noexcept { return self_filtered_.load(); }

private:
    void listen_loop(std::stop_token stop);
    void handle_datagram(std::string_view data, const std::string& source_ip);

    MachineRegistry& registry_;
    MachineId local_id_;
    Logger& logger_;

    int fd_ = -1;
    std::jthread thread_;

    std::mutex callback_mutex_;
    BeaconCallback callback_;

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> self_filtered_{0};
};

}  // namespace beacon_mesh
