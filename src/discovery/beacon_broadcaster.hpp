/**
 * @file beacon_broadcaster.hpp
 * @brief Periodic UDP presence announcements.
 * @author BeaconMesh contributors
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <netinet/in.h>
#include <string>
#include <thread>
#include <vector>

namespace beacon_mesh {

using DescriptorProvider = std::function<MachineDescriptor()>;

/**
 * @brief Parse "a.b.c.d" or "a.b.c.d:port"; the port defaults to default_port.
 */
[[nodiscard]] Result<sockaddr_in> parse_beacon_target(const std::string& target,
                                                      uint16_t default_port);

/**
 * @brief Sends one beacon per tick to every target until stopped.
 *
 * The descriptor is fetched from the provider on every tick, so service
 * changes propagate with the next beacon. A failed send to one target is
 * logged and the remaining targets and later ticks proceed.
 */
class BeaconBroadcaster {
public:
    BeaconBroadcaster(std::vector<std::string> targets, uint16_t discovery_port, Logger& logger);
    ~BeaconBroadcaster();

    // Non-copyable
    BeaconBroadcaster(const BeaconBroadcaster&) = delete;
    BeaconBroadcaster& operator=(const BeaconBroadcaster&) = delete;

    /// ConfigurationError when a target cannot be parsed.
    Result<void> run(DescriptorProvider provider, std::chrono::milliseconds interval);
    void stop();

    /// Wake the loop and emit one beacon now.
    void send_now();

    [[nodiscard]] uint64_t beacons_sent() const noexcept { return sequence_.load(); }
    [[nodiscard]] bool is_running() const noexcept { return thread_.joinable(); }

private:
    void broadcast_loop(std::stop_token stop);
    void send_once();

    std::vector<std::string> targets_;
    uint16_t discovery_port_;
    Logger& logger_;

    std::vector<sockaddr_in> destinations_;
    DescriptorProvider provider_;
    std::chrono::milliseconds interval_{15000};
    int fd_ = -1;

    std::atomic<uint64_t> sequence_{0};
    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    bool send_requested_ = false;
    std::jthread thread_;
};

}  // namespace beacon_mesh
