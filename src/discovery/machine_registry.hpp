/**
 * @file machine_registry.hpp
 * @brief Authoritative table of known machines with liveness expiry.
 * @author BeaconMesh contributors
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace beacon_mesh {

enum class RegistryEvent : uint8_t {
    Inserted,
    Refreshed,
    Revived,       ///< Offline entry seen again
    Collision,     ///< Same id, different hostname or address
    WentOffline
};

[[nodiscard]] constexpr std::string_view to_string(RegistryEvent event) noexcept {
    switch (event) {
        case RegistryEvent::Inserted:    return "inserted";
        case RegistryEvent::Refreshed:   return "refreshed";
        case RegistryEvent::Revived:     return "revived";
        case RegistryEvent::Collision:   return "collision";
        case RegistryEvent::WentOffline: return "went_offline";
    }
    return "unknown";
}

/**
 * @brief Machine table keyed by machine_id, self included.
 *
 * Written by the beacon listener, every link's message handler and the
 * expiry sweep; writes take the exclusive lock, reads the shared one.
 * Entries are never deleted. They go offline only through expire_stale()
 * and come back only through upsert().
 *
 * The change listener runs on the mutating thread after the lock is
 * released.
 */
class MachineRegistry {
public:
    /**
     * Arguments: the entry after the change, the event, and the hostname
     * the entry carried before (set for Collision only).
     */
    using ChangeListener =
        std::function<void(const MachineDescriptor&, RegistryEvent, const std::string&)>;

    MachineRegistry(MachineId local_id, std::chrono::milliseconds silence_window);

    /**
     * @brief Insert or refresh. last_seen never decreases; a default
     *        last_seen means "now".
     */
    RegistryEvent upsert(MachineDescriptor descriptor);

    /// NotFound when the id was never seen.
    [[nodiscard]] Result<MachineDescriptor> get(const MachineId& id) const;

    /// Entries with status online or degraded, self excluded.
    [[nodiscard]] std::vector<MachineDescriptor> list_online() const;

    /// Every entry, self and offline ones included.
    [[nodiscard]] std::vector<MachineDescriptor> snapshot() const;

    /**
     * @brief Mark every remote entry silent for at least the window offline.
     * @return Ids that went offline in this sweep.
     */
    std::vector<MachineId> expire_stale(SteadyTime now);

    /// Refresh last_seen from link traffic. Does not revive offline entries.
    bool touch(const MachineId& id, SteadyTime now);

    /// Online/Degraded toggling from link health. Offline entries are left alone.
    bool set_status(const MachineId& id, MachineStatus status);

    [[nodiscard]] bool is_offline(const MachineId& id) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] uint64_t collision_count() const noexcept { return collisions_.load(); }
    [[nodiscard]] const MachineId& local_id() const noexcept { return local_id_; }
    [[nodiscard]] std::chrono::milliseconds silence_window() const noexcept { return silence_window_; }

    void set_listener(ChangeListener listener);

private:
    void notify(const MachineDescriptor& descriptor, RegistryEvent event,
                const std::string& previous_hostname);

    const MachineId local_id_;
    const std::chrono::milliseconds silence_window_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<MachineId, MachineDescriptor> machines_;
    std::atomic<uint64_t> collisions_{0};

    std::mutex listener_mutex_;
    ChangeListener listener_;
};

}  // namespace beacon_mesh
