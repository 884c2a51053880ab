/**
 * @file machine_registry.cpp
 * @brief MachineRegistry implementation.
 * @author BeaconMesh contributors
 */

#include "discovery/machine_registry.hpp"

#include <algorithm>

namespace beacon_mesh {

MachineRegistry::MachineRegistry(MachineId local_id, std::chrono::milliseconds silence_window)
    : local_id_(std::move(local_id)), silence_window_(silence_window) {}

RegistryEvent MachineRegistry::upsert(MachineDescriptor descriptor) {
    if (descriptor.last_seen == SteadyTime{}) {
        descriptor.last_seen = std::chrono::steady_clock::now();
    }

    RegistryEvent event = RegistryEvent::Refreshed;
    std::string previous_hostname;
    MachineDescriptor stored;
    {
        std::unique_lock lock(mutex_);
        auto it = machines_.find(descriptor.machine_id);
        if (it == machines_.end()) {
            descriptor.status = MachineStatus::Online;
            stored = descriptor;
            machines_.emplace(descriptor.machine_id, std::move(descriptor));
            event = RegistryEvent::Inserted;
        } else {
            auto& existing = it->second;
            bool was_offline = existing.status == MachineStatus::Offline;

            if (!was_offline && (existing.hostname != descriptor.hostname
                                 || existing.primary_ip != descriptor.primary_ip)) {
                event = RegistryEvent::Collision;
                previous_hostname = existing.hostname;
                collisions_.fetch_add(1);
            } else if (was_offline) {
                event = RegistryEvent::Revived;
            } else {
                event = RegistryEvent::Refreshed;
            }

            // Last write wins for identity; liveness only moves forward
            descriptor.last_seen = std::max(existing.last_seen, descriptor.last_seen);
            descriptor.status = was_offline ? MachineStatus::Online : existing.status;
            existing = std::move(descriptor);
            stored = existing;
        }
    }

    if (event != RegistryEvent::Refreshed) {
        notify(stored, event, previous_hostname);
    }
    return event;
}

Result<MachineDescriptor> MachineRegistry::get(const MachineId& id) const {
    std::shared_lock lock(mutex_);
    auto it = machines_.find(id);
    if (it == machines_.end()) {
        return make_error<MachineDescriptor>(ErrorKind::NotFound, "Unknown machine: " + id);
    }
    return it->second;
}

std::vector<MachineDescriptor> MachineRegistry::list_online() const {
    std::shared_lock lock(mutex_);
    std::vector<MachineDescriptor> result;
    for (const auto& [id, descriptor] : machines_) {
        if (id != local_id_ && descriptor.is_live()) {
            result.push_back(descriptor);
        }
    }
    return result;
}

std::vector<MachineDescriptor> MachineRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    std::vector<MachineDescriptor> result;
    result.reserve(machines_.size());
    for (const auto& [id, descriptor] : machines_) {
        result.push_back(descriptor);
    }
    return result;
}

std::vector<MachineId> MachineRegistry::expire_stale(SteadyTime now) {
    std::vector<MachineDescriptor> expired;
    {
        std::unique_lock lock(mutex_);
        for (auto& [id, descriptor] : machines_) {
            if (id == local_id_ || descriptor.status == MachineStatus::Offline) continue;
            if (now - descriptor.last_seen >= silence_window_) {
                descriptor.status = MachineStatus::Offline;
                expired.push_back(descriptor);
            }
        }
    }

    std::vector<MachineId> ids;
    for (const auto& descriptor : expired) {
        ids.push_back(descriptor.machine_id);
        notify(descriptor, RegistryEvent::WentOffline, {});
    }
    return ids;
}

bool MachineRegistry::touch(const MachineId& id, SteadyTime now) {
    std::unique_lock lock(mutex_);
    auto it = machines_.find(id);
    if (it == machines_.end()) return false;
    it->second.last_seen = std::max(it->second.last_seen, now);
    return true;
}

bool MachineRegistry::set_status(const MachineId& id, MachineStatus status) {
    if (status == MachineStatus::Offline) return false;

    std::unique_lock lock(mutex_);
    auto it = machines_.find(id);
    if (it == machines_.end() || it->second.status == MachineStatus::Offline) return false;
    it->second.status = status;
    return true;
}

bool MachineRegistry::is_offline(const MachineId& id) const {
    std::shared_lock lock(mutex_);
    auto it = machines_.find(id);
    return it == machines_.end() || it->second.status == MachineStatus::Offline;
}

size_t MachineRegistry::size() const {
    std::shared_lock lock(mutex_);
    return machines_.size();
}

void MachineRegistry::set_listener(ChangeListener listener) {
    std::lock_guard lock(listener_mutex_);
    listener_ = std::move(listener);
}

void MachineRegistry::notify(const MachineDescriptor& descriptor, RegistryEvent event,
                             const std::string& previous_hostname) {
    ChangeListener listener;
    {
        std::lock_guard lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) listener(descriptor, event, previous_hostname);
}

}  // namespace beacon_mesh
