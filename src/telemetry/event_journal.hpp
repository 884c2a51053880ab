/**
 * @file event_journal.hpp
 * @brief Structured mesh event collection for telemetry.
 * @author BeaconMesh contributors
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>

namespace beacon_mesh {

/**
 * @brief Records membership, link and port events as NDJSON.
 *
 * Each record carries `event` and `ts`; the remaining fields depend on the
 * event. The journal is separate from the diagnostic log so that tooling
 * can replay mesh history without parsing free-form messages.
 */
class EventJournal {
public:
    explicit EventJournal(std::unique_ptr<ILogSink> sink);

    void record_peer_discovered(const MachineDescriptor& peer);
    void record_peer_revived(const MachineId& peer);
    void record_peer_offline(const MachineId& peer);
    void record_peer_collision(const MachineId& peer,
                               std::string_view old_hostname,
                               std::string_view new_hostname);
    void record_link_transition(const MachineId& peer, LinkDirection direction,
                                LinkState from, LinkState to,
                                std::string_view reason);
    void record_port_claimed(uint16_t port, std::string_view service);
    void record_port_released(uint16_t port, std::string_view service);

    void flush();

    [[nodiscard]] uint64_t events_recorded() const;

private:
    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex write_mutex_;
    uint64_t events_recorded_{0};

    void emit(std::string_view json_line);
};

}  // namespace beacon_mesh
