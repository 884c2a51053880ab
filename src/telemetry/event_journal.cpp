/**
 * @file event_journal.cpp
 * @brief EventJournal implementation.
 * @author BeaconMesh contributors
 */

#include "telemetry/event_journal.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace beacon_mesh {

namespace {

nlohmann::ordered_json make_event(std::string_view name) {
    nlohmann::ordered_json record;
    record["event"] = std::string{name};
    record["ts"] = format_iso8601(std::chrono::system_clock::now());
    return record;
}

std::string dump(const nlohmann::ordered_json& record) {
    return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

EventJournal::EventJournal(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void EventJournal::record_peer_discovered(const MachineDescriptor& peer) {
    auto record = make_event("peer_discovered");
    record["peer"] = peer.machine_id;
    record["hostname"] = peer.hostname;
    record["ip"] = peer.primary_ip;
    record["cluster_port"] = peer.websocket_port;
    auto services = nlohmann::ordered_json::array();
    for (const auto& svc : peer.advertised_services) {
        services.push_back({{"name", svc.name}, {"port", svc.port}});
    }
    record["services"] = std::move(services);
    emit(dump(record));
}

void EventJournal::record_peer_revived(const MachineId& peer) {
    auto record = make_event("peer_revived");
    record["peer"] = peer;
    emit(dump(record));
}

void EventJournal::record_peer_offline(const MachineId& peer) {
    auto record = make_event("peer_offline");
    record["peer"] = peer;
    emit(dump(record));
}

void EventJournal::record_peer_collision(const MachineId& peer,
                                          std::string_view old_hostname,
                                          std::string_view new_hostname) {
    auto record = make_event("peer_collision");
    record["peer"] = peer;
    record["previous_hostname"] = std::string{old_hostname};
    record["hostname"] = std::string{new_hostname};
    emit(dump(record));
}

void EventJournal::record_link_transition(const MachineId& peer, LinkDirection direction,
                                           LinkState from, LinkState to,
                                           std::string_view reason) {
    auto record = make_event("link_state");
    record["peer"] = peer;
    record["direction"] = std::string{to_string(direction)};
    record["from"] = std::string{to_string(from)};
    record["to"] = std::string{to_string(to)};
    if (!reason.empty()) {
        record["reason"] = std::string{reason};
    }
    emit(dump(record));
}

void EventJournal::record_port_claimed(uint16_t port, std::string_view service) {
    auto record = make_event("port_claimed");
    record["port"] = port;
    record["service"] = std::string{service};
    emit(dump(record));
}

void EventJournal::record_port_released(uint16_t port, std::string_view service) {
    auto record = make_event("port_released");
    record["port"] = port;
    record["service"] = std::string{service};
    emit(dump(record));
}

void EventJournal::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    ++events_recorded_;
}

void EventJournal::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

uint64_t EventJournal::events_recorded() const {
    std::lock_guard lock(write_mutex_);
    return events_recorded_;
}

}  // namespace beacon_mesh
