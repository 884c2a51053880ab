/**
 * @file control_server.cpp
 * @brief ControlServer implementation.
 * @author BeaconMesh contributors
 */

#include "app/control_server.hpp"
#include "discovery/descriptor_json.hpp"

#include <unistd.h>

#include <algorithm>

namespace beacon_mesh {

namespace {
constexpr std::string_view COMPONENT = "control";
}

nlohmann::json peer_view_to_json(const PeerView& peer, SteadyTime now) {
    auto j = descriptor_to_json(peer.descriptor);
    j["status"] = std::string{to_string(peer.descriptor.status)};

    auto silent = std::chrono::duration_cast<std::chrono::milliseconds>(now - peer.descriptor.last_seen);
    j["last_seen_ms_ago"] = std::max<int64_t>(silent.count(), 0);

    if (peer.link_state) {
        j["link_state"] = std::string{to_string(*peer.link_state)};
    } else {
        j["link_state"] = nullptr;
    }
    if (peer.link_direction) {
        j["link_direction"] = std::string{to_string(*peer.link_direction)};
    }
    return j;
}

ControlServer::ControlServer(DiscoveryCoordinator& coordinator, Logger& logger)
    : coordinator_(coordinator)
    , port_service_(coordinator.ports())
    , logger_(logger) {}

ControlServer::~ControlServer() {
    stop();
}

Result<void> ControlServer::start(uint16_t port) {
    if (port != 0) {
        auto claim = coordinator_.ports().claim(port, std::string{CONTROL_SERVICE},
                                                static_cast<int>(::getpid()));
        if (!claim.success) {
            return Error{ErrorKind::ResourceConflict, claim.message};
        }
        claimed_port_ = port;
    }

    auto listening = server_.listen("127.0.0.1", port);
    if (!listening) {
        release_claim();
        return listening;
    }

    server_.serve([this](std::string_view request) { return dispatch(request); });
    logger_.info(COMPONENT, "Control endpoint on 127.0.0.1:" + std::to_string(server_.port()));
    return Result<void>{};
}

void ControlServer::stop() {
    server_.stop_serving();
    server_.close();
    release_claim();
}

void ControlServer::release_claim() {
    if (claimed_port_ == 0) return;
    auto released = coordinator_.ports().release(claimed_port_);
    if (!released.success) {
        logger_.debug(COMPONENT, released.message);
    }
    claimed_port_ = 0;
}

std::string ControlServer::dispatch(std::string_view request) {
    auto parsed = nlohmann::json::parse(request, nullptr, false);
    nlohmann::json reply;

    if (parsed.is_discarded() || !parsed.is_object() || !parsed.contains("op")
        || !parsed["op"].is_string()) {
        logger_.warn(COMPONENT, "Malformed control request");
        reply = error_to_json({ErrorKind::ProtocolViolation, "Request must be an object with a string 'op'"});
    } else {
        const auto& op = parsed["op"].get_ref<const std::string&>();
        logger_.debug(COMPONENT, "Request " + op);

        if (op == "list_peers") {
            reply = list_peers();
        } else if (op == "discover_now") {
            reply = discover_now();
        } else if (PortService::handles(op)) {
            reply = port_service_.handle(parsed);
        } else {
            reply = error_to_json({ErrorKind::NotFound, "Unknown op '" + op + "'"});
        }
    }
    return reply.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json ControlServer::list_peers() const {
    auto now = std::chrono::steady_clock::now();
    nlohmann::json peers = nlohmann::json::array();
    for (const auto& peer : coordinator_.list_peers()) {
        peers.push_back(peer_view_to_json(peer, now));
    }
    return {{"local", descriptor_to_json(coordinator_.local())}, {"peers", std::move(peers)}};
}

nlohmann::json ControlServer::discover_now() {
    nlohmann::json found = nlohmann::json::array();
    for (const auto& peer : coordinator_.discover_now()) {
        found.push_back(descriptor_to_json(peer));
    }
    return {{"discovered", std::move(found)}};
}

}  // namespace beacon_mesh
