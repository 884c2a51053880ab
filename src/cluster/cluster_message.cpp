/**
 * @file cluster_message.cpp
 * @brief ClusterMessageCodec implementation.
 * @author BeaconMesh contributors
 */

#include "cluster/cluster_message.hpp"
#include "discovery/descriptor_json.hpp"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace beacon_mesh {

namespace {

/// <16 hex random process prefix>-<counter>
std::string next_message_id() {
    static const std::string prefix = [] {
        std::random_device rd;
        std::mt19937_64 rng(rd());
        std::ostringstream oss;
        oss << std::hex << std::setw(16) << std::setfill('0') << rng();
        return oss.str();
    }();
    static std::atomic<uint64_t> counter{0};
    return prefix + "-" + std::to_string(counter.fetch_add(1) + 1);
}

}  // anonymous namespace

std::optional<MessageType> parse_message_type(std::string_view text) noexcept {
    if (text == "registration")      return MessageType::Registration;
    if (text == "heartbeat")         return MessageType::Heartbeat;
    if (text == "status_update")     return MessageType::StatusUpdate;
    if (text == "task_coordination") return MessageType::TaskCoordination;
    return std::nullopt;
}

ClusterMessage ClusterMessage::make(MessageType type, MachineId source, nlohmann::json payload) {
    ClusterMessage message;
    message.type = type;
    message.source_machine_id = std::move(source);
    message.message_id = next_message_id();
    message.payload = std::move(payload);
    message.timestamp = format_iso8601(std::chrono::system_clock::now());
    return message;
}

std::string ClusterMessageCodec::encode(const ClusterMessage& message) {
    nlohmann::json j = {
        {"type", std::string(to_string(message.type))},
        {"source_machine_id", message.source_machine_id},
        {"message_id", message.message_id},
        {"payload", message.payload},
        {"timestamp", message.timestamp},
    };
    if (message.target_machine_id) {
        j["target_machine_id"] = *message.target_machine_id;
    }
    if (message.correlation_id) {
        j["correlation_id"] = *message.correlation_id;
    }
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Result<ClusterMessage> ClusterMessageCodec::decode(std::string_view data) {
    auto violation = [](std::string message) {
        return make_error<ClusterMessage>(ErrorKind::ProtocolViolation, std::move(message));
    };

    auto j = nlohmann::json::parse(data.begin(), data.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return violation("envelope is not a JSON object");
    }

    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string()) {
        return violation("envelope has no type");
    }
    auto type = parse_message_type(type_it->get<std::string>());
    if (!type) {
        return violation("unknown message type: " + type_it->get<std::string>());
    }

    auto source_it = j.find("source_machine_id");
    if (source_it == j.end() || !source_it->is_string() || source_it->get<std::string>().empty()) {
        return violation("envelope has no source_machine_id");
    }

    ClusterMessage message;
    message.type = *type;
    message.source_machine_id = source_it->get<std::string>();

    if (auto it = j.find("target_machine_id"); it != j.end() && it->is_string()) {
        message.target_machine_id = it->get<std::string>();
    }
    if (auto it = j.find("message_id"); it != j.end() && it->is_string()) {
        message.message_id = it->get<std::string>();
    }
    if (auto it = j.find("correlation_id"); it != j.end() && it->is_string()) {
        message.correlation_id = it->get<std::string>();
    }
    if (auto it = j.find("payload"); it != j.end()) {
        message.payload = *it;
    }
    if (auto it = j.find("timestamp"); it != j.end() && it->is_string()) {
        message.timestamp = it->get<std::string>();
    }
    return message;
}

ClusterMessage make_registration(const MachineDescriptor& local) {
    return ClusterMessage::make(MessageType::Registration, local.machine_id,
                                descriptor_to_json(local));
}

ClusterMessage make_heartbeat(const MachineId& local) {
    return ClusterMessage::make(MessageType::Heartbeat, local);
}

}  // namespace beacon_mesh
