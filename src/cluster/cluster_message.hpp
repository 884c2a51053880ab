/**
 * @file cluster_message.hpp
 * @brief Typed envelope carried on cluster links.
 * @author BeaconMesh contributors
 *
 * {"type":"heartbeat","source_machine_id":"m-aaa","target_machine_id":"m-bbb",
 *  "message_id":"...","correlation_id":"...","payload":{},"timestamp":"...Z"}
 *
 * `target_machine_id` and `correlation_id` are omitted when unset. The core
 * interprets `registration` and `heartbeat`; `status_update` and
 * `task_coordination` payloads are passed through untouched.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace beacon_mesh {

enum class MessageType : uint8_t {
    Registration,
    Heartbeat,
    StatusUpdate,
    TaskCoordination
};

[[nodiscard]] constexpr std::string_view to_string(MessageType type) noexcept {
    switch (type) {
        case MessageType::Registration:     return "registration";
        case MessageType::Heartbeat:        return "heartbeat";
        case MessageType::StatusUpdate:     return "status_update";
        case MessageType::TaskCoordination: return "task_coordination";
    }
    return "unknown";
}

[[nodiscard]] std::optional<MessageType> parse_message_type(std::string_view text) noexcept;

struct ClusterMessage {
    MessageType type{MessageType::Heartbeat};
    MachineId source_machine_id;
    std::optional<MachineId> target_machine_id;
    std::string message_id;
    std::optional<std::string> correlation_id;
    nlohmann::json payload = nlohmann::json::object();
    std::string timestamp;

    /// Fresh message id and current timestamp.
    static ClusterMessage make(MessageType type, MachineId source,
                               nlohmann::json payload = nlohmann::json::object());
};

struct ClusterMessageCodec {
    static std::string encode(const ClusterMessage& message);

    /// ProtocolViolation for malformed JSON, an unknown type or missing fields.
    static Result<ClusterMessage> decode(std::string_view data);
};

static_assert(WireCodecLike<ClusterMessageCodec, ClusterMessage>);

/// Registration carrying the sender's descriptor.
[[nodiscard]] ClusterMessage make_registration(const MachineDescriptor& local);

[[nodiscard]] ClusterMessage make_heartbeat(const MachineId& local);

}  // namespace beacon_mesh
