/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for BeaconMesh wire codecs.
 * @author BeaconMesh contributors
 *
 * Beacons and cluster envelopes are encoded on every tick and every frame.
 * The codecs are stateless structs with static encode/decode; the concept
 * pins down that shape at compile time.
 */

#pragma once

#include "core/result.hpp"

#include <concepts>
#include <string>
#include <string_view>

namespace beacon_mesh {

// ─────────────────────────────────────────────
// WireCodecLike
// ─────────────────────────────────────────────

/**
 * @concept WireCodecLike
 * @brief Constrains types that turn a message into bytes and back.
 *
 * decode() must never throw on hostile input; malformed bytes come back
 * as an ErrorKind::ProtocolViolation result.
 */
template <typename T, typename MessageT>
concept WireCodecLike = requires(const MessageT& msg, std::string_view data) {
    { T::encode(msg) } -> std::same_as<std::string>;
    { T::decode(data) } -> std::same_as<Result<MessageT>>;
};

}  // namespace beacon_mesh
