/**
 * @file socket_owner.hpp
 * @brief Identify the process listening on a local TCP port.
 * @author BeaconMesh contributors
 *
 * Matches LISTEN sockets in /proc/net/tcp{,6} against the socket inodes
 * held open under /proc/<pid>/fd. Processes owned by other users are
 * invisible without privileges, in which case no owner is reported.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace beacon_mesh {

/**
 * @brief Socket inodes in LISTEN state bound to `port` in a /proc/net/tcp dump.
 */
[[nodiscard]] std::vector<uint64_t> listening_inodes(std::string_view proc_net_tcp,
                                                     uint16_t port);

/**
 * @brief "PID <pid>: <comm>" for the listener on `port`, if one is visible.
 */
[[nodiscard]] std::optional<std::string> find_socket_owner(uint16_t port);

}  // namespace beacon_mesh
