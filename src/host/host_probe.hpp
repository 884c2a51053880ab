/**
 * @file host_probe.hpp
 * @brief Local host identity and capability probing.
 * @author BeaconMesh contributors
 *
 * Reads hostname, interface addresses and resource hints once at startup.
 * Data sources:
 *   gethostname()   hostname
 *   getifaddrs()    IPv4 interface addresses
 *   /proc/meminfo   memory total and available
 *   uname()         platform string
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace beacon_mesh {

[[nodiscard]] std::string local_hostname();

/**
 * @brief All IPv4 addresses bound to local interfaces, loopback included.
 */
[[nodiscard]] std::vector<std::string> local_ipv4_addresses();

/**
 * @brief Pick the address peers should dial.
 *
 * Priority: 10.x, then 192.168.x, then 172.x with the lowest second
 * octet, then any other non-loopback address, then 127.0.0.1.
 */
[[nodiscard]] std::string select_primary_ip(const std::vector<std::string>& candidates);

[[nodiscard]] std::string primary_ip();

/**
 * @brief "<hostname>-<8 hex digits>", lower-cased, fresh per process.
 */
[[nodiscard]] MachineId generate_machine_id(std::string_view hostname);

/**
 * @brief Parse the MemTotal / MemAvailable lines of a meminfo dump.
 */
[[nodiscard]] Capabilities parse_meminfo(std::string_view meminfo_text);

[[nodiscard]] Capabilities probe_capabilities();

/**
 * @brief This machine's descriptor: configured identity where set, probed
 *        values elsewhere.
 */
[[nodiscard]] MachineDescriptor describe_local_machine(const NodeConfig& node);

}  // namespace beacon_mesh
