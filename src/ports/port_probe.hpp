/**
 * @file port_probe.hpp
 * @brief OS-level port availability probing.
 * @author BeaconMesh contributors
 *
 * IPortProbe is the seam between PortRegistry bookkeeping and the kernel:
 * SystemPortProbe binds a real test socket, tests substitute a scripted
 * probe.
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace beacon_mesh {

/**
 * @brief Abstract interface for "can this port be bound right now?".
 */
class IPortProbe {
public:
    virtual ~IPortProbe() = default;

    /// False only when the port is already bound by someone else.
    [[nodiscard]] virtual bool is_available(uint16_t port) = 0;

    /// Human-readable owner of a bound port, when it can be determined.
    [[nodiscard]] virtual std::optional<std::string> describe_owner(uint16_t port) = 0;
};

/**
 * @brief Probes by binding a TCP socket to 0.0.0.0:<port>.
 *
 * Only EADDRINUSE counts as unavailable. Any other failure (for example
 * EACCES on a privileged port) is logged and reported as available, since
 * the socket layer could not prove the port is taken.
 */
class SystemPortProbe : public IPortProbe {
public:
    explicit SystemPortProbe(Logger& logger) : logger_(logger) {}

    [[nodiscard]] bool is_available(uint16_t port) override;
    [[nodiscard]] std::optional<std::string> describe_owner(uint16_t port) override;

private:
    Logger& logger_;
};

}  // namespace beacon_mesh
