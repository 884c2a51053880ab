/**
 * @file port_registry.hpp
 * @brief Local authority over port ownership.
 * @author BeaconMesh contributors
 *
 * Two tiers: an immutable reserved table loaded from configuration at
 * construction, overlaid by a mutable table of active claims. Lookups
 * consult the reserved tier first. Every claim is also checked against the
 * kernel through an IPortProbe, so bookkeeping never hides a real conflict.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "ports/port_probe.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace beacon_mesh {

class EventJournal;

enum class AllocationStatus : uint8_t {
    Reserved,
    Active
};

[[nodiscard]] constexpr std::string_view to_string(AllocationStatus status) noexcept {
    switch (status) {
        case AllocationStatus::Reserved: return "reserved";
        case AllocationStatus::Active:   return "active";
    }
    return "unknown";
}

struct PortAllocation {
    uint16_t port{0};
    std::string service;
    AllocationStatus status{AllocationStatus::Active};
    std::optional<int> pid;
    Timestamp start_time{};
};

enum class PortCategory : uint8_t {
    Web,
    Api,
    Tool,
    Generic
};

[[nodiscard]] constexpr std::string_view to_string(PortCategory category) noexcept {
    switch (category) {
        case PortCategory::Web:     return "web";
        case PortCategory::Api:     return "api";
        case PortCategory::Tool:    return "tool";
        case PortCategory::Generic: return "generic";
    }
    return "unknown";
}

/**
 * @brief Case-insensitive substring match: web/dashboard, api, mcp/tool/agent.
 */
[[nodiscard]] PortCategory categorize_service(std::string_view service);

/**
 * @brief Outcome of claim() and release().
 */
struct PortDecision {
    bool success{false};
    uint16_t port{0};
    std::string message;
    std::optional<uint16_t> suggested_port;
};

/**
 * @brief Outcome of validate_service(); `port` is the confirmed or suggested port.
 */
struct ServiceValidation {
    bool valid{false};
    uint16_t port{0};
    std::string message;
};

struct CategoryRange {
    PortCategory category{PortCategory::Generic};
    PortRange range;
};

struct PortStatus {
    std::vector<PortAllocation> reserved;
    std::vector<PortAllocation> active;
    std::vector<CategoryRange> ranges;
};

/**
 * @brief Thread-safe port table.
 *
 * The table mutex is never held while probing the kernel or scanning /proc.
 * A claim therefore checks the tables, probes unlocked, and re-checks the
 * tables before inserting.
 */
class PortRegistry {
public:
    PortRegistry(const PortsConfig& config,
                 std::shared_ptr<IPortProbe> probe,
                 Logger& logger,
                 EventJournal* journal = nullptr);

    // Non-copyable
    PortRegistry(const PortRegistry&) = delete;
    PortRegistry& operator=(const PortRegistry&) = delete;

    /// True when a test socket can be bound to the port.
    [[nodiscard]] bool check(uint16_t port);

    PortDecision claim(uint16_t port, const std::string& service,
                       std::optional<int> pid = std::nullopt);
    PortDecision release(uint16_t port);

    /**
     * @brief First port of the service's category range with no reserved or
     *        active allocation.
     * @return ResourceConflict when every port in the range is taken.
     */
    [[nodiscard]] Result<uint16_t> suggest_alternative(std::string_view service) const;

    /// Dry-run of claim(); nothing is recorded.
    [[nodiscard]] ServiceValidation validate_service(const std::string& service,
                                                     std::optional<uint16_t> requested_port);

    [[nodiscard]] PortStatus status() const;

    /// Reserved entry first, active claim second.
    [[nodiscard]] std::optional<PortAllocation> lookup(uint16_t port) const;

    [[nodiscard]] bool is_reserved(uint16_t port) const;

private:
    /// Ownership conflict message, or nullopt when `service` may take `port`.
    std::optional<std::string> ownership_conflict_locked(uint16_t port,
                                                         const std::string& service) const;
    Result<uint16_t> suggest_locked(std::string_view service) const;
    std::string suggestion_text(const Result<uint16_t>& suggestion,
                                std::string_view service) const;
    PortRange range_for(PortCategory category) const noexcept;

    const std::map<uint16_t, PortAllocation> reserved_;
    PortRangesConfig ranges_;
    std::shared_ptr<IPortProbe> probe_;
    Logger& logger_;
    EventJournal* journal_;

    mutable std::mutex mutex_;
    std::map<uint16_t, PortAllocation> active_;
};

}  // namespace beacon_mesh
