/**
 * @file port_registry.cpp
 * @brief PortRegistry implementation.
 * @author BeaconMesh contributors
 */

#include "ports/port_registry.hpp"
#include "telemetry/event_journal.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace beacon_mesh {

namespace {

std::map<uint16_t, PortAllocation> build_reserved(const PortsConfig& config) {
    std::map<uint16_t, PortAllocation> table;
    auto boot = std::chrono::system_clock::now();
    for (const auto& entry : config.reserved) {
        table.emplace(entry.port, PortAllocation{
            .port = entry.port,
            .service = entry.service,
            .status = AllocationStatus::Reserved,
            .pid = std::nullopt,
            .start_time = boot,
        });
    }
    return table;
}

std::string to_lower(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

}  // anonymous namespace

PortCategory categorize_service(std::string_view service) {
    auto name = to_lower(service);
    auto has = [&name](std::string_view needle) {
        return name.find(needle) != std::string::npos;
    };

    if (has("web") || has("dashboard")) return PortCategory::Web;
    if (has("api")) return PortCategory::Api;
    if (has("mcp") || has("tool") || has("agent")) return PortCategory::Tool;
    return PortCategory::Generic;
}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

PortRegistry::PortRegistry(const PortsConfig& config,
                           std::shared_ptr<IPortProbe> probe,
                           Logger& logger,
                           EventJournal* journal)
    : reserved_(build_reserved(config))
    , ranges_(config.ranges)
    , probe_(std::move(probe))
    , logger_(logger)
    , journal_(journal) {
    logger_.debug("ports", "Loaded " + std::to_string(reserved_.size()) + " reserved ports");
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

bool PortRegistry::check(uint16_t port) {
    return probe_->is_available(port);
}

bool PortRegistry::is_reserved(uint16_t port) const {
    return reserved_.contains(port);
}

std::optional<PortAllocation> PortRegistry::lookup(uint16_t port) const {
    if (auto it = reserved_.find(port); it != reserved_.end()) {
        return it->second;
    }
    std::lock_guard lock(mutex_);
    if (auto it = active_.find(port); it != active_.end()) {
        return it->second;
    }
    return std::nullopt;
}

PortStatus PortRegistry::status() const {
    PortStatus out;
    for (const auto& [port, alloc] : reserved_) {
        out.reserved.push_back(alloc);
    }
    {
        std::lock_guard lock(mutex_);
        for (const auto& [port, alloc] : active_) {
            out.active.push_back(alloc);
        }
    }
    out.ranges = {
        {PortCategory::Web, ranges_.web},
        {PortCategory::Api, ranges_.api},
        {PortCategory::Tool, ranges_.tool},
        {PortCategory::Generic, ranges_.generic},
    };
    return out;
}

Result<uint16_t> PortRegistry::suggest_alternative(std::string_view service) const {
    std::lock_guard lock(mutex_);
    return suggest_locked(service);
}

PortRange PortRegistry::range_for(PortCategory category) const noexcept {
    switch (category) {
        case PortCategory::Web:     return ranges_.web;
        case PortCategory::Api:     return ranges_.api;
        case PortCategory::Tool:    return ranges_.tool;
        case PortCategory::Generic: return ranges_.generic;
    }
    return ranges_.generic;
}

Result<uint16_t> PortRegistry::suggest_locked(std::string_view service) const {
    auto category = categorize_service(service);
    auto range = range_for(category);

    for (uint32_t port = range.start; port <= range.end; ++port) {
        auto p = static_cast<uint16_t>(port);
        if (!reserved_.contains(p) && !active_.contains(p)) {
            return p;
        }
    }
    return make_error<uint16_t>(ErrorKind::ResourceConflict,
        "No free port in the " + std::string(to_string(category)) + " range "
        + std::to_string(range.start) + "-" + std::to_string(range.end));
}

std::string PortRegistry::suggestion_text(const Result<uint16_t>& suggestion,
                                          std::string_view service) const {
    if (suggestion.has_value()) {
        return "Use port " + std::to_string(suggestion.value()) + " instead.";
    }
    return "No alternative is available for " + std::string(service) + ": "
           + suggestion.error().message + ".";
}

std::optional<std::string> PortRegistry::ownership_conflict_locked(
        uint16_t port, const std::string& service) const {
    if (auto it = reserved_.find(port); it != reserved_.end() && it->second.service != service) {
        return "Port " + std::to_string(port) + " is reserved for " + it->second.service + ".";
    }
    if (auto it = active_.find(port); it != active_.end() && it->second.service != service) {
        return "Port " + std::to_string(port) + " is already claimed by "
               + it->second.service + ".";
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Claim / Release
// ─────────────────────────────────────────────

PortDecision PortRegistry::claim(uint16_t port, const std::string& service,
                                 std::optional<int> pid) {
    if (port == 0 || service.empty()) {
        return PortDecision{
            .success = false,
            .port = port,
            .message = "A claim needs a non-zero port and a service name",
            .suggested_port = std::nullopt,
        };
    }

    auto reject = [&](std::string reason) {
        auto suggestion = suggest_locked(service);
        PortDecision decision{
            .success = false,
            .port = port,
            .message = std::move(reason) + " " + suggestion_text(suggestion, service),
            .suggested_port = std::nullopt,
        };
        if (suggestion.has_value()) decision.suggested_port = suggestion.value();
        return decision;
    };

    {
        std::lock_guard lock(mutex_);
        if (auto conflict = ownership_conflict_locked(port, service)) {
            auto decision = reject(std::move(*conflict));
            logger_.info("ports", decision.message);
            return decision;
        }
    }

    if (!probe_->is_available(port)) {
        auto owner = probe_->describe_owner(port);
        std::string reason = "Port " + std::to_string(port) + " is already in use by: "
                           + owner.value_or("unknown process") + ".";
        PortDecision decision;
        {
            std::lock_guard lock(mutex_);
            decision = reject(std::move(reason));
        }
        logger_.info("ports", decision.message);
        return decision;
    }

    {
        std::lock_guard lock(mutex_);
        // Another caller may have claimed the port while the probe ran
        if (auto conflict = ownership_conflict_locked(port, service)) {
            auto decision = reject(std::move(*conflict));
            logger_.info("ports", decision.message);
            return decision;
        }
        active_[port] = PortAllocation{
            .port = port,
            .service = service,
            .status = AllocationStatus::Active,
            .pid = pid,
            .start_time = std::chrono::system_clock::now(),
        };
    }

    logger_.info("ports", "Port " + std::to_string(port) + " claimed for " + service);
    if (journal_) journal_->record_port_claimed(port, service);

    return PortDecision{
        .success = true,
        .port = port,
        .message = "Port " + std::to_string(port) + " successfully claimed for " + service,
        .suggested_port = std::nullopt,
    };
}

PortDecision PortRegistry::release(uint16_t port) {
    if (reserved_.contains(port)) {
        return PortDecision{
            .success = false,
            .port = port,
            .message = "Port " + std::to_string(port)
                     + " is a reserved system port and cannot be released",
            .suggested_port = std::nullopt,
        };
    }

    std::string service;
    {
        std::lock_guard lock(mutex_);
        auto it = active_.find(port);
        if (it == active_.end()) {
            return PortDecision{
                .success = false,
                .port = port,
                .message = "Port " + std::to_string(port) + " is not registered",
                .suggested_port = std::nullopt,
            };
        }
        service = std::move(it->second.service);
        active_.erase(it);
    }

    logger_.info("ports", "Port " + std::to_string(port) + " released by " + service);
    if (journal_) journal_->record_port_released(port, service);

    return PortDecision{
        .success = true,
        .port = port,
        .message = "Port " + std::to_string(port) + " released successfully",
        .suggested_port = std::nullopt,
    };
}

// ─────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────

ServiceValidation PortRegistry::validate_service(const std::string& service,
                                                 std::optional<uint16_t> requested_port) {
    if (!requested_port || *requested_port == 0) {
        auto suggestion = suggest_alternative(service);
        if (!suggestion) {
            return ServiceValidation{false, 0, suggestion.error().message};
        }
        return ServiceValidation{
            true, suggestion.value(),
            "Suggested port " + std::to_string(suggestion.value()) + " for " + service};
    }

    const auto port = *requested_port;
    auto rejected = [&](std::string reason) {
        auto suggestion = suggest_alternative(service);
        if (!suggestion) {
            return ServiceValidation{false, 0, reason + " " + suggestion.error().message};
        }
        return ServiceValidation{
            false, suggestion.value(),
            reason + " Suggested port: " + std::to_string(suggestion.value())};
    };

    std::optional<std::string> conflict;
    {
        std::lock_guard lock(mutex_);
        conflict = ownership_conflict_locked(port, service);
    }
    if (conflict) {
        return rejected(std::move(*conflict));
    }

    if (!probe_->is_available(port)) {
        auto owner = probe_->describe_owner(port);
        return rejected("Port " + std::to_string(port) + " is in use by "
                        + owner.value_or("unknown process") + ".");
    }

    return ServiceValidation{
        true, port, "Port " + std::to_string(port) + " is available for " + service};
}

}  // namespace beacon_mesh
