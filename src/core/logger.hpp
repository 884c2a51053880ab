/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 * @author BeaconMesh contributors
 *
 * Provides ILogSink (virtual interface for runtime-configurable log destinations)
 * and a thread-safe Logger front-end. Every record names the component that
 * emitted it ("listener", "link", "ports", ...), so a single NDJSON stream
 * can be filtered per subsystem.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace beacon_mesh {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// ILogSink (virtual, runtime-configurable)
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe logger front-end.
 *
 * Record layout: {"level":..,"ts":..,"component":..,"msg":..}
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warn(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

    void log(LogLevel level, std::string_view component, std::string_view message);
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    mutable std::mutex mutex_;
};

}  // namespace beacon_mesh
