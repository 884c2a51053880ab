/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps.
 * @author BeaconMesh contributors
 */

#include "core/logger.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace beacon_mesh {

std::string format_iso8601(Timestamp ts) {
    auto time_t_now = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;

    std::tm utc{};
    ::gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info")  return LogLevel::Info;
    if (text == "warn")  return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    return std::nullopt;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::debug(std::string_view component, std::string_view message) {
    log(LogLevel::Debug, component, message);
}
void Logger::info(std::string_view component, std::string_view message) {
    log(LogLevel::Info, component, message);
}
void Logger::warn(std::string_view component, std::string_view message) {
    log(LogLevel::Warn, component, message);
}
void Logger::error(std::string_view component, std::string_view message) {
    log(LogLevel::Error, component, message);
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    if (level < min_level_.load(std::memory_order_relaxed)) return;

    // Field order is level, ts, component, msg
    nlohmann::ordered_json record;
    record["level"] = std::string{to_string(level)};
    record["ts"] = format_iso8601(std::chrono::system_clock::now());
    record["component"] = std::string{component};
    record["msg"] = std::string{message};

    // Peer-supplied strings are not guaranteed to be UTF-8
    auto line = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard lock(mutex_);
    sink_->write(line);
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

void Logger::set_level(LogLevel level) noexcept {
    min_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() const noexcept {
    return min_level_.load(std::memory_order_relaxed);
}

}  // namespace beacon_mesh
