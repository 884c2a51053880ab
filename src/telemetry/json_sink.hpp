/**
 * @file json_sink.hpp
 * @brief NDJSON file log sink with rotation support.
 * @author BeaconMesh contributors
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace beacon_mesh {

/**
 * @brief Writes NDJSON to rotating log files.
 *
 * `<prefix>.ndjson` is the live file; on rotation it becomes
 * `<prefix>.1.ndjson`, older files shift up, and anything beyond
 * `max_files` is deleted.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;

private:
    void rotate_if_needed();
    std::filesystem::path rotated_path(uint32_t index) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Keeps lines in memory; used by tests to assert on log output.
 */
class MemorySink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override {}

    [[nodiscard]] std::vector<std::string> lines() const;
    [[nodiscard]] bool contains(std::string_view needle) const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

}  // namespace beacon_mesh
