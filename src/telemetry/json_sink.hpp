/**
 * @file json_sink.hpp
 * @brief NDJSON log sinks: rotating file, stdout, in-memory and null.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace sandbox_engine {

/**
 * @brief Writes NDJSON to `<dir>/<prefix>.ndjson`, rotating by size.
 *
 * On rotation the live file becomes `<prefix>.1.ndjson`, older files shift
 * up by one and anything beyond `max_files` is deleted.
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

    /// Threshold in bytes; exposed so tests can use tiny files.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

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
 * @brief Keeps every line in memory. Used by tests to assert on log output.
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

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace sandbox_engine
