/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace sandbox_engine {

struct EngineConfig {
    uint32_t max_concurrent = 5;
    uint32_t default_timeout_ms = 30000;
    uint32_t default_memory_limit_mb = 512;
    uint32_t max_output_kb = 1024;
    uint64_t record_ttl_ms = 3600000;       ///< Age after which terminal records are evicted
    uint64_t sweep_interval_ms = 3600000;   ///< Period of the eviction sweep
};

struct LimitsConfig {
    uint32_t max_code_bytes = 100000;
    uint32_t min_timeout_ms = 10;
    uint32_t max_timeout_ms = 60000;
    uint32_t min_memory_mb = 16;
    uint32_t max_memory_mb = 2048;
};

struct ContainerConfig {
    std::string socket_path = "/var/run/docker.sock";
    std::string api_version = "v1.41";
    std::filesystem::path workspace_root = std::filesystem::temp_directory_path() / "sandbox_engine";
    uint64_t nano_cpus = 1000000000;        ///< 1 CPU
    int64_t pids_limit = 64;
    uint32_t pull_timeout_ms = 300000;
    uint32_t stop_grace_ms = 2000;          ///< Bound on teardown requests after a kill
};

struct TelemetryConfig {
    std::filesystem::path log_dir;          ///< Empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level engine configuration.
 */
struct Config {
    EngineConfig engine;
    LimitsConfig limits;
    ContainerConfig container;
    TelemetryConfig telemetry;

    [[nodiscard]] size_t max_output_bytes() const noexcept {
        return static_cast<size_t>(engine.max_output_kb) * 1024;
    }
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Apply MAX_EXECUTION_TIME_MS, MAX_MEMORY_MB, MAX_OUTPUT_SIZE_KB and
 *        MAX_CONCURRENT_EXECUTIONS from the environment when set.
 *
 * Unparseable values are rejected with ValidationFailed.
 */
Result<void> apply_env_overrides(Config& config);

/**
 * @brief Reject inconsistent settings (zero bounds, min > max).
 */
Result<void> validate_config(const Config& config);

}  // namespace sandbox_engine
