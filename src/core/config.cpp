/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace sandbox_engine {

namespace {

template <typename T, typename Node>
T read_uint(Node&& node, T fallback) {
    auto value = node.template value<int64_t>();
    if (!value || *value < 0) return fallback;
    return static_cast<T>(*value);
}

/**
 * @brief Parse a positive decimal from an environment variable.
 *
 * Returns the fallback when the variable is unset.
 */
Result<uint32_t> env_uint(const char* name, uint32_t fallback) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') return fallback;

    errno = 0;
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(raw, &end, 10);
    if (errno != 0 || end == raw || *end != '\0'
        || parsed == 0 || parsed > std::numeric_limits<uint32_t>::max()) {
        return Error{ErrorCode::ValidationFailed,
                     std::string{"Invalid value for "} + name + ": " + raw};
    }
    return static_cast<uint32_t>(parsed);
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;
        const Config defaults;

        // [engine]
        if (auto engine = tbl["engine"]; engine.is_table()) {
            config.engine.max_concurrent =
                read_uint(engine["max_concurrent"], defaults.engine.max_concurrent);
            config.engine.default_timeout_ms =
                read_uint(engine["default_timeout_ms"], defaults.engine.default_timeout_ms);
            config.engine.default_memory_limit_mb =
                read_uint(engine["default_memory_limit_mb"], defaults.engine.default_memory_limit_mb);
            config.engine.max_output_kb =
                read_uint(engine["max_output_kb"], defaults.engine.max_output_kb);
            config.engine.record_ttl_ms =
                read_uint(engine["record_ttl_ms"], defaults.engine.record_ttl_ms);
            config.engine.sweep_interval_ms =
                read_uint(engine["sweep_interval_ms"], defaults.engine.sweep_interval_ms);
        }

        // [limits]
        if (auto limits = tbl["limits"]; limits.is_table()) {
            config.limits.max_code_bytes =
                read_uint(limits["max_code_bytes"], defaults.limits.max_code_bytes);
            config.limits.min_timeout_ms =
                read_uint(limits["min_timeout_ms"], defaults.limits.min_timeout_ms);
            config.limits.max_timeout_ms =
                read_uint(limits["max_timeout_ms"], defaults.limits.max_timeout_ms);
            config.limits.min_memory_mb =
                read_uint(limits["min_memory_mb"], defaults.limits.min_memory_mb);
            config.limits.max_memory_mb =
                read_uint(limits["max_memory_mb"], defaults.limits.max_memory_mb);
        }

        // [container]
        if (auto container = tbl["container"]; container.is_table()) {
            config.container.socket_path =
                container["socket_path"].value_or(defaults.container.socket_path);
            config.container.api_version =
                container["api_version"].value_or(defaults.container.api_version);
            config.container.workspace_root =
                container["workspace_root"].value_or(defaults.container.workspace_root.string());
            config.container.nano_cpus =
                read_uint(container["nano_cpus"], defaults.container.nano_cpus);
            config.container.pids_limit =
                container["pids_limit"].value_or(defaults.container.pids_limit);
            config.container.pull_timeout_ms =
                read_uint(container["pull_timeout_ms"], defaults.container.pull_timeout_ms);
            config.container.stop_grace_ms =
                read_uint(container["stop_grace_ms"], defaults.container.stop_grace_ms);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.max_file_size_mb =
                read_uint(telemetry["max_file_size_mb"], defaults.telemetry.max_file_size_mb);
            config.telemetry.rotate_count =
                read_uint(telemetry["rotate_count"], defaults.telemetry.rotate_count);
            config.telemetry.log_level =
                telemetry["log_level"].value_or(defaults.telemetry.log_level);
        }

        if (auto valid = validate_config(config); !valid) {
            return valid.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ValidationFailed,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<void> apply_env_overrides(Config& config) {
    auto timeout = env_uint("MAX_EXECUTION_TIME_MS", config.engine.default_timeout_ms);
    if (!timeout) return timeout.error();
    auto memory = env_uint("MAX_MEMORY_MB", config.engine.default_memory_limit_mb);
    if (!memory) return memory.error();
    auto output = env_uint("MAX_OUTPUT_SIZE_KB", config.engine.max_output_kb);
    if (!output) return output.error();
    auto concurrent = env_uint("MAX_CONCURRENT_EXECUTIONS", config.engine.max_concurrent);
    if (!concurrent) return concurrent.error();

    config.engine.default_timeout_ms = *timeout;
    config.engine.default_memory_limit_mb = *memory;
    config.engine.max_output_kb = *output;
    config.engine.max_concurrent = *concurrent;
    return validate_config(config);
}

Result<void> validate_config(const Config& config) {
    if (config.engine.max_concurrent == 0) {
        return Error{ErrorCode::ValidationFailed, "engine.max_concurrent must be positive"};
    }
    if (config.engine.max_output_kb == 0) {
        return Error{ErrorCode::ValidationFailed, "engine.max_output_kb must be positive"};
    }
    if (config.limits.min_timeout_ms > config.limits.max_timeout_ms) {
        return Error{ErrorCode::ValidationFailed, "limits.min_timeout_ms exceeds limits.max_timeout_ms"};
    }
    if (config.limits.min_memory_mb > config.limits.max_memory_mb) {
        return Error{ErrorCode::ValidationFailed, "limits.min_memory_mb exceeds limits.max_memory_mb"};
    }
    if (config.engine.default_timeout_ms == 0 || config.engine.default_memory_limit_mb == 0) {
        return Error{ErrorCode::ValidationFailed, "engine defaults must be positive"};
    }
    if (config.container.socket_path.empty()) {
        return Error{ErrorCode::ValidationFailed, "container.socket_path must not be empty"};
    }
    return Result<void>{};
}

}  // namespace sandbox_engine
