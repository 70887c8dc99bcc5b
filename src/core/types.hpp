/**
 * @file types.hpp
 * @brief Fundamental types used throughout SandboxEngine.
 * @author Dimitris Kafetzis
 *
 * Defines ExecutionId, the Language and status enumerations, submission
 * options, and the Execution / ExecutionMetrics records held by the
 * orchestrator's registry. All types have value semantics.
 */

#pragma once

#include "core/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sandbox_engine {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using ExecutionId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;
using Millis = std::chrono::milliseconds;

// ─────────────────────────────────────────────
// Languages
// ─────────────────────────────────────────────

enum class Language : uint8_t {
    JavaScript,
    TypeScript,
    Python,
    Java,
    Cpp,
    C,
    Go,
    Rust
};

[[nodiscard]] constexpr std::string_view to_string(Language lang) noexcept {
    switch (lang) {
        case Language::JavaScript: return "javascript";
        case Language::TypeScript: return "typescript";
        case Language::Python:     return "python";
        case Language::Java:       return "java";
        case Language::Cpp:        return "cpp";
        case Language::C:          return "c";
        case Language::Go:         return "go";
        case Language::Rust:       return "rust";
    }
    return "unknown";
}

/**
 * @brief Parse a language tag at the edge.
 *
 * Case-insensitive; accepts common aliases ("js", "py", "c++", ...).
 * Unknown tags yield ErrorCode::UnsupportedLanguage.
 */
Result<Language> parse_language(std::string_view tag);

// ─────────────────────────────────────────────
// Execution Status
// ─────────────────────────────────────────────

enum class ExecutionStatus : uint8_t {
    Running,
    Completed,
    Error,
    Timeout,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Running:   return "running";
        case ExecutionStatus::Completed: return "completed";
        case ExecutionStatus::Error:     return "error";
        case ExecutionStatus::Timeout:   return "timeout";
        case ExecutionStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(ExecutionStatus status) noexcept {
    return status != ExecutionStatus::Running;
}

// ─────────────────────────────────────────────
// Submission
// ─────────────────────────────────────────────

/**
 * @brief A request to run code. Immutable after submission.
 */
struct ExecutionOptions {
    std::string code;
    Language language = Language::JavaScript;
    std::optional<uint32_t> timeout_ms;
    std::optional<uint32_t> memory_limit_mb;
    std::optional<std::string> input;
};

// ─────────────────────────────────────────────
// Execution Record
// ─────────────────────────────────────────────

/**
 * @brief One request to run code plus its resulting record.
 *
 * `failure` refines the Error status (OutputLimitExceeded, RuntimeError, ...).
 * `exit_code` is -1 when the unit was killed before reporting one.
 */
struct Execution {
    ExecutionId id;
    ExecutionStatus status = ExecutionStatus::Running;
    Language language = Language::JavaScript;
    std::string output;
    std::optional<std::string> error;
    std::optional<ErrorCode> failure;
    int exit_code = 0;
    Millis runtime{0};
    uint64_t memory_used_bytes = 0;
    Timestamp timestamp;
};

/**
 * @brief Companion record with the same lifecycle as its Execution.
 */
struct ExecutionMetrics {
    ExecutionId id;
    SteadyTime start_time;
    std::optional<SteadyTime> end_time;
    uint64_t memory_peak_bytes = 0;
    size_t output_bytes = 0;
};

/**
 * @brief Aggregate counters over the registry.
 */
struct ExecutionStats {
    size_t total = 0;
    size_t running = 0;
    size_t completed = 0;
    size_t failed = 0;
    size_t timed_out = 0;
    size_t cancelled = 0;
    double avg_runtime_ms = 0.0;
    size_t active = 0;
    size_t max_concurrent = 0;
};

}  // namespace sandbox_engine
