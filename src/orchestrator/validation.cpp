/**
 * @file validation.cpp
 * @brief validate_submission implementation.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/validation.hpp"

#include <string>

namespace sandbox_engine {

Result<void> validate_submission(const ExecutionOptions& options, const LimitsConfig& limits) {
    if (options.code.empty()) {
        return Error{ErrorCode::ValidationFailed, "Code is required"};
    }
    if (options.code.size() > limits.max_code_bytes) {
        return Error{ErrorCode::ValidationFailed,
                     "Code exceeds " + std::to_string(limits.max_code_bytes) + " bytes"};
    }
    if (options.timeout_ms
        && (*options.timeout_ms < limits.min_timeout_ms || *options.timeout_ms > limits.max_timeout_ms)) {
        return Error{ErrorCode::ValidationFailed,
                     "Timeout must be between " + std::to_string(limits.min_timeout_ms) + " and "
                     + std::to_string(limits.max_timeout_ms) + " ms"};
    }
    if (options.memory_limit_mb
        && (*options.memory_limit_mb < limits.min_memory_mb || *options.memory_limit_mb > limits.max_memory_mb)) {
        return Error{ErrorCode::ValidationFailed,
                     "Memory limit must be between " + std::to_string(limits.min_memory_mb) + " and "
                     + std::to_string(limits.max_memory_mb) + " MB"};
    }
    return Result<void>{};
}

}  // namespace sandbox_engine
