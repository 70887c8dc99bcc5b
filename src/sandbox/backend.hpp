/**
 * @file backend.hpp
 * @brief ISandboxBackend: the seam between the orchestrator and an isolation strategy.
 * @author Dimitris Kafetzis
 *
 * A backend runs one execution to completion on the calling thread and
 * reports what happened. It never writes the registry; the orchestrator
 * is the sole writer of terminal status.
 */

#pragma once

#include "catalog/language_profile.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace sandbox_engine {

/// Effective limits for one run, after defaults are applied.
struct ExecutionLimits {
    Millis timeout{30000};
    uint64_t memory_limit_bytes = 512ull * 1024 * 1024;
    size_t max_output_bytes = 1024 * 1024;
};

/// Receives each accepted output chunk as it is captured.
using OutputCallback = std::function<void(std::string_view chunk)>;

struct BackendRequest {
    ExecutionId id;
    ExecutionOptions options;
    const LanguageProfile* profile = nullptr;
    ExecutionLimits limits;
    std::stop_token stop;          ///< Signalled by cancel()
    OutputCallback on_output;      ///< Optional
};

/**
 * @brief What a backend observed. `failure` is set for every non-Completed outcome.
 */
struct BackendOutcome {
    ExecutionStatus status = ExecutionStatus::Completed;
    std::optional<ErrorCode> failure;
    std::string output;
    std::optional<std::string> error;
    int exit_code = 0;
    uint64_t memory_used_bytes = 0;

    static BackendOutcome completed(std::string output, int exit_code = 0, uint64_t memory = 0);
    static BackendOutcome failed(ErrorCode code, std::string message,
                                 std::string partial_output = {}, int exit_code = -1,
                                 uint64_t memory = 0);
};

/// Terminal status an ErrorCode maps to: Timeout, Cancelled, or Error.
[[nodiscard]] constexpr ExecutionStatus status_for(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Timeout:   return ExecutionStatus::Timeout;
        case ErrorCode::Cancelled: return ExecutionStatus::Cancelled;
        default:                   return ExecutionStatus::Error;
    }
}

/**
 * @brief Abstract isolation strategy.
 */
class ISandboxBackend {
public:
    virtual ~ISandboxBackend() = default;

    /**
     * @brief Run the request to a terminal outcome.
     *
     * Must release every resource it acquired before returning, on every
     * path. Implementations report failures through the outcome and do
     * not throw for anything the submitted code can cause.
     */
    virtual BackendOutcome run(const BackendRequest& request) = 0;

    [[nodiscard]] virtual IsolationBackend kind() const noexcept = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace sandbox_engine
