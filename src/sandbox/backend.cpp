/**
 * @file backend.cpp
 * @brief BackendOutcome factories.
 * @author Dimitris Kafetzis
 */

#include "sandbox/backend.hpp"

namespace sandbox_engine {

BackendOutcome BackendOutcome::completed(std::string output, int exit_code, uint64_t memory) {
    BackendOutcome outcome;
    outcome.status = ExecutionStatus::Completed;
    outcome.output = std::move(output);
    outcome.exit_code = exit_code;
    outcome.memory_used_bytes = memory;
    return outcome;
}

BackendOutcome BackendOutcome::failed(ErrorCode code, std::string message,
                                      std::string partial_output, int exit_code,
                                      uint64_t memory) {
    BackendOutcome outcome;
    outcome.status = status_for(code);
    outcome.failure = code;
    outcome.error = std::move(message);
    outcome.output = std::move(partial_output);
    outcome.exit_code = exit_code;
    outcome.memory_used_bytes = memory;
    return outcome;
}

}  // namespace sandbox_engine
