/**
 * @file v8_backend.hpp
 * @brief In-process JavaScript backend on a fresh V8 isolate per execution.
 * @author Dimitris Kafetzis
 *
 * The isolate is created with a heap ceiling, gets a context whose only
 * capability is `console`, and is disposed before run() returns. Hung code
 * is interrupted with TerminateExecution() from a DeadlineTimer that also
 * watches the cancellation token.
 */

#pragma once

#include "core/logger.hpp"
#include "sandbox/backend.hpp"

namespace sandbox_engine {

class V8Backend : public ISandboxBackend {
public:
    explicit V8Backend(Logger& logger);

    BackendOutcome run(const BackendRequest& request) override;

    [[nodiscard]] IsolationBackend kind() const noexcept override { return IsolationBackend::InProcess; }
    [[nodiscard]] std::string_view name() const noexcept override { return "v8"; }

    /// Process-wide V8 platform setup. Idempotent and thread-safe.
    static void initialize();

    /// The engine version string, e.g. "11.3.244.8-node.16".
    [[nodiscard]] static std::string engine_version();

private:
    Logger& logger_;
};

}  // namespace sandbox_engine
