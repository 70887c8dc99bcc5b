/**
 * @file orchestrator.hpp
 * @brief Top-level Orchestrator facade: owns execution lifecycle and the registry.
 * @author Dimitris Kafetzis
 *
 * Provides a single entry point for:
 *   1. Submitting code (validated, slot-gated, dispatched to a backend)
 *   2. Querying, listing, cancelling and evicting executions
 *   3. Subscribing to lifecycle events
 *
 * Backends are injected through Options for testability; when left empty
 * the V8 backend and the Docker-backed container backend are created.
 */

#pragma once

#include "catalog/language_profile.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/worker_pool.hpp"
#include "governor/concurrency_governor.hpp"
#include "orchestrator/event_channel.hpp"
#include "orchestrator/execution_registry.hpp"
#include "sandbox/backend.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <vector>

namespace sandbox_engine {

class Orchestrator {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;                   ///< null: stdout
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ILogSink> metrics_sink;               ///< null: discarded
        std::unique_ptr<ISandboxBackend> in_process_backend;  ///< null: V8Backend
        std::unique_ptr<ISandboxBackend> container_backend;   ///< null: ContainerBackend over Docker
        const LanguageCatalog* catalog = nullptr;             ///< null: LanguageCatalog::instance()
    };

    explicit Orchestrator(Options opts);
    ~Orchestrator();

    // Non-copyable, non-movable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ── Lifecycle ────────────────────────────

    /// Start the periodic eviction sweep. Fails once stop() has run.
    Result<void> start();

    /// Refuse new work, signal every running execution and drain the workers. Final.
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Executions ───────────────────────────

    /**
     * @brief Validate, reserve a slot, create a Running record and dispatch.
     *
     * Fails with ValidationFailed, UnsupportedLanguage or CapacityExceeded
     * without creating a record.
     */
    Result<ExecutionId> submit(ExecutionOptions options);

    [[nodiscard]] Result<Execution> get_result(const ExecutionId& id) const;
    [[nodiscard]] Result<ExecutionMetrics> get_metrics(const ExecutionId& id) const;

    /// Running -> Cancelled and signal the backend. No-op once terminal.
    Result<void> cancel(const ExecutionId& id);

    /// Newest first.
    [[nodiscard]] std::vector<Execution> list_executions() const;

    /// Drop terminal records that ended more than `max_age` ago.
    size_t evict_expired(Millis max_age);

    /// Block until the execution is terminal or `timeout` elapses; returns the latest record.
    [[nodiscard]] Result<Execution> wait(const ExecutionId& id, Millis timeout) const;

    [[nodiscard]] ExecutionStats stats() const;
    [[nodiscard]] const std::vector<LanguageProfile>& supported_languages() const noexcept;

    // ── Events ───────────────────────────────

    [[nodiscard]] EventChannel::Subscription subscribe(EventChannel::Handler handler);
    bool unsubscribe(EventChannel::SubscriptionId id);

    // ── Accessors (for testing) ──────────────
    Logger& logger() { return logger_; }
    const Config& config() const { return config_; }
    MetricsCollector& metrics() { return metrics_; }

private:
    [[nodiscard]] ExecutionLimits limits_for(const ExecutionOptions& options) const;
    ISandboxBackend& backend_for(const LanguageProfile& profile);

    void dispatch(const BackendRequest& request, ConcurrencyGovernor::Slot& slot);
    void finalize(const ExecutionId& id, BackendOutcome outcome, ConcurrencyGovernor::Slot& slot);
    void signal_waiters();
    void sweep_loop(std::stop_token stop);

    Config config_;
    Logger logger_;
    MetricsCollector metrics_;
    const LanguageCatalog& catalog_;

    ConcurrencyGovernor governor_;
    ExecutionRegistry registry_;
    EventChannel events_;

    std::unique_ptr<ISandboxBackend> in_process_;
    std::unique_ptr<ISandboxBackend> container_;

    std::mutex stop_mutex_;
    std::unordered_map<ExecutionId, std::stop_source> stop_sources_;

    mutable std::mutex wait_mutex_;
    mutable std::condition_variable wait_cv_;

    std::atomic<bool> running_{false};
    std::atomic<bool> accepting_{true};
    std::atomic<bool> stopped_{false};  ///< Workers are gone for good

    std::mutex sweep_mutex_;
    std::condition_variable_any sweep_cv_;
    std::jthread sweeper_;

    // Last: workers are joined before anything they use is destroyed
    WorkerPool pool_;
};

}  // namespace sandbox_engine
