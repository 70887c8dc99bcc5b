/**
 * @file orchestrator.cpp
 * @brief Orchestrator implementation.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/orchestrator.hpp"

#include "orchestrator/execution_id.hpp"
#include "orchestrator/validation.hpp"
#include "sandbox/container_backend.hpp"
#include "sandbox/docker_client.hpp"
#include "sandbox/v8_backend.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <exception>

namespace sandbox_engine {

namespace {

constexpr uint32_t kMaxIdAttempts = 16;

std::unique_ptr<ILogSink> or_default(std::unique_ptr<ILogSink> sink, bool discard) {
    if (sink) return sink;
    if (discard) return std::make_unique<NullSink>();
    return std::make_unique<StdoutSink>();
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

Orchestrator::Orchestrator(Options opts)
    : config_(std::move(opts.config))
    , logger_(or_default(std::move(opts.log_sink), false), opts.log_level, "orchestrator")
    , metrics_(or_default(std::move(opts.metrics_sink), true))
    , catalog_(opts.catalog ? *opts.catalog : LanguageCatalog::instance())
    , governor_(config_.engine.max_concurrent)
    , events_(&logger_)
    , in_process_(std::move(opts.in_process_backend))
    , container_(std::move(opts.container_backend))
    , pool_(config_.engine.max_concurrent) {
    if (!in_process_) {
        in_process_ = std::make_unique<V8Backend>(logger_);
    }
    if (!container_) {
        DockerClient::Options docker;
        docker.socket_path = config_.container.socket_path;
        docker.api_version = config_.container.api_version;
        container_ = std::make_unique<ContainerBackend>(
            std::make_unique<DockerClient>(std::move(docker), &logger_),
            ContainerBackend::options_from(config_.container), logger_);
    }
}

Orchestrator::~Orchestrator() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> Orchestrator::start() {
    if (stopped_) {
        return Error{ErrorCode::Internal, "Orchestrator cannot be restarted after stop()"};
    }
    if (running_.exchange(true)) {
        return Error{"Already running"};
    }

    sweeper_ = std::jthread([this](std::stop_token stop) { sweep_loop(stop); });
    logger_.info("Orchestrator started: max_concurrent=" + std::to_string(governor_.bound())
                 + " workers=" + std::to_string(pool_.thread_count())
                 + " sweep_interval_ms=" + std::to_string(config_.engine.sweep_interval_ms));
    return Result<void>{};
}

void Orchestrator::stop() {
    accepting_ = false;
    stopped_ = true;

    {
        std::lock_guard lock(stop_mutex_);
        for (auto& [id, source] : stop_sources_) source.request_stop();
    }

    if (sweeper_.joinable()) {
        sweeper_.request_stop();
        sweeper_.join();
    }
    pool_.shutdown();

    if (running_.exchange(false)) {
        logger_.info("Orchestrator stopped");
    }
    metrics_.flush();
    logger_.flush();
}

void Orchestrator::sweep_loop(std::stop_token stop) {
    const Millis interval(config_.engine.sweep_interval_ms);
    const Millis ttl(config_.engine.record_ttl_ms);

    std::unique_lock lock(sweep_mutex_);
    while (!stop.stop_requested()) {
        if (sweep_cv_.wait_for(lock, stop, interval, [] { return false; })) break;
        if (stop.stop_requested()) break;

        lock.unlock();
        evict_expired(ttl);
        lock.lock();
    }
}

// ─────────────────────────────────────────────
// Executions
// ─────────────────────────────────────────────

Result<ExecutionId> Orchestrator::submit(ExecutionOptions options) {
    if (!accepting_) {
        return Error{ErrorCode::Internal, "Engine is shutting down"};
    }
    if (auto valid = validate_submission(options, config_.limits); !valid) {
        return valid.error();
    }
    auto profile = catalog_.lookup(options.language);
    if (!profile) return profile.error();

    auto slot = std::make_shared<ConcurrencyGovernor::Slot>(governor_.acquire_slot());
    if (!slot->held()) {
        return Error{ErrorCode::CapacityExceeded,
                     "Maximum concurrent executions (" + std::to_string(governor_.bound())
                     + ") reached. Please try again later."};
    }

    const auto submitted = std::chrono::system_clock::now();
    const auto started = std::chrono::steady_clock::now();

    ExecutionId id;
    for (uint32_t nonce = 0;; ++nonce) {
        if (nonce == kMaxIdAttempts) {
            return Error{ErrorCode::Internal, "Could not allocate a unique execution id"};
        }
        id = make_execution_id(options.language, options.code, submitted, nonce);

        Execution record;
        record.id = id;
        record.status = ExecutionStatus::Running;
        record.language = options.language;
        record.timestamp = submitted;

        ExecutionMetrics metrics;
        metrics.id = id;
        metrics.start_time = started;

        if (registry_.insert(std::move(record), std::move(metrics))) break;
    }

    std::stop_source stop_source;
    {
        std::lock_guard lock(stop_mutex_);
        stop_sources_.emplace(id, stop_source);
    }

    BackendRequest request;
    request.id = id;
    request.profile = *profile;
    request.limits = limits_for(options);
    request.options = std::move(options);
    request.stop = stop_source.get_token();
    request.on_output = [this, id](std::string_view chunk) {
        registry_.append_output(id, chunk);
        events_.publish(ExecutionEvent{ExecutionEvent::Type::OutputChunk, id, std::string(chunk), std::nullopt});
    };

    logger_.info("Execution " + id + " started (" + std::to_string(governor_.active()) + "/"
                 + std::to_string(governor_.bound()) + " active, " + std::string(to_string(request.options.language))
                 + " via " + std::string(backend_for(**profile).name()) + ")");
    metrics_.record_started(id, request.options.language, governor_.active(), governor_.bound());
    events_.publish(ExecutionEvent{ExecutionEvent::Type::Started, id, {}, std::nullopt});

    bool posted = pool_.post([this, slot, request = std::move(request)]() {
        dispatch(request, *slot);
    });
    if (!posted) {
        finalize(id, BackendOutcome::failed(ErrorCode::Internal, "Engine is shutting down"), *slot);
    }
    return id;
}

Result<Execution> Orchestrator::get_result(const ExecutionId& id) const {
    auto record = registry_.get(id);
    if (!record) {
        return Error{ErrorCode::NotFound, "Execution not found: " + id};
    }
    return *record;
}

Result<ExecutionMetrics> Orchestrator::get_metrics(const ExecutionId& id) const {
    auto metrics = registry_.get_metrics(id);
    if (!metrics) {
        return Error{ErrorCode::NotFound, "Execution not found: " + id};
    }
    return *metrics;
}

Result<void> Orchestrator::cancel(const ExecutionId& id) {
    auto transitioned = registry_.mark_cancelled(id, std::chrono::steady_clock::now());
    if (!transitioned) return transitioned.error();
    if (!*transitioned) return Result<void>{};

    {
        std::lock_guard lock(stop_mutex_);
        if (auto it = stop_sources_.find(id); it != stop_sources_.end()) {
            it->second.request_stop();
        }
    }

    logger_.info("Execution " + id + " cancelled");
    metrics_.record_cancelled(id);
    events_.publish(ExecutionEvent{ExecutionEvent::Type::Cancelled, id, {}, registry_.get(id)});
    signal_waiters();
    return Result<void>{};
}

std::vector<Execution> Orchestrator::list_executions() const {
    return registry_.list();
}

size_t Orchestrator::evict_expired(Millis max_age) {
    size_t evicted = registry_.evict_older_than(max_age, std::chrono::steady_clock::now());
    if (evicted > 0) {
        logger_.info("Evicted " + std::to_string(evicted) + " expired executions");
        metrics_.record_evicted(evicted, registry_.size());
    }
    return evicted;
}

Result<Execution> Orchestrator::wait(const ExecutionId& id, Millis timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock lock(wait_mutex_);
    for (;;) {
        auto record = registry_.get(id);
        if (!record) {
            return Error{ErrorCode::NotFound, "Execution not found: " + id};
        }
        if (is_terminal(record->status)) return *record;
        if (wait_cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            auto latest = registry_.get(id);
            if (!latest) return Error{ErrorCode::NotFound, "Execution not found: " + id};
            return *latest;
        }
    }
}

ExecutionStats Orchestrator::stats() const {
    auto stats = registry_.stats();
    stats.active = governor_.active();
    stats.max_concurrent = governor_.bound();
    return stats;
}

const std::vector<LanguageProfile>& Orchestrator::supported_languages() const noexcept {
    return catalog_.profiles();
}

EventChannel::Subscription Orchestrator::subscribe(EventChannel::Handler handler) {
    return events_.subscribe(std::move(handler));
}

bool Orchestrator::unsubscribe(EventChannel::SubscriptionId id) {
    return events_.unsubscribe(id);
}

// ─────────────────────────────────────────────
// Dispatch
// ─────────────────────────────────────────────

ExecutionLimits Orchestrator::limits_for(const ExecutionOptions& options) const {
    ExecutionLimits limits;
    limits.timeout = Millis(options.timeout_ms.value_or(config_.engine.default_timeout_ms));
    limits.memory_limit_bytes =
        static_cast<uint64_t>(options.memory_limit_mb.value_or(config_.engine.default_memory_limit_mb))
        * 1024 * 1024;
    limits.max_output_bytes = config_.max_output_bytes();
    return limits;
}

ISandboxBackend& Orchestrator::backend_for(const LanguageProfile& profile) {
    switch (profile.backend) {
        case IsolationBackend::InProcess: return *in_process_;
        case IsolationBackend::Container: return *container_;
    }
    return *container_;
}

void Orchestrator::dispatch(const BackendRequest& request, ConcurrencyGovernor::Slot& slot) {
    BackendOutcome outcome;
    try {
        outcome = backend_for(*request.profile).run(request);
    } catch (const std::exception& e) {
        logger_.error("Backend failure for " + request.id + ": " + e.what());
        outcome = BackendOutcome::failed(ErrorCode::Internal, std::string("Backend failure: ") + e.what());
    } catch (...) {
        logger_.error("Backend failure for " + request.id + ": non-standard exception");
        outcome = BackendOutcome::failed(ErrorCode::Internal, "Backend failure: non-standard exception");
    }
    finalize(request.id, std::move(outcome), slot);
}

void Orchestrator::finalize(const ExecutionId& id, BackendOutcome outcome,
                            ConcurrencyGovernor::Slot& slot) {
    ExecutionRegistry::CompleteResult applied;
    {
        // Waiters never observe a terminal record whose slot is still held.
        std::lock_guard lock(wait_mutex_);
        applied = registry_.complete(id, outcome, std::chrono::steady_clock::now());
        slot.reset();
    }
    wait_cv_.notify_all();

    {
        std::lock_guard lock(stop_mutex_);
        stop_sources_.erase(id);
    }

    if (applied == ExecutionRegistry::CompleteResult::Applied) {
        auto record = registry_.get(id);
        auto metrics = registry_.get_metrics(id);
        if (record && metrics) {
            if (record->status == ExecutionStatus::Completed) {
                logger_.info("Execution " + id + " completed in " + std::to_string(record->runtime.count()) + "ms");
            } else {
                logger_.warn("Execution " + id + " finished with status " + std::string(to_string(record->status))
                             + (record->error ? ": " + *record->error : std::string{}));
            }
            metrics_.record_finished(*record, *metrics);
        }
        events_.publish(ExecutionEvent{ExecutionEvent::Type::Completed, id, {}, record});
    } else if (applied == ExecutionRegistry::CompleteResult::AlreadyTerminal) {
        logger_.debug("Execution " + id + " backend returned after cancellation");
    }
}

void Orchestrator::signal_waiters() {
    std::lock_guard lock(wait_mutex_);
    wait_cv_.notify_all();
}

}  // namespace sandbox_engine
