/**
 * @file test_orchestrator.cpp
 * @brief Orchestrator facade tests with scripted backends.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/orchestrator.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace sandbox_engine;
using namespace std::chrono_literals;

namespace {

/// Holds backends until the test releases them or the run is stopped.
struct Gate {
    std::mutex mutex;
    std::condition_variable cv;
    bool open = false;

    void release() {
        {
            std::lock_guard lock(mutex);
            open = true;
        }
        cv.notify_all();
    }

    /// true once released, false if the stop token fired first.
    bool wait(const std::stop_token& stop) {
        std::unique_lock lock(mutex);
        while (!open) {
            if (stop.stop_requested()) return false;
            cv.wait_for(lock, 1ms);
        }
        return true;
    }
};

class ScriptedBackend : public ISandboxBackend {
public:
    using Script = std::function<BackendOutcome(const BackendRequest&)>;

    explicit ScriptedBackend(IsolationBackend kind) : kind_(kind) {
        script = [](const BackendRequest&) { return BackendOutcome::completed(""); };
    }

    BackendOutcome run(const BackendRequest& request) override {
        ++runs;
        {
            std::lock_guard lock(mutex_);
            last_limits_ = request.limits;
        }
        return script(request);
    }

    [[nodiscard]] IsolationBackend kind() const noexcept override { return kind_; }
    [[nodiscard]] std::string_view name() const noexcept override { return "scripted"; }

    ExecutionLimits last_limits() const {
        std::lock_guard lock(mutex_);
        return last_limits_;
    }

    Script script;
    std::atomic<int> runs{0};

private:
    IsolationBackend kind_;
    mutable std::mutex mutex_;
    ExecutionLimits last_limits_;
};

BackendOutcome run_until_released(Gate& gate, const BackendRequest& request) {
    if (!gate.wait(request.stop)) {
        return BackendOutcome::failed(ErrorCode::Cancelled, "Execution cancelled", "partial output");
    }
    return BackendOutcome::completed("released\n");
}

ExecutionOptions js(std::string code = "console.log('hi')") {
    ExecutionOptions o;
    o.code = std::move(code);
    o.language = Language::JavaScript;
    return o;
}

ExecutionOptions python(std::string code = "print('hi')") {
    ExecutionOptions o;
    o.code = std::move(code);
    o.language = Language::Python;
    return o;
}

}  // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    ScriptedBackend* in_process_ = nullptr;
    ScriptedBackend* container_ = nullptr;
    std::unique_ptr<Orchestrator> orch_;
    Gate gate_;

    void TearDown() override {
        gate_.release();
        orch_.reset();
    }

    void build(Config config = default_config(), const LanguageCatalog* catalog = nullptr) {
        auto in = std::make_unique<ScriptedBackend>(IsolationBackend::InProcess);
        auto container = std::make_unique<ScriptedBackend>(IsolationBackend::Container);
        in_process_ = in.get();
        container_ = container.get();

        Orchestrator::Options opts;
        opts.config = std::move(config);
        opts.log_sink = std::make_unique<NullSink>();
        opts.in_process_backend = std::move(in);
        opts.container_backend = std::move(container);
        opts.catalog = catalog;
        orch_ = std::make_unique<Orchestrator>(std::move(opts));
    }

    void block_backends() {
        auto blocking = [this](const BackendRequest& r) { return run_until_released(gate_, r); };
        in_process_->script = blocking;
        container_->script = blocking;
    }

    Execution finished(const ExecutionId& id) {
        auto r = orch_->wait(id, 5s);
        EXPECT_TRUE(r) << id;
        if (!r) return Execution{};
        EXPECT_TRUE(is_terminal(r->status)) << id;
        return *r;
    }

    bool slots_drained(Millis within = 5s) {
        auto deadline = std::chrono::steady_clock::now() + within;
        while (orch_->stats().active > 0) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(1ms);
        }
        return true;
    }
};

// ═══════════════════════════════════════════════
// Submission and routing
// ═══════════════════════════════════════════════

TEST_F(OrchestratorTest, InProcessLanguageCompletes) {
    build();
    in_process_->script = [](const BackendRequest& r) {
        if (r.on_output) r.on_output("hello\n");
        return BackendOutcome::completed("hello\n", 0, 2048);
    };

    auto id = orch_->submit(js());
    ASSERT_TRUE(id) << id.error().message;
    EXPECT_EQ(id->rfind("javascript_", 0), 0u);

    auto e = finished(*id);
    EXPECT_EQ(e.status, ExecutionStatus::Completed);
    EXPECT_EQ(e.output, "hello\n");
    EXPECT_EQ(e.exit_code, 0);
    EXPECT_EQ(e.memory_used_bytes, 2048u);
    EXPECT_EQ(e.language, Language::JavaScript);
    EXPECT_EQ(in_process_->runs.load(), 1);
    EXPECT_EQ(container_->runs.load(), 0);

    auto m = orch_->get_metrics(*id);
    ASSERT_TRUE(m);
    EXPECT_TRUE(m->end_time.has_value());
    EXPECT_EQ(m->output_bytes, 6u);
    EXPECT_EQ(orch_->stats().active, 0u);
}

TEST_F(OrchestratorTest, ContainerLanguageRoutesToContainerBackend) {
    build();
    auto id = orch_->submit(python());
    ASSERT_TRUE(id);
    EXPECT_EQ(finished(*id).status, ExecutionStatus::Completed);
    EXPECT_EQ(container_->runs.load(), 1);
    EXPECT_EQ(in_process_->runs.load(), 0);
}

TEST_F(OrchestratorTest, LimitsDefaultFromConfig) {
    auto config = default_config();
    config.engine.default_timeout_ms = 1234;
    config.engine.default_memory_limit_mb = 64;
    config.engine.max_output_kb = 8;
    build(config);

    ASSERT_TRUE(orch_->submit(js()).has_value());
    ASSERT_TRUE(slots_drained());
    auto defaults = in_process_->last_limits();
    EXPECT_EQ(defaults.timeout, 1234ms);
    EXPECT_EQ(defaults.memory_limit_bytes, 64ull * 1024 * 1024);
    EXPECT_EQ(defaults.max_output_bytes, 8u * 1024);

    auto explicit_limits = js();
    explicit_limits.timeout_ms = 50;
    explicit_limits.memory_limit_mb = 32;
    ASSERT_TRUE(orch_->submit(explicit_limits).has_value());
    ASSERT_TRUE(slots_drained());
    EXPECT_EQ(in_process_->last_limits().timeout, 50ms);
    EXPECT_EQ(in_process_->last_limits().memory_limit_bytes, 32ull * 1024 * 1024);
}

TEST_F(OrchestratorTest, BackendFailureStatuses) {
    build();
    container_->script = [](const BackendRequest& r) {
        if (r.options.code == "timeout") {
            return BackendOutcome::failed(ErrorCode::Timeout, "Execution timed out after 10ms");
        }
        return BackendOutcome::failed(ErrorCode::RuntimeError, "Process exited with code 2", "trace", 2);
    };

    auto t = orch_->submit(python("timeout"));
    auto r = orch_->submit(python("raise SystemExit(2)"));
    ASSERT_TRUE(t);
    ASSERT_TRUE(r);

    auto timed_out = finished(*t);
    EXPECT_EQ(timed_out.status, ExecutionStatus::Timeout);
    EXPECT_EQ(timed_out.exit_code, -1);

    auto failed = finished(*r);
    EXPECT_EQ(failed.status, ExecutionStatus::Error);
    EXPECT_EQ(failed.failure, ErrorCode::RuntimeError);
    EXPECT_EQ(failed.exit_code, 2);
    EXPECT_EQ(failed.output, "trace");
}

TEST_F(OrchestratorTest, BackendExceptionBecomesInternalError) {
    build();
    in_process_->script = [](const BackendRequest&) -> BackendOutcome {
        throw std::runtime_error("isolate exploded");
    };

    auto id = orch_->submit(js());
    ASSERT_TRUE(id);
    auto e = finished(*id);
    EXPECT_EQ(e.status, ExecutionStatus::Error);
    EXPECT_EQ(e.failure, ErrorCode::Internal);
    ASSERT_TRUE(e.error.has_value());
    EXPECT_NE(e.error->find("isolate exploded"), std::string::npos);
    EXPECT_TRUE(slots_drained());
}

TEST_F(OrchestratorTest, NonStandardThrowBecomesInternalError) {
    build();
    in_process_->script = [](const BackendRequest&) -> BackendOutcome { throw 42; };

    auto id = orch_->submit(js());
    ASSERT_TRUE(id);
    auto e = finished(*id);
    EXPECT_EQ(e.status, ExecutionStatus::Error);
    EXPECT_EQ(e.failure, ErrorCode::Internal);
    EXPECT_TRUE(slots_drained());
}

// ═══════════════════════════════════════════════
// Timeouts
// ═══════════════════════════════════════════════

namespace {

BackendOutcome sleep_past_timeout(const BackendRequest& r) {
    std::this_thread::sleep_for(r.limits.timeout + 5ms);
    return BackendOutcome::failed(ErrorCode::Timeout, "Execution timed out");
}

}  // namespace

TEST_F(OrchestratorTest, TimeoutRuntimeCoversTheLimit) {
    build();
    in_process_->script = sleep_past_timeout;

    auto options = js("while (true) {}");
    options.timeout_ms = 20;
    auto id = orch_->submit(options);
    ASSERT_TRUE(id);

    auto e = finished(*id);
    EXPECT_EQ(e.status, ExecutionStatus::Timeout);
    EXPECT_EQ(e.exit_code, -1);
    EXPECT_GE(e.runtime, 20ms);
}

TEST_F(OrchestratorTest, RepeatedTimeoutsReleaseEverySlot) {
    auto config = default_config();
    config.engine.max_concurrent = 2;
    build(config);
    in_process_->script = sleep_past_timeout;

    for (int i = 0; i < 6; ++i) {
        auto options = js("while (true) {} // " + std::to_string(i));
        options.timeout_ms = 10;
        auto id = orch_->submit(options);
        ASSERT_TRUE(id) << "round " << i << ": " << id.error().message;
        EXPECT_EQ(finished(*id).status, ExecutionStatus::Timeout);
        ASSERT_TRUE(slots_drained());
    }

    EXPECT_EQ(orch_->stats().active, 0u);
    EXPECT_EQ(orch_->stats().timed_out, 6u);

    in_process_->script = [](const BackendRequest&) { return BackendOutcome::completed("ok\n"); };
    auto next = orch_->submit(js());
    ASSERT_TRUE(next);
    EXPECT_EQ(finished(*next).status, ExecutionStatus::Completed);
}

// ═══════════════════════════════════════════════
// Rejections create no record
// ═══════════════════════════════════════════════

TEST_F(OrchestratorTest, ValidationFailureCreatesNoRecord) {
    build();
    auto id = orch_->submit(js(""));
    ASSERT_FALSE(id);
    EXPECT_EQ(id.error().code, ErrorCode::ValidationFailed);

    auto too_slow = js();
    too_slow.timeout_ms = 10'000'000;
    EXPECT_EQ(orch_->submit(too_slow).error().code, ErrorCode::ValidationFailed);

    EXPECT_TRUE(orch_->list_executions().empty());
    EXPECT_EQ(orch_->stats().active, 0u);
}

TEST_F(OrchestratorTest, LanguageWithoutProfileRejected) {
    LanguageCatalog js_only({LanguageProfile{.language = Language::JavaScript,
                                             .backend = IsolationBackend::InProcess}});
    build(default_config(), &js_only);

    auto id = orch_->submit(python());
    ASSERT_FALSE(id);
    EXPECT_EQ(id.error().code, ErrorCode::UnsupportedLanguage);
    EXPECT_TRUE(orch_->list_executions().empty());
    EXPECT_EQ(orch_->supported_languages().size(), 1u);
}

TEST_F(OrchestratorTest, CapacityExceededCreatesNoRecord) {
    auto config = default_config();
    config.engine.max_concurrent = 2;
    build(config);
    block_backends();

    auto a = orch_->submit(js("a"));
    auto b = orch_->submit(python("b"));
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(orch_->stats().active, 2u);

    auto c = orch_->submit(js("c"));
    ASSERT_FALSE(c);
    EXPECT_EQ(c.error().code, ErrorCode::CapacityExceeded);
    EXPECT_EQ(c.error().message, "Maximum concurrent executions (2) reached. Please try again later.");
    EXPECT_EQ(orch_->list_executions().size(), 2u);

    gate_.release();
    EXPECT_EQ(finished(*a).status, ExecutionStatus::Completed);
    EXPECT_EQ(finished(*b).status, ExecutionStatus::Completed);

    // Slots are free again by the time the records are terminal
    EXPECT_EQ(orch_->stats().active, 0u);
    EXPECT_TRUE(orch_->submit(js("c")).has_value());
}

TEST_F(OrchestratorTest, IdenticalSubmissionsGetDistinctIds) {
    build();
    block_backends();
    std::set<ExecutionId> ids;
    for (int i = 0; i < 5; ++i) {
        auto id = orch_->submit(js("same code"));
        ASSERT_TRUE(id);
        ids.insert(*id);
    }
    EXPECT_EQ(ids.size(), 5u);
}

// ═══════════════════════════════════════════════
// Cancellation
// ═══════════════════════════════════════════════

TEST_F(OrchestratorTest, CancelRunningExecution) {
    build();
    block_backends();

    auto id = orch_->submit(python());
    ASSERT_TRUE(id);
    ASSERT_TRUE(orch_->cancel(*id));

    // Visible immediately, before the backend has unwound
    auto now = orch_->get_result(*id);
    ASSERT_TRUE(now);
    EXPECT_EQ(now->status, ExecutionStatus::Cancelled);
    EXPECT_EQ(now->exit_code, -1);

    auto e = finished(*id);
    EXPECT_EQ(e.status, ExecutionStatus::Cancelled);
    EXPECT_TRUE(slots_drained());

    // The late outcome may attach the partial output, never a new status
    auto after = orch_->get_result(*id);
    ASSERT_TRUE(after);
    EXPECT_EQ(after->status, ExecutionStatus::Cancelled);
    EXPECT_EQ(after->output, "partial output");
}

TEST_F(OrchestratorTest, CancelIsIdempotentAndNoOpWhenTerminal) {
    build();
    auto done = orch_->submit(js());
    ASSERT_TRUE(done);
    EXPECT_EQ(finished(*done).status, ExecutionStatus::Completed);

    EXPECT_TRUE(orch_->cancel(*done));
    EXPECT_EQ(orch_->get_result(*done)->status, ExecutionStatus::Completed);

    block_backends();
    auto running = orch_->submit(js("other"));
    ASSERT_TRUE(running);
    EXPECT_TRUE(orch_->cancel(*running));
    EXPECT_TRUE(orch_->cancel(*running));
    EXPECT_EQ(orch_->get_result(*running)->status, ExecutionStatus::Cancelled);
}

TEST_F(OrchestratorTest, UnknownIdsAreNotFound) {
    build();
    EXPECT_EQ(orch_->get_result("nope").error().code, ErrorCode::NotFound);
    EXPECT_EQ(orch_->get_metrics("nope").error().code, ErrorCode::NotFound);
    EXPECT_EQ(orch_->cancel("nope").error().code, ErrorCode::NotFound);
    EXPECT_EQ(orch_->wait("nope", 10ms).error().code, ErrorCode::NotFound);
}

TEST_F(OrchestratorTest, WaitTimesOutWithRunningRecord) {
    build();
    block_backends();
    auto id = orch_->submit(js());
    ASSERT_TRUE(id);

    auto r = orch_->wait(*id, 30ms);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->status, ExecutionStatus::Running);
}

// ═══════════════════════════════════════════════
// Listing, stats and eviction
// ═══════════════════════════════════════════════

TEST_F(OrchestratorTest, ListIsNewestFirst) {
    build();
    std::vector<ExecutionId> submitted;
    for (const char* code : {"first", "second", "third"}) {
        auto id = orch_->submit(js(code));
        ASSERT_TRUE(id);
        submitted.push_back(*id);
        std::this_thread::sleep_for(3ms);
    }

    auto list = orch_->list_executions();
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].id, submitted[2]);
    EXPECT_EQ(list[1].id, submitted[1]);
    EXPECT_EQ(list[2].id, submitted[0]);
}

TEST_F(OrchestratorTest, StatsReflectOutcomes) {
    build();
    in_process_->script = [](const BackendRequest& r) {
        return r.options.code == "bad" ? BackendOutcome::failed(ErrorCode::RuntimeError, "boom", "", 1)
                                       : BackendOutcome::completed("ok");
    };
    finished(*orch_->submit(js("good")));
    finished(*orch_->submit(js("bad")));

    auto s = orch_->stats();
    EXPECT_EQ(s.total, 2u);
    EXPECT_EQ(s.completed, 1u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_EQ(s.running, 0u);
    EXPECT_EQ(s.max_concurrent, 5u);
}

TEST_F(OrchestratorTest, EvictExpiredKeepsRunningRecords) {
    build();
    auto done = orch_->submit(js("done"));
    ASSERT_TRUE(done);
    finished(*done);

    block_backends();
    auto running = orch_->submit(js("running"));
    ASSERT_TRUE(running);

    std::this_thread::sleep_for(5ms);
    EXPECT_EQ(orch_->evict_expired(1h), 0u);
    EXPECT_EQ(orch_->evict_expired(1ms), 1u);
    EXPECT_EQ(orch_->get_result(*done).error().code, ErrorCode::NotFound);
    EXPECT_TRUE(orch_->get_result(*running).has_value());
}

TEST_F(OrchestratorTest, PeriodicSweepEvicts) {
    auto config = default_config();
    config.engine.record_ttl_ms = 1;
    config.engine.sweep_interval_ms = 10;
    build(config);
    ASSERT_TRUE(orch_->start());
    EXPECT_TRUE(orch_->is_running());

    auto id = orch_->submit(js());
    ASSERT_TRUE(id);
    finished(*id);

    bool evicted = false;
    for (int i = 0; i < 500 && !evicted; ++i) {
        std::this_thread::sleep_for(2ms);
        evicted = !orch_->get_result(*id).has_value();
    }
    EXPECT_TRUE(evicted);
    orch_->stop();
    EXPECT_FALSE(orch_->is_running());
}

// ═══════════════════════════════════════════════
// Events and lifecycle
// ═══════════════════════════════════════════════

TEST_F(OrchestratorTest, EventsFollowTheLifecycle) {
    build();
    in_process_->script = [](const BackendRequest& r) {
        r.on_output("a");
        r.on_output("b");
        return BackendOutcome::completed("ab");
    };

    std::mutex mutex;
    std::vector<ExecutionEvent> events;
    auto sub = orch_->subscribe([&](const ExecutionEvent& e) {
        std::lock_guard lock(mutex);
        events.push_back(e);
    });

    auto id = orch_->submit(js());
    ASSERT_TRUE(id);
    finished(*id);

    // Completed is published after the record turns terminal
    for (int i = 0; i < 500; ++i) {
        {
            std::lock_guard lock(mutex);
            if (events.size() >= 4) break;
        }
        std::this_thread::sleep_for(1ms);
    }

    std::lock_guard lock(mutex);
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].type, ExecutionEvent::Type::Started);
    EXPECT_EQ(events[1].type, ExecutionEvent::Type::OutputChunk);
    EXPECT_EQ(events[1].chunk, "a");
    EXPECT_EQ(events[2].chunk, "b");
    EXPECT_EQ(events[3].type, ExecutionEvent::Type::Completed);
    ASSERT_TRUE(events[3].snapshot.has_value());
    EXPECT_EQ(events[3].snapshot->status, ExecutionStatus::Completed);
    for (const auto& e : events) EXPECT_EQ(e.id, *id);
}

TEST_F(OrchestratorTest, CancelPublishesCancelledEvent) {
    build();
    block_backends();
    std::atomic<int> cancelled{0};
    auto sub = orch_->subscribe([&](const ExecutionEvent& e) {
        if (e.type == ExecutionEvent::Type::Cancelled) ++cancelled;
    });

    auto id = orch_->submit(js());
    ASSERT_TRUE(id);
    ASSERT_TRUE(orch_->cancel(*id));
    ASSERT_TRUE(orch_->cancel(*id));
    EXPECT_EQ(cancelled.load(), 1);

    EXPECT_TRUE(orch_->unsubscribe(sub.id()));
}

TEST_F(OrchestratorTest, StopSignalsInFlightAndRefusesNewWork) {
    build();
    block_backends();
    ASSERT_TRUE(orch_->start());
    EXPECT_FALSE(orch_->start());

    auto id = orch_->submit(python());
    ASSERT_TRUE(id);

    orch_->stop();
    auto e = orch_->get_result(*id);
    ASSERT_TRUE(e);
    EXPECT_EQ(e->status, ExecutionStatus::Cancelled);
    EXPECT_EQ(orch_->stats().active, 0u);

    auto refused = orch_->submit(js());
    ASSERT_FALSE(refused);
}

TEST_F(OrchestratorTest, RestartAfterStopIsRejected) {
    build();
    ASSERT_TRUE(orch_->start());
    orch_->stop();

    auto restarted = orch_->start();
    ASSERT_FALSE(restarted);
    EXPECT_EQ(restarted.error().code, ErrorCode::Internal);
    EXPECT_FALSE(orch_->submit(js()));
    EXPECT_EQ(in_process_->runs.load(), 0);
}
