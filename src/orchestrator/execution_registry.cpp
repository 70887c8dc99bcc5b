/**
 * @file execution_registry.cpp
 * @brief ExecutionRegistry implementation.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/execution_registry.hpp"

#include <algorithm>
#include <mutex>

namespace sandbox_engine {

namespace {

Millis elapsed(SteadyTime start, SteadyTime end) {
    return std::chrono::duration_cast<Millis>(end - start);
}

}  // anonymous namespace

bool ExecutionRegistry::insert(Execution execution, ExecutionMetrics metrics) {
    std::unique_lock lock(mutex_);
    if (entries_.count(execution.id) > 0) return false;

    auto id = execution.id;
    entries_.emplace(std::move(id), Entry{std::move(execution), std::move(metrics), next_sequence_++});
    return true;
}

std::optional<Execution> ExecutionRegistry::get(const ExecutionId& id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.execution;
}

std::optional<ExecutionMetrics> ExecutionRegistry::get_metrics(const ExecutionId& id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.metrics;
}

bool ExecutionRegistry::append_output(const ExecutionId& id, std::string_view chunk) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end() || is_terminal(it->second.execution.status)) return false;

    it->second.execution.output.append(chunk);
    it->second.metrics.output_bytes = it->second.execution.output.size();
    return true;
}

ExecutionRegistry::CompleteResult ExecutionRegistry::complete(const ExecutionId& id,
                                                              const BackendOutcome& outcome,
                                                              SteadyTime end) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return CompleteResult::NotFound;

    auto& exec = it->second.execution;
    auto& metrics = it->second.metrics;

    if (is_terminal(exec.status)) {
        if (outcome.output.size() > exec.output.size()) {
            exec.output = outcome.output;
            metrics.output_bytes = exec.output.size();
        }
        exec.memory_used_bytes = outcome.memory_used_bytes;
        metrics.memory_peak_bytes = outcome.memory_used_bytes;
        return CompleteResult::AlreadyTerminal;
    }

    exec.status = outcome.status;
    exec.failure = outcome.failure;
    exec.output = outcome.output;
    exec.error = outcome.error;
    exec.exit_code = outcome.exit_code;
    exec.memory_used_bytes = outcome.memory_used_bytes;
    exec.runtime = elapsed(metrics.start_time, end);

    metrics.end_time = end;
    metrics.memory_peak_bytes = outcome.memory_used_bytes;
    metrics.output_bytes = exec.output.size();
    return CompleteResult::Applied;
}

Result<bool> ExecutionRegistry::mark_cancelled(const ExecutionId& id, SteadyTime end) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return Error{ErrorCode::NotFound, "Execution not found: " + id};
    }

    auto& exec = it->second.execution;
    if (is_terminal(exec.status)) return false;

    exec.status = ExecutionStatus::Cancelled;
    exec.failure = ErrorCode::Cancelled;
    exec.error = "Execution cancelled";
    exec.exit_code = -1;
    exec.runtime = elapsed(it->second.metrics.start_time, end);
    it->second.metrics.end_time = end;
    return true;
}

size_t ExecutionRegistry::evict_older_than(Millis max_age, SteadyTime now) {
    std::unique_lock lock(mutex_);
    size_t evicted = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        const auto& entry = it->second;
        bool expired = is_terminal(entry.execution.status)
                    && entry.metrics.end_time
                    && now - *entry.metrics.end_time > max_age;
        if (expired) {
            it = entries_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    return evicted;
}

std::vector<Execution> ExecutionRegistry::list() const {
    std::vector<const Entry*> ordered;
    std::shared_lock lock(mutex_);
    ordered.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) ordered.push_back(&entry);

    std::sort(ordered.begin(), ordered.end(), [](const Entry* a, const Entry* b) {
        if (a->execution.timestamp != b->execution.timestamp) {
            return a->execution.timestamp > b->execution.timestamp;
        }
        return a->sequence > b->sequence;
    });

    std::vector<Execution> out;
    out.reserve(ordered.size());
    for (const auto* entry : ordered) out.push_back(entry->execution);
    return out;
}

ExecutionStats ExecutionRegistry::stats() const {
    std::shared_lock lock(mutex_);
    ExecutionStats stats;
    stats.total = entries_.size();

    double runtime_sum = 0.0;
    size_t finished = 0;
    for (const auto& [id, entry] : entries_) {
        switch (entry.execution.status) {
            case ExecutionStatus::Running:   ++stats.running; break;
            case ExecutionStatus::Completed: ++stats.completed; break;
            case ExecutionStatus::Error:     ++stats.failed; break;
            case ExecutionStatus::Timeout:   ++stats.timed_out; break;
            case ExecutionStatus::Cancelled: ++stats.cancelled; break;
        }
        if (is_terminal(entry.execution.status)) {
            runtime_sum += static_cast<double>(entry.execution.runtime.count());
            ++finished;
        }
    }
    stats.avg_runtime_ms = finished > 0 ? runtime_sum / static_cast<double>(finished) : 0.0;
    return stats;
}

size_t ExecutionRegistry::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

}  // namespace sandbox_engine
