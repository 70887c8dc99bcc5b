/**
 * @file execution_registry.hpp
 * @brief Lock-protected store of Execution records and their metrics.
 * @author Dimitris Kafetzis
 *
 * The only shared mutable state of the engine. Readers take a shared lock
 * and receive copies; every transition takes the exclusive lock, so status
 * changes are atomic with respect to observers. Terminal status is never
 * overwritten.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sandbox/backend.hpp"

#include <optional>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sandbox_engine {

class ExecutionRegistry {
public:
    enum class CompleteResult : uint8_t {
        Applied,          ///< Running -> terminal
        AlreadyTerminal,  ///< Status kept; late output/memory attached
        NotFound
    };

    /// Insert a Running record. Returns false if the id is taken.
    bool insert(Execution execution, ExecutionMetrics metrics);

    [[nodiscard]] std::optional<Execution> get(const ExecutionId& id) const;
    [[nodiscard]] std::optional<ExecutionMetrics> get_metrics(const ExecutionId& id) const;

    /// Append captured output to a Running record.
    bool append_output(const ExecutionId& id, std::string_view chunk);

    /// Apply a backend outcome.
    CompleteResult complete(const ExecutionId& id, const BackendOutcome& outcome, SteadyTime end);

    /**
     * @brief Running -> Cancelled.
     * @return true if this call transitioned the record, false if it was
     *         already terminal, NotFound if unknown.
     */
    Result<bool> mark_cancelled(const ExecutionId& id, SteadyTime end);

    /// Remove terminal records whose end time is older than `max_age`.
    size_t evict_older_than(Millis max_age, SteadyTime now);

    /// Newest first.
    [[nodiscard]] std::vector<Execution> list() const;

    /// Counters only; `active` and `max_concurrent` are left to the caller.
    [[nodiscard]] ExecutionStats stats() const;

    [[nodiscard]] size_t size() const;

private:
    struct Entry {
        Execution execution;
        ExecutionMetrics metrics;
        uint64_t sequence = 0;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<ExecutionId, Entry> entries_;
    uint64_t next_sequence_ = 0;
};

}  // namespace sandbox_engine
