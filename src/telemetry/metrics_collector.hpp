/**
 * @file metrics_collector.hpp
 * @brief Structured lifecycle events for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>

namespace sandbox_engine {

/**
 * @brief Emits one NDJSON event per execution lifecycle transition.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_started(const ExecutionId& id, Language language, size_t active, size_t bound);
    void record_finished(const Execution& execution, const ExecutionMetrics& metrics);
    void record_cancelled(const ExecutionId& id);
    void record_evicted(size_t count, size_t remaining);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace sandbox_engine
