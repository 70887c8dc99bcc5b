/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace sandbox_engine {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_started(const ExecutionId& id, Language language,
                                      size_t active, size_t bound) {
    std::ostringstream oss;
    oss << R"({"event":"execution_started")"
        << R"(,"id":")" << json_escape(id) << "\""
        << R"(,"language":")" << to_string(language) << "\""
        << R"(,"active":)" << active
        << R"(,"bound":)" << bound
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_finished(const Execution& execution,
                                       const ExecutionMetrics& metrics) {
    std::ostringstream oss;
    oss << R"({"event":"execution_finished")"
        << R"(,"id":")" << json_escape(execution.id) << "\""
        << R"(,"status":")" << to_string(execution.status) << "\"";
    if (execution.failure) {
        oss << R"(,"failure":")" << to_string(*execution.failure) << "\"";
    }
    oss << R"(,"exit_code":)" << execution.exit_code
        << R"(,"runtime_ms":)" << execution.runtime.count()
        << R"(,"memory_bytes":)" << metrics.memory_peak_bytes
        << R"(,"output_bytes":)" << metrics.output_bytes
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_cancelled(const ExecutionId& id) {
    std::ostringstream oss;
    oss << R"({"event":"execution_cancelled")"
        << R"(,"id":")" << json_escape(id) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_evicted(size_t count, size_t remaining) {
    std::ostringstream oss;
    oss << R"({"event":"executions_evicted")"
        << R"(,"count":)" << count
        << R"(,"remaining":)" << remaining
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace sandbox_engine
