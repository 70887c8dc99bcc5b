/**
 * @file result_json.cpp
 * @brief Result and submission JSON codec.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/result_json.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sandbox_engine {

namespace {

Result<std::optional<uint32_t>> optional_uint(const Json::Value& request, const char* key) {
    if (!request.isMember(key) || request[key].isNull()) return std::optional<uint32_t>{};
    const auto& value = request[key];
    if (!value.isUInt()) {
        return Error{ErrorCode::ValidationFailed, std::string(key) + " must be a non-negative integer"};
    }
    return std::optional<uint32_t>(static_cast<uint32_t>(value.asUInt()));
}

}  // anonymous namespace

std::string format_timestamp(Timestamp ts) {
    auto time_t_ts = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_ts, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

Json::Value to_json(const Execution& execution) {
    Json::Value out(Json::objectValue);
    out["id"] = execution.id;
    out["status"] = std::string(to_string(execution.status));
    out["output"] = execution.output;
    if (execution.error) out["error"] = *execution.error;
    if (execution.failure) out["failure"] = std::string(to_string(*execution.failure));
    out["exitCode"] = execution.exit_code;
    out["runtimeMs"] = Json::Value(static_cast<Json::Int64>(execution.runtime.count()));
    out["memoryUsedBytes"] = Json::Value(static_cast<Json::UInt64>(execution.memory_used_bytes));
    out["language"] = std::string(to_string(execution.language));
    out["timestamp"] = format_timestamp(execution.timestamp);
    return out;
}

Json::Value to_json(const ExecutionStats& stats) {
    Json::Value out(Json::objectValue);
    out["total"] = Json::Value(static_cast<Json::UInt64>(stats.total));
    out["running"] = Json::Value(static_cast<Json::UInt64>(stats.running));
    out["completed"] = Json::Value(static_cast<Json::UInt64>(stats.completed));
    out["failed"] = Json::Value(static_cast<Json::UInt64>(stats.failed));
    out["timedOut"] = Json::Value(static_cast<Json::UInt64>(stats.timed_out));
    out["cancelled"] = Json::Value(static_cast<Json::UInt64>(stats.cancelled));
    out["avgRuntimeMs"] = stats.avg_runtime_ms;
    out["activeExecutions"] = Json::Value(static_cast<Json::UInt64>(stats.active));
    out["maxConcurrent"] = Json::Value(static_cast<Json::UInt64>(stats.max_concurrent));
    return out;
}

Json::Value to_json(const std::vector<LanguageProfile>& profiles) {
    Json::Value out(Json::arrayValue);
    for (const auto& profile : profiles) {
        Json::Value entry(Json::objectValue);
        entry["language"] = std::string(to_string(profile.language));
        entry["backend"] = std::string(to_string(profile.backend));
        if (!profile.image.empty()) entry["image"] = profile.image;
        entry["fileName"] = profile.naming.file_name;
        if (profile.requires_transpile) entry["requiresTranspile"] = true;
        out.append(entry);
    }
    return out;
}

Result<ExecutionOptions> options_from_json(const Json::Value& request) {
    if (!request.isObject()) {
        return Error{ErrorCode::ValidationFailed, "Request must be a JSON object"};
    }
    if (!request["code"].isString()) {
        return Error{ErrorCode::ValidationFailed, "code must be a string"};
    }
    if (!request["language"].isString()) {
        return Error{ErrorCode::ValidationFailed, "language must be a string"};
    }

    auto language = parse_language(request["language"].asString());
    if (!language) return language.error();

    auto timeout = optional_uint(request, "timeout");
    if (!timeout) return timeout.error();
    auto memory = optional_uint(request, "memoryLimitMb");
    if (!memory) return memory.error();

    ExecutionOptions options;
    options.code = request["code"].asString();
    options.language = *language;
    options.timeout_ms = *timeout;
    options.memory_limit_mb = *memory;
    if (request.isMember("input") && !request["input"].isNull()) {
        if (!request["input"].isString()) {
            return Error{ErrorCode::ValidationFailed, "input must be a string"};
        }
        options.input = request["input"].asString();
    }
    return options;
}

}  // namespace sandbox_engine
