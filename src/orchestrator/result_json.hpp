/**
 * @file result_json.hpp
 * @brief JSON shapes of submissions and results at the engine's edge.
 * @author Dimitris Kafetzis
 *
 * Submission: {code, language, timeout?, memoryLimitMb?, input?}
 * Result:     {id, status, output, error?, failure?, exitCode, runtimeMs,
 *              memoryUsedBytes, language, timestamp}
 */

#pragma once

#include "catalog/language_profile.hpp"
#include "core/json.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace sandbox_engine {

/// ISO-8601 UTC with milliseconds, e.g. "2024-01-31T12:00:00.123Z".
[[nodiscard]] std::string format_timestamp(Timestamp ts);

[[nodiscard]] Json::Value to_json(const Execution& execution);
[[nodiscard]] Json::Value to_json(const ExecutionStats& stats);
[[nodiscard]] Json::Value to_json(const std::vector<LanguageProfile>& profiles);

/// Decode a submission. Unknown languages are UnsupportedLanguage, shape errors ValidationFailed.
Result<ExecutionOptions> options_from_json(const Json::Value& request);

}  // namespace sandbox_engine
