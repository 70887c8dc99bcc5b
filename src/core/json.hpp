/**
 * @file json.hpp
 * @brief jsoncpp helpers returning Result instead of throwing.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"

#include <json/json.h>

#include <string>
#include <string_view>

namespace sandbox_engine {

/// Parse a JSON document; syntax errors become ValidationFailed.
[[nodiscard]] Result<Json::Value> parse_json(std::string_view text);

/// Compact single-line rendering.
[[nodiscard]] std::string write_json(const Json::Value& value);

/// Indented rendering for humans.
[[nodiscard]] std::string write_json_pretty(const Json::Value& value);

}  // namespace sandbox_engine
