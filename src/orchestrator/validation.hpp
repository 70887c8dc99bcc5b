/**
 * @file validation.hpp
 * @brief Submission checks applied before any slot or record is taken.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

namespace sandbox_engine {

/**
 * @brief Reject malformed submissions with ValidationFailed.
 *
 * Code must be non-empty and within `max_code_bytes`; an explicit timeout
 * or memory limit must lie within the configured bounds.
 */
Result<void> validate_submission(const ExecutionOptions& options, const LimitsConfig& limits);

}  // namespace sandbox_engine
