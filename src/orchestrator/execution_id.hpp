/**
 * @file execution_id.hpp
 * @brief Execution id derivation: language prefix, submission time, content hash.
 * @author Dimitris Kafetzis
 *
 *   <language>_<unix-ms>_<first 8 hex of SHA-256(code + unix-ms [+ "#" nonce])>
 *
 * No central counter. The nonce only disambiguates identical code
 * submitted within the same millisecond.
 */

#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace sandbox_engine {

/// Lowercase hex SHA-256 digest.
[[nodiscard]] std::string sha256_hex(std::string_view data);

[[nodiscard]] ExecutionId make_execution_id(Language language, std::string_view code,
                                            Timestamp submitted, uint32_t nonce = 0);

}  // namespace sandbox_engine
