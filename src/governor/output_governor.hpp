/**
 * @file output_governor.hpp
 * @brief Byte-capped accumulator for captured program output.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace sandbox_engine {

/**
 * @brief Accumulates output up to a fixed ceiling.
 *
 * The captured text never exceeds the ceiling: a chunk that crosses it is
 * truncated at the boundary and the governor latches into the exceeded
 * state. Owned by a single backend call; not thread-safe.
 */
class OutputGovernor {
public:
    explicit OutputGovernor(size_t ceiling_bytes);

    /**
     * @brief Append a chunk.
     * @return The portion actually accepted (empty once exceeded).
     */
    std::string_view append(std::string_view chunk);

    [[nodiscard]] bool exceeded() const noexcept { return exceeded_; }
    [[nodiscard]] size_t size() const noexcept { return buffer_.size(); }
    [[nodiscard]] size_t ceiling() const noexcept { return ceiling_; }
    [[nodiscard]] size_t remaining() const noexcept { return ceiling_ - buffer_.size(); }
    [[nodiscard]] const std::string& text() const noexcept { return buffer_; }

    /// Move the captured text out, leaving the governor empty.
    [[nodiscard]] std::string take();

private:
    size_t ceiling_;
    std::string buffer_;
    bool exceeded_ = false;
};

}  // namespace sandbox_engine
