/**
 * @file output_governor.cpp
 * @brief OutputGovernor implementation.
 * @author Dimitris Kafetzis
 */

#include "governor/output_governor.hpp"

#include <algorithm>

namespace sandbox_engine {

OutputGovernor::OutputGovernor(size_t ceiling_bytes) : ceiling_(ceiling_bytes) {}

std::string_view OutputGovernor::append(std::string_view chunk) {
    if (exceeded_ || chunk.empty()) return {};

    size_t accepted = std::min(chunk.size(), remaining());
    size_t offset = buffer_.size();
    buffer_.append(chunk.data(), accepted);

    if (accepted < chunk.size()) {
        exceeded_ = true;
    }
    return std::string_view(buffer_).substr(offset, accepted);
}

std::string OutputGovernor::take() {
    std::string out = std::move(buffer_);
    buffer_.clear();
    return out;
}

}  // namespace sandbox_engine
