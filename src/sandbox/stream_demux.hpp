/**
 * @file stream_demux.hpp
 * @brief Splits the daemon's multiplexed attach stream into channel payloads.
 * @author Dimitris Kafetzis
 *
 * Wire format per frame:
 *   [1B stream: 0=stdin 1=stdout 2=stderr][3B zero][uint32_t big-endian size][payload]
 *
 * Frames may be split across reads at any byte; partial headers and
 * payloads are buffered until complete.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_engine {

enum class StreamChannel : uint8_t { Stdin = 0, Stdout = 1, Stderr = 2 };

struct StreamFrame {
    StreamChannel channel = StreamChannel::Stdout;
    std::string payload;
};

class StreamDemuxer {
public:
    static constexpr size_t HEADER_SIZE = 8;
    static constexpr uint32_t MAX_FRAME_SIZE = 16 * 1024 * 1024;

    /// Consume raw bytes; complete frames are appended to `frames`.
    Result<void> feed(std::string_view data, std::vector<StreamFrame>& frames);

    /// Bytes held back waiting for the rest of a frame.
    [[nodiscard]] size_t buffered() const noexcept { return pending_.size(); }

private:
    std::string pending_;
};

}  // namespace sandbox_engine
