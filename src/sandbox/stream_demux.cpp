/**
 * @file stream_demux.cpp
 * @brief StreamDemuxer implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/stream_demux.hpp"

namespace sandbox_engine {

namespace {

uint32_t decode_u32(const uint8_t* buf) {
    return (static_cast<uint32_t>(buf[0]) << 24)
         | (static_cast<uint32_t>(buf[1]) << 16)
         | (static_cast<uint32_t>(buf[2]) << 8)
         | static_cast<uint32_t>(buf[3]);
}

}  // anonymous namespace

Result<void> StreamDemuxer::feed(std::string_view data, std::vector<StreamFrame>& frames) {
    pending_.append(data);

    size_t offset = 0;
    while (pending_.size() - offset >= HEADER_SIZE) {
        const auto* header = reinterpret_cast<const uint8_t*>(pending_.data() + offset);
        if (header[0] > 2 || header[1] != 0 || header[2] != 0 || header[3] != 0) {
            return Error{"Malformed stream frame header"};
        }

        uint32_t size = decode_u32(header + 4);
        if (size > MAX_FRAME_SIZE) {
            return Error{"Stream frame too large: " + std::to_string(size) + " bytes"};
        }
        if (pending_.size() - offset - HEADER_SIZE < size) break;

        StreamFrame frame;
        frame.channel = static_cast<StreamChannel>(header[0]);
        frame.payload.assign(pending_, offset + HEADER_SIZE, size);
        frames.push_back(std::move(frame));
        offset += HEADER_SIZE + size;
    }

    pending_.erase(0, offset);
    return Result<void>{};
}

}  // namespace sandbox_engine
