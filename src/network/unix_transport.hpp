/**
 * @file unix_transport.hpp
 * @brief Stream connection over an AF_UNIX socket with poll()-based timeouts.
 * @author Dimitris Kafetzis
 *
 * Used to talk to the container daemon's local API socket. One connection
 * carries one request; long-lived streams (attach, wait) each get their own.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace sandbox_engine {

class UnixConnection {
public:
    static constexpr size_t READ_CHUNK = 64 * 1024;

    enum class ReadStatus : uint8_t {
        Data,       ///< Bytes were appended
        Eof,        ///< Peer closed the stream
        TimedOut    ///< Nothing arrived within the wait
    };

    UnixConnection() = default;
    ~UnixConnection();

    UnixConnection(UnixConnection&& other) noexcept;
    UnixConnection& operator=(UnixConnection&& other) noexcept;
    UnixConnection(const UnixConnection&) = delete;
    UnixConnection& operator=(const UnixConnection&) = delete;

    Result<void> connect(const std::string& socket_path, uint32_t timeout_ms = 5000);

    /// Write every byte or fail.
    Result<void> send_all(std::string_view data, uint32_t timeout_ms = 5000);

    /// Append whatever is available (at most READ_CHUNK) to `out`.
    Result<ReadStatus> read_some(std::string& out, uint32_t timeout_ms);

    void close() noexcept;

    [[nodiscard]] bool is_connected() const noexcept { return fd_ >= 0; }

private:
    int fd_ = -1;
};

}  // namespace sandbox_engine
