/**
 * @file http_codec.hpp
 * @brief Minimal HTTP/1.1 request encoder and incremental response parser.
 * @author Dimitris Kafetzis
 *
 * Covers what a local daemon API needs: Content-Length, chunked and
 * read-until-close bodies, and connection upgrades (101) after which the
 * body is an unframed byte stream.
 */

#pragma once

#include "core/result.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sandbox_engine {

struct HttpRequest {
    std::string method = "GET";
    std::string target = "/";
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /// Serialize with Host, Content-Length and Connection headers added.
    [[nodiscard]] std::string encode() const;
};

/// Percent-encode a query or path component.
[[nodiscard]] std::string url_encode(std::string_view text);

/**
 * @brief Push-style response parser. Feed bytes as they arrive.
 *
 * Decoded body bytes accumulate until drained with take_body(), so a
 * streaming caller sees each chunk once.
 */
class HttpResponseParser {
public:
    static constexpr size_t MAX_HEADER_BYTES = 64 * 1024;

    enum class State : uint8_t { StatusLine, Headers, Body, Complete };

    Result<void> feed(std::string_view data);

    /// Connection closed by the peer: completes read-until-close bodies.
    Result<void> finish();

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] bool headers_complete() const noexcept {
        return state_ == State::Body || state_ == State::Complete;
    }
    [[nodiscard]] bool complete() const noexcept { return state_ == State::Complete; }

    [[nodiscard]] int status() const noexcept { return status_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

    /// Case-insensitive header lookup.
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;

    /// True once a 101 response switched the connection to a raw stream.
    [[nodiscard]] bool upgraded() const noexcept { return status_ == 101; }

    [[nodiscard]] const std::string& body() const noexcept { return body_; }
    [[nodiscard]] std::string take_body();

private:
    enum class Framing : uint8_t { None, ContentLength, Chunked, UntilClose };
    enum class ChunkState : uint8_t { Size, Data, DataEnd, Trailer };

    Result<void> parse_status_line(std::string_view line);
    Result<void> parse_header_line(std::string_view line);
    void select_framing();

    /// One parsing step. Returns false when more input is needed.
    Result<bool> step();
    Result<bool> step_chunked();

    State state_ = State::StatusLine;
    Framing framing_ = Framing::None;
    ChunkState chunk_state_ = ChunkState::Size;

    int status_ = 0;
    std::string reason_;
    std::map<std::string, std::string> headers_;   ///< Keys lowercased
    size_t header_bytes_ = 0;

    std::string pending_;
    std::string body_;
    size_t remaining_ = 0;   ///< Content-Length or current chunk bytes left
};

}  // namespace sandbox_engine
