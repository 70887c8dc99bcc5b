/**
 * @file http_codec.cpp
 * @brief HttpRequest encoding and HttpResponseParser implementation.
 * @author Dimitris Kafetzis
 */

#include "network/http_codec.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace sandbox_engine {

namespace {

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
    return text;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Request
// ─────────────────────────────────────────────

std::string HttpRequest::encode() const {
    std::string out;
    out.reserve(256 + body.size());
    out += method;
    out += ' ';
    out += target;
    out += " HTTP/1.1\r\n";

    bool has_host = false;
    bool has_connection = false;
    for (const auto& [name, value] : headers) {
        auto lower = to_lower(name);
        if (lower == "host") has_host = true;
        if (lower == "connection") has_connection = true;
        out += name;
        out += ": ";
        out += value;
        out += "\r\n";
    }
    if (!has_host) out += "Host: localhost\r\n";
    if (!has_connection) out += "Connection: close\r\n";
    if (!body.empty() || method == "POST" || method == "PUT") {
        out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    }
    out += "\r\n";
    out += body;
    return out;
}

std::string url_encode(std::string_view text) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

// ─────────────────────────────────────────────
// Response Parser
// ─────────────────────────────────────────────

Result<void> HttpResponseParser::feed(std::string_view data) {
    pending_.append(data);
    for (;;) {
        auto progressed = step();
        if (!progressed) return progressed.error();
        if (!*progressed) return Result<void>{};
    }
}

Result<void> HttpResponseParser::finish() {
    if (state_ == State::Complete) return Result<void>{};
    if (state_ == State::Body && framing_ == Framing::UntilClose) {
        state_ = State::Complete;
        return Result<void>{};
    }
    return Error{"Connection closed before the response was complete"};
}

std::optional<std::string> HttpResponseParser::header(std::string_view name) const {
    auto it = headers_.find(to_lower(name));
    if (it == headers_.end()) return std::nullopt;
    return it->second;
}

std::string HttpResponseParser::take_body() {
    std::string out = std::move(body_);
    body_.clear();
    return out;
}

Result<bool> HttpResponseParser::step() {
    switch (state_) {
        case State::StatusLine:
        case State::Headers: {
            auto eol = pending_.find("\r\n");
            if (eol == std::string::npos) {
                if (header_bytes_ + pending_.size() > MAX_HEADER_BYTES) {
                    return Error{"Response header too large"};
                }
                return false;
            }
            std::string line = pending_.substr(0, eol);
            pending_.erase(0, eol + 2);
            header_bytes_ += eol + 2;
            if (header_bytes_ > MAX_HEADER_BYTES) {
                return Error{"Response header too large"};
            }

            if (state_ == State::StatusLine) {
                auto parsed = parse_status_line(line);
                if (!parsed) return parsed.error();
                state_ = State::Headers;
            } else if (line.empty()) {
                select_framing();
                state_ = framing_ == Framing::None ? State::Complete : State::Body;
            } else {
                auto parsed = parse_header_line(line);
                if (!parsed) return parsed.error();
            }
            return true;
        }

        case State::Body:
            switch (framing_) {
                case Framing::ContentLength: {
                    if (pending_.empty()) return false;
                    size_t n = std::min(remaining_, pending_.size());
                    body_.append(pending_, 0, n);
                    pending_.erase(0, n);
                    remaining_ -= n;
                    if (remaining_ == 0) state_ = State::Complete;
                    return true;
                }
                case Framing::UntilClose:
                    body_.append(pending_);
                    pending_.clear();
                    return false;
                case Framing::Chunked:
                    return step_chunked();
                case Framing::None:
                    state_ = State::Complete;
                    return true;
            }
            return false;

        case State::Complete:
            return false;
    }
    return false;
}

Result<bool> HttpResponseParser::step_chunked() {
    switch (chunk_state_) {
        case ChunkState::Size: {
            auto eol = pending_.find("\r\n");
            if (eol == std::string::npos) return false;
            std::string_view line(pending_.data(), eol);
            if (auto semi = line.find(';'); semi != std::string_view::npos) {
                line = line.substr(0, semi);
            }
            line = trim(line);

            size_t size = 0;
            auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), size, 16);
            if (ec != std::errc{} || ptr != line.data() + line.size()) {
                return Error{"Malformed chunk size"};
            }
            pending_.erase(0, eol + 2);

            if (size == 0) {
                chunk_state_ = ChunkState::Trailer;
            } else {
                remaining_ = size;
                chunk_state_ = ChunkState::Data;
            }
            return true;
        }
        case ChunkState::Data: {
            if (pending_.empty()) return false;
            size_t n = std::min(remaining_, pending_.size());
            body_.append(pending_, 0, n);
            pending_.erase(0, n);
            remaining_ -= n;
            if (remaining_ == 0) chunk_state_ = ChunkState::DataEnd;
            return true;
        }
        case ChunkState::DataEnd: {
            if (pending_.size() < 2) return false;
            if (pending_.compare(0, 2, "\r\n") != 0) {
                return Error{"Missing CRLF after chunk data"};
            }
            pending_.erase(0, 2);
            chunk_state_ = ChunkState::Size;
            return true;
        }
        case ChunkState::Trailer: {
            auto eol = pending_.find("\r\n");
            if (eol == std::string::npos) return false;
            pending_.erase(0, eol + 2);
            if (eol == 0) state_ = State::Complete;
            return true;
        }
    }
    return false;
}

Result<void> HttpResponseParser::parse_status_line(std::string_view line) {
    // HTTP/1.1 200 OK
    if (line.substr(0, 5) != "HTTP/") {
        return Error{"Malformed status line"};
    }
    auto sp = line.find(' ');
    if (sp == std::string_view::npos || line.size() < sp + 4) {
        return Error{"Malformed status line"};
    }
    auto code = line.substr(sp + 1, 3);
    int value = 0;
    auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), value);
    if (ec != std::errc{} || ptr != code.data() + code.size()) {
        return Error{"Malformed status code"};
    }
    status_ = value;
    reason_ = line.size() > sp + 5 ? std::string(trim(line.substr(sp + 5))) : std::string{};
    return Result<void>{};
}

Result<void> HttpResponseParser::parse_header_line(std::string_view line) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return Error{"Malformed header line"};
    }
    headers_[to_lower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
    return Result<void>{};
}

void HttpResponseParser::select_framing() {
    if (status_ == 101) {
        framing_ = Framing::UntilClose;
        return;
    }
    if (status_ == 204 || status_ == 304 || (status_ >= 100 && status_ < 200)) {
        framing_ = Framing::None;
        return;
    }

    if (auto te = header("transfer-encoding"); te && to_lower(*te).find("chunked") != std::string::npos) {
        framing_ = Framing::Chunked;
        chunk_state_ = ChunkState::Size;
        return;
    }
    if (auto cl = header("content-length")) {
        size_t length = 0;
        auto [ptr, ec] = std::from_chars(cl->data(), cl->data() + cl->size(), length);
        if (ec == std::errc{} && ptr == cl->data() + cl->size()) {
            remaining_ = length;
            framing_ = length == 0 ? Framing::None : Framing::ContentLength;
            return;
        }
    }
    framing_ = Framing::UntilClose;
}

}  // namespace sandbox_engine
