/**
 * @file unix_transport.cpp
 * @brief UnixConnection implementation.
 * @author Dimitris Kafetzis
 */

#include "network/unix_transport.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace sandbox_engine {

UnixConnection::~UnixConnection() {
    close();
}

UnixConnection::UnixConnection(UnixConnection&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

UnixConnection& UnixConnection::operator=(UnixConnection&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Result<void> UnixConnection::connect(const std::string& socket_path, uint32_t timeout_ms) {
    if (fd_ >= 0) {
        return Error{"Already connected"};
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        return Error{ErrorCode::EnvironmentUnavailable, "Socket path too long: " + socket_path};
    }
    std::memcpy(addr.sun_path, socket_path.c_str(), socket_path.size() + 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        return Error{ErrorCode::EnvironmentUnavailable,
                     "Failed to create socket: " + std::string(strerror(errno))};
    }

    int ret = ::connect(fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    if (ret < 0 && errno != EINPROGRESS && errno != EAGAIN) {
        int err = errno;
        close();
        return Error{ErrorCode::EnvironmentUnavailable,
                     "Connect to " + socket_path + " failed: " + std::string(strerror(err))};
    }

    if (ret < 0) {
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLOUT;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready <= 0) {
            close();
            return Error{ErrorCode::EnvironmentUnavailable, "Connect to " + socket_path + " timed out"};
        }

        int err = 0;
        socklen_t len = sizeof(err);
        ::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len);
        if (err != 0) {
            close();
            return Error{ErrorCode::EnvironmentUnavailable,
                         "Connect to " + socket_path + " failed: " + std::string(strerror(err))};
        }
    }

    return Result<void>{};
}

Result<void> UnixConnection::send_all(std::string_view data, uint32_t timeout_ms) {
    if (fd_ < 0) {
        return Error{"Not connected"};
    }

    const char* ptr = data.data();
    size_t remaining = data.size();

    while (remaining > 0) {
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLOUT;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) return Error{"Send timed out"};

        auto sent = ::send(fd_, ptr, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return Error{"Send failed: " + std::string(strerror(errno))};
        }

        ptr += sent;
        remaining -= static_cast<size_t>(sent);
    }

    return Result<void>{};
}

Result<UnixConnection::ReadStatus> UnixConnection::read_some(std::string& out, uint32_t timeout_ms) {
    if (fd_ < 0) {
        return Error{"Not connected"};
    }

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;

    int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
    if (ready < 0) {
        if (errno == EINTR) return ReadStatus::TimedOut;
        return Error{"Poll failed: " + std::string(strerror(errno))};
    }
    if (ready == 0) return ReadStatus::TimedOut;

    char buf[READ_CHUNK];
    auto received = ::recv(fd_, buf, sizeof(buf), 0);
    if (received == 0) return ReadStatus::Eof;
    if (received < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return ReadStatus::TimedOut;
        if (errno == ECONNRESET) return ReadStatus::Eof;
        return Error{"Receive failed: " + std::string(strerror(errno))};
    }

    out.append(buf, static_cast<size_t>(received));
    return ReadStatus::Data;
}

void UnixConnection::close() noexcept {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace sandbox_engine
