/**
 * @file unix_socket.cpp
 * @brief Unix-domain stream socket implementation.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#include "mmbind/net/unix_socket.hpp"
#include "mmbind/utils/logger.hpp"

#include <cstring>

namespace mmbind {
namespace net {

UnixSocket::UnixSocket()
    : socket_(INVALID_SOCKET_HANDLE)
    , lastError_(0)
{
    socket_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        setLastError();
        LOG_ERROR("UnixSocket", "Failed to create socket: error {}", lastError_);
    }
}

UnixSocket::UnixSocket(SocketHandle handle)
    : socket_(handle)
    , lastError_(0)
{
}

UnixSocket::~UnixSocket() {
    close();
}

UnixSocket::UnixSocket(UnixSocket&& other) noexcept
    : socket_(other.socket_)
    , lastError_(other.lastError_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

UnixSocket& UnixSocket::operator=(UnixSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        lastError_ = other.lastError_;
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

bool UnixSocket::fillAddress(const std::string& path, struct sockaddr_un& addr) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;

    // sun_path must hold the path plus its terminator
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        lastError_ = ENAMETOOLONG;
        LOG_ERROR("UnixSocket", "Invalid socket path '{}'", path);
        return false;
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return true;
}

bool UnixSocket::connect(const std::string& path) {
    if (!isValid()) {
        return false;
    }

    struct sockaddr_un addr;
    if (!fillAddress(path, addr)) {
        return false;
    }

    if (::connect(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        setLastError();
        LOG_DEBUG("UnixSocket", "Failed to connect to {} - error {}", path, lastError_);
        return false;
    }

    LOG_DEBUG("UnixSocket", "Connected to {}", path);
    return true;
}

bool UnixSocket::setTimeout(std::chrono::milliseconds timeout) {
    if (!isValid()) {
        return false;
    }

    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    if (setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        setsockopt(socket_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        setLastError();
        LOG_ERROR("UnixSocket", "Failed to set timeout: error {}", lastError_);
        return false;
    }

    return true;
}

bool UnixSocket::bind(const std::string& path) {
    if (!isValid()) {
        return false;
    }

    struct sockaddr_un addr;
    if (!fillAddress(path, addr)) {
        return false;
    }

    ::unlink(path.c_str());

    if (::bind(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        setLastError();
        LOG_ERROR("UnixSocket", "Failed to bind to {} - error {}", path, lastError_);
        return false;
    }

    LOG_DEBUG("UnixSocket", "Bound to {}", path);
    return true;
}

bool UnixSocket::listen(int backlog) {
    if (!isValid()) {
        return false;
    }

    if (::listen(socket_, backlog) != 0) {
        setLastError();
        LOG_ERROR("UnixSocket", "Failed to listen: error {}", lastError_);
        return false;
    }

    return true;
}

UnixSocket UnixSocket::accept() {
    if (!isValid()) {
        return UnixSocket(INVALID_SOCKET_HANDLE);
    }

    SocketHandle peer = ::accept(socket_, nullptr, nullptr);
    if (peer == INVALID_SOCKET_HANDLE) {
        setLastError();
        LOG_DEBUG("UnixSocket", "accept failed: error {}", lastError_);
    }
    return UnixSocket(peer);
}

ssize_t UnixSocket::send(const void* data, size_t length) {
    if (!isValid()) {
        return -1;
    }

    // MSG_NOSIGNAL: a vanished peer must surface as EPIPE, not SIGPIPE
    ssize_t result = ::send(socket_, data, length, MSG_NOSIGNAL);
    if (result < 0) {
        setLastError();
        return -1;
    }

    return result;
}

ssize_t UnixSocket::receive(void* buffer, size_t bufferSize) {
    if (!isValid()) {
        return -1;
    }

    ssize_t result;
    do {
        result = ::recv(socket_, buffer, bufferSize, 0);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        setLastError();
        return -1;
    }

    return result;
}

bool UnixSocket::close() {
    bool ok = true;
    if (isValid()) {
        if (closeSocket(socket_) != 0) {
            setLastError();
            ok = false;
        }
        socket_ = INVALID_SOCKET_HANDLE;
    }
    return ok;
}

void UnixSocket::setLastError() {
    lastError_ = getLastSocketError();
}

}  // namespace net
}  // namespace mmbind
