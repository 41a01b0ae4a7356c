/**
 * @file unix_socket.hpp
 * @brief RAII Unix-domain stream socket.
 *
 * Thin wrapper over AF_UNIX/SOCK_STREAM sockets with send/receive
 * timeouts. Errors are reported through return values and
 * getLastError(); callers decide how to surface them.
 *
 * Usage:
 * @code
 * UnixSocket sock;
 * sock.setTimeout(std::chrono::seconds(60));
 * if (!sock.connect("/tmp/minimega/minimega")) { ... }
 *
 * sock.send(msg.data(), msg.size());
 * char buffer[4096];
 * ssize_t n = sock.receive(buffer, sizeof(buffer));  // 0 = peer closed
 * @endcode
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include "mmbind/net/export.hpp"
#include "mmbind/net/platform.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace mmbind {
namespace net {

/**
 * @class UnixSocket
 * @brief Owning handle for a Unix-domain stream socket.
 *
 * Client side: connect(). Server side (used by test stubs and tools):
 * bind(), listen(), accept().
 */
class MMBIND_NET_API UnixSocket {
public:
    /**
     * @brief Create an unconnected stream socket.
     */
    UnixSocket();

    /**
     * @brief Adopt an already open descriptor (e.g. from accept()).
     */
    explicit UnixSocket(SocketHandle handle);

    ~UnixSocket();

    // Non-copyable, but movable
    UnixSocket(const UnixSocket&) = delete;
    UnixSocket& operator=(const UnixSocket&) = delete;
    UnixSocket(UnixSocket&& other) noexcept;
    UnixSocket& operator=(UnixSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    SocketHandle handle() const { return socket_; }

    /**
     * @brief Connect to a listening socket at a filesystem path.
     * @return True on success.
     */
    bool connect(const std::string& path);

    /**
     * @brief Apply the same timeout to blocking sends and receives.
     *
     * A zero timeout means block forever.
     */
    bool setTimeout(std::chrono::milliseconds timeout);

    /**
     * @brief Bind to a filesystem path, unlinking a stale socket file first.
     */
    bool bind(const std::string& path);

    bool listen(int backlog = 1);

    /**
     * @brief Accept one connection.
     * @return The connected peer; invalid on error.
     */
    UnixSocket accept();

    /**
     * @brief Send bytes in a single call.
     * @return Number of bytes written, or -1 on error.
     */
    ssize_t send(const void* data, size_t length);

    /**
     * @brief Receive up to @p bufferSize bytes.
     * @return Bytes read, 0 when the peer closed, -1 on error or timeout
     *         (see getLastError() and isTimeoutError()).
     */
    ssize_t receive(void* buffer, size_t bufferSize);

    /**
     * @brief Close the socket.
     * @return False if the underlying close reported an error.
     */
    bool close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;

    void setLastError();
    bool fillAddress(const std::string& path, struct sockaddr_un& addr);
};

}  // namespace net
}  // namespace mmbind
