/**
 * @file platform.hpp
 * @brief POSIX socket type definitions and includes.
 *
 * Unix-domain sockets only exist on POSIX targets, so unlike a portable
 * network layer there is no Winsock branch here.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include <errno.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>

namespace mmbind {
namespace net {

using SocketHandle = int;
constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

inline int getLastSocketError() { return errno; }
inline int closeSocket(SocketHandle s) { return ::close(s); }

/**
 * @brief Whether an errno value from recv/send means the socket timed out.
 */
inline bool isTimeoutError(int err) {
    return err == EAGAIN || err == EWOULDBLOCK;
}

}  // namespace net
}  // namespace mmbind
