#pragma once

#include <sys/socket.h>  // sockaddr_storage

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "ioreactor/platform.hpp"

namespace ioreactor {

// Thin wrappers centralising the socket / fd system calls, so that higher-level modules
// (objects, main...) never need the platform networking headers for the common cases.

// Set a file descriptor to non-blocking mode.
// Returns true on success.
bool SetNonBlocking(NativeHandle fd) noexcept;

// Set the close-on-exec flag on a file descriptor.
// Returns true on success.
bool SetCloseOnExec(NativeHandle fd) noexcept;

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket.
// Returns true on success.
bool SetTcpNoDelay(NativeHandle fd) noexcept;

// Retrieve the pending socket error (SO_ERROR).
// Returns the error code (0 means no error, >0 is errno).
// On failure to query, returns the errno from getsockopt itself.
int GetSocketError(NativeHandle fd) noexcept;

// Returns true if fd refers to a socket.
bool IsSocket(NativeHandle fd) noexcept;

// Fill `addr` with the local address bound to `fd`.
// Returns true on success.
bool GetLocalAddress(NativeHandle fd, sockaddr_storage& addr) noexcept;

// Fill `addr` with the remote peer address of `fd`.
// Returns true on success.
bool GetPeerAddress(NativeHandle fd, sockaddr_storage& addr) noexcept;

// Port of an AF_INET / AF_INET6 address in host byte order, 0 for other families.
uint16_t GetPort(const sockaddr_storage& addr) noexcept;

// Human readable 'ip:port' ('[ip]:port' for IPv6) form of an address.
std::string FormatAddress(const sockaddr_storage& addr);

// Send data on a connected socket without raising SIGPIPE (MSG_NOSIGNAL on Linux).
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(NativeHandle fd, const void* data, std::size_t len) noexcept;

// Convenience overload accepting a string_view.
inline int64_t SafeSend(NativeHandle fd, std::string_view data) noexcept {
  return SafeSend(fd, data.data(), data.size());
}

// Shutdown the write half of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownWrite(NativeHandle fd) noexcept;

}  // namespace ioreactor
