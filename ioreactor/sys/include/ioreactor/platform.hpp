#pragma once

// Type aliases and error helpers for ioreactor's system layer. Linux only (epoll and eventfd).
//
//   NativeHandle       – the OS handle type for files / sockets
//   kInvalidHandle     – sentinel value representing an invalid handle
//   LastSystemError()  – retrieve the last system error code
//   SystemErrorMessage – human-readable description for an error code

#ifndef __linux__
#error "Unsupported platform: ioreactor requires Linux"
#endif

#include <unistd.h>  // close

#include <cerrno>   // errno, EAGAIN, EINTR, …
#include <cstring>  // std::strerror

namespace ioreactor {

using NativeHandle = int;
inline constexpr NativeHandle kInvalidHandle = -1;

inline int LastSystemError() noexcept { return errno; }

// The returned pointer is valid at least until the next call from the same thread.
// Always log the numeric code alongside the message.
inline const char* SystemErrorMessage(int err) noexcept { return std::strerror(err); }

inline int CloseNativeHandle(NativeHandle fd) noexcept { return ::close(fd); }

// ---------------------------------------------------------------------------
// Error-code constants for socket / system operations.
// ---------------------------------------------------------------------------
namespace error {
inline constexpr int kWouldBlock = EAGAIN;
inline constexpr int kInterrupted = EINTR;
inline constexpr int kInProgress = EINPROGRESS;
inline constexpr int kAlready = EALREADY;
inline constexpr int kConnectionReset = ECONNRESET;
inline constexpr int kConnectionAborted = ECONNABORTED;
inline constexpr int kBrokenPipe = EPIPE;
inline constexpr int kTooManyFiles = EMFILE;
}  // namespace error

// True for error codes meaning "no progress possible now, retry on next readiness".
inline constexpr bool IsTransientError(int err) noexcept {
  return err == error::kWouldBlock || err == EWOULDBLOCK || err == error::kInterrupted;
}

}  // namespace ioreactor
