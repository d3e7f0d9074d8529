#pragma once

#include <cstdint>

#include "ioreactor/base-fd.hpp"
#include "ioreactor/platform.hpp"

namespace ioreactor {

// Simple RAII class wrapping an IPv4 TCP socket file descriptor.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Construct a socket with the given type and protocol.
  // Throws std::system_error on failure.
  explicit Socket(Type type, int protocol = 0);

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Try to bind the socket to the given port on all interfaces with specified options.
  // Returns true on success, false on failure.
  // Throws std::system_error on setsockopt failure.
  [[nodiscard]] bool tryBind(bool reusePort, bool tcpNoDelay, uint16_t port) const;

  // Bind and start listening on the given port. If port is 0, an ephemeral port is chosen and updated in the argument.
  // Throws std::system_error on failure.
  void bindAndListen(bool reusePort, bool tcpNoDelay, uint16_t& port);

  // Transfers the ownership of the handle to the caller.
  [[nodiscard]] BaseFd release() noexcept { return BaseFd(_baseFd.release()); }

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace ioreactor
