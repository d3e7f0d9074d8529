#pragma once

#include <sys/socket.h>  // sockaddr_storage

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

#include "ioreactor/descriptor.hpp"
#include "ioreactor/event-loop.hpp"
#include "ioreactor/platform.hpp"
#include "ioreactor/timedef.hpp"
#include "ioreactor/timer-queue.hpp"

namespace ioreactor {

// Listening TCP socket (IPv4, all interfaces) registered in an event loop, accepting connections as they
// arrive and handing each of them over as an open, non-blocking Descriptor of kind Socket.
// When the process runs out of descriptors (EMFILE, ENFILE) or of kernel memory (ENOBUFS, ENOMEM), the
// pending connections stay in the backlog and the listening socket keeps being readable: accepting is then
// paused for acceptBackoff() instead of being retried at each cycle.
class TcpAcceptor {
 public:
  static constexpr SteadyDuration kDefaultAcceptBackoff = std::chrono::milliseconds(100);

  // Called once per accepted connection, with the peer address. The callee takes ownership of the
  // Descriptor (typically by moving it into its own state and registering it).
  using AcceptCallback = std::function<void(Descriptor, const sockaddr_storage&)>;

  // Binds and listens on 'port' (0 picks an ephemeral port, see port()) and registers the listening socket
  // in 'loop', which must outlive this object.
  // Throws std::system_error if the socket cannot be created, bound or registered.
  TcpAcceptor(EventLoop& loop, uint16_t port, AcceptCallback onAccept, bool reusePort = false,
              bool tcpNoDelay = false);

  TcpAcceptor(const TcpAcceptor&) = delete;
  TcpAcceptor(TcpAcceptor&&) = delete;
  TcpAcceptor& operator=(const TcpAcceptor&) = delete;
  TcpAcceptor& operator=(TcpAcceptor&&) = delete;

  ~TcpAcceptor();

  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  [[nodiscard]] NativeHandle fd() const noexcept { return _listenDesc.fd(); }

  [[nodiscard]] std::size_t nbAccepted() const noexcept { return _nbAccepted; }

  [[nodiscard]] SteadyDuration acceptBackoff() const noexcept { return _acceptBackoff; }

  void setAcceptBackoff(SteadyDuration backoff) noexcept { _acceptBackoff = backoff; }

  // True while accepting is paused after a resource exhaustion.
  [[nodiscard]] bool isPaused() const noexcept { return _resumeTimerId != kInvalidTimerId; }

  // Unregisters and closes the listening socket. Connections already handed over are not affected.
  void close() noexcept;

 private:
  void acceptNewConnections();

  void pauseAccepting();

  EventLoop& _loop;
  AcceptCallback _onAccept;
  std::size_t _nbAccepted{};
  SteadyDuration _acceptBackoff{kDefaultAcceptBackoff};
  TimerId _resumeTimerId{kInvalidTimerId};
  uint16_t _port;
  bool _tcpNoDelay;
  Descriptor _listenDesc;
};

}  // namespace ioreactor
