#include "ioreactor/tcp-acceptor.hpp"

#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <system_error>
#include <utility>

#include "ioreactor/base-fd.hpp"
#include "ioreactor/descriptor.hpp"
#include "ioreactor/event-loop.hpp"
#include "ioreactor/handler.hpp"
#include "ioreactor/log.hpp"
#include "ioreactor/platform.hpp"
#include "ioreactor/socket-ops.hpp"
#include "ioreactor/socket.hpp"
#include "ioreactor/timer-queue.hpp"

namespace ioreactor {

namespace {

Descriptor CreateListenDescriptor(bool reusePort, bool tcpNoDelay, uint16_t& port) {
  Socket listenSocket(Socket::Type::StreamNonBlock);
  listenSocket.bindAndListen(reusePort, tcpNoDelay, port);
  return Descriptor(listenSocket.release(), Descriptor::Kind::Socket, Descriptor::Interest::Read);
}

}  // namespace

TcpAcceptor::TcpAcceptor(EventLoop& loop, uint16_t port, AcceptCallback onAccept, bool reusePort, bool tcpNoDelay)
    : _loop(loop),
      _onAccept(std::move(onAccept)),
      _port(port),
      _tcpNoDelay(tcpNoDelay),
      _listenDesc(CreateListenDescriptor(reusePort, tcpNoDelay, _port)) {
  Handler handler;
  handler.onReadable = [this](Descriptor&) { acceptNewConnections(); };
  handler.onError = [this](Descriptor&, std::error_code ec) {
    log::error("Listening socket on port {} failed: {}", _port, ec.message());
  };
  loop.add(_listenDesc, std::move(handler));
  log::info("Accepting TCP connections on port {}", _port);
}

TcpAcceptor::~TcpAcceptor() { _loop.cancel(_resumeTimerId); }

void TcpAcceptor::close() noexcept {
  _loop.cancel(std::exchange(_resumeTimerId, kInvalidTimerId));
  _listenDesc.close();
}

void TcpAcceptor::pauseAccepting() {
  log::warn("Pausing accept on port {} for {} ms", _port,
            std::chrono::duration_cast<std::chrono::milliseconds>(_acceptBackoff).count());
  _listenDesc.setInterest(Descriptor::Interest::None);
  _resumeTimerId = _loop.callAfter(_acceptBackoff, [this] {
    _resumeTimerId = kInvalidTimerId;
    if (_listenDesc.isOpen()) {
      log::debug("Resuming accept on port {}", _port);
      _listenDesc.setInterest(Descriptor::Interest::Read);
    }
  });
}

void TcpAcceptor::acceptNewConnections() {
  while (_listenDesc.isOpen()) {
    sockaddr_storage peerAddr{};
    socklen_t peerAddrLen = sizeof(peerAddr);
    BaseFd cnxFd(::accept4(_listenDesc.fd(), reinterpret_cast<sockaddr*>(&peerAddr), &peerAddrLen,
                           SOCK_NONBLOCK | SOCK_CLOEXEC));
    if (!cnxFd) {
      const int err = errno;
      if (err == EINTR) {
        continue;
      }
      if (err == EAGAIN || err == EWOULDBLOCK) {
        // no more waiting connections
        break;
      }
      if (err == ECONNABORTED) {
        // The peer gave up before we accepted: not a failure of the listening socket.
        log::debug("Connection aborted before accept on port {}", _port);
        continue;
      }
      log::error("Connection accept failed on port {}: errno={}, msg={}", _port, err, SystemErrorMessage(err));
      if (err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM) {
        // The connection stays in the backlog, so the socket stays readable until resources are freed.
        pauseAccepting();
      }
      break;
    }
    if (_tcpNoDelay && !SetTcpNoDelay(cnxFd.fd())) {
      const int err = errno;
      log::error("setsockopt(TCP_NODELAY) failed for fd # {} err={} ({})", cnxFd.fd(), err, SystemErrorMessage(err));
    }
    ++_nbAccepted;
    log::debug("Connection fd # {} accepted from {}", cnxFd.fd(), FormatAddress(peerAddr));
    _onAccept(Descriptor(std::move(cnxFd), Descriptor::Kind::Socket, Descriptor::Interest::Read), peerAddr);
  }
}

}  // namespace ioreactor
