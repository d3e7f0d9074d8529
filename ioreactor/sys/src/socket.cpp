#include "ioreactor/socket.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>

#include "ioreactor/base-fd.hpp"
#include "ioreactor/errno-throw.hpp"
#include "ioreactor/log.hpp"
#include "ioreactor/socket-ops.hpp"

namespace ioreactor {

namespace {

int ToNativeType(Socket::Type type) noexcept {
  switch (type) {
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC;
    default:
      return SOCK_STREAM | SOCK_CLOEXEC;
  }
}

}  // namespace

Socket::Socket(Type type, int protocol) : _baseFd(::socket(AF_INET, ToNativeType(type), protocol)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

bool Socket::tryBind(bool reusePort, bool tcpNoDelay, uint16_t port) const {
  static constexpr int kEnable = 1;
  if (::setsockopt(fd(), SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) < 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }
  if (reusePort && ::setsockopt(fd(), SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) < 0) {
    throw_errno("setsockopt(SO_REUSEPORT) failed");
  }
  if (tcpNoDelay && !SetTcpNoDelay(fd())) {
    throw_errno("setsockopt(TCP_NODELAY) failed");
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);
  if (::bind(fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    const int err = errno;
    log::warn("bind of fd # {} on port {} failed: errno={}, msg={}", fd(), port, err, SystemErrorMessage(err));
    return false;
  }
  return true;
}

void Socket::bindAndListen(bool reusePort, bool tcpNoDelay, uint16_t& port) {
  if (!tryBind(reusePort, tcpNoDelay, port)) {
    throw_errno("bind failed on port {}", port);
  }
  if (::listen(fd(), SOMAXCONN) != 0) {
    throw_errno("listen failed on fd # {}", fd());
  }
  if (port == 0) {
    sockaddr_storage addr{};
    if (!GetLocalAddress(fd(), addr)) {
      throw_errno("getsockname failed on fd # {}", fd());
    }
    port = GetPort(addr);
  }
  log::debug("Socket fd # {} listening on port {}", fd(), port);
}

}  // namespace ioreactor
