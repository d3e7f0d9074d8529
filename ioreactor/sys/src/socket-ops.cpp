#include "ioreactor/socket-ops.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/stat.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include <spdlog/fmt/fmt.h>

#include "ioreactor/platform.hpp"

namespace ioreactor {

bool SetNonBlocking(NativeHandle fd) noexcept {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags == -1) {
    return false;
  }
  return (flags & O_NONBLOCK) != 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

bool SetCloseOnExec(NativeHandle fd) noexcept {
  const int flags = ::fcntl(fd, F_GETFD, 0);
  if (flags == -1) {
    return false;
  }
  return (flags & FD_CLOEXEC) != 0 || ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) != -1;
}

bool SetTcpNoDelay(NativeHandle fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

int GetSocketError(NativeHandle fd) noexcept {
  int err = 0;
  socklen_t len = sizeof(err);
  // NOLINTNEXTLINE(misc-include-cleaner) sys/socket.h is the correct header for SOL_SOCKET and SO_ERROR
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == -1) {
    return LastSystemError();
  }
  return err;
}

bool IsSocket(NativeHandle fd) noexcept {
  struct stat st{};
  return ::fstat(fd, &st) == 0 && S_ISSOCK(st.st_mode);
}

bool GetLocalAddress(NativeHandle fd, sockaddr_storage& addr) noexcept {
  socklen_t len = sizeof(addr);
  return ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0;
}

bool GetPeerAddress(NativeHandle fd, sockaddr_storage& addr) noexcept {
  socklen_t len = sizeof(addr);
  return ::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0;
}

uint16_t GetPort(const sockaddr_storage& addr) noexcept {
  if (addr.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
  }
  return 0;
}

std::string FormatAddress(const sockaddr_storage& addr) {
  std::array<char, INET6_ADDRSTRLEN> buf{};
  if (addr.ss_family == AF_INET) {
    const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
    if (::inet_ntop(AF_INET, &in->sin_addr, buf.data(), buf.size()) != nullptr) {
      return fmt::format("{}:{}", buf.data(), GetPort(addr));
    }
  } else if (addr.ss_family == AF_INET6) {
    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
    if (::inet_ntop(AF_INET6, &in6->sin6_addr, buf.data(), buf.size()) != nullptr) {
      return fmt::format("[{}]:{}", buf.data(), GetPort(addr));
    }
  }
  return "<unknown>";
}

int64_t SafeSend(NativeHandle fd, const void* data, std::size_t len) noexcept {
  return static_cast<int64_t>(::send(fd, data, len, MSG_NOSIGNAL));
}

bool ShutdownWrite(NativeHandle fd) noexcept { return ::shutdown(fd, SHUT_WR) == 0; }

}  // namespace ioreactor
