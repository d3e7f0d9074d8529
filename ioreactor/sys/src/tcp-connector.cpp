#include "ioreactor/tcp-connector.hpp"

#include <netdb.h>
#include <sys/socket.h>

#include <cerrno>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "ioreactor/base-fd.hpp"
#include "ioreactor/descriptor.hpp"
#include "ioreactor/log.hpp"
#include "ioreactor/platform.hpp"

namespace ioreactor {

ConnectResult ConnectTCP(std::string_view host, std::string_view port, int family) {
  // getaddrinfo expects null-terminated strings
  const std::string hostStr(host);
  const std::string portStr(port);

  addrinfo hints{};
  hints.ai_family = family;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* res = nullptr;
  const int gai = ::getaddrinfo(hostStr.c_str(), portStr.c_str(), &hints, &res);
  std::unique_ptr<addrinfo, void (*)(addrinfo*)> resRAII(res, &::freeaddrinfo);
  ConnectResult connectResult;

  if (gai != 0) [[unlikely]] {
    log::error("ConnectTCP: getaddrinfo('{}', '{}') failed: {}", host, port, ::gai_strerror(gai));
    connectResult.failure = true;
    return connectResult;
  }

  for (addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
    const int socktype = rp->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC;

    BaseFd baseFd(::socket(rp->ai_family, socktype, rp->ai_protocol));
    if (!baseFd) [[unlikely]] {
      const int saved = errno;
      log::error(
          "ConnectTCP: socket() failed for addrinfo entry (family={}, socktype={}, protocol={}): errno={}, msg={}",
          rp->ai_family, rp->ai_socktype, rp->ai_protocol, saved, SystemErrorMessage(saved));
      if (saved == EMFILE || saved == ENFILE) {
        break;  // no point in continuing
      }
      continue;
    }

    if (::connect(baseFd.fd(), rp->ai_addr, rp->ai_addrlen) == 0) {
      // connected immediately
      connectResult.desc = Descriptor(std::move(baseFd), Descriptor::Kind::Socket, Descriptor::Interest::Read);
      return connectResult;
    }

    const int connectErr = errno;
    // Non-blocking connect started -> completion will be signalled via the poller
    switch (connectErr) {
      case EINPROGRESS:
        [[fallthrough]];
      case EALREADY:
        // EALREADY: a previous non-blocking connect is already in progress on this socket
        connectResult.desc = Descriptor(std::move(baseFd), Descriptor::Kind::Socket, Descriptor::Interest::Write);
        connectResult.connectPending = true;
        return connectResult;
      case EINTR:
        // EINTR: interrupted system call; treat as transient and try next address
        continue;
      default:
        log::error(
            "ConnectTCP: connect() failed for addrinfo entry (family={}, socktype={}, protocol={}): errno={}, msg={}",
            rp->ai_family, rp->ai_socktype, rp->ai_protocol, connectErr, SystemErrorMessage(connectErr));
        break;
    }
  }
  connectResult.failure = true;
  return connectResult;
}

}  // namespace ioreactor
