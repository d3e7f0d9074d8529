#pragma once

#include <string_view>

#include "ioreactor/descriptor.hpp"

namespace ioreactor {

struct ConnectResult {
  Descriptor desc;
  bool connectPending{false};
  bool failure{false};
};

// Attempt to resolve host:port and connect to one of the returned addresses with a non-blocking socket.
// On success returns a ConnectResult owning the socket descriptor (interest Write while the connect is
// pending) and a flag indicating whether the connect is still in progress (EINPROGRESS): completion is
// then signalled by writability, and its outcome given by SO_ERROR.
// On failure (resolution or all addresses refused synchronously) 'failure' is set.
//
// Parameters:
// - host: hostname or IP address to connect to
// - port: port number or service name
// - family: address family, 0 for unspecified
ConnectResult ConnectTCP(std::string_view host, std::string_view port, int family = 0);

}  // namespace ioreactor
