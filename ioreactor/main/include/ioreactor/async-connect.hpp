#pragma once

#include <cstdint>
#include <functional>
#include <string_view>
#include <system_error>

#include "ioreactor/descriptor.hpp"
#include "ioreactor/event-loop.hpp"
#include "ioreactor/timedef.hpp"

namespace ioreactor {

// Outcome of an asynchronous connect: on success the error code is empty and the Descriptor is the
// connected socket (kind Socket, Read interest, not registered). On failure the Descriptor is closed.
using ConnectCallback = std::function<void(std::error_code, Descriptor)>;

// Starts a non-blocking TCP connect to host:port driven by 'loop'.
// 'onConnect' is always invoked exactly once, from the loop thread and never before this function returns,
// with one of:
//  - no error, when the connection is established,
//  - std::errc::host_unreachable if the host cannot be resolved or all its addresses refused synchronously,
//  - the SO_ERROR of the socket (connection_refused...) if the connect failed,
//  - std::errc::timed_out if not connected within 'timeout'.
// Throws std::system_error if the pending connect cannot be registered in 'loop'.
// Name resolution is synchronous: a host name (as opposed to a numeric address) makes getaddrinfo block the
// calling thread, and the loop with it, until the resolver answers. 'timeout' only bounds the connect itself.
// Pass numeric addresses from latency sensitive loops.
void AsyncConnect(EventLoop& loop, std::string_view host, uint16_t port, SteadyDuration timeout,
                  ConnectCallback onConnect);

}  // namespace ioreactor
