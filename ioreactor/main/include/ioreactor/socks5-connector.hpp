#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include "ioreactor/async-connect.hpp"
#include "ioreactor/descriptor.hpp"
#include "ioreactor/event-loop.hpp"
#include "ioreactor/timedef.hpp"

namespace ioreactor {

// Establishes a tunnel to targetHost:targetPort through a SOCKS5 proxy (RFC 1928, CONNECT command, no
// authentication), over 'proxyConn', an already connected socket to the proxy (not registered in any loop).
//
// 'onTunnel' is invoked exactly once from the loop thread, after this function returned:
//  - on success with an empty error code and an open Descriptor of kind Proxy, positioned right after the
//    proxy reply: everything read from it afterwards comes from the target,
//  - on failure with a closed Descriptor and the error: the mapped proxy refusal (see Socks5ReplyError),
//    std::errc::permission_denied if the proxy requires authentication, std::errc::protocol_error on
//    malformed replies, std::errc::connection_aborted if the proxy closed the connection,
//    std::errc::timed_out if the handshake did not complete within 'timeout', or the socket error.
// Throws std::invalid_argument if the target host name is longer than 255 bytes, and std::system_error if
// 'proxyConn' cannot be registered in 'loop'.
void Socks5Connect(EventLoop& loop, Descriptor proxyConn, std::string_view targetHost, uint16_t targetPort,
                   SteadyDuration timeout, ConnectCallback onTunnel);

// Connects to the proxy with AsyncConnect, then runs Socks5Connect. 'timeout' bounds the whole operation.
// The proxy host name is resolved synchronously (see AsyncConnect), the target one by the proxy.
void Socks5ConnectVia(EventLoop& loop, std::string_view proxyHost, uint16_t proxyPort, std::string_view targetHost,
                      uint16_t targetPort, SteadyDuration timeout, ConnectCallback onTunnel);

// Encodes the CONNECT request for the given target: an IPv4 / IPv6 address literal is sent as such,
// anything else as a domain name resolved by the proxy.
// Throws std::invalid_argument if a domain name is empty or longer than 255 bytes.
[[nodiscard]] std::string BuildSocks5ConnectRequest(std::string_view host, uint16_t port);

// Maps a non-zero REP field of a proxy reply to an error code.
[[nodiscard]] std::error_code Socks5ReplyError(uint8_t rep) noexcept;

}  // namespace ioreactor
