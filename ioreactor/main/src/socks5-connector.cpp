#include "ioreactor/socks5-connector.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "ioreactor/async-connect.hpp"
#include "ioreactor/base-fd.hpp"
#include "ioreactor/descriptor.hpp"
#include "ioreactor/event-loop.hpp"
#include "ioreactor/handler.hpp"
#include "ioreactor/log.hpp"
#include "ioreactor/timedef.hpp"

namespace ioreactor {

namespace {

constexpr uint8_t kSocksVersion = 0x05;
constexpr uint8_t kMethodNoAuth = 0x00;
constexpr uint8_t kMethodNoneAcceptable = 0xFF;
constexpr uint8_t kCmdConnect = 0x01;
constexpr uint8_t kAtypIPv4 = 0x01;
constexpr uint8_t kAtypDomain = 0x03;
constexpr uint8_t kAtypIPv6 = 0x04;

// Fixed part of the reply: VER REP RSV ATYP
constexpr std::size_t kReplyHeadLen = 4;

constexpr std::string_view kGreeting("\x05\x01\x00", 3);

class Socks5Handshake {
 public:
  enum class Phase : uint8_t { MethodReply, ReplyHead, ReplyAddress, Done };

  Socks5Handshake(Descriptor proxyConn, std::string request, ConnectCallback onTunnel)
      : _desc(std::move(proxyConn)), _request(std::move(request)), _onTunnel(std::move(onTunnel)), _out(kGreeting) {}

  Descriptor& desc() noexcept { return _desc; }

  void onReadable() {
    while (_phase != Phase::Done && _desc.isOpen()) {
      // Never read past the reply: bytes after it already belong to the tunnel.
      std::array<std::byte, 256> buf;
      const std::size_t want = std::min(expected() - _in.size(), buf.size());
      const IoResult res = _desc.read(std::span<std::byte>(buf.data(), want));
      if (res.status == IoStatus::WouldBlock) {
        return;
      }
      if (res.status == IoStatus::Eof) {
        fail(std::make_error_code(std::errc::connection_aborted));
        return;
      }
      if (res.status == IoStatus::Fatal) {
        // reported to onError by the loop
        return;
      }
      _in.append(reinterpret_cast<const char*>(buf.data()), res.bytes);
      if (_in.size() == expected()) {
        advance();
      }
    }
  }

  void onWritable() { flush(); }

  void fail(std::error_code ec) {
    if (_phase == Phase::Done) {
      return;
    }
    _phase = Phase::Done;
    log::debug("SOCKS5 handshake on fd # {} failed: {}", _desc.fd(), ec.message());
    ConnectCallback cb = std::move(_onTunnel);
    _desc.close();
    cb(ec, Descriptor{});
  }

 private:
  // Total number of bytes of the message currently awaited.
  [[nodiscard]] std::size_t expected() const noexcept {
    switch (_phase) {
      case Phase::MethodReply:
        return 2;
      case Phase::ReplyHead:
        return kReplyHeadLen;
      case Phase::ReplyAddress:
        return _replyLen;
      default:
        return _in.size();
    }
  }

  void flush() {
    if (!_out.empty()) {
      const IoResult res = _desc.write(_out);
      if (res.status == IoStatus::Fatal) {
        return;
      }
      _out.erase(0, res.bytes);
    }
    if (_desc.isOpen()) {
      _desc.setInterest(_out.empty() ? Descriptor::Interest::Read : Descriptor::Interest::Write);
    }
  }

  void advance() {
    const auto byteAt = [this](std::size_t pos) { return static_cast<uint8_t>(_in[pos]); };
    switch (_phase) {
      case Phase::MethodReply:
        if (byteAt(0) != kSocksVersion) {
          fail(std::make_error_code(std::errc::protocol_error));
        } else if (byteAt(1) == kMethodNoneAcceptable) {
          fail(std::make_error_code(std::errc::permission_denied));
        } else if (byteAt(1) != kMethodNoAuth) {
          fail(std::make_error_code(std::errc::protocol_error));
        } else {
          _in.clear();
          _phase = Phase::ReplyHead;
          _out = std::move(_request);
          flush();
        }
        break;
      case Phase::ReplyHead:
        if (byteAt(0) != kSocksVersion) {
          fail(std::make_error_code(std::errc::protocol_error));
          break;
        }
        if (byteAt(1) != 0) {
          fail(Socks5ReplyError(byteAt(1)));
          break;
        }
        switch (byteAt(3)) {
          case kAtypIPv4:
            _replyLen = kReplyHeadLen + 4U + 2U;
            break;
          case kAtypIPv6:
            _replyLen = kReplyHeadLen + 16U + 2U;
            break;
          case kAtypDomain:
            // the length byte comes first, the rest of the reply length is known once it is read
            _replyLen = kReplyHeadLen + 1U;
            break;
          default:
            fail(std::make_error_code(std::errc::protocol_error));
            return;
        }
        _phase = Phase::ReplyAddress;
        break;
      case Phase::ReplyAddress:
        if (byteAt(3) == kAtypDomain && _replyLen == kReplyHeadLen + 1U) {
          _replyLen += static_cast<std::size_t>(byteAt(kReplyHeadLen)) + 2U;
          break;
        }
        succeed();
        break;
      default:
        break;
    }
  }

  void succeed() {
    _phase = Phase::Done;
    log::debug("SOCKS5 tunnel established on fd # {}", _desc.fd());
    ConnectCallback cb = std::move(_onTunnel);
    Descriptor tunnel(BaseFd(_desc.release()), Descriptor::Kind::Proxy, Descriptor::Interest::Read);
    cb({}, std::move(tunnel));
  }

  Descriptor _desc;
  std::string _request;
  ConnectCallback _onTunnel;
  std::string _out;
  std::string _in;
  std::size_t _replyLen{};
  Phase _phase{Phase::MethodReply};
};

}  // namespace

std::string BuildSocks5ConnectRequest(std::string_view host, uint16_t port) {
  std::string req;
  req.push_back(static_cast<char>(kSocksVersion));
  req.push_back(static_cast<char>(kCmdConnect));
  req.push_back('\0');  // reserved

  const std::string hostStr(host);
  in_addr addr4{};
  in6_addr addr6{};
  if (::inet_pton(AF_INET, hostStr.c_str(), &addr4) == 1) {
    req.push_back(static_cast<char>(kAtypIPv4));
    req.append(reinterpret_cast<const char*>(&addr4), sizeof(addr4));
  } else if (::inet_pton(AF_INET6, hostStr.c_str(), &addr6) == 1) {
    req.push_back(static_cast<char>(kAtypIPv6));
    req.append(reinterpret_cast<const char*>(&addr6), sizeof(addr6));
  } else {
    if (host.empty() || host.size() > 255U) {
      throw std::invalid_argument("SOCKS5 domain name length must be in [1, 255]");
    }
    req.push_back(static_cast<char>(kAtypDomain));
    req.push_back(static_cast<char>(host.size()));
    req.append(host);
  }
  req.push_back(static_cast<char>(port >> 8));
  req.push_back(static_cast<char>(port & 0xFF));
  return req;
}

std::error_code Socks5ReplyError(uint8_t rep) noexcept {
  switch (rep) {
    case 0x01:
      // general SOCKS server failure
      return std::make_error_code(std::errc::io_error);
    case 0x02:
      // connection not allowed by ruleset
      return std::make_error_code(std::errc::permission_denied);
    case 0x03:
      return std::make_error_code(std::errc::network_unreachable);
    case 0x04:
      return std::make_error_code(std::errc::host_unreachable);
    case 0x05:
      return std::make_error_code(std::errc::connection_refused);
    case 0x06:
      // TTL expired
      return std::make_error_code(std::errc::timed_out);
    case 0x07:
      return std::make_error_code(std::errc::operation_not_supported);
    case 0x08:
      return std::make_error_code(std::errc::address_family_not_supported);
    default:
      return std::make_error_code(std::errc::protocol_error);
  }
}

void Socks5Connect(EventLoop& loop, Descriptor proxyConn, std::string_view targetHost, uint16_t targetPort,
                   SteadyDuration timeout, ConnectCallback onTunnel) {
  auto handshake = std::make_shared<Socks5Handshake>(
      std::move(proxyConn), BuildSocks5ConnectRequest(targetHost, targetPort), std::move(onTunnel));

  Handler handler;
  handler.onReadable = [handshake](Descriptor&) { handshake->onReadable(); };
  handler.onWritable = [handshake](Descriptor&) { handshake->onWritable(); };
  handler.onError = [handshake](Descriptor&, std::error_code ec) { handshake->fail(ec); };
  handler.onTimeout = [handshake](Descriptor&) { handshake->fail(std::make_error_code(std::errc::timed_out)); };

  Descriptor& desc = handshake->desc();
  desc.setInterest(Descriptor::Interest::Write);
  loop.add(desc, std::move(handler));
  loop.armTimeout(desc, timeout);
  log::debug("SOCKS5 handshake started on fd # {} for {}:{}", desc.fd(), targetHost, targetPort);
}

void Socks5ConnectVia(EventLoop& loop, std::string_view proxyHost, uint16_t proxyPort, std::string_view targetHost,
                      uint16_t targetPort, SteadyDuration timeout, ConnectCallback onTunnel) {
  const SteadyTimePoint deadline = SteadyClock::now() + timeout;
  AsyncConnect(loop, proxyHost, proxyPort, timeout,
               [&loop, target = std::string(targetHost), targetPort, deadline, onTunnel = std::move(onTunnel)](
                   std::error_code ec, Descriptor proxyConn) mutable {
                 if (ec) {
                   onTunnel(ec, Descriptor{});
                   return;
                 }
                 Socks5Connect(loop, std::move(proxyConn), target, targetPort,
                               std::max(deadline - SteadyClock::now(), SteadyDuration::zero()), std::move(onTunnel));
               });
}

}  // namespace ioreactor
