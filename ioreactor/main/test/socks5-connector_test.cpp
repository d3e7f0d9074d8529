#include "ioreactor/socks5-connector.hpp"

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "ioreactor/descriptor.hpp"
#include "ioreactor/event-loop-config.hpp"
#include "ioreactor/event-loop.hpp"
#include "ioreactor/handler.hpp"
#include "ioreactor/tcp-acceptor.hpp"
#include "ioreactor/timedef.hpp"

namespace ioreactor {

namespace {

using namespace std::chrono_literals;

void RunUntil(EventLoop& loop, const std::function<bool()>& done, SteadyDuration timeout = 3s) {
  const auto deadline = SteadyClock::now() + timeout;
  while (!done() && SteadyClock::now() < deadline) {
    ASSERT_TRUE(loop.runOnce());
  }
}

std::string Bytes(std::initializer_list<int> bytes) {
  std::string out;
  for (int byte : bytes) {
    out.push_back(static_cast<char>(byte));
  }
  return out;
}

// Minimal SOCKS5 server side, served by the same loop as the client under test.
class FakeProxy {
 public:
  enum class Mode : uint8_t { Tunnel, RejectMethods, RefuseConnect, CloseAfterGreeting, Silent, Garbage };

  static constexpr std::string_view kBanner = "220 target ready";

  FakeProxy(EventLoop& loop, Mode mode)
      : _mode(mode), _acceptor(loop, 0, [this, &loop](Descriptor desc, const sockaddr_storage&) {
          auto& conn = *_conns.emplace_back(std::make_unique<Conn>());
          conn.desc = std::move(desc);
          Handler handler;
          handler.onReadable = [this, &conn](Descriptor& self) { onData(conn, self); };
          loop.add(conn.desc, std::move(handler));
        }) {}

  [[nodiscard]] uint16_t port() const noexcept { return _acceptor.port(); }

  std::string greeting;
  std::string request;

 private:
  struct Conn {
    Descriptor desc;
    std::string in;
    bool greeted{false};
  };

  void onData(Conn& conn, Descriptor& desc) {
    std::array<std::byte, 512> buf;
    while (true) {
      const IoResult res = desc.read(buf);
      if (res.status != IoStatus::Ok) {
        break;
      }
      conn.in.append(reinterpret_cast<const char*>(buf.data()), res.bytes);
    }
    if (!conn.greeted) {
      if (conn.in.size() < 3) {
        return;
      }
      greeting = conn.in.substr(0, 3);
      conn.in.erase(0, 3);
      conn.greeted = true;
      switch (_mode) {
        case Mode::RejectMethods:
          desc.write(Bytes({0x05, 0xFF}));
          return;
        case Mode::CloseAfterGreeting:
          desc.close();
          return;
        case Mode::Silent:
          return;
        case Mode::Garbage:
          desc.write(Bytes({0x04, 0x00}));
          return;
        default:
          desc.write(Bytes({0x05, 0x00}));
          break;
      }
    }
    // domain name request: VER CMD RSV ATYP LEN NAME PORT
    if (conn.in.size() < 5) {
      return;
    }
    const std::size_t len = 5U + static_cast<uint8_t>(conn.in[4]) + 2U;
    if (conn.in.size() < len) {
      return;
    }
    request = conn.in.substr(0, len);
    conn.in.erase(0, len);
    if (_mode == Mode::RefuseConnect) {
      desc.write(Bytes({0x05, 0x05, 0x00, 0x01, 0, 0, 0, 0, 0, 0}));
      return;
    }
    // bound address given as a domain, followed right away by data from the target
    desc.write(Bytes({0x05, 0x00, 0x00, 0x03, 4, 'p', 'r', 'o', 'x', 0x1F, 0x90}) + std::string(kBanner));
  }

  Mode _mode;
  std::vector<std::unique_ptr<Conn>> _conns;
  TcpAcceptor _acceptor;
};

struct Outcome {
  std::error_code ec;
  Descriptor desc;
};

}  // namespace

class Socks5ConnectorTest : public ::testing::Test {
 protected:
  ConnectCallback recorder() {
    return [this](std::error_code ec, Descriptor desc) {
      ++nbCalls;
      outcome.emplace(Outcome{ec, std::move(desc)});
    };
  }

  std::error_code runHandshake(FakeProxy::Mode mode, SteadyDuration timeout = 2s) {
    FakeProxy proxy(loop, mode);
    Socks5ConnectVia(loop, "127.0.0.1", proxy.port(), "example.com", 443, timeout, recorder());
    RunUntil(loop, [this] { return outcome.has_value(); });
    EXPECT_TRUE(outcome.has_value());
    EXPECT_EQ(nbCalls, 1);
    return outcome ? outcome->ec : std::error_code{};
  }

  EventLoop loop{EventLoopConfig{}.withMaxPollInterval(10ms)};
  std::optional<Outcome> outcome;
  int nbCalls = 0;
};

TEST_F(Socks5ConnectorTest, EstablishesTunnel) {
  FakeProxy proxy(loop, FakeProxy::Mode::Tunnel);
  Socks5ConnectVia(loop, "127.0.0.1", proxy.port(), "example.com", 443, 2s, recorder());
  RunUntil(loop, [this] { return outcome.has_value(); });

  ASSERT_TRUE(outcome.has_value());
  ASSERT_FALSE(outcome->ec) << outcome->ec.message();
  EXPECT_EQ(proxy.greeting, Bytes({0x05, 0x01, 0x00}));
  EXPECT_EQ(proxy.request, BuildSocks5ConnectRequest("example.com", 443));

  Descriptor& tunnel = outcome->desc;
  EXPECT_TRUE(tunnel.isOpen());
  EXPECT_EQ(tunnel.kind(), Descriptor::Kind::Proxy);
  EXPECT_FALSE(tunnel.isOwned());

  // Bytes following the proxy reply belong to the target
  std::string received;
  Handler handler;
  handler.onReadable = [&received](Descriptor& desc) {
    std::array<std::byte, 64> buf;
    const IoResult res = desc.read(buf);
    received.append(reinterpret_cast<const char*>(buf.data()), res.bytes);
  };
  loop.add(tunnel, std::move(handler));
  RunUntil(loop, [&received] { return received.size() >= FakeProxy::kBanner.size(); });
  EXPECT_EQ(received, FakeProxy::kBanner);
  EXPECT_EQ(nbCalls, 1);
}

TEST_F(Socks5ConnectorTest, AuthenticationRequired) {
  EXPECT_EQ(runHandshake(FakeProxy::Mode::RejectMethods), std::errc::permission_denied);
  EXPECT_FALSE(outcome->desc.isOpen());
}

TEST_F(Socks5ConnectorTest, ProxyRefusesTarget) {
  EXPECT_EQ(runHandshake(FakeProxy::Mode::RefuseConnect), std::errc::connection_refused);
}

TEST_F(Socks5ConnectorTest, ProxyClosesConnection) {
  EXPECT_EQ(runHandshake(FakeProxy::Mode::CloseAfterGreeting), std::errc::connection_aborted);
}

TEST_F(Socks5ConnectorTest, MalformedReply) {
  EXPECT_EQ(runHandshake(FakeProxy::Mode::Garbage), std::errc::protocol_error);
}

TEST_F(Socks5ConnectorTest, SilentProxyTimesOut) {
  EXPECT_EQ(runHandshake(FakeProxy::Mode::Silent, 100ms), std::errc::timed_out);
}

TEST_F(Socks5ConnectorTest, UnreachableProxy) {
  uint16_t closedPort = 0;
  {
    EventLoop tmpLoop;
    TcpAcceptor tmp(tmpLoop, 0, [](Descriptor, const sockaddr_storage&) {});
    closedPort = tmp.port();
  }
  Socks5ConnectVia(loop, "127.0.0.1", closedPort, "example.com", 443, 2s, recorder());
  RunUntil(loop, [this] { return outcome.has_value(); });
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->ec);
  EXPECT_FALSE(outcome->desc.isOpen());
}

TEST(Socks5RequestTest, IPv4Target) {
  EXPECT_EQ(BuildSocks5ConnectRequest("127.0.0.1", 80),
            Bytes({0x05, 0x01, 0x00, 0x01, 127, 0, 0, 1, 0x00, 0x50}));
}

TEST(Socks5RequestTest, IPv6Target) {
  const std::string req = BuildSocks5ConnectRequest("::1", 8080);
  ASSERT_EQ(req.size(), 4U + 16U + 2U);
  EXPECT_EQ(req[3], 0x04);
  EXPECT_EQ(req[19], 0x01);
  EXPECT_EQ(static_cast<uint8_t>(req[20]), 0x1F);
  EXPECT_EQ(static_cast<uint8_t>(req[21]), 0x90);
}

TEST(Socks5RequestTest, DomainTarget) {
  EXPECT_EQ(BuildSocks5ConnectRequest("a.io", 443),
            Bytes({0x05, 0x01, 0x00, 0x03, 4, 'a', '.', 'i', 'o', 0x01, 0xBB}));
  EXPECT_THROW((void)BuildSocks5ConnectRequest(std::string(256, 'a'), 443), std::invalid_argument);
  EXPECT_THROW((void)BuildSocks5ConnectRequest("", 443), std::invalid_argument);
}

TEST(Socks5ReplyErrorTest, MapsReplyCodes) {
  EXPECT_EQ(Socks5ReplyError(0x01), std::errc::io_error);
  EXPECT_EQ(Socks5ReplyError(0x02), std::errc::permission_denied);
  EXPECT_EQ(Socks5ReplyError(0x03), std::errc::network_unreachable);
  EXPECT_EQ(Socks5ReplyError(0x04), std::errc::host_unreachable);
  EXPECT_EQ(Socks5ReplyError(0x05), std::errc::connection_refused);
  EXPECT_EQ(Socks5ReplyError(0x06), std::errc::timed_out);
  EXPECT_EQ(Socks5ReplyError(0x07), std::errc::operation_not_supported);
  EXPECT_EQ(Socks5ReplyError(0x08), std::errc::address_family_not_supported);
  EXPECT_EQ(Socks5ReplyError(0x42), std::errc::protocol_error);
}

}  // namespace ioreactor
