// ioreactor Umbrella Header
//
// Include this single header to pull in the public reactor API:
//   - EventLoop, its configuration and statistics
//   - Descriptor and the Handler callbacks bound to it
//   - Timers (TimerQueue / TimerId)
//   - TCP helpers built on the loop: TcpAcceptor, AsyncConnect, SOCKS5 tunnels
//
// Each re-exported header line is annotated with IWYU pragma: export so that users only including
// <ioreactor/ioreactor.hpp> are considered to use the symbols directly.
// Pollers are selected through EventLoopConfig::pollerKind and are not re-exported here: include
// "ioreactor/poller.hpp" to drive a backend by hand.
//
// Usage Example:
//    #include <ioreactor/ioreactor.hpp>
//    using namespace ioreactor;
//    int main() {
//      EventLoop loop;
//      loop.callAfter(std::chrono::milliseconds(10), [&loop] { loop.stop(); });
//      loop.run();
//    }

#pragma once

// IWYU pragma: begin_exports
#include "ioreactor/async-connect.hpp"
#include "ioreactor/descriptor.hpp"
#include "ioreactor/event-loop-config.hpp"
#include "ioreactor/event-loop.hpp"
#include "ioreactor/fault.hpp"
#include "ioreactor/fd-limits.hpp"
#include "ioreactor/handler.hpp"
#include "ioreactor/loop-stats.hpp"
#include "ioreactor/signal-handler.hpp"
#include "ioreactor/socks5-connector.hpp"
#include "ioreactor/tcp-acceptor.hpp"
#include "ioreactor/timer-queue.hpp"
// IWYU pragma: end_exports
