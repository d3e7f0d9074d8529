#include "ioreactor/async-connect.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "ioreactor/base-fd.hpp"
#include "ioreactor/descriptor.hpp"
#include "ioreactor/event-loop.hpp"
#include "ioreactor/handler.hpp"
#include "ioreactor/log.hpp"
#include "ioreactor/socket-ops.hpp"
#include "ioreactor/tcp-connector.hpp"
#include "ioreactor/timedef.hpp"

namespace ioreactor {

namespace {

struct PendingConnect {
  void complete(std::error_code ec) {
    if (std::exchange(done, true)) {
      return;
    }
    Descriptor connected;
    if (!ec) {
      // Hand over a fresh, unregistered descriptor. Releasing the handle detaches it from the loop.
      connected = Descriptor(BaseFd(desc.release()), Descriptor::Kind::Socket, Descriptor::Interest::Read);
    }
    ConnectCallback cb = std::move(onConnect);
    cb(ec, std::move(connected));
  }

  Descriptor desc;
  ConnectCallback onConnect;
  bool done{false};
};

}  // namespace

void AsyncConnect(EventLoop& loop, std::string_view host, uint16_t port, SteadyDuration timeout,
                  ConnectCallback onConnect) {
  auto state = std::make_shared<PendingConnect>();
  state->onConnect = std::move(onConnect);

  ConnectResult cnxRes = ConnectTCP(host, std::to_string(port));
  if (cnxRes.failure) {
    log::warn("Unable to connect to {}:{}", host, port);
    loop.post([state] { state->complete(std::make_error_code(std::errc::host_unreachable)); });
    return;
  }
  state->desc = std::move(cnxRes.desc);
  if (!cnxRes.connectPending) {
    log::debug("fd # {} connected immediately to {}:{}", state->desc.fd(), host, port);
    loop.post([state] { state->complete({}); });
    return;
  }

  Handler handler;
  handler.onWritable = [state](Descriptor& desc) {
    const int err = GetSocketError(desc.fd());
    if (err != 0) {
      log::debug("Connect of fd # {} failed: {}", desc.fd(), SystemErrorMessage(err));
      state->complete(std::error_code(err, std::generic_category()));
      desc.close();
      return;
    }
    log::debug("fd # {} connected", desc.fd());
    state->complete({});
  };
  handler.onError = [state](Descriptor&, std::error_code ec) { state->complete(ec); };
  handler.onTimeout = [state](Descriptor& desc) {
    log::debug("Connect of fd # {} timed out", desc.fd());
    state->complete(std::make_error_code(std::errc::timed_out));
    desc.close();
  };

  loop.add(state->desc, std::move(handler));
  loop.armTimeout(state->desc, timeout);
}

}  // namespace ioreactor
