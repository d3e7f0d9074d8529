#include <ioreactor/ioreactor.hpp>
#include <ioreactor/socket-ops.hpp>
#include <array>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <list>
#include <span>
#include <string>
#include <system_error>
#include <utility>

using namespace ioreactor;

namespace {

// Per-connection state: bytes read but not yet echoed back.
struct Connection {
  Descriptor desc;
  std::string pending;
};

}  // namespace

int main(int argc, char **argv) {
  uint16_t port = 0;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }

  // Enable signal handler for graceful shutdown on Ctrl+C
  SignalHandler::Enable();
  RaiseOpenFileLimit();

  try {
    EventLoop loop;
    std::list<Connection> connections;

    auto flush = [](Connection &cnx) {
      const IoResult res = cnx.desc.write(cnx.pending);
      cnx.pending.erase(0, res.bytes);
      if (res.status == IoStatus::Fatal) {
        return;
      }
      cnx.desc.setInterest(cnx.pending.empty() ? Descriptor::Interest::Read : Descriptor::Interest::ReadWrite);
    };

    TcpAcceptor acceptor(loop, port, [&](Descriptor desc, const sockaddr_storage &peer) {
      std::cout << "New connection from " << FormatAddress(peer) << '\n';
      auto cnxIt = connections.emplace(connections.end(), Connection{std::move(desc), {}});
      Connection &cnx = *cnxIt;

      Handler handler;
      handler.onReadable = [&cnx, &flush](Descriptor &self) {
        std::array<std::byte, 4096> buf;
        while (true) {
          const IoResult res = self.read(buf);
          if (res.status == IoStatus::Ok) {
            cnx.pending.append(reinterpret_cast<const char *>(buf.data()), res.bytes);
            continue;
          }
          if (res.status == IoStatus::Eof) {
            self.close();
            return;
          }
          break;
        }
        if (!cnx.pending.empty()) {
          flush(cnx);
        }
      };
      handler.onWritable = [&cnx, &flush](Descriptor &) { flush(cnx); };
      handler.onError = [](Descriptor &self, std::error_code ec) {
        std::cerr << "Connection fd # " << self.fd() << " error: " << ec.message() << '\n';
      };
      loop.add(cnx.desc, std::move(handler));

      // Closed connections are purged lazily on accept.
      std::erase_if(connections, [](const Connection &other) { return !other.desc.isOpen(); });
    });

    std::cout << "Echo server listening on port " << acceptor.port() << " (" << loop.pollerName() << ")\n";
    loop.run();  // blocking run, until Ctrl+C
    std::cout << "Stats: \n" << loop.stats().json_str() << '\n';
  } catch (const std::exception &e) {
    std::cerr << "Echo server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
