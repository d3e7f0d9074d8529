#include <ioreactor/ioreactor.hpp>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

using namespace ioreactor;

// Sends a HEAD request to <host>:80 through the SOCKS5 proxy <proxy-host>:<proxy-port> and prints the answer.
int main(int argc, char **argv) {
  using namespace std::chrono_literals;

  if (argc < 4) {
    std::cerr << "Usage: " << argv[0] << " <proxy-host> <proxy-port> <host>\n";
    return EXIT_FAILURE;
  }
  const std::string host = argv[3];

  try {
    EventLoop loop(EventLoopConfig{}.withStopWhenIdle());
    Descriptor tunnel;
    int exitCode = EXIT_SUCCESS;

    Socks5ConnectVia(loop, argv[1], static_cast<uint16_t>(std::stoi(argv[2])), host, 80, 5s,
                     [&](std::error_code ec, Descriptor desc) {
                       if (ec) {
                         std::cerr << "Tunnel failed: " << ec.message() << '\n';
                         exitCode = EXIT_FAILURE;
                         return;
                       }
                       tunnel = std::move(desc);
                       tunnel.write("HEAD / HTTP/1.1\r\nHost: " + host + "\r\nConnection: close\r\n\r\n");

                       Handler handler;
                       handler.onReadable = [](Descriptor &self) {
                         std::array<std::byte, 4096> buf;
                         const IoResult res = self.read(buf);
                         if (res.status == IoStatus::Ok) {
                           std::cout.write(reinterpret_cast<const char *>(buf.data()),
                                           static_cast<std::streamsize>(res.bytes));
                         } else if (res.status == IoStatus::Eof) {
                           self.close();
                         }
                       };
                       handler.onTimeout = [](Descriptor &self) { self.close(); };
                       loop.add(tunnel, std::move(handler));
                       loop.armTimeout(tunnel, 10s);
                     });

    loop.run();
    return exitCode;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
}
