#include <ioreactor/ioreactor.hpp>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace ioreactor;

int main() {
  using namespace std::chrono_literals;

  try {
    EventLoop loop(EventLoopConfig{}.withStopWhenIdle());

    const auto start = SteadyClock::now();
    auto elapsedMs = [start] {
      return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start).count();
    };

    int nbTicks = 0;
    TimerId tick = kInvalidTimerId;
    tick = loop.callEvery(100ms, [&] {
      std::cout << "[" << elapsedMs() << " ms] tick " << ++nbTicks << '\n';
      if (nbTicks == 5) {
        loop.cancel(tick);
      }
    });
    loop.callAfter(250ms, [&] { std::cout << "[" << elapsedMs() << " ms] one-shot timer\n"; });
    loop.post([] { std::cout << "posted task runs first\n"; });

    loop.run();  // returns once nothing is scheduled anymore
    std::cout << "Stats: \n" << loop.stats().json_str() << '\n';
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
