#pragma once

#include "ioreactor/base-fd.hpp"
#include "ioreactor/platform.hpp"

namespace ioreactor {

// Simple RAII class wrapping a non-blocking, close-on-exec eventfd used as a wakeup mechanism.
// send() may be called from any thread.
class EventFd {
 public:
  // Create the wakeup fd.
  // Throws std::system_error on failure.
  EventFd();

  // Send a wakeup event.
  void send() const noexcept;

  // Drain / read pending wakeup events.
  void read() const noexcept;

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace ioreactor
