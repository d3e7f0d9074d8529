#include "ioreactor/event-fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>

#include "ioreactor/base-fd.hpp"
#include "ioreactor/errno-throw.hpp"
#include "ioreactor/log.hpp"
#include "ioreactor/platform.hpp"

namespace ioreactor {

EventFd::EventFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new EventFd");
  }
  log::debug("EventFd fd # {} opened", fd());
}

void EventFd::send() const noexcept {
  static constexpr eventfd_t one = 1;
  const auto ret = ::eventfd_write(fd(), one);
  if (ret == -1) {
    const auto savedErr = errno;
    // EAGAIN means the counter is saturated: a wakeup is already pending.
    if (savedErr != EAGAIN) {
      log::error("Event fd send failed err={}: {}", savedErr, SystemErrorMessage(savedErr));
    }
  } else {
    log::trace("Event fd send succeeded");
  }
}

void EventFd::read() const noexcept {
  eventfd_t counterValue;
  const auto ret = ::eventfd_read(fd(), &counterValue);
  if (ret == -1) {
    const auto savedErr = errno;
    if (savedErr != EAGAIN) {
      log::error("Event fd read failed err={}: {}", savedErr, SystemErrorMessage(savedErr));
    }
  } else {
    log::trace("Event fd drained (value={})", static_cast<unsigned long long>(counterValue));
  }
}

}  // namespace ioreactor
