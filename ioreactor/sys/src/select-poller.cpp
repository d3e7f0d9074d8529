#include "ioreactor/select-poller.hpp"

#include <sys/select.h>
#include <sys/time.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "ioreactor/event.hpp"
#include "ioreactor/log.hpp"
#include "ioreactor/timedef.hpp"

namespace ioreactor {

SelectPoller::SelectPoller(uint32_t capacity)
    : _capacity(capacity == 0 ? kMaxCapacity : capacity), _maxFd(_wakeupFd.fd()) {
  if (_capacity > kMaxCapacity) {
    throw std::invalid_argument("select capacity cannot exceed FD_SETSIZE");
  }
  if (std::cmp_greater_equal(_wakeupFd.fd(), kMaxCapacity)) {
    throw std::system_error(std::make_error_code(std::errc::value_too_large),
                            "select wakeup fd does not fit in an fd_set");
  }
  FD_ZERO(&_readSet);
  FD_ZERO(&_writeSet);
  FD_ZERO(&_exceptSet);
  FD_SET(_wakeupFd.fd(), &_readSet);
  _ready.reserve(16);
  log::debug("SelectPoller created (capacity={}, wakeup fd # {})", _capacity, _wakeupFd.fd());
}

void SelectPoller::setInterest(NativeHandle fd, EventBmp eventBmp) noexcept {
  if ((eventBmp & EventIn) != 0) {
    FD_SET(fd, &_readSet);
  } else {
    FD_CLR(fd, &_readSet);
  }
  if ((eventBmp & EventOut) != 0) {
    FD_SET(fd, &_writeSet);
  } else {
    FD_CLR(fd, &_writeSet);
  }
  if ((eventBmp & EventPri) != 0) {
    FD_SET(fd, &_exceptSet);
  } else {
    FD_CLR(fd, &_exceptSet);
  }
}

void SelectPoller::clearInterest(NativeHandle fd) noexcept {
  FD_CLR(fd, &_readSet);
  FD_CLR(fd, &_writeSet);
  FD_CLR(fd, &_exceptSet);
}

void SelectPoller::updateMaxFd() noexcept {
  _maxFd = _wakeupFd.fd();
  for (const auto& [fd, eventBmp] : _registered) {
    _maxFd = std::max(_maxFd, fd);
  }
}

std::error_code SelectPoller::add(FdEvent event) {
  if (event.fd < 0) {
    return std::make_error_code(std::errc::bad_file_descriptor);
  }
  if (std::cmp_greater_equal(event.fd, _capacity)) {
    log::error("select ADD refused: fd # {} exceeds capacity {}", event.fd, _capacity);
    return std::make_error_code(std::errc::value_too_large);
  }
  if (!_registered.emplace(event.fd, event.eventBmp).second) {
    log::warn("select ADD refused: fd # {} already registered", event.fd);
    return std::make_error_code(std::errc::file_exists);
  }
  setInterest(event.fd, event.eventBmp);
  _maxFd = std::max(_maxFd, event.fd);
  return {};
}

std::error_code SelectPoller::mod(FdEvent event) {
  auto it = _registered.find(event.fd);
  if (it == _registered.end()) {
    return std::make_error_code(std::errc::no_such_file_or_directory);
  }
  it->second = event.eventBmp;
  setInterest(event.fd, event.eventBmp);
  return {};
}

std::error_code SelectPoller::del(NativeHandle fd) {
  if (_registered.erase(fd) == 0) {
    return std::make_error_code(std::errc::no_such_file_or_directory);
  }
  clearInterest(fd);
  if (fd == _maxFd) {
    updateMaxFd();
  }
  return {};
}

std::span<const Poller::FdEvent> SelectPoller::poll(SteadyDuration timeout) {
  // select() overwrites its sets: work on copies.
  fd_set readSet = _readSet;
  fd_set writeSet = _writeSet;
  fd_set exceptSet = _exceptSet;

  timeval tv{};
  timeval* pTimeout = nullptr;
  if (timeout >= SteadyDuration::zero()) {
    const auto us = std::chrono::ceil<std::chrono::microseconds>(timeout).count();
    tv.tv_sec = static_cast<decltype(tv.tv_sec)>(us / 1000000);
    tv.tv_usec = static_cast<decltype(tv.tv_usec)>(us % 1000000);
    pTimeout = &tv;
  }

  _ready.clear();
  const int nbReady = ::select(_maxFd + 1, &readSet, &writeSet, &exceptSet, pTimeout);
  if (nbReady == -1) {
    const auto err = errno;
    if (err == EINTR) {
      return {_ready.data(), 0U};
    }
    setLastError(err);
    log::error("select failed (max fd # {}, errno={}, msg={})", _maxFd, err, SystemErrorMessage(err));
    return {};
  }
  if (nbReady == 0) {
    return {_ready.data(), 0U};
  }

  if (FD_ISSET(_wakeupFd.fd(), &readSet)) {
    _wakeupFd.read();
  }
  for (const auto& [fd, interest] : _registered) {
    EventBmp eventBmp = 0;
    if (FD_ISSET(fd, &readSet)) {
      eventBmp |= EventIn;
    }
    if (FD_ISSET(fd, &writeSet)) {
      eventBmp |= EventOut;
    }
    if (FD_ISSET(fd, &exceptSet)) {
      eventBmp |= EventPri;
    }
    if (eventBmp != 0) {
      _ready.push_back(FdEvent{fd, eventBmp});
    }
  }
  return {_ready.data(), _ready.size()};
}

}  // namespace ioreactor
