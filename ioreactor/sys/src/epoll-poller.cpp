#include "ioreactor/epoll-poller.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <new>
#include <span>
#include <system_error>
#include <type_traits>
#include <utility>

#include "ioreactor/base-fd.hpp"
#include "ioreactor/errno-throw.hpp"
#include "ioreactor/event.hpp"
#include "ioreactor/log.hpp"
#include "ioreactor/timedef.hpp"

namespace ioreactor {

namespace {

static_assert(std::is_trivially_copyable_v<epoll_event> && std::is_standard_layout_v<epoll_event>,
              "epoll_event must be trivially copyable for malloc / realloc usage");

static_assert(EventIn == EPOLLIN, "EventIn value mismatch");
static_assert(EventPri == EPOLLPRI, "EventPri value mismatch");
static_assert(EventOut == EPOLLOUT, "EventOut value mismatch");
static_assert(EventErr == EPOLLERR, "EventErr value mismatch");
static_assert(EventHup == EPOLLHUP, "EventHup value mismatch");
static_assert(EventRdHup == EPOLLRDHUP, "EventRdHup value mismatch");

constexpr EventBmp kSupportedEvents = EventIn | EventPri | EventOut | EventErr | EventHup | EventRdHup;

}  // namespace

EpollPoller::EpollPoller(uint32_t initialCapacity)
    : _nbAllocatedEvents(std::max(1U, initialCapacity)),
      _baseFd(::epoll_create1(EPOLL_CLOEXEC)),
      _pEvents(std::malloc(static_cast<std::size_t>(_nbAllocatedEvents) * sizeof(epoll_event))) {
  if (!_baseFd) {
    const auto err = errno;
    std::free(_pEvents);
    errno = err;
    throw_errno("epoll_create1 failed");
  }
  if (_pEvents == nullptr) {
    throw std::bad_alloc();
  }
  if (initialCapacity == 0) {
    log::warn("EpollPoller constructed with initialCapacity=0; promoting to 1");
  }

  epoll_event ev{EPOLLIN, epoll_data_t{.fd = _wakeupFd.fd()}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, _wakeupFd.fd(), &ev) != 0) {
    const auto err = errno;
    std::free(_pEvents);
    errno = err;
    throw_errno("epoll_ctl ADD of wakeup fd # {} failed", _wakeupFd.fd());
  }
  _ready.reserve(_nbAllocatedEvents);

  log::debug("EpollPoller fd # {} opened", _baseFd.fd());
}

EpollPoller::~EpollPoller() { std::free(_pEvents); }

std::error_code EpollPoller::add(FdEvent event) {
  if (_registered.count(event.fd) != 0) {
    log::warn("epoll ADD refused: fd # {} already registered", event.fd);
    return std::make_error_code(std::errc::file_exists);
  }
  epoll_event ev{event.eventBmp & kSupportedEvents, epoll_data_t{.fd = event.fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    log::error("epoll_ctl ADD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
               SystemErrorMessage(err));
    return {err, std::generic_category()};
  }
  _registered.emplace(event.fd, event.eventBmp);
  return {};
}

std::error_code EpollPoller::mod(FdEvent event) {
  auto it = _registered.find(event.fd);
  if (it == _registered.end()) {
    return std::make_error_code(std::errc::no_such_file_or_directory);
  }
  epoll_event ev{event.eventBmp & kSupportedEvents, epoll_data_t{.fd = event.fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_MOD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    log::error("epoll_ctl MOD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
               SystemErrorMessage(err));
    return {err, std::generic_category()};
  }
  it->second = event.eventBmp;
  return {};
}

std::error_code EpollPoller::del(NativeHandle fd) {
  if (_registered.erase(fd) == 0) {
    return std::make_error_code(std::errc::no_such_file_or_directory);
  }
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) [[unlikely]] {
    // DEL failures are usually benign if fd already closed (the kernel dropped it); log at debug to avoid noise.
    const auto err = errno;
    log::debug("epoll_ctl DEL failed (fd # {}, errno={}, msg={})", fd, err, SystemErrorMessage(err));
    return {err, std::generic_category()};
  }
  return {};
}

std::span<const Poller::FdEvent> EpollPoller::poll(SteadyDuration timeout) {
  const uint32_t capacityBeforePoll = _nbAllocatedEvents;
  auto* epollEvents = static_cast<epoll_event*>(_pEvents);
  const int timeoutMs = ToPollTimeoutMs(timeout);

  const int nbReadyFds = ::epoll_wait(_baseFd.fd(), epollEvents, static_cast<int>(capacityBeforePoll), timeoutMs);

  _ready.clear();
  if (nbReadyFds == -1) {
    const auto err = errno;
    if (err == EINTR) {
      // Interrupted; treat as no events. Return an empty span with a valid data pointer.
      return {_ready.data(), 0U};
    }
    setLastError(err);
    log::error("epoll_wait failed (timeout_ms={}, errno={}, msg={})", timeoutMs, err, SystemErrorMessage(err));
    return {};  // data() == nullptr
  }

  for (int idx = 0; idx < nbReadyFds; ++idx) {
    const epoll_event& ev = epollEvents[idx];
    if (ev.data.fd == _wakeupFd.fd()) {
      _wakeupFd.read();
      continue;
    }
    _ready.push_back(FdEvent{ev.data.fd, static_cast<EventBmp>(ev.events)});
  }

  // If saturated, grow buffer for subsequent polls.
  if (std::cmp_equal(nbReadyFds, capacityBeforePoll)) {
    const uint32_t newCapacity = capacityBeforePoll * 2U;
    void* newEvents = std::realloc(_pEvents, static_cast<std::size_t>(newCapacity) * sizeof(epoll_event));
    if (newEvents == nullptr) {
      log::error("Failed to reallocate memory for saturated events, keeping actual size of {}", _nbAllocatedEvents);
    } else {
      _pEvents = newEvents;
      _nbAllocatedEvents = newCapacity;
    }
  }

  if (_ready.empty()) {
    return {_ready.data(), 0U};
  }
  return {_ready.data(), _ready.size()};
}

}  // namespace ioreactor
