#include "ioreactor/poll-poller.hpp"

#include <poll.h>

#include <cerrno>
#include <cstddef>
#include <span>
#include <system_error>

#include "ioreactor/event.hpp"
#include "ioreactor/log.hpp"
#include "ioreactor/timedef.hpp"

namespace ioreactor {

namespace {

short ToPollEvents(EventBmp eventBmp) noexcept {
  short events = 0;
  if ((eventBmp & EventIn) != 0) {
    events |= POLLIN;
  }
  if ((eventBmp & EventPri) != 0) {
    events |= POLLPRI;
  }
  if ((eventBmp & EventOut) != 0) {
    events |= POLLOUT;
  }
#ifdef POLLRDHUP
  if ((eventBmp & EventRdHup) != 0) {
    events |= POLLRDHUP;
  }
#endif
  return events;
}

EventBmp FromPollRevents(short revents) noexcept {
  EventBmp eventBmp = 0;
  if ((revents & POLLIN) != 0) {
    eventBmp |= EventIn;
  }
  if ((revents & POLLPRI) != 0) {
    eventBmp |= EventPri;
  }
  if ((revents & POLLOUT) != 0) {
    eventBmp |= EventOut;
  }
  // POLLNVAL: fd not open. Reported as an error so that the owner gets notified and unregisters it.
  if ((revents & (POLLERR | POLLNVAL)) != 0) {
    eventBmp |= EventErr;
  }
  if ((revents & POLLHUP) != 0) {
    eventBmp |= EventHup;
  }
#ifdef POLLRDHUP
  if ((revents & POLLRDHUP) != 0) {
    eventBmp |= EventRdHup;
  }
#endif
  return eventBmp;
}

}  // namespace

PollPoller::PollPoller() {
  _pollFds.push_back(pollfd{_wakeupFd.fd(), POLLIN, 0});
  // Keeps _ready.data() non-null, an empty span with nullptr data being reserved to poll failures.
  _ready.reserve(16);
  log::debug("PollPoller created (wakeup fd # {})", _wakeupFd.fd());
}

std::error_code PollPoller::add(FdEvent event) {
  if (event.fd < 0) {
    return std::make_error_code(std::errc::bad_file_descriptor);
  }
  const auto [it, inserted] = _slotByFd.emplace(event.fd, _pollFds.size());
  if (!inserted) {
    log::warn("poll ADD refused: fd # {} already registered", event.fd);
    return std::make_error_code(std::errc::file_exists);
  }
  _pollFds.push_back(pollfd{event.fd, ToPollEvents(event.eventBmp), 0});
  return {};
}

std::error_code PollPoller::mod(FdEvent event) {
  auto it = _slotByFd.find(event.fd);
  if (it == _slotByFd.end()) {
    return std::make_error_code(std::errc::no_such_file_or_directory);
  }
  _pollFds[it->second].events = ToPollEvents(event.eventBmp);
  return {};
}

std::error_code PollPoller::del(NativeHandle fd) {
  auto it = _slotByFd.find(fd);
  if (it == _slotByFd.end()) {
    return std::make_error_code(std::errc::no_such_file_or_directory);
  }
  const std::size_t slot = it->second;
  _slotByFd.erase(it);
  const std::size_t lastSlot = _pollFds.size() - 1U;
  if (slot != lastSlot) {
    _pollFds[slot] = _pollFds[lastSlot];
    _slotByFd[_pollFds[slot].fd] = slot;
  }
  _pollFds.pop_back();
  return {};
}

std::span<const Poller::FdEvent> PollPoller::poll(SteadyDuration timeout) {
  const int timeoutMs = ToPollTimeoutMs(timeout);

  _ready.clear();
  const int nbReady = ::poll(_pollFds.data(), static_cast<nfds_t>(_pollFds.size()), timeoutMs);
  if (nbReady == -1) {
    const auto err = errno;
    if (err == EINTR) {
      return {_ready.data(), 0U};
    }
    setLastError(err);
    log::error("poll failed (nfds={}, timeout_ms={}, errno={}, msg={})", _pollFds.size(), timeoutMs, err,
               SystemErrorMessage(err));
    return {};
  }

  _ready.reserve(_pollFds.size());
  int nbRemaining = nbReady;
  for (std::size_t slot = 0; slot < _pollFds.size() && nbRemaining > 0; ++slot) {
    const pollfd& pfd = _pollFds[slot];
    if (pfd.revents == 0) {
      continue;
    }
    --nbRemaining;
    if (slot == 0) {
      _wakeupFd.read();
      continue;
    }
    _ready.push_back(FdEvent{pfd.fd, FromPollRevents(pfd.revents)});
  }
  return {_ready.data(), _ready.size()};
}

}  // namespace ioreactor
