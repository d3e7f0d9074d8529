#include "ioreactor/event-loop.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "ioreactor/descriptor.hpp"
#include "ioreactor/event-loop-config.hpp"
#include "ioreactor/event.hpp"
#include "ioreactor/fault.hpp"
#include "ioreactor/handler.hpp"
#include "ioreactor/log.hpp"
#include "ioreactor/platform.hpp"
#include "ioreactor/poller.hpp"
#include "ioreactor/signal-handler.hpp"
#include "ioreactor/socket-ops.hpp"
#include "ioreactor/timedef.hpp"
#include "ioreactor/timer-queue.hpp"

namespace ioreactor {

namespace {

EventBmp ToEventBmp(Descriptor::Interest interest) noexcept {
  EventBmp bmp = 0;
  if (WantsRead(interest)) {
    bmp |= EventIn | EventPri | EventRdHup;
  }
  if (WantsWrite(interest)) {
    bmp |= EventOut;
  }
  return bmp;
}

// Error to report for an EventErr / EventHup readiness.
std::error_code BackendFaultError(const Descriptor& desc, EventBmp eventBmp) noexcept {
  if (desc.kind() != Descriptor::Kind::File) {
    const int err = GetSocketError(desc.fd());
    if (err != 0) {
      return {err, std::generic_category()};
    }
  }
  return std::make_error_code((eventBmp & EventErr) != 0 ? std::errc::io_error : std::errc::broken_pipe);
}

}  // namespace

template <class Fn>
void EventLoop::invokeGuarded(NativeHandle fd, FaultSource source, Fn&& fn) {
  try {
    std::forward<Fn>(fn)();
  } catch (const std::exception& ex) {
    log::error("{} callback of fd # {} threw: {}", FaultSourceName(source), fd, ex.what());
    reportFault(fd, source, ex.what());
  } catch (...) {
    log::error("{} callback of fd # {} threw an unknown exception", FaultSourceName(source), fd);
    reportFault(fd, source, "unknown exception");
  }
}

EventLoop::EventLoop(EventLoopConfig config)
    : _config(std::move(config)),
      _timers([this](TimerId, std::string_view message) { reportFault(kInvalidHandle, FaultSource::Timer, message); }) {
  _config.validate();
  if (_config.logLevel) {
    log::set_level(*_config.logLevel);
  }
  _poller = MakePoller(_config.pollerKind, _config.pollerOptions());
  log::debug("Event loop created with {} backend", pollerName());
}

EventLoop::~EventLoop() {
  // The loop goes away but the descriptors stay with their users: they simply stop being owned.
  for (auto& [fd, entry] : _entries) {
    if (entry->desc == nullptr || OwnerOf(*entry->desc) != this) {
      continue;
    }
    // Closing descriptors are finished below, from _closing.
    if (entry->desc->state() != Descriptor::State::Closing) {
      SetOwner(*entry->desc, nullptr);
    }
  }
  for (PendingAdd& pendingAdd : _pendingAdds) {
    SetOwner(*pendingAdd.desc, nullptr);
  }
  for (Descriptor* desc : _closing) {
    FinishClose(*desc);
  }
}

EventLoop::Entry* EventLoop::findEntry(const Descriptor& desc) noexcept {
  auto it = _entries.find(desc.fd());
  if (it == _entries.end() || it->second->desc != &desc) {
    return nullptr;
  }
  return it->second.get();
}

EventLoop::PendingAdd* EventLoop::findPendingAdd(const Descriptor& desc) noexcept {
  auto it = std::ranges::find(_pendingAdds, &desc, &PendingAdd::desc);
  return it == _pendingAdds.end() ? nullptr : &*it;
}

TimerId* EventLoop::findTimeoutId(const Descriptor& desc) noexcept {
  Entry* entry = findEntry(desc);
  if (entry != nullptr && !entry->removed) {
    return &entry->timeoutId;
  }
  PendingAdd* pendingAdd = findPendingAdd(desc);
  return pendingAdd == nullptr ? nullptr : &pendingAdd->timeoutId;
}

bool EventLoop::isRegistered(const Descriptor& desc) const noexcept {
  if (OwnerOf(desc) != this) {
    return false;
  }
  auto it = _entries.find(desc.fd());
  if (it != _entries.end() && it->second->desc == &desc && !it->second->removed) {
    return true;
  }
  return std::ranges::find(_pendingAdds, &desc, &PendingAdd::desc) != _pendingAdds.end();
}

void EventLoop::add(Descriptor& desc, Handler handler) {
  const NativeHandle fd = desc.fd();
  if (!desc.isOpen()) {
    throw std::system_error(std::make_error_code(std::errc::bad_file_descriptor),
                            "Cannot register a descriptor that is not open");
  }
  DescriptorOwner* owner = OwnerOf(desc);
  // A descriptor removed earlier in the current cycle is still owned by this loop and may be added back.
  if (owner != nullptr && (owner != this || isRegistered(desc))) {
    throw std::system_error(std::make_error_code(std::errc::file_exists),
                            fmt::format("fd # {} is already registered", fd));
  }
  if (const std::error_code ec = _poller->add(Poller::FdEvent{fd, ToEventBmp(desc.interest())}); ec) {
    throw std::system_error(ec, fmt::format("Unable to register fd # {} in {} backend", fd, pollerName()));
  }
  SetOwner(desc, this);
  if (_inCycle) {
    _pendingAdds.push_back(PendingAdd{&desc, std::move(handler)});
  } else {
    _entries.insert_or_assign(fd, std::make_unique<Entry>(Entry{&desc, std::move(handler)}));
  }
  log::debug("{} fd # {} registered ({} registered)", DescriptorKindName(desc.kind()), fd, nbRegistered());
}

bool EventLoop::unregister(Descriptor& desc) noexcept {
  const NativeHandle fd = desc.fd();
  auto pendingIt = std::ranges::find(_pendingAdds, &desc, &PendingAdd::desc);
  if (pendingIt != _pendingAdds.end()) {
    _timers.cancel(pendingIt->timeoutId);
    _poller->del(fd);
    _pendingAdds.erase(pendingIt);
    log::debug("fd # {} unregistered before its registration was applied", fd);
    return true;
  }
  Entry* entry = findEntry(desc);
  if (entry == nullptr || entry->removed) {
    return false;
  }
  _timers.cancel(std::exchange(entry->timeoutId, kInvalidTimerId));
  _poller->del(fd);
  if (_inCycle) {
    // The entry (and its handler) may be in use by the current dispatch.
    entry->removed = true;
    _hasRemovals = true;
  } else {
    _entries.erase(fd);
  }
  log::debug("fd # {} unregistered ({} registered)", fd, nbRegistered());
  return true;
}

bool EventLoop::remove(Descriptor& desc) {
  if (OwnerOf(desc) != this || !desc.isOpen()) {
    return false;
  }
  if (!unregister(desc)) {
    return false;
  }
  if (findEntry(desc) == nullptr) {
    SetOwner(desc, nullptr);
  }
  return true;
}

void EventLoop::modify(Descriptor& desc, Descriptor::Interest interest) {
  if (!isRegistered(desc)) {
    throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory),
                            fmt::format("fd # {} is not registered in this loop", desc.fd()));
  }
  desc.setInterest(interest);
}

void EventLoop::interestChanged(Descriptor& desc) {
  if (!isRegistered(desc)) {
    return;
  }
  const std::error_code ec = _poller->mod(Poller::FdEvent{desc.fd(), ToEventBmp(desc.interest())});
  if (ec) {
    throw std::system_error(ec, fmt::format("Unable to change the interest of fd # {}", desc.fd()));
  }
}

bool EventLoop::closing(Descriptor& desc) noexcept {
  unregister(desc);
  if (findEntry(desc) == nullptr) {
    return false;
  }
  // Keep the handle open until the end of the dispatch step so that its value cannot be reused by a new
  // descriptor while events reported for it are still being dispatched.
  _closing.push_back(&desc);
  return true;
}

void EventLoop::relocated(Descriptor& from, Descriptor& to) noexcept {
  auto it = _entries.find(to.fd());
  if (it != _entries.end() && it->second->desc == &from) {
    it->second->desc = &to;
  }
  for (PendingAdd& pendingAdd : _pendingAdds) {
    if (pendingAdd.desc == &from) {
      pendingAdd.desc = &to;
    }
  }
  std::ranges::replace(_closing, &from, &to);
}

void EventLoop::detached(Descriptor& desc) noexcept {
  unregister(desc);
  Entry* entry = findEntry(desc);
  if (entry != nullptr) {
    entry->desc = nullptr;
  }
  std::erase(_closing, &desc);
}

void EventLoop::armTimeout(Descriptor& desc, SteadyDuration timeout) {
  TimerId* pTimeoutId = OwnerOf(desc) == this ? findTimeoutId(desc) : nullptr;
  if (pTimeoutId == nullptr) {
    throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory),
                            fmt::format("Cannot arm a timeout on fd # {}, not registered in this loop", desc.fd()));
  }
  _timers.cancel(*pTimeoutId);
  const NativeHandle fd = desc.fd();
  *pTimeoutId = _timers.schedule(SteadyClock::now() + timeout, [this, fd] { fireTimeout(fd); });
}

bool EventLoop::disarmTimeout(Descriptor& desc) {
  TimerId* pTimeoutId = OwnerOf(desc) == this ? findTimeoutId(desc) : nullptr;
  if (pTimeoutId == nullptr) {
    return false;
  }
  return _timers.cancel(std::exchange(*pTimeoutId, kInvalidTimerId));
}

void EventLoop::fireTimeout(NativeHandle fd) {
  auto it = _entries.find(fd);
  if (it != _entries.end() && it->second->desc != nullptr && !it->second->removed) {
    Entry& entry = *it->second;
    entry.timeoutId = kInvalidTimerId;
    if (entry.handler.onTimeout && entry.desc->isOpen()) {
      invokeGuarded(fd, FaultSource::Timeout, [&entry] { entry.handler.onTimeout(*entry.desc); });
    }
    return;
  }
  auto pendingIt = std::ranges::find_if(_pendingAdds, [fd](const PendingAdd& pendingAdd) {
    return pendingAdd.desc->fd() == fd;
  });
  if (pendingIt == _pendingAdds.end()) {
    return;
  }
  pendingIt->timeoutId = kInvalidTimerId;
  // _pendingAdds may grow from the callback
  auto onTimeout = pendingIt->handler.onTimeout;
  Descriptor* desc = pendingIt->desc;
  if (onTimeout) {
    invokeGuarded(fd, FaultSource::Timeout, [&onTimeout, desc] { onTimeout(*desc); });
  }
}

TimerId EventLoop::callAfter(SteadyDuration delay, TimerQueue::Callback cb) {
  return _timers.schedule(SteadyClock::now() + delay, std::move(cb));
}

TimerId EventLoop::callEvery(SteadyDuration interval, TimerQueue::Callback cb) {
  if (interval <= SteadyDuration::zero()) {
    throw std::invalid_argument("Recurring timer interval must be positive");
  }
  return _timers.schedule(SteadyClock::now() + interval, std::move(cb), interval);
}

TimerId EventLoop::callAt(SteadyTimePoint deadline, TimerQueue::Callback cb) {
  return _timers.schedule(deadline, std::move(cb));
}

bool EventLoop::cancel(TimerId id) noexcept { return _timers.cancel(id); }

void EventLoop::post(std::function<void()> task) {
  if (!task) {
    throw std::invalid_argument("Posted task cannot be empty");
  }
  _postedTasks.push(std::move(task));
  _poller->wakeup();
}

void EventLoop::stop() noexcept {
  _stopRequested.store(true, std::memory_order_relaxed);
  _poller->wakeup();
}

void EventLoop::reportFault(NativeHandle fd, FaultSource source, std::string_view message) {
  switch (source) {
    case FaultSource::Timer:
      ++_stats.timerFaults;
      break;
    case FaultSource::Task:
      ++_stats.taskFaults;
      break;
    default:
      ++_stats.handlerFaults;
      break;
  }
  if (!_config.faultHook) {
    return;
  }
  try {
    _config.faultHook(Fault{fd, source, std::string(message)});
  } catch (const std::exception& ex) {
    log::error("Fault hook threw: {}", ex.what());
  } catch (...) {
    log::error("Fault hook threw an unknown exception");
  }
}

void EventLoop::runPostedTasks() {
  _postedTasks.takeAll(_tasksBuffer);
  for (auto& task : _tasksBuffer) {
    invokeGuarded(kInvalidHandle, FaultSource::Task, task);
    ++_stats.postedTasksRun;
  }
  _tasksBuffer.clear();
}

SteadyDuration EventLoop::computeTimeout() {
  if (_stopRequested.load(std::memory_order_relaxed) || _postedTasks.hasTasks()) {
    return SteadyDuration::zero();
  }
  SteadyDuration timeout = _config.maxPollInterval < std::chrono::milliseconds::zero()
                               ? SteadyDuration(-1)
                               : std::chrono::duration_cast<SteadyDuration>(_config.maxPollInterval);
  if (const auto nextDeadline = _timers.nextDeadline(); nextDeadline) {
    const SteadyDuration untilNext = std::max(*nextDeadline - SteadyClock::now(), SteadyDuration::zero());
    if (timeout < SteadyDuration::zero() || untilNext < timeout) {
      timeout = untilNext;
    }
  }
  return timeout;
}

void EventLoop::dispatch(Poller::FdEvent event) {
  const NativeHandle fd = event.fd;
  auto it = _entries.find(fd);
  if (it == _entries.end()) {
    log::trace("Ignoring events {:#x} of unknown fd # {}", event.eventBmp, fd);
    return;
  }
  // Stable during the whole dispatch step: the registry is only modified in applyPendingUpdates().
  Entry& entry = *it->second;
  if (entry.desc == nullptr || !entry.desc->isOpen()) {
    return;
  }
  ++_stats.eventsDispatched;
  const EventBmp bmp = event.eventBmp;

  if ((bmp & EventReadable) != 0 && entry.handler.onReadable) {
    invokeGuarded(fd, FaultSource::Readable, [&entry] { entry.handler.onReadable(*entry.desc); });
    if (entry.desc == nullptr || !entry.desc->isOpen()) {
      return;
    }
  }
  if ((bmp & EventOut) != 0 && entry.handler.onWritable) {
    invokeGuarded(fd, FaultSource::Writable, [&entry] { entry.handler.onWritable(*entry.desc); });
    if (entry.desc == nullptr || !entry.desc->isOpen()) {
      return;
    }
  }

  // A hang-up still carrying readable data (or a half close) is an end of stream for the reader to drain:
  // it keeps being reported as readable until the reader closes the descriptor.
  const bool drainable = (bmp & (EventIn | EventPri | EventRdHup)) != 0 && entry.handler.onReadable;
  std::error_code ec = TakeFault(*entry.desc);
  if ((bmp & EventErr) != 0 || ((bmp & EventHup) != 0 && !drainable)) {
    ec = BackendFaultError(*entry.desc, bmp);
  }
  if (!ec) {
    return;
  }
  log::debug("fd # {} fault: {}", fd, ec.message());
  if (entry.handler.onError) {
    invokeGuarded(fd, FaultSource::Error, [&entry, ec] { entry.handler.onError(*entry.desc, ec); });
  }
  if (entry.desc != nullptr) {
    entry.desc->close();
  }
}

void EventLoop::applyPendingUpdates() {
  // Handlers of removed entries are destroyed last, their destructors may release other descriptors
  // and thus request new updates, applied by the next iteration.
  std::vector<Handler> graveyard;
  while (_hasRemovals || !_pendingAdds.empty() || !_closing.empty()) {
    if (_hasRemovals) {
      _hasRemovals = false;
      for (auto it = _entries.begin(); it != _entries.end();) {
        Entry& entry = *it->second;
        if (!entry.removed) {
          ++it;
          continue;
        }
        if (entry.desc != nullptr && entry.desc->isOpen() && OwnerOf(*entry.desc) == this) {
          SetOwner(*entry.desc, nullptr);
        }
        graveyard.push_back(std::move(entry.handler));
        it = _entries.erase(it);
      }
    }

    std::vector<PendingAdd> pendingAdds = std::exchange(_pendingAdds, {});
    for (PendingAdd& pendingAdd : pendingAdds) {
      SetOwner(*pendingAdd.desc, this);
      _entries.insert_or_assign(pendingAdd.desc->fd(), std::make_unique<Entry>(Entry{
                                                           pendingAdd.desc, std::move(pendingAdd.handler),
                                                           pendingAdd.timeoutId}));
    }

    std::vector<Descriptor*> closing = std::exchange(_closing, {});
    for (Descriptor* desc : closing) {
      log::debug("fd # {} closed", desc->fd());
      FinishClose(*desc);
    }

    graveyard.clear();
  }
}

bool EventLoop::isIdle() const noexcept {
  return _poller->size() == 0 && _timers.empty() && !_postedTasks.hasTasks();
}

bool EventLoop::cycle() {
  _inCycle = true;

  runPostedTasks();
  applyPendingUpdates();

  const SteadyDuration timeout = computeTimeout();
  ++_stats.polls;
  const auto events = _poller->poll(timeout);
  if (events.data() == nullptr) [[unlikely]] {
    _inCycle = false;
    return false;
  }

  for (const Poller::FdEvent event : events) {
    dispatch(event);
  }
  applyPendingUpdates();

  _stats.timersFired += _timers.fireExpired(SteadyClock::now());
  applyPendingUpdates();

  _inCycle = false;
  ++_stats.cycles;
  return true;
}

bool EventLoop::runOnce() { return cycle(); }

void EventLoop::run() {
  bool expected = false;
  if (!_running.compare_exchange_strong(expected, true)) {
    throw std::logic_error("Event loop is already running");
  }
  log::info("Event loop started ({} backend, {} registered, {} timers)", pollerName(), nbRegistered(), nbTimers());
  while (!_stopRequested.load(std::memory_order_relaxed)) {
    if (_config.stopWhenIdle && isIdle()) {
      log::debug("Nothing left to watch");
      break;
    }
    if (!cycle()) {
      const std::error_code ec = _poller->lastError();
      log::critical("Event loop stopped on {} backend failure: {}", pollerName(), ec.message());
      _stopRequested.store(false, std::memory_order_relaxed);
      _running.store(false, std::memory_order_relaxed);
      throw std::system_error(ec, "Event loop backend failure");
    }
    if (SignalHandler::IsStopRequested()) {
      log::info("Stop requested by signal");
      break;
    }
  }
  _stopRequested.store(false, std::memory_order_relaxed);
  _running.store(false, std::memory_order_relaxed);
  log::info("Event loop stopped");
}

}  // namespace ioreactor
