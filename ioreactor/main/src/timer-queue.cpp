#include "ioreactor/timer-queue.hpp"

#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <utility>

#include "ioreactor/log.hpp"
#include "ioreactor/timedef.hpp"

namespace ioreactor {

void TimerQueue::push(SteadyTimePoint deadline, TimerId id, Timer& timer) {
  timer.seq = _nextSeq++;
  _heap.push(HeapEntry{deadline, timer.seq, id});
}

TimerId TimerQueue::schedule(SteadyTimePoint deadline, Callback cb, SteadyDuration interval) {
  if (!cb) {
    throw std::invalid_argument("Timer callback cannot be empty");
  }
  const TimerId id = _nextId++;
  auto [it, inserted] = _timers.emplace(id, Timer{std::move(cb), interval, 0});
  push(deadline, id, it->second);
  log::trace("Timer {} scheduled ({} live)", id, _timers.size());
  return id;
}

bool TimerQueue::cancel(TimerId id) noexcept {
  // The heap entry stays until it reaches the top, where it is recognized as stale.
  return _timers.erase(id) != 0;
}

void TimerQueue::purgeStaleTop() {
  while (!_heap.empty()) {
    const HeapEntry& top = _heap.top();
    auto it = _timers.find(top.id);
    if (it != _timers.end() && it->second.seq == top.seq) {
      return;
    }
    _heap.pop();
  }
}

std::optional<SteadyTimePoint> TimerQueue::nextDeadline() {
  purgeStaleTop();
  if (_heap.empty()) {
    return std::nullopt;
  }
  return _heap.top().deadline;
}

std::size_t TimerQueue::fireExpired(SteadyTimePoint now) {
  // Entries pushed from now on (new timers, recurring re-insertions) wait for the next pass.
  const uint64_t seqLimit = _nextSeq;
  std::size_t nbFired = 0;
  while (true) {
    purgeStaleTop();
    if (_heap.empty()) {
      break;
    }
    const HeapEntry top = _heap.top();
    if (top.deadline > now || top.seq >= seqLimit) {
      break;
    }
    _heap.pop();

    auto it = _timers.find(top.id);
    Callback cb = std::move(it->second.cb);
    if (it->second.interval > SteadyDuration::zero()) {
      // Stays live during its callback so that it can cancel itself.
      push(now + it->second.interval, top.id, it->second);
    } else {
      _timers.erase(it);
    }

    ++nbFired;
    try {
      cb();
    } catch (const std::exception& ex) {
      log::error("Timer {} callback threw: {}", top.id, ex.what());
      if (_onFault) {
        _onFault(top.id, ex.what());
      }
    } catch (...) {
      log::error("Timer {} callback threw an unknown exception", top.id);
      if (_onFault) {
        _onFault(top.id, "unknown exception");
      }
    }

    // Recurring: give the callback back, unless cancelled meanwhile.
    it = _timers.find(top.id);
    if (it != _timers.end() && !it->second.cb) {
      it->second.cb = std::move(cb);
    }
  }
  return nbFired;
}

}  // namespace ioreactor
