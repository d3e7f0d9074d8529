#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <queue>
#include <string_view>
#include <vector>

#include "ioreactor/flat-hash-map.hpp"
#include "ioreactor/timedef.hpp"

namespace ioreactor {

// Cancellation token of a scheduled timer. 0 is never a valid id.
using TimerId = uint64_t;

inline constexpr TimerId kInvalidTimerId = 0;

// Deadline ordered schedule of one-shot and recurring callbacks.
//
// Timers are kept in a binary heap of (deadline, sequence, id). Cancellation only erases the id from the
// live table, the heap entry being discarded when it reaches the top. Equal deadlines fire in scheduling
// order. A recurring timer is re-inserted on each fire with a deadline computed from the fire time.
// Not thread-safe.
class TimerQueue {
 public:
  using Callback = std::function<void()>;

  // Called when a timer callback throws. The queue keeps firing the other timers.
  using FaultCallback = std::function<void(TimerId, std::string_view)>;

  TimerQueue() = default;

  explicit TimerQueue(FaultCallback onFault) : _onFault(std::move(onFault)) {}

  // Schedules 'cb' at 'deadline'. If interval is positive, the timer is recurring and fires again every
  // 'interval' after each fire, until cancelled.
  TimerId schedule(SteadyTimePoint deadline, Callback cb, SteadyDuration interval = SteadyDuration::zero());

  // Returns false if the id is unknown, already fired (one-shot) or already cancelled.
  // A timer may cancel itself from its own callback.
  bool cancel(TimerId id) noexcept;

  [[nodiscard]] bool contains(TimerId id) const noexcept { return _timers.count(id) != 0; }

  // Earliest deadline among live timers, if any.
  [[nodiscard]] std::optional<SteadyTimePoint> nextDeadline();

  // Fires, in deadline order, all timers whose deadline is <= now. Timers scheduled by the fired callbacks
  // are not fired before the next call, even if already due.
  // Returns the number of callbacks invoked.
  std::size_t fireExpired(SteadyTimePoint now);

  // Number of live (scheduled, not cancelled) timers.
  [[nodiscard]] std::size_t size() const noexcept { return _timers.size(); }

  [[nodiscard]] bool empty() const noexcept { return _timers.empty(); }

 private:
  struct Timer {
    Callback cb;
    SteadyDuration interval;
    uint64_t seq;
  };

  struct HeapEntry {
    SteadyTimePoint deadline;
    uint64_t seq;
    TimerId id;

    // std::priority_queue is a max-heap: invert to pop the earliest (deadline, seq) first.
    bool operator<(const HeapEntry& other) const noexcept {
      return deadline != other.deadline ? deadline > other.deadline : seq > other.seq;
    }
  };

  void push(SteadyTimePoint deadline, TimerId id, Timer& timer);

  void purgeStaleTop();

  std::priority_queue<HeapEntry, std::vector<HeapEntry>> _heap;
  flat_hash_map<TimerId, Timer> _timers;
  FaultCallback _onFault;
  TimerId _nextId{1};
  uint64_t _nextSeq{0};
};

}  // namespace ioreactor
