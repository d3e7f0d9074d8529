#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

#include "ioreactor/descriptor.hpp"
#include "ioreactor/event-loop-config.hpp"
#include "ioreactor/fault.hpp"
#include "ioreactor/flat-hash-map.hpp"
#include "ioreactor/handler.hpp"
#include "ioreactor/internal/posted-tasks.hpp"
#include "ioreactor/loop-stats.hpp"
#include "ioreactor/platform.hpp"
#include "ioreactor/poller.hpp"
#include "ioreactor/timedef.hpp"
#include "ioreactor/timer-queue.hpp"

namespace ioreactor {

// Single-threaded readiness dispatcher: owns one Poller, the Descriptor -> Handler registry and a
// TimerQueue. One loop per thread; only stop(), wakeup() and post() may be called from other threads.
//
// Each cycle:
//   1. run the tasks posted since the previous cycle,
//   2. wait for readiness, at most until the next timer deadline (capped by maxPollInterval),
//      without blocking if a stop or a posted task is pending,
//   3. dispatch the reported events to the handlers,
//   4. apply the registrations / unregistrations requested during step 3,
//   5. fire the expired timers.
//
// Registry changes requested from callbacks are buffered until the end of the dispatch step, so that
// handlers can safely add, remove or close any descriptor, including their own.
class EventLoop : private DescriptorOwner {
 public:
  // Throws std::invalid_argument if config is invalid, std::system_error if no backend can be created.
  explicit EventLoop(EventLoopConfig config = {});

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&&) = delete;

  // Descriptors still registered are released (not closed).
  ~EventLoop() override;

  // Registers 'desc' with its current interest. The loop does not own the Descriptor object, which must
  // outlive its registration (destroying it unregisters it).
  // Throws std::system_error:
  //  - std::errc::file_exists if 'desc' is already registered here or owned by another loop,
  //  - std::errc::bad_file_descriptor if 'desc' is not open,
  //  - the backend error if it refuses the descriptor (value_too_large for select capacity, EPERM for regular
  //    files under epoll...). The registry is left unchanged.
  // From a callback, the registry insertion happens at the end of the dispatch step.
  void add(Descriptor& desc, Handler handler);

  // Unregisters 'desc', without closing it. Returns false if it is not registered in this loop.
  // From a callback, readiness already reported for 'desc' in the current cycle is still dispatched, and the
  // descriptor stays owned by this loop until the end of the dispatch step.
  bool remove(Descriptor& desc);

  // Changes the interest of a registered descriptor, equivalent to desc.setInterest(interest).
  // Throws std::system_error (std::errc::no_such_file_or_directory) if 'desc' is not registered here.
  void modify(Descriptor& desc, Descriptor::Interest interest);

  // Arms (or re-arms) a deadline for 'desc': its onTimeout callback fires once after 'timeout' unless disarmed
  // before. Cleared on unregistration.
  // Throws std::system_error (std::errc::no_such_file_or_directory) if 'desc' is not registered here.
  void armTimeout(Descriptor& desc, SteadyDuration timeout);

  // Returns false if no deadline was armed for 'desc'.
  bool disarmTimeout(Descriptor& desc);

  // Schedules cb once after 'delay'.
  TimerId callAfter(SteadyDuration delay, TimerQueue::Callback cb);

  // Schedules cb every 'interval', first fire after 'interval'.
  // Throws std::invalid_argument if interval is not positive.
  TimerId callEvery(SteadyDuration interval, TimerQueue::Callback cb);

  // Schedules cb once at 'deadline'.
  TimerId callAt(SteadyTimePoint deadline, TimerQueue::Callback cb);

  // Returns false if the timer already fired or was already cancelled.
  bool cancel(TimerId id) noexcept;

  // Queues 'task' to be run by the loop thread at the start of the next cycle. Thread-safe.
  void post(std::function<void()> task);

  // Interrupts a blocking wait of the loop. Thread-safe.
  void wakeup() const noexcept { _poller->wakeup(); }

  // Requests run() to return after the current cycle. Thread-safe.
  void stop() noexcept;

  // Runs cycles until stop() is called, SIGINT / SIGTERM is received (see SignalHandler), or, with
  // stopWhenIdle, until nothing is registered nor scheduled.
  // Throws std::system_error with the backend error if the wait fails, and std::logic_error if already running.
  void run();

  // Runs a single cycle. Returns false if the backend wait failed (see pollerError()).
  bool runOnce();

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_relaxed); }

  // Number of registered descriptors, including the ones whose registration is buffered.
  [[nodiscard]] std::size_t nbRegistered() const noexcept { return _poller->size(); }

  // Number of scheduled timers, descriptor deadlines included.
  [[nodiscard]] std::size_t nbTimers() const noexcept { return _timers.size(); }

  [[nodiscard]] bool isRegistered(NativeHandle fd) const noexcept { return _poller->contains(fd); }

  [[nodiscard]] bool isRegistered(const Descriptor& desc) const noexcept;

  [[nodiscard]] PollerKind pollerKind() const noexcept { return _poller->kind(); }

  [[nodiscard]] std::string_view pollerName() const noexcept { return PollerKindName(_poller->kind()); }

  [[nodiscard]] std::error_code pollerError() const noexcept { return _poller->lastError(); }

  [[nodiscard]] const EventLoopConfig& config() const noexcept { return _config; }

  [[nodiscard]] LoopStats stats() const noexcept { return _stats; }

 private:
  struct Entry {
    Descriptor* desc;
    Handler handler;
    TimerId timeoutId{kInvalidTimerId};
    bool removed{false};  // unregistration buffered until the end of the dispatch step
  };

  struct PendingAdd {
    Descriptor* desc;
    Handler handler;
    TimerId timeoutId{kInvalidTimerId};
  };

  // DescriptorOwner
  void interestChanged(Descriptor& desc) override;
  bool closing(Descriptor& desc) noexcept override;
  void relocated(Descriptor& from, Descriptor& to) noexcept override;
  void detached(Descriptor& desc) noexcept override;

  Entry* findEntry(const Descriptor& desc) noexcept;
  PendingAdd* findPendingAdd(const Descriptor& desc) noexcept;
  TimerId* findTimeoutId(const Descriptor& desc) noexcept;

  // Drops 'desc' from the backend and the registry (or marks it removed while in a cycle).
  // Returns false if it is not registered.
  bool unregister(Descriptor& desc) noexcept;

  bool cycle();
  void runPostedTasks();
  [[nodiscard]] SteadyDuration computeTimeout();
  void dispatch(Poller::FdEvent event);
  void fireTimeout(NativeHandle fd);
  void applyPendingUpdates();
  [[nodiscard]] bool isIdle() const noexcept;

  template <class Fn>
  void invokeGuarded(NativeHandle fd, FaultSource source, Fn&& fn);

  void reportFault(NativeHandle fd, FaultSource source, std::string_view message);

  EventLoopConfig _config;
  std::unique_ptr<Poller> _poller;
  TimerQueue _timers;
  // Entries are referenced by the dispatch step across callbacks: keep their address stable.
  flat_hash_map<NativeHandle, std::unique_ptr<Entry>> _entries;
  std::vector<PendingAdd> _pendingAdds;
  std::vector<Descriptor*> _closing;  // handle release deferred to the end of the dispatch step
  std::vector<internal::PostedTasks::Task> _tasksBuffer;
  internal::PostedTasks _postedTasks;
  LoopStats _stats;
  std::atomic<bool> _stopRequested{false};
  std::atomic<bool> _running{false};
  bool _inCycle{false};
  bool _hasRemovals{false};
};

}  // namespace ioreactor
