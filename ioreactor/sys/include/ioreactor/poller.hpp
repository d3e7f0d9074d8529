#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <system_error>

#include "ioreactor/event-fd.hpp"
#include "ioreactor/event.hpp"
#include "ioreactor/platform.hpp"
#include "ioreactor/timedef.hpp"

namespace ioreactor {

// Readiness multiplexing mechanisms, ordered by decreasing capability.
enum class PollerKind : uint8_t { Auto, Epoll, Poll, Select };

[[nodiscard]] std::string_view PollerKindName(PollerKind kind) noexcept;

struct PollerOptions {
  // Starting number of event slots of the epoll buffer. Values of 0 are promoted to 1.
  uint32_t initialEventCapacity{64};
  // Exclusive upper bound on descriptor values accepted by the select poller (at most FD_SETSIZE).
  uint32_t selectCapacity{0};
};

// Common registration / wait contract of the readiness backends.
//
// Semantics shared by all implementations:
//  * add() on an already registered fd fails with std::errc::file_exists, mod() / del() on an unknown fd
//    fail with std::errc::no_such_file_or_directory. A failed call never alters the registration set.
//  * Interest is level-triggered: a descriptor that stays ready is reported on every poll().
//  * poll() timeout: zero polls without blocking, negative blocks indefinitely, positive blocks at most
//    that long.
//  * EventErr / EventHup are always reported by epoll and poll, whatever the registered interest.
//  * Each poller owns a wakeup EventFd, watched internally and never reported nor counted in size().
class Poller {
 public:
  struct FdEvent {
    NativeHandle fd;
    EventBmp eventBmp;
  };

  Poller(const Poller&) = delete;
  Poller(Poller&&) = delete;
  Poller& operator=(const Poller&) = delete;
  Poller& operator=(Poller&&) = delete;

  virtual ~Poller() = default;

  [[nodiscard]] virtual PollerKind kind() const noexcept = 0;

  // Register fd with given events.
  [[nodiscard]] virtual std::error_code add(FdEvent event) = 0;

  // Modify the events of a registered fd.
  [[nodiscard]] virtual std::error_code mod(FdEvent event) = 0;

  // Remove fd from monitoring.
  virtual std::error_code del(NativeHandle fd) = 0;

  // Waits for ready events up to the given timeout.
  //
  // Returns a span over an internal, reusable buffer, valid until the next call to poll().
  //  - On success: returns a non-empty span of ready events.
  //  - On timeout, wakeup or when interrupted by a signal (EINTR): returns an empty span
  //    with non-null data() pointer.
  //  - On unrecoverable poll failure (already logged, see lastError()): returns an empty span
  //    with nullptr data() pointer.
  [[nodiscard]] virtual std::span<const FdEvent> poll(SteadyDuration timeout) = 0;

  // Number of registered descriptors.
  [[nodiscard]] virtual std::size_t size() const noexcept = 0;

  [[nodiscard]] virtual bool contains(NativeHandle fd) const noexcept = 0;

  // Interrupts a poll() blocked in another thread (or makes the next one return immediately).
  // Thread-safe.
  void wakeup() const noexcept { _wakeupFd.send(); }

  // Error of the last failed poll().
  [[nodiscard]] std::error_code lastError() const noexcept { return _lastError; }

 protected:
  Poller() = default;

  void setLastError(int err) noexcept { _lastError = std::error_code(err, std::generic_category()); }

  EventFd _wakeupFd;

 private:
  std::error_code _lastError;
};

// Converts a poll timeout into milliseconds for epoll_wait / poll.
// Negative -> -1 (infinite), zero -> 0, positive sub-millisecond values round up to 1.
[[nodiscard]] int ToPollTimeoutMs(SteadyDuration timeout) noexcept;

// Builds the most capable poller available, starting from 'preferred' and falling back to less capable
// kinds (Epoll > Poll > Select). PollerKind::Auto starts from the most capable one.
// Throws std::system_error if none of the candidates could be created.
[[nodiscard]] std::unique_ptr<Poller> MakePoller(PollerKind preferred = PollerKind::Auto,
                                                 PollerOptions options = {});

}  // namespace ioreactor
