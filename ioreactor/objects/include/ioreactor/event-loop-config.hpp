#pragma once

#include <sys/select.h>

#include <chrono>
#include <cstdint>
#include <optional>

#include "ioreactor/fault.hpp"
#include "ioreactor/log.hpp"
#include "ioreactor/poller.hpp"

namespace ioreactor {

struct EventLoopConfig {
  static constexpr uint32_t kMaxSelectCapacity = FD_SETSIZE;

  // Preferred readiness backend. If it cannot be created, the next less capable kind is tried
  // (epoll > poll > select). Auto starts from the most capable one. Default: Auto.
  PollerKind pollerKind{PollerKind::Auto};

  // Upper bound of a single wait of the backend, even when no timer is due earlier.
  // A negative value removes the cap: the loop then sleeps until the next timer, I/O event or wakeup.
  // Default: 1 s.
  std::chrono::milliseconds maxPollInterval{std::chrono::seconds{1}};

  // Number of event slots initially reserved by the epoll backend. The buffer doubles when a wait fills it.
  // Must be > 0. Default: 64.
  uint32_t initialEventCapacity{64};

  // Exclusive upper bound of descriptor values accepted by the select backend, in [1, FD_SETSIZE].
  // Registering a descriptor above it is a capacity fault. Default: FD_SETSIZE.
  uint32_t selectCapacity{kMaxSelectCapacity};

  // When true, run() returns as soon as no descriptor is registered and no timer is scheduled.
  // Default: false.
  bool stopWhenIdle{false};

  // If set, applied as the global log level when the loop is constructed.
  std::optional<log::level::level_enum> logLevel;

  // Called (from the loop thread) for each handler / timer / posted task that threw.
  // Faults are logged at error level in any case.
  FaultHook faultHook;

  // Throws std::invalid_argument if the configuration is invalid.
  void validate() const;

  // Backend construction options derived from this configuration.
  [[nodiscard]] PollerOptions pollerOptions() const noexcept { return {initialEventCapacity, selectCapacity}; }

  EventLoopConfig& withPollerKind(PollerKind kind);

  EventLoopConfig& withMaxPollInterval(std::chrono::milliseconds interval);

  EventLoopConfig& withInitialEventCapacity(uint32_t capacity);

  EventLoopConfig& withSelectCapacity(uint32_t capacity);

  EventLoopConfig& withStopWhenIdle(bool on = true);

  EventLoopConfig& withLogLevel(log::level::level_enum level);

  EventLoopConfig& withFaultHook(FaultHook hook);
};

}  // namespace ioreactor
