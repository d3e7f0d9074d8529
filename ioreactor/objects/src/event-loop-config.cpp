#include "ioreactor/event-loop-config.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include "ioreactor/fault.hpp"
#include "ioreactor/log.hpp"
#include "ioreactor/poller.hpp"

namespace ioreactor {

void EventLoopConfig::validate() const {
  switch (pollerKind) {
    case PollerKind::Auto:
    case PollerKind::Epoll:
    case PollerKind::Poll:
    case PollerKind::Select:
      break;
    default:
      throw std::invalid_argument("Invalid poller kind");
  }
  if (initialEventCapacity == 0) {
    throw std::invalid_argument("initialEventCapacity must be > 0");
  }
  if (selectCapacity == 0 || selectCapacity > kMaxSelectCapacity) {
    throw std::invalid_argument("selectCapacity must be in [1, FD_SETSIZE]");
  }
  if (maxPollInterval == std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("maxPollInterval must be non-zero (negative means no cap)");
  }
  if (logLevel && (*logLevel < log::level::trace || *logLevel >= log::level::n_levels)) {
    throw std::invalid_argument("Invalid log level");
  }
}

EventLoopConfig& EventLoopConfig::withPollerKind(PollerKind kind) {
  pollerKind = kind;
  return *this;
}

EventLoopConfig& EventLoopConfig::withMaxPollInterval(std::chrono::milliseconds interval) {
  maxPollInterval = interval;
  return *this;
}

EventLoopConfig& EventLoopConfig::withInitialEventCapacity(uint32_t capacity) {
  initialEventCapacity = capacity;
  return *this;
}

EventLoopConfig& EventLoopConfig::withSelectCapacity(uint32_t capacity) {
  selectCapacity = capacity;
  return *this;
}

EventLoopConfig& EventLoopConfig::withStopWhenIdle(bool on) {
  stopWhenIdle = on;
  return *this;
}

EventLoopConfig& EventLoopConfig::withLogLevel(log::level::level_enum level) {
  logLevel = level;
  return *this;
}

EventLoopConfig& EventLoopConfig::withFaultHook(FaultHook hook) {
  faultHook = std::move(hook);
  return *this;
}

}  // namespace ioreactor
