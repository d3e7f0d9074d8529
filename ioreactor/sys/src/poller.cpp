#include "ioreactor/poller.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <string_view>
#include <system_error>

#include "ioreactor/epoll-poller.hpp"
#include "ioreactor/log.hpp"
#include "ioreactor/platform.hpp"
#include "ioreactor/poll-poller.hpp"
#include "ioreactor/select-poller.hpp"
#include "ioreactor/timedef.hpp"

namespace ioreactor {

std::string_view PollerKindName(PollerKind kind) noexcept {
  switch (kind) {
    case PollerKind::Auto:
      return "auto";
    case PollerKind::Epoll:
      return "epoll";
    case PollerKind::Poll:
      return "poll";
    case PollerKind::Select:
      return "select";
    default:
      return "unknown";
  }
}

int ToPollTimeoutMs(SteadyDuration timeout) noexcept {
  if (timeout < SteadyDuration::zero()) {
    return -1;
  }
  const auto ms = std::chrono::ceil<std::chrono::milliseconds>(timeout).count();
  if (ms > std::numeric_limits<int>::max()) {
    return std::numeric_limits<int>::max();
  }
  return static_cast<int>(ms);
}

namespace {

std::unique_ptr<Poller> CreatePoller(PollerKind kind, const PollerOptions& options) {
  switch (kind) {
    case PollerKind::Epoll:
      return std::make_unique<EpollPoller>(options.initialEventCapacity);
    case PollerKind::Poll:
      return std::make_unique<PollPoller>();
    case PollerKind::Select:
      return std::make_unique<SelectPoller>(options.selectCapacity);
    default:
      return nullptr;
  }
}

}  // namespace

std::unique_ptr<Poller> MakePoller(PollerKind preferred, PollerOptions options) {
  static constexpr PollerKind kRanked[] = {PollerKind::Epoll, PollerKind::Poll, PollerKind::Select};

  const PollerKind first = preferred == PollerKind::Auto ? PollerKind::Epoll : preferred;
  std::error_code lastErr = std::make_error_code(std::errc::function_not_supported);
  bool started = false;
  for (PollerKind kind : kRanked) {
    if (kind == first) {
      started = true;
    }
    if (!started) {
      continue;
    }
    try {
      auto poller = CreatePoller(kind, options);
      if (poller) {
        if (kind != first) {
          log::warn("Poller '{}' unavailable, falling back to '{}'", PollerKindName(first), PollerKindName(kind));
        }
        log::debug("Using '{}' poller", PollerKindName(kind));
        return poller;
      }
      log::warn("Poller '{}' is not supported on this platform", PollerKindName(kind));
    } catch (const std::system_error& ex) {
      lastErr = ex.code();
      log::warn("Unable to create '{}' poller: {}", PollerKindName(kind), ex.what());
    }
  }
  throw std::system_error(lastErr, "no readiness backend could be created");
}

}  // namespace ioreactor
