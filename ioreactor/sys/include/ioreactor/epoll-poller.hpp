#pragma once

#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

#include "ioreactor/base-fd.hpp"
#include "ioreactor/flat-hash-map.hpp"
#include "ioreactor/poller.hpp"

namespace ioreactor {

// Thin RAII wrapper over epoll, the indexed readiness mechanism of Linux.
//
//  * Registration / modification are O(1); poll() cost depends only on the number of ready descriptors.
//  * Interest is always level-triggered (EPOLLET is never set).
//  * Event buffer starts with initialEventCapacity slots. On saturation (returned events == current
//    capacity) the capacity is doubled. We do not shrink the buffer; poll cost is independent of capacity.
class EpollPoller final : public Poller {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  // Throws std::system_error if epoll_create1 fails.
  explicit EpollPoller(uint32_t initialCapacity = kInitialCapacity);

  ~EpollPoller() override;

  [[nodiscard]] PollerKind kind() const noexcept override { return PollerKind::Epoll; }

  [[nodiscard]] std::error_code add(FdEvent event) override;

  [[nodiscard]] std::error_code mod(FdEvent event) override;

  std::error_code del(NativeHandle fd) override;

  [[nodiscard]] std::span<const FdEvent> poll(SteadyDuration timeout) override;

  [[nodiscard]] std::size_t size() const noexcept override { return _registered.size(); }

  [[nodiscard]] bool contains(NativeHandle fd) const noexcept override { return _registered.count(fd) != 0; }

  // Current allocated capacity (number of event slots available without reallocation).
  [[nodiscard]] uint32_t capacity() const noexcept { return _nbAllocatedEvents; }

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

 private:
  uint32_t _nbAllocatedEvents;
  BaseFd _baseFd;
  void* _pEvents;
  flat_hash_map<NativeHandle, EventBmp> _registered;
  std::vector<FdEvent> _ready;
};

}  // namespace ioreactor
