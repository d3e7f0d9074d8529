#pragma once

#include <poll.h>

#include <cstddef>
#include <span>
#include <system_error>
#include <vector>

#include "ioreactor/flat-hash-map.hpp"
#include "ioreactor/poller.hpp"

namespace ioreactor {

// Readiness backend over poll(2): a flat pollfd array scanned linearly on each wait.
// The wakeup fd always occupies slot 0. Removal swaps the last slot into the hole, so the array stays
// dense and the fd -> slot map gives O(1) add / mod / del.
class PollPoller final : public Poller {
 public:
  PollPoller();

  [[nodiscard]] PollerKind kind() const noexcept override { return PollerKind::Poll; }

  [[nodiscard]] std::error_code add(FdEvent event) override;

  [[nodiscard]] std::error_code mod(FdEvent event) override;

  std::error_code del(NativeHandle fd) override;

  [[nodiscard]] std::span<const FdEvent> poll(SteadyDuration timeout) override;

  [[nodiscard]] std::size_t size() const noexcept override { return _slotByFd.size(); }

  [[nodiscard]] bool contains(NativeHandle fd) const noexcept override { return _slotByFd.count(fd) != 0; }

 private:
  std::vector<pollfd> _pollFds;
  flat_hash_map<NativeHandle, std::size_t> _slotByFd;
  std::vector<FdEvent> _ready;
};

}  // namespace ioreactor
