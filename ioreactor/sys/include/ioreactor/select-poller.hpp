#pragma once

#include <sys/select.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

#include "ioreactor/flat-hash-map.hpp"
#include "ioreactor/poller.hpp"

namespace ioreactor {

// Readiness backend over select(2), the least capable but most portable mechanism.
// Descriptor values are bounded: registering an fd >= capacity() fails with std::errc::value_too_large.
// The exception set is reported as EventPri (out-of-band data on sockets).
// select has no dedicated error / hang-up sets: a broken or hung up descriptor shows up as readable
// (the next read reports end of stream or the error), so EventErr / EventHup are never produced here.
class SelectPoller final : public Poller {
 public:
  static constexpr uint32_t kMaxCapacity = FD_SETSIZE;

  // capacity 0 means kMaxCapacity. Throws std::invalid_argument if capacity > kMaxCapacity, and
  // std::system_error if the internal wakeup fd does not fit in an fd_set.
  explicit SelectPoller(uint32_t capacity = kMaxCapacity);

  [[nodiscard]] PollerKind kind() const noexcept override { return PollerKind::Select; }

  [[nodiscard]] std::error_code add(FdEvent event) override;

  [[nodiscard]] std::error_code mod(FdEvent event) override;

  std::error_code del(NativeHandle fd) override;

  [[nodiscard]] std::span<const FdEvent> poll(SteadyDuration timeout) override;

  [[nodiscard]] std::size_t size() const noexcept override { return _registered.size(); }

  [[nodiscard]] bool contains(NativeHandle fd) const noexcept override { return _registered.count(fd) != 0; }

  [[nodiscard]] uint32_t capacity() const noexcept { return _capacity; }

 private:
  void setInterest(NativeHandle fd, EventBmp eventBmp) noexcept;

  void clearInterest(NativeHandle fd) noexcept;

  void updateMaxFd() noexcept;

  fd_set _readSet;
  fd_set _writeSet;
  fd_set _exceptSet;
  uint32_t _capacity;
  NativeHandle _maxFd;
  flat_hash_map<NativeHandle, EventBmp> _registered;
  std::vector<FdEvent> _ready;
};

}  // namespace ioreactor
