#pragma once

#include "ioreactor/platform.hpp"

namespace ioreactor {

// Simple RAII class wrapping a file descriptor / native handle.
class BaseFd {
 public:
  static constexpr NativeHandle kClosedFd = kInvalidHandle;

  explicit BaseFd(NativeHandle fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd& other) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd& other) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept;

  ~BaseFd() { close(); }

  [[nodiscard]] NativeHandle fd() const noexcept { return _fd; }

  // Truthy check so users can write: if (baseFd) { ... }
  // Returns true if the underlying fd is valid (not closed).
  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Release ownership of the underlying fd without closing it.
  // Returns the raw fd and sets this object to closed state.
  [[nodiscard]] NativeHandle release() noexcept;

  // Close the underlying file descriptor immediately.
  // Idempotent: multiple calls after first successful/failed close are no-ops.
  void close() noexcept;

  // Equality comparison - simply compare the underlying fd integer.
  bool operator==(const BaseFd&) const noexcept = default;

 private:
  NativeHandle _fd;
};

}  // namespace ioreactor
