#include "ioreactor/base-fd.hpp"

#include <cerrno>
#include <utility>

#include "ioreactor/log.hpp"
#include "ioreactor/platform.hpp"

namespace ioreactor {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd != kClosedFd) {
    while (true) {
      if (CloseNativeHandle(_fd) == 0) {
        break;
      }
      const int err = LastSystemError();
      if (err == EINTR) {
        // Retry close if interrupted; POSIX allows either retry or treat as closed.
        continue;
      }
      // Other errors: EBADF (benign if race closed elsewhere), EIO, etc.
      log::error("close fd # {} failed: {}", _fd, SystemErrorMessage(err));
      break;
    }
    log::debug("fd # {} closed", _fd);
    _fd = kClosedFd;
  }
}

NativeHandle BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace ioreactor
