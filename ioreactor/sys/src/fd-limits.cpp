#include "ioreactor/fd-limits.hpp"

#include <sys/resource.h>

#include <cerrno>
#include <cstdint>

#include "ioreactor/errno-throw.hpp"
#include "ioreactor/log.hpp"
#include "ioreactor/platform.hpp"

namespace ioreactor {

uint64_t RaiseOpenFileLimit() {
  rlimit limits{};
  if (::getrlimit(RLIMIT_NOFILE, &limits) != 0) {
    throw_errno("getrlimit(RLIMIT_NOFILE) failed");
  }
  if (limits.rlim_cur == limits.rlim_max) {
    return static_cast<uint64_t>(limits.rlim_cur);
  }
  const auto previous = limits.rlim_cur;
  limits.rlim_cur = limits.rlim_max;
  if (::setrlimit(RLIMIT_NOFILE, &limits) != 0) {
    const int err = errno;
    log::warn("Unable to raise open files soft limit from {} to {}: errno={}, msg={}",
              static_cast<uint64_t>(previous), static_cast<uint64_t>(limits.rlim_max), err, SystemErrorMessage(err));
    return static_cast<uint64_t>(previous);
  }
  log::info("Open files soft limit raised from {} to {}", static_cast<uint64_t>(previous),
            static_cast<uint64_t>(limits.rlim_cur));
  return static_cast<uint64_t>(limits.rlim_cur);
}

}  // namespace ioreactor
