#pragma once

#include <cstdint>

namespace ioreactor {

// Raises the soft limit of open file descriptors of the process up to its hard limit, so that a loop can
// watch as many descriptors as the system allows.
// Returns the soft limit in effect after the call.
// Throws std::system_error if the current limits cannot be queried.
uint64_t RaiseOpenFileLimit();

}  // namespace ioreactor
