#pragma once

#include <functional>
#include <system_error>

#include "ioreactor/descriptor.hpp"

namespace ioreactor {

// Callbacks bound to one registered Descriptor. Every slot is optional.
// Application context is carried by the callables themselves (lambda captures).
//
// For a given readiness report the loop invokes onReadable, then onWritable, then onError, skipping the
// remaining ones as soon as the descriptor is closed. After onError the loop closes the descriptor.
struct Handler {
  // Input, urgent data, or end of stream / hang-up to observe.
  std::function<void(Descriptor&)> onReadable;

  // Output possible.
  std::function<void(Descriptor&)> onWritable;

  // Error reported by the backend (error from SO_ERROR when available), hang-up with nothing left to read
  // (std::errc::broken_pipe), or fatal fault recorded by a read / write during the previous callbacks.
  // A hang-up while input is still pending is not an error: onReadable keeps being called until the reader
  // observes the end of stream and closes the descriptor.
  std::function<void(Descriptor&, std::error_code)> onError;

  // Deadline armed by EventLoop::armTimeout expired. Fires once per arming.
  std::function<void(Descriptor&)> onTimeout;
};

}  // namespace ioreactor
