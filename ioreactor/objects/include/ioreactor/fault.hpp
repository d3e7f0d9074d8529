#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "ioreactor/platform.hpp"

namespace ioreactor {

// Where an isolated callback failure happened.
enum class FaultSource : uint8_t { Readable, Writable, Error, Timeout, Timer, Task };

[[nodiscard]] std::string_view FaultSourceName(FaultSource source) noexcept;

// Description of a callback failure that was caught by the event loop, which keeps running.
struct Fault {
  NativeHandle fd{kInvalidHandle};  // descriptor of the handler, kInvalidHandle for timers and posted tasks
  FaultSource source{FaultSource::Task};
  std::string message;
};

using FaultHook = std::function<void(const Fault&)>;

}  // namespace ioreactor
