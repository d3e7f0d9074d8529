#pragma once

#include <cstdint>

namespace ioreactor {

using EventBmp = uint32_t;

// Values are those of epoll on Linux, which happen to match the poll() ones for the first five flags.
// All poller implementations translate their native flags into this set.
inline constexpr EventBmp EventIn = 0x001;
inline constexpr EventBmp EventPri = 0x002;
inline constexpr EventBmp EventOut = 0x004;
inline constexpr EventBmp EventErr = 0x008;
inline constexpr EventBmp EventHup = 0x010;
inline constexpr EventBmp EventRdHup = 0x2000;

// Events meaning that the descriptor is broken or hung up.
inline constexpr EventBmp EventFault = EventErr | EventHup;

// Events that should wake up a reader: data, urgent data, or end of stream to observe.
inline constexpr EventBmp EventReadable = EventIn | EventPri | EventHup | EventRdHup;

}  // namespace ioreactor
