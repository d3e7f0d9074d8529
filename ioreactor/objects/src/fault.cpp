#include "ioreactor/fault.hpp"

#include <string_view>

namespace ioreactor {

std::string_view FaultSourceName(FaultSource source) noexcept {
  switch (source) {
    case FaultSource::Readable:
      return "readable";
    case FaultSource::Writable:
      return "writable";
    case FaultSource::Error:
      return "error";
    case FaultSource::Timeout:
      return "timeout";
    case FaultSource::Timer:
      return "timer";
    case FaultSource::Task:
      return "task";
    default:
      return "unknown";
  }
}

}  // namespace ioreactor
