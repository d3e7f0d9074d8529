#include "ioreactor/loop-stats.hpp"

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

namespace ioreactor {

std::string LoopStats::json_str() const {
  std::string out;
  out.reserve(208UL);
  out.push_back('{');
  bool first = true;
  for_each_field([&out, &first](std::string_view name, uint64_t value) {
    if (!first) {
      out.push_back(',');
    }
    first = false;
    out.push_back('"');
    out.append(name).append("\":");
    char buf[24];
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    out.append(buf, ptr);
  });
  out.push_back('}');
  return out;
}

}  // namespace ioreactor
