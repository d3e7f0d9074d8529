#pragma once

// Logging goes through spdlog. Call sites use the fmt-style API through the ioreactor::log alias:
//   log::error("epoll_ctl ADD failed (fd # {}, errno={})", fd, err);
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace ioreactor {

namespace log = spdlog;

}  // namespace ioreactor
