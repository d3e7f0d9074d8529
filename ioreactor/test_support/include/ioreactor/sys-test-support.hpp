#pragma once

#include <dlfcn.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ioreactor/base-fd.hpp"

namespace ioreactor::test {

// Portable resolver for RTLD_NEXT symbols, for tests interposing system calls.
// It aborts if symbol resolution fails.
template <typename Fn>
Fn ResolveNext(const char* name) {
  void* sym = dlsym(RTLD_NEXT, name);
  if (sym == nullptr) {
    std::abort();
  }
  return reinterpret_cast<Fn>(sym);
}

// FIFO of scripted results consumed by interposed system calls. Thread-safe.
template <typename Action>
class ActionQueue {
 public:
  ActionQueue() = default;
  ActionQueue(const ActionQueue&) = delete;
  ActionQueue& operator=(const ActionQueue&) = delete;

  void reset() {
    std::scoped_lock<std::mutex> lock(_mutex);
    _actions.clear();
  }

  void setActions(std::initializer_list<Action> actions) {
    std::scoped_lock<std::mutex> lock(_mutex);
    _actions.assign(actions.begin(), actions.end());
  }

  void setActions(std::vector<Action> actions) {
    std::scoped_lock<std::mutex> lock(_mutex);
    _actions.clear();
    for (auto& action : actions) {
      _actions.emplace_back(std::move(action));
    }
  }

  void push(Action action) {
    std::scoped_lock<std::mutex> lock(_mutex);
    _actions.emplace_back(std::move(action));
  }

  [[nodiscard]] std::optional<Action> pop() {
    std::scoped_lock<std::mutex> lock(_mutex);
    if (_actions.empty()) {
      return std::nullopt;
    }
    Action front = std::move(_actions.front());
    _actions.pop_front();
    return front;
  }

 private:
  std::mutex _mutex;
  std::deque<Action> _actions;
};

// Same as ActionQueue, with one queue per key (typically a file descriptor).
template <typename Key, typename Action, typename Hash = std::hash<Key>, typename Eq = std::equal_to<Key>>
class KeyedActionQueue {
 public:
  KeyedActionQueue() = default;
  KeyedActionQueue(const KeyedActionQueue&) = delete;
  KeyedActionQueue& operator=(const KeyedActionQueue&) = delete;

  void reset() {
    std::scoped_lock<std::mutex> lock(_mutex);
    _queues.clear();
  }

  void setActions(const Key& key, std::initializer_list<Action> actions) {
    std::scoped_lock<std::mutex> lock(_mutex);
    _queues[key] = std::deque<Action>(actions.begin(), actions.end());
  }

  void push(const Key& key, Action action) {
    std::scoped_lock<std::mutex> lock(_mutex);
    _queues[key].emplace_back(std::move(action));
  }

  [[nodiscard]] std::optional<Action> pop(const Key& key) {
    std::scoped_lock<std::mutex> lock(_mutex);
    auto it = _queues.find(key);
    if (it == _queues.end() || it->second.empty()) {
      return std::nullopt;
    }
    Action front = std::move(it->second.front());
    it->second.pop_front();
    if (it->second.empty()) {
      _queues.erase(it);
    }
    return front;
  }

 private:
  std::mutex _mutex;
  std::unordered_map<Key, std::deque<Action>, Hash, Eq> _queues;
};

template <typename Queue>
class QueueResetGuard {
 public:
  explicit QueueResetGuard(Queue& queue) noexcept : _queue(queue) {}
  QueueResetGuard(const QueueResetGuard&) = delete;
  QueueResetGuard& operator=(const QueueResetGuard&) = delete;
  ~QueueResetGuard() { _queue.reset(); }

 private:
  Queue& _queue;
};

// Connected pair of AF_UNIX stream sockets.
inline std::pair<BaseFd, BaseFd> CreateSocketPair() {
  int fds[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
    throw std::runtime_error("socketpair failed: " + std::string(std::strerror(errno)));
  }
  return {BaseFd(fds[0]), BaseFd(fds[1])};
}

// Blocking-style write of the whole buffer on a possibly non-blocking fd.
inline void WriteAll(int fd, std::string_view data) {
  while (!data.empty()) {
    const auto nbWritten = ::write(fd, data.data(), data.size());
    if (nbWritten == -1) {
      if (errno == EINTR || errno == EAGAIN) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        continue;
      }
      throw std::runtime_error("write failed: " + std::string(std::strerror(errno)));
    }
    data.remove_prefix(static_cast<std::size_t>(nbWritten));
  }
}

// Reads exactly 'size' bytes from fd, retrying on would-block up to 'timeout'.
inline std::string ReadExactly(int fd, std::size_t size,
                               std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
  std::string out;
  out.resize(size);
  std::size_t pos = 0;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (pos < size) {
    const auto nbRead = ::read(fd, out.data() + pos, size - pos);
    if (nbRead > 0) {
      pos += static_cast<std::size_t>(nbRead);
      continue;
    }
    if (nbRead == 0) {
      break;
    }
    if ((errno != EINTR && errno != EAGAIN) || std::chrono::steady_clock::now() > deadline) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  out.resize(pos);
  return out;
}

}  // namespace ioreactor::test
