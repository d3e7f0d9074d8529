#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace ioreactor::internal {

// Tasks posted to an event loop from any thread, drained by the loop thread at the start of each cycle.
class PostedTasks {
 public:
  using Task = std::function<void()>;

  void push(Task task) {
    std::scoped_lock<std::mutex> lock(_lock);
    _tasks.push_back(std::move(task));
    _hasTasks.store(true, std::memory_order_release);
  }

  // Swaps the pending tasks into 'out' (cleared first), leaving the queue empty.
  void takeAll(std::vector<Task>& out) {
    out.clear();
    if (!_hasTasks.load(std::memory_order_acquire)) {
      return;
    }
    std::scoped_lock<std::mutex> lock(_lock);
    out.swap(_tasks);
    _hasTasks.store(false, std::memory_order_relaxed);
  }

  [[nodiscard]] bool hasTasks() const noexcept { return _hasTasks.load(std::memory_order_acquire); }

 private:
  // Protected by lock since callers may post from other threads.
  std::mutex _lock;
  std::vector<Task> _tasks;
  std::atomic<bool> _hasTasks{false};
};

}  // namespace ioreactor::internal
