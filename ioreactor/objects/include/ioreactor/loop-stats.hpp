#pragma once

#include <cstdint>
#include <string>

namespace ioreactor {

// Snapshot of the counters of an EventLoop since its construction.
struct LoopStats {
  // Serialize this stats snapshot to JSON (single object).
  [[nodiscard]] std::string json_str() const;

  // Introspection enumeration of scalar numeric fields (order matches serialization order).
  template <class F>
  void for_each_field(F&& fun) const {
    fun("cycles", cycles);
    fun("polls", polls);
    fun("eventsDispatched", eventsDispatched);
    fun("timersFired", timersFired);
    fun("handlerFaults", handlerFaults);
    fun("timerFaults", timerFaults);
    fun("taskFaults", taskFaults);
    fun("postedTasksRun", postedTasksRun);
  }

  uint64_t cycles{};            // completed dispatch cycles
  uint64_t polls{};             // backend waits issued
  uint64_t eventsDispatched{};  // (descriptor, events) pairs handed to handlers
  uint64_t timersFired{};       // timer callbacks and descriptor timeouts invoked
  uint64_t handlerFaults{};     // exceptions thrown by handler callbacks
  uint64_t timerFaults{};       // exceptions thrown by timer callbacks
  uint64_t taskFaults{};        // exceptions thrown by posted tasks
  uint64_t postedTasksRun{};
};

}  // namespace ioreactor
