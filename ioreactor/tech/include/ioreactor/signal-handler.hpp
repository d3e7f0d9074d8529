#pragma once

namespace ioreactor {

// Process-wide termination request flag, set from SIGINT / SIGTERM.
// Event loops poll IsStopRequested() once per cycle and stop when it becomes true.
class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Sets up signal handlers for SIGINT and SIGTERM to request a graceful stop of running loops.
  static void Enable();

  // Disables the signal handlers and restores default behavior.
  static void Disable();

  // Returns true if a termination signal was received.
  static bool IsStopRequested();

  // Resets the stop-requested flag, so that loops can be run again in the same process.
  static void ResetStopRequest();
};

}  // namespace ioreactor
