#include "ioreactor/signal-handler.hpp"

#include <csignal>

#include "ioreactor/log.hpp"

namespace {

volatile std::sig_atomic_t g_signalStatus{};

}  // namespace

extern "C" void IoreactorSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace ioreactor {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::IoreactorSignalHandler);
  std::signal(SIGTERM, ::IoreactorSignalHandler);
  log::debug("SIGINT / SIGTERM handlers installed");
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_signalStatus != 0; }

void SignalHandler::ResetStopRequest() { g_signalStatus = 0; }

}  // namespace ioreactor
