#include "companion/signal-handler.hpp"

#include <csignal>

#include "companion/errno-throw.hpp"

namespace companion {

namespace {

constexpr int kStopSignals[] = {SIGINT, SIGTERM};

volatile std::sig_atomic_t gStopSignal = 0;

void RecordStopSignal(int sigNum) {
  // Only async-signal-safe work here.
  if (gStopSignal == 0) {
    gStopSignal = sigNum;
  }
}

void SetDisposition(int sigNum, void (*handler)(int), int flags) {
  struct sigaction action{};
  action.sa_handler = handler;
  action.sa_flags = flags;
  sigemptyset(&action.sa_mask);
  if (::sigaction(sigNum, &action, nullptr) != 0) {
    throw_errno("sigaction failed for signal {}", sigNum);
  }
}

}  // namespace

void SignalHandler::Enable() {
  for (int sigNum : kStopSignals) {
    SetDisposition(sigNum, RecordStopSignal, SA_RESETHAND | SA_RESTART);
  }
}

void SignalHandler::Disable() {
  for (int sigNum : kStopSignals) {
    SetDisposition(sigNum, SIG_DFL, 0);
  }
}

bool SignalHandler::IsStopRequested() { return gStopSignal != 0; }

int SignalHandler::ReceivedSignal() { return static_cast<int>(gStopSignal); }

void SignalHandler::ResetStopRequest() { gStopSignal = 0; }

}  // namespace companion
