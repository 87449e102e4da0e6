#pragma once

namespace companion {

// Process wide SIGINT / SIGTERM latch polled by the companion main loop.
//
// The first termination signal is only recorded: the main loop notices it and shuts the server down gracefully.
// The handler is one-shot, so a second signal gets the default disposition and terminates a stuck shutdown.
class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Installs the one-shot handler for SIGINT and SIGTERM. Throws std::system_error if sigaction fails.
  static void Enable();

  // Restores the default disposition of both signals.
  static void Disable();

  [[nodiscard]] static bool IsStopRequested();

  // First termination signal received, 0 if none.
  [[nodiscard]] static int ReceivedSignal();

 private:
  friend class SignalHandlerGlobalTest;

  static void ResetStopRequest();
};

}  // namespace companion
