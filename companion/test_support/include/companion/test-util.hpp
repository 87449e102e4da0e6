#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#include "companion/connection.hpp"
#include "companion/socket.hpp"
#include "companion/timedef.hpp"

namespace companion::test {

// Polls 'predicate' until it returns true or 'timeout' expires. Returns the last evaluation.
template <class Predicate>
bool WaitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds{5},
             std::chrono::milliseconds step = std::chrono::milliseconds{2}) {
  const auto deadline = SteadyClock::now() + timeout;
  while (!predicate()) {
    if (SteadyClock::now() >= deadline) {
      return predicate();
    }
    std::this_thread::sleep_for(step);
  }
  return true;
}

// Listening socket on an ephemeral port, for in-process fake peers.
class LoopbackListener {
 public:
  LoopbackListener();

  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  [[nodiscard]] std::string portStr() const { return std::to_string(_port); }

  // Waits up to 'timeout' for a pending connection. The result is invalid if none arrived.
  [[nodiscard]] Connection accept(SysDuration timeout) const;

  void close() noexcept { _socket.close(); }

 private:
  Socket _socket;
  uint16_t _port{0};
};

// Blocking connect to 127.0.0.1:'port'. Throws std::runtime_error on failure.
[[nodiscard]] Connection ConnectLoopback(uint16_t port, SysDuration timeout = std::chrono::seconds{2});

}  // namespace companion::test
