#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "companion/connection.hpp"
#include "companion/test-util.hpp"

namespace companion::test {

// Loopback TCP server pushing the same frame to every connected client at a fixed interval.
class FakeVideoRelay {
 public:
  explicit FakeVideoRelay(std::string frame = std::string(1024, 'v'),
                          std::chrono::milliseconds interval = std::chrono::milliseconds{5});

  FakeVideoRelay(const FakeVideoRelay&) = delete;
  FakeVideoRelay& operator=(const FakeVideoRelay&) = delete;

  ~FakeVideoRelay();

  [[nodiscard]] uint16_t port() const noexcept { return _listener.port(); }

  [[nodiscard]] std::string portStr() const { return _listener.portStr(); }

  // Frames are not pushed while paused.
  void setPaused(bool paused) { _paused.store(paused); }

  // Ends the stream of every connected client.
  void closeClients();

  // Stops accepting and closes every client. Idempotent.
  void stop();

  [[nodiscard]] std::size_t connectionsAccepted() const noexcept { return _connectionsAccepted.load(); }

  [[nodiscard]] std::size_t activeClients() const;

  [[nodiscard]] std::size_t bytesSent() const noexcept { return _bytesSent.load(); }

 private:
  void run(const std::stop_token& stopToken);

  std::string _frame;
  std::chrono::milliseconds _interval;
  mutable std::mutex _mutex;
  std::vector<Connection> _clients;
  std::atomic<bool> _paused{false};
  std::atomic<std::size_t> _connectionsAccepted{0};
  std::atomic<std::size_t> _bytesSent{0};
  LoopbackListener _listener;
  std::jthread _thread;
};

}  // namespace companion::test
