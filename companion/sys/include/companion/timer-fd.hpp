#pragma once

#include <chrono>
#include <cstdint>

#include "companion/base-fd.hpp"

namespace companion {

// Monotonic periodic tick registered in the reactor epoll set, driving the server maintenance (stream back
// pressure, target state). Created disarmed, non-blocking and close-on-exec.
class TimerFd {
 public:
  // Throws std::system_error if the timerfd cannot be created.
  TimerFd();

  // First expiration after one 'period'. Throws std::system_error on failure, std::invalid_argument if 'period'
  // is not positive.
  void start(std::chrono::milliseconds period) const;

  // Throws std::system_error on failure.
  void stop() const;

  // Returns the number of expirations since the previous drain, 0 if none. More than one means ticks were missed.
  std::uint64_t drain() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace companion
