#pragma once

#include <cstdint>

#include "companion/base-fd.hpp"

namespace companion {

// Wakeup counter of the reactor: other threads notify(), the reactor thread drains it when epoll reports it
// readable. Non-blocking and close-on-exec.
class EventFd {
 public:
  // Throws std::system_error if the eventfd cannot be created.
  EventFd();

  void notify() const noexcept;

  // Returns the number of notifications since the previous drain, 0 if none.
  std::uint64_t drain() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace companion
