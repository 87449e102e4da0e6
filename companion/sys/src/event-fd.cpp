#include "companion/event-fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>

#include "companion/errno-throw.hpp"
#include "companion/log.hpp"

namespace companion {

EventFd::EventFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("eventfd creation failed");
  }
}

void EventFd::notify() const noexcept {
  // EAGAIN means the counter is saturated, the reactor is woken up anyway.
  if (::eventfd_write(fd(), 1) != 0 && errno != EAGAIN) {
    log::error("eventfd # {} notify failed: {}", fd(), std::strerror(errno));
  }
}

std::uint64_t EventFd::drain() const noexcept {
  eventfd_t count = 0;
  if (::eventfd_read(fd(), &count) == 0) {
    return count;
  }
  if (errno != EAGAIN) {
    log::error("eventfd # {} drain failed: {}", fd(), std::strerror(errno));
  }
  return 0;
}

}  // namespace companion
