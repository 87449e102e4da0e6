#include "companion/timer-fd.hpp"

#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <stdexcept>

#include "companion/errno-throw.hpp"
#include "companion/log.hpp"

namespace companion {

namespace {

void SetTime(int fd, const timespec& period) {
  const itimerspec spec{period, period};
  if (::timerfd_settime(fd, 0, &spec, nullptr) != 0) {
    throw_errno("timerfd_settime failed on fd # {}", fd);
  }
}

}  // namespace

TimerFd::TimerFd() : _baseFd(::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("timerfd creation failed");
  }
}

void TimerFd::start(std::chrono::milliseconds period) const {
  if (period <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("timer period must be positive");
  }
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(period);
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(period - secs);
  SetTime(fd(), timespec{static_cast<time_t>(secs.count()), static_cast<long>(nanos.count())});
}

void TimerFd::stop() const { SetTime(fd(), timespec{0, 0}); }

std::uint64_t TimerFd::drain() const noexcept {
  std::uint64_t expirations = 0;
  const auto ret = ::read(fd(), &expirations, sizeof(expirations));
  if (ret == static_cast<ssize_t>(sizeof(expirations))) {
    return expirations;
  }
  if (ret < 0 && errno != EAGAIN) {
    log::error("timerfd # {} drain failed: {}", fd(), std::strerror(errno));
  }
  return 0;
}

}  // namespace companion
