#include "companion/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "companion/log.hpp"

namespace companion {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

void BaseFd::close() noexcept {
  const int fd = release();
  if (fd == kClosedFd) {
    return;
  }
  if (::close(fd) == 0) {
    log::trace("fd # {} closed", fd);
    return;
  }
  const int err = errno;
  if (err == EINTR) {
    log::debug("close of fd # {} interrupted, descriptor released anyway", fd);
  } else {
    log::error("close of fd # {} failed: {}", fd, std::strerror(err));
  }
}

}  // namespace companion
