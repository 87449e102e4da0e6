#include "companion/socket-ops.hpp"

#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "companion/timedef.hpp"

namespace companion {

namespace {

int RemainingMs(SteadyTimePoint deadline) {
  const auto remaining =
      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now()).count();
  return static_cast<int>(std::clamp<std::chrono::milliseconds::rep>(remaining, 0, INT32_MAX));
}

IoStatus WaitUntil(int fd, bool forWrite, SteadyTimePoint deadline) noexcept {
  pollfd pfd{fd, static_cast<short>(forWrite ? POLLOUT : POLLIN), 0};
  while (true) {
    const int ret = ::poll(&pfd, 1, RemainingMs(deadline));
    if (ret == 0) {
      return IoStatus::Timeout;
    }
    if (ret == -1) {
      if (errno == EINTR) {
        continue;
      }
      return IoStatus::Error;
    }
    if ((pfd.revents & (POLLERR | POLLNVAL)) != 0) {
      // The caller reads SO_ERROR for the actual cause.
      return IoStatus::Error;
    }
    // POLLHUP with readable data is reported as ready: the following read observes the end of stream.
    return IoStatus::Ok;
  }
}

}  // namespace

bool SetNonBlocking(int fd) noexcept {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags == -1) {
    return false;
  }
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

bool SetTcpNoDelay(int fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

int GetSocketError(int fd) noexcept {
  int err = 0;
  socklen_t len = sizeof(err);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == -1) {
    return errno;
  }
  return err;
}

int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept {
  return static_cast<int64_t>(::send(fd, data, len, MSG_NOSIGNAL));
}

bool ShutdownReadWrite(int fd) noexcept { return ::shutdown(fd, SHUT_RDWR) == 0; }

std::string_view IoStatusName(IoStatus status) noexcept {
  switch (status) {
    case IoStatus::Ok:
      return "ok";
    case IoStatus::Timeout:
      return "timeout";
    case IoStatus::PeerClosed:
      return "peer closed";
    case IoStatus::Error:
      return "error";
    default:
      return "unknown";
  }
}

IoStatus WaitReady(int fd, bool forWrite, SysDuration timeout) noexcept {
  return WaitUntil(fd, forWrite, SteadyClock::now() + timeout);
}

IoStatus SendAll(int fd, std::string_view data, SysDuration timeout) noexcept {
  const auto deadline = SteadyClock::now() + timeout;
  while (!data.empty()) {
    const auto sent = SafeSend(fd, data);
    if (sent > 0) {
      data.remove_prefix(static_cast<std::size_t>(sent));
      continue;
    }
    if (sent == -1 && errno == EINTR) {
      continue;
    }
    if (sent == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      const auto status = WaitUntil(fd, true, deadline);
      if (status != IoStatus::Ok) {
        return status;
      }
      continue;
    }
    if (errno == EPIPE || errno == ECONNRESET) {
      return IoStatus::PeerClosed;
    }
    return IoStatus::Error;
  }
  return IoStatus::Ok;
}

IoStatus RecvExact(int fd, char* buf, std::size_t len, SysDuration timeout) noexcept {
  const auto deadline = SteadyClock::now() + timeout;
  std::size_t received = 0;
  while (received < len) {
    const auto ret = ::recv(fd, buf + received, len - received, 0);
    if (ret > 0) {
      received += static_cast<std::size_t>(ret);
      continue;
    }
    if (ret == 0) {
      return IoStatus::PeerClosed;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      const auto status = WaitUntil(fd, false, deadline);
      if (status != IoStatus::Ok) {
        return status;
      }
      continue;
    }
    return errno == ECONNRESET ? IoStatus::PeerClosed : IoStatus::Error;
  }
  return IoStatus::Ok;
}

IoStatus RecvSome(int fd, char* buf, std::size_t len, SysDuration timeout, std::size_t& nbRead) noexcept {
  const auto deadline = SteadyClock::now() + timeout;
  nbRead = 0;
  while (true) {
    const auto ret = ::recv(fd, buf, len, 0);
    if (ret > 0) {
      nbRead = static_cast<std::size_t>(ret);
      return IoStatus::Ok;
    }
    if (ret == 0) {
      return IoStatus::PeerClosed;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      const auto status = WaitUntil(fd, false, deadline);
      if (status != IoStatus::Ok) {
        return status;
      }
      continue;
    }
    return errno == ECONNRESET ? IoStatus::PeerClosed : IoStatus::Error;
  }
}

}  // namespace companion
