#pragma once

namespace companion {

// Owner of one file descriptor: sockets, eventfd, timerfd and the epoll instance all sit on it.
class BaseFd {
 public:
  static constexpr int kClosedFd = -1;

  explicit BaseFd(int fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd&) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd&) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept;

  ~BaseFd() { close(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Hands the descriptor over, this object is left closed.
  [[nodiscard]] int release() noexcept;

  // Closes the descriptor once. Linux releases it even when close() reports EINTR, so close is never retried:
  // a retry could close a descriptor opened meanwhile by another thread. No-op when already closed.
  void close() noexcept;

  bool operator==(const BaseFd&) const noexcept = default;

 private:
  int _fd;
};

}  // namespace companion
