#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "companion/timedef.hpp"

namespace companion {

// Thin wrappers centralising socket system calls so that higher level modules never include networking headers.

// Set a file descriptor to non-blocking mode.
// Returns true on success.
bool SetNonBlocking(int fd) noexcept;

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket.
// Returns true on success.
bool SetTcpNoDelay(int fd) noexcept;

// Retrieve the pending socket error (SO_ERROR). 0 means no error.
int GetSocketError(int fd) noexcept;

// Send without raising SIGPIPE. Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept;

inline int64_t SafeSend(int fd, std::string_view data) noexcept { return SafeSend(fd, data.data(), data.size()); }

// Shutdown both read and write halves of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownReadWrite(int fd) noexcept;

// Outcome of the deadline-bounded I/O helpers below.
enum class IoStatus : std::uint8_t { Ok, Timeout, PeerClosed, Error };

[[nodiscard]] std::string_view IoStatusName(IoStatus status) noexcept;

// Wait until 'fd' is readable (or writable if 'forWrite') for at most 'timeout'.
// Error means poll failed or the fd reported POLLERR / POLLNVAL (errno is set when available).
[[nodiscard]] IoStatus WaitReady(int fd, bool forWrite, SysDuration timeout) noexcept;

// Write all of 'data' to a non-blocking fd before 'timeout' expires.
[[nodiscard]] IoStatus SendAll(int fd, std::string_view data, SysDuration timeout) noexcept;

// Read exactly 'len' bytes from a non-blocking fd before 'timeout' expires.
// PeerClosed if the peer closed the connection before 'len' bytes arrived.
[[nodiscard]] IoStatus RecvExact(int fd, char* buf, std::size_t len, SysDuration timeout) noexcept;

// Read what is available (at most 'len' bytes), waiting up to 'timeout' for the first byte.
// On Ok, 'nbRead' is > 0.
[[nodiscard]] IoStatus RecvSome(int fd, char* buf, std::size_t len, SysDuration timeout,
                                std::size_t& nbRead) noexcept;

}  // namespace companion
