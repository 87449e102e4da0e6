#include "companion/socket.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>

#include "companion/base-fd.hpp"
#include "companion/errno-throw.hpp"
#include "companion/log.hpp"
#include "companion/socket-ops.hpp"

namespace companion {

namespace {

int ComputeSocketType(Socket::Type type) {
  switch (type) {
    case Socket::Type::Stream:
      return SOCK_STREAM | SOCK_CLOEXEC;
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC;
    default:
      throw std::invalid_argument("Invalid socket type");
  }
}

void SetSockOptOrThrow(int fd, int level, int optName, const char* optDesc) {
  static constexpr int kEnable = 1;
  if (::setsockopt(fd, level, optName, &kEnable, sizeof(kEnable)) != 0) {
    throw_errno("setsockopt({}) failed on fd # {}", optDesc, fd);
  }
}

}  // namespace

Socket::Socket(Type type, int protocol) : _baseFd(::socket(AF_INET, ComputeSocketType(type), protocol)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

bool Socket::tryBind(bool reusePort, bool tcpNoDelay, uint16_t port) const {
  const int fd = _baseFd.fd();
  SetSockOptOrThrow(fd, SOL_SOCKET, SO_REUSEADDR, "SO_REUSEADDR");
  if (reusePort) {
    SetSockOptOrThrow(fd, SOL_SOCKET, SO_REUSEPORT, "SO_REUSEPORT");
  }
  if (tcpNoDelay && !SetTcpNoDelay(fd)) {
    throw_errno("setsockopt(TCP_NODELAY) failed on fd # {}", fd);
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);
  return ::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;
}

void Socket::bindAndListen(bool reusePort, bool tcpNoDelay, uint16_t& port) {
  const int fd = _baseFd.fd();
  if (!tryBind(reusePort, tcpNoDelay, port)) {
    throw_errno("bind failed on port {}", port);
  }
  if (::listen(fd, SOMAXCONN) != 0) {
    throw_errno("listen failed on port {}", port);
  }
  if (port == 0) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      throw_errno("getsockname failed on fd # {}", fd);
    }
    port = ntohs(addr.sin_port);
  }
  log::debug("Socket fd # {} listening on port {}", fd, port);
}

}  // namespace companion
