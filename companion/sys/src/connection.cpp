#include "companion/connection.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <string>

#include "companion/log.hpp"
#include "companion/socket.hpp"

namespace companion {

namespace {

std::string FormatPeer(const sockaddr_in& addr) {
  std::array<char, INET_ADDRSTRLEN> host{};
  if (::inet_ntop(AF_INET, &addr.sin_addr, host.data(), host.size()) == nullptr) {
    return {};
  }
  return fmt::format("{}:{}", host.data(), ntohs(addr.sin_port));
}

}  // namespace

Connection::Connection(const Socket& listener) {
  sockaddr_in addr{};
  socklen_t addrLen = sizeof(addr);
  const int fd = ::accept4(listener.fd(), reinterpret_cast<sockaddr*>(&addr), &addrLen, SOCK_NONBLOCK | SOCK_CLOEXEC);
  if (fd < 0) {
    const int err = errno;
    // EAGAIN ends the accept loop of the caller.
    if (err != EAGAIN && err != EWOULDBLOCK) {
      log::error("accept on listener fd # {} failed: {}", listener.fd(), std::strerror(err));
    }
    return;
  }
  _baseFd = BaseFd(fd);
  _peer = FormatPeer(addr);
  log::debug("Accepted {} on fd # {}", _peer, fd);
}

}  // namespace companion
