#include "companion/tcp-connector.hpp"

#include <netdb.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>

#include "companion/base-fd.hpp"
#include "companion/connection.hpp"
#include "companion/log.hpp"
#include "companion/socket-ops.hpp"
#include "companion/timedef.hpp"

namespace companion {

ConnectResult ConnectTCP(std::string_view host, std::string_view port, int family) {
  // getaddrinfo expects null-terminated strings.
  const std::string hostStr(host);
  const std::string portStr(port);

  addrinfo hints{};
  hints.ai_family = family;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* res = nullptr;
  const int gai = ::getaddrinfo(hostStr.c_str(), portStr.c_str(), &hints, &res);
  std::unique_ptr<addrinfo, void (*)(addrinfo*)> resRAII(res, &::freeaddrinfo);
  ConnectResult connectResult;

  if (gai != 0) [[unlikely]] {
    log::error("ConnectTCP: getaddrinfo('{}', '{}') failed: {}", host, port, ::gai_strerror(gai));
    connectResult.failure = true;
    connectResult.err = EHOSTUNREACH;
    return connectResult;
  }

  for (addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
    const int socktype = rp->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC;

    connectResult.cnx = Connection(BaseFd(::socket(rp->ai_family, socktype, rp->ai_protocol)));
    if (!connectResult.cnx) [[unlikely]] {
      connectResult.err = errno;
      log::error("ConnectTCP: socket() failed (family={}, protocol={}): errno={}, msg={}", rp->ai_family,
                 rp->ai_protocol, connectResult.err, std::strerror(connectResult.err));
      if (connectResult.err == EMFILE || connectResult.err == ENFILE) {
        break;  // no point in continuing
      }
      continue;
    }

    if (::connect(connectResult.cnx.fd(), rp->ai_addr, rp->ai_addrlen) == 0) {
      return connectResult;
    }

    connectResult.err = errno;
    switch (connectResult.err) {
      case EINPROGRESS:
        [[fallthrough]];
      case EALREADY:
        connectResult.connectPending = true;
        return connectResult;
      case EINTR:
        continue;
      default:
        log::debug("ConnectTCP: connect() to {}:{} failed (family={}): errno={}, msg={}", host, port, rp->ai_family,
                   connectResult.err, std::strerror(connectResult.err));
        break;
    }
  }
  connectResult.cnx.close();
  connectResult.failure = true;
  return connectResult;
}

ConnectResult ConnectTCP(std::string_view host, std::string_view port, SysDuration timeout) {
  ConnectResult connectResult = ConnectTCP(host, port);
  if (connectResult.failure || !connectResult.connectPending) {
    return connectResult;
  }

  const int fd = connectResult.cnx.fd();
  const IoStatus status = WaitReady(fd, true, timeout);
  int err = 0;
  if (status == IoStatus::Timeout) {
    err = ETIMEDOUT;
  } else {
    err = GetSocketError(fd);
    if (err == 0 && status != IoStatus::Ok) {
      err = ECONNREFUSED;
    }
  }
  connectResult.connectPending = false;
  if (err != 0) {
    log::debug("ConnectTCP: connection to {}:{} failed: {}", host, port, std::strerror(err));
    connectResult.cnx.close();
    connectResult.failure = true;
    connectResult.err = err;
  }
  return connectResult;
}

}  // namespace companion
