#include "companion/test-util.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include "companion/connection.hpp"
#include "companion/socket-ops.hpp"
#include "companion/socket.hpp"
#include "companion/tcp-connector.hpp"
#include "companion/timedef.hpp"

namespace companion::test {

LoopbackListener::LoopbackListener() : _socket(Socket::Type::StreamNonBlock) {
  _socket.bindAndListen(false, false, _port);
}

Connection LoopbackListener::accept(SysDuration timeout) const {
  if (WaitReady(_socket.fd(), false, timeout) != IoStatus::Ok) {
    return {};
  }
  return Connection(_socket);
}

Connection ConnectLoopback(uint16_t port, SysDuration timeout) {
  ConnectResult result = ConnectTCP("127.0.0.1", std::to_string(port), timeout);
  if (result.failure) {
    throw std::runtime_error(fmt::format("Unable to connect to 127.0.0.1:{}: {}", port, std::strerror(result.err)));
  }
  return std::move(result.cnx);
}

}  // namespace companion::test
