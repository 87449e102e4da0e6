#include "companion/socket.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include "companion/connection.hpp"

namespace companion {

TEST(SocketTest, Nominal) {
  Socket sock(Socket::Type::Stream);
  EXPECT_TRUE(sock);
  EXPECT_GE(sock.fd(), 0);
  sock.close();
  EXPECT_FALSE(sock);
}

TEST(SocketTest, Invalid) {
  Socket::Type invalidType;
  std::memset(&invalidType, 255, sizeof(Socket::Type));
  EXPECT_THROW(Socket{invalidType}, std::invalid_argument);
}

TEST(SocketTest, BindAndListenUpdatesPort) {
  Socket sock(Socket::Type::StreamNonBlock);
  uint16_t port = 0;
  EXPECT_NO_THROW(sock.bindAndListen(false, true, port));
  EXPECT_NE(0, port);
}

TEST(SocketTest, TryBindReturnsFalseWhenPortIsTaken) {
  Socket first(Socket::Type::Stream);
  uint16_t port = 0;
  first.bindAndListen(false, false, port);
  Socket second(Socket::Type::Stream);
  EXPECT_FALSE(second.tryBind(false, false, port));
}

TEST(SocketTest, BindAndListenThrowsWhenPortInUse) {
  Socket first(Socket::Type::Stream);
  uint16_t port = 0;
  first.bindAndListen(false, false, port);
  Socket second(Socket::Type::Stream);
  EXPECT_THROW(second.bindAndListen(false, false, port), std::system_error);
}

TEST(SocketTest, AcceptWithoutPendingConnectionIsInvalid) {
  Socket sock(Socket::Type::StreamNonBlock);
  uint16_t port = 0;
  sock.bindAndListen(false, false, port);
  Connection cnx(sock);
  EXPECT_FALSE(cnx);
}

}  // namespace companion
