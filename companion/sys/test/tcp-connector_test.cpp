#include "companion/tcp-connector.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <string>

#include "companion/connection.hpp"
#include "companion/socket-ops.hpp"
#include "companion/socket.hpp"

using namespace companion;
using namespace std::chrono_literals;

TEST(TcpConnectorTest, ConnectsToLocalListener) {
  Socket listener(Socket::Type::Stream);
  uint16_t port = 0;
  listener.bindAndListen(false, false, port);

  ConnectResult result = ConnectTCP("127.0.0.1", std::to_string(port), 1s);
  ASSERT_FALSE(result.failure);
  EXPECT_FALSE(result.connectPending);
  ASSERT_TRUE(result.cnx);

  Connection accepted(listener);
  ASSERT_TRUE(accepted);
  EXPECT_TRUE(accepted.peer().starts_with("127.0.0.1:"));
  EXPECT_EQ(SendAll(result.cnx.fd(), "ping", 1s), IoStatus::Ok);
  char buf[4];
  EXPECT_EQ(RecvExact(accepted.fd(), buf, sizeof(buf), 1s), IoStatus::Ok);
  EXPECT_EQ(std::string(buf, sizeof(buf)), "ping");
}

TEST(TcpConnectorTest, RefusedPortFails) {
  uint16_t port = 0;
  {
    // Grab an ephemeral port then release it so that nobody listens there.
    Socket sock(Socket::Type::Stream);
    sock.bindAndListen(false, false, port);
  }
  ConnectResult result = ConnectTCP("127.0.0.1", std::to_string(port), 1s);
  EXPECT_TRUE(result.failure);
  EXPECT_NE(result.err, 0);
  EXPECT_FALSE(result.cnx);
}

TEST(TcpConnectorTest, UnresolvableHostFails) {
  ConnectResult result = ConnectTCP("host.invalid", "80", 100ms);
  EXPECT_TRUE(result.failure);
  EXPECT_FALSE(result.cnx);
}
