#include "companion/signal-handler.hpp"

#include <gtest/gtest.h>

#include <csignal>

namespace companion {

class SignalHandlerGlobalTest : public ::testing::Test {
 protected:
  void TearDown() override {
    SignalHandler::ResetStopRequest();
    SignalHandler::Disable();
  }
};

TEST_F(SignalHandlerGlobalTest, NoSignalMeansNoStop) {
  SignalHandler::Enable();
  EXPECT_FALSE(SignalHandler::IsStopRequested());
  EXPECT_EQ(SignalHandler::ReceivedSignal(), 0);
}

TEST_F(SignalHandlerGlobalTest, SigIntRequestsStop) {
  SignalHandler::Enable();
  // raise() is synchronous in the calling thread, the handler runs before it returns.
  ::raise(SIGINT);
  EXPECT_TRUE(SignalHandler::IsStopRequested());
  EXPECT_EQ(SignalHandler::ReceivedSignal(), SIGINT);
}

TEST_F(SignalHandlerGlobalTest, HandlerIsOneShot) {
  SignalHandler::Enable();
  ::raise(SIGTERM);
  struct sigaction current{};
  ASSERT_EQ(::sigaction(SIGTERM, nullptr, &current), 0);
  EXPECT_EQ(current.sa_handler, SIG_DFL);
  ASSERT_EQ(::sigaction(SIGINT, nullptr, &current), 0);
  EXPECT_NE(current.sa_handler, SIG_DFL);
}

TEST_F(SignalHandlerGlobalTest, FirstSignalIsKept) {
  SignalHandler::Enable();
  ::raise(SIGINT);
  ::raise(SIGTERM);
  EXPECT_EQ(SignalHandler::ReceivedSignal(), SIGINT);
}

TEST_F(SignalHandlerGlobalTest, SigTermRequestsStop) {
  SignalHandler::Enable();
  ::raise(SIGTERM);
  EXPECT_TRUE(SignalHandler::IsStopRequested());
  EXPECT_EQ(SignalHandler::ReceivedSignal(), SIGTERM);
}

}  // namespace companion
