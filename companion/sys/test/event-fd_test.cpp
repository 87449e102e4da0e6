#include "companion/event-fd.hpp"

#include <gtest/gtest.h>
#include <poll.h>

#include "companion/base-fd.hpp"

using namespace companion;

namespace {

bool IsReadable(int fd) {
  pollfd pfd{fd, POLLIN, 0};
  return ::poll(&pfd, 1, 0) == 1 && (pfd.revents & POLLIN) != 0;
}

}  // namespace

TEST(EventFdTest, CreatedQuiet) {
  EventFd eventFd;
  EXPECT_NE(eventFd.fd(), BaseFd::kClosedFd);
  EXPECT_FALSE(IsReadable(eventFd.fd()));
}

TEST(EventFdTest, DrainCountsNotifications) {
  EventFd eventFd;
  eventFd.notify();
  eventFd.notify();
  eventFd.notify();
  EXPECT_TRUE(IsReadable(eventFd.fd()));
  EXPECT_EQ(eventFd.drain(), 3U);
  EXPECT_FALSE(IsReadable(eventFd.fd()));
}

TEST(EventFdTest, DrainWithoutNotificationReturnsZero) {
  EventFd eventFd;
  EXPECT_EQ(eventFd.drain(), 0U);
}
