#include "companion/event-loop.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <utility>

#include "companion/event-fd.hpp"
#include "companion/event.hpp"

using namespace companion;
using namespace std::chrono_literals;

TEST(EventLoopTest, PollTimeoutReturnsEmptyValidSpan) {
  EventLoop loop(10ms);
  const auto events = loop.poll();
  EXPECT_TRUE(events.empty());
  EXPECT_NE(events.data(), nullptr);
}

TEST(EventLoopTest, ReportsReadyFd) {
  EventLoop loop(100ms);
  EventFd wakeup;
  loop.addOrThrow(EventLoop::EventFd{EventIn, wakeup.fd()});
  wakeup.notify();

  const auto events = loop.poll();
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].fd, wakeup.fd());
  EXPECT_NE(events[0].eventBmp & EventIn, 0U);
}

TEST(EventLoopTest, AddTwiceFails) {
  EventLoop loop(10ms);
  EventFd wakeup;
  ASSERT_TRUE(loop.add(EventLoop::EventFd{EventIn, wakeup.fd()}));
  EXPECT_FALSE(loop.add(EventLoop::EventFd{EventIn, wakeup.fd()}));
}

TEST(EventLoopTest, ModAndDel) {
  EventLoop loop(10ms);
  EventFd wakeup;
  EventFd other;
  EXPECT_FALSE(loop.mod(EventLoop::EventFd{EventIn, other.fd()}));
  loop.addOrThrow(EventLoop::EventFd{EventIn, wakeup.fd()});
  EXPECT_TRUE(loop.mod(EventLoop::EventFd{EventIn | EventOut, wakeup.fd()}));
  loop.del(wakeup.fd());
  wakeup.notify();
  EXPECT_TRUE(loop.poll().empty());
}

TEST(EventLoopTest, BufferGrowsWhenSaturated) {
  EventLoop loop(100ms, 1);
  EXPECT_EQ(loop.capacity(), 1U);
  EventFd first;
  EventFd second;
  loop.addOrThrow(EventLoop::EventFd{EventIn, first.fd()});
  loop.addOrThrow(EventLoop::EventFd{EventIn, second.fd()});
  first.notify();
  second.notify();

  EXPECT_EQ(loop.poll().size(), 1U);
  EXPECT_EQ(loop.capacity(), 2U);
  EXPECT_EQ(loop.poll().size(), 2U);
}

TEST(EventLoopTest, MoveKeepsRegistrations) {
  EventLoop loop(100ms);
  EventFd wakeup;
  loop.addOrThrow(EventLoop::EventFd{EventIn, wakeup.fd()});
  EventLoop moved(std::move(loop));
  wakeup.notify();
  EXPECT_EQ(moved.poll().size(), 1U);
}
