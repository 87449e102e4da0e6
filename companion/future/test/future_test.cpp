#include "companion/future.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "companion/error.hpp"

namespace companion {

TEST(FutureTest, ResolveOnce) {
  Promise<int> promise;
  auto future = promise.future();
  EXPECT_EQ(future.state(), FutureState::Pending);
  EXPECT_FALSE(future.isTerminal());

  EXPECT_TRUE(promise.resolve(42));
  EXPECT_FALSE(promise.resolve(43));
  EXPECT_FALSE(promise.fail(Error(ErrorKind::Internal, "late")));
  EXPECT_FALSE(promise.cancel());

  EXPECT_EQ(future.state(), FutureState::Succeeded);
  EXPECT_EQ(future.value(), 42);
  EXPECT_EQ(future.get(), 42);
  EXPECT_EQ(future.error().kind(), ErrorKind::InvalidState);
}

TEST(FutureTest, FailOnce) {
  Promise<std::string> promise;
  auto future = promise.future();
  EXPECT_TRUE(promise.fail(Error(ErrorKind::DeviceError, "boom", 8)));
  EXPECT_FALSE(promise.resolve("ok"));
  EXPECT_EQ(future.state(), FutureState::Failed);
  EXPECT_EQ(future.error().kind(), ErrorKind::DeviceError);
  EXPECT_EQ(future.error().code(), 8);
  EXPECT_THROW((void)future.value(), FutureError);
  try {
    (void)future.get();
    FAIL() << "get() should throw";
  } catch (const FutureError& ex) {
    EXPECT_EQ(ex.error().message(), "boom");
  }
}

TEST(FutureTest, PendingValueThrowsInvalidState) {
  Promise<int> promise;
  try {
    (void)promise.future().value();
    FAIL() << "value() should throw";
  } catch (const FutureError& ex) {
    EXPECT_EQ(ex.error().kind(), ErrorKind::InvalidState);
  }
}

TEST(FutureTest, AlreadyTerminalFactories) {
  EXPECT_EQ(Future<int>::Resolved(3).value(), 3);
  EXPECT_EQ(Future<Void>::Resolved().state(), FutureState::Succeeded);
  EXPECT_EQ(Future<int>::Failed(Error(ErrorKind::Timeout, "t")).error().kind(), ErrorKind::Timeout);
  auto cancelled = Future<int>::Cancelled("lookup");
  EXPECT_EQ(cancelled.state(), FutureState::Cancelled);
  EXPECT_EQ(cancelled.error().kind(), ErrorKind::Cancelled);
  EXPECT_EQ(cancelled.name(), "lookup");
}

TEST(FutureTest, NamedIsShared) {
  Promise<int> promise;
  auto future = promise.future().named("afc-read");
  EXPECT_EQ(promise.future().name(), "afc-read");
  promise.cancel();
  EXPECT_EQ(future.error().message(), "afc-read cancelled");
}

TEST(FutureTest, CallbacksRunInRegistrationOrder) {
  Promise<int> promise;
  std::vector<int> order;
  auto future = promise.future();
  future.onComplete([&order](const Future<int>& done) { order.push_back(done.value()); });
  future.onComplete([&order](const Future<int>&) { order.push_back(100); });
  EXPECT_TRUE(order.empty());
  promise.resolve(7);
  future.onComplete([&order](const Future<int>&) { order.push_back(200); });
  EXPECT_EQ(order, (std::vector<int>{7, 100, 200}));
}

TEST(FutureTest, CallbackRegisteredDuringDispatchRunsAfterCurrentOnes) {
  Promise<Void> promise;
  auto future = promise.future();
  std::vector<int> order;
  future.onComplete([&](const Future<Void>&) {
    order.push_back(1);
    future.onComplete([&](const Future<Void>&) { order.push_back(3); });
  });
  future.onComplete([&](const Future<Void>&) { order.push_back(2); });
  promise.resolve();
  EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(FutureTest, ThrowingCallbackDoesNotStopOthers) {
  Promise<int> promise;
  int calls = 0;
  promise.future().onComplete([](const Future<int>&) { throw std::runtime_error("callback failure"); });
  promise.future().onComplete([&calls](const Future<int>&) { ++calls; });
  promise.resolve(1);
  EXPECT_EQ(calls, 1);
}

TEST(FutureTest, CancelRunsHookOnceAndCallbacksObserveCancelled) {
  Promise<int> promise;
  auto future = promise.future();
  int hookCalls = 0;
  std::vector<FutureState> observed;
  future.onCancel([&hookCalls]() {
    ++hookCalls;
    return Future<Void>::Resolved();
  });
  future.onComplete([&observed](const Future<int>& done) { observed.push_back(done.state()); });
  future.onComplete([&observed](const Future<int>& done) { observed.push_back(done.state()); });

  auto teardown = future.cancel();
  EXPECT_EQ(teardown.state(), FutureState::Succeeded);
  EXPECT_EQ(future.state(), FutureState::Cancelled);
  EXPECT_EQ(hookCalls, 1);
  EXPECT_EQ(observed, (std::vector<FutureState>{FutureState::Cancelled, FutureState::Cancelled}));

  (void)future.cancel();
  EXPECT_FALSE(promise.resolve(1));
  EXPECT_FALSE(promise.cancel());
  EXPECT_EQ(hookCalls, 1);
  EXPECT_EQ(observed.size(), 2U);
}

TEST(FutureTest, CancelReturnsHookTeardown) {
  Promise<Void> promise;
  Promise<Void> teardownPromise;
  promise.future().onCancel([teardownPromise]() { return teardownPromise.future(); });
  auto teardown = promise.future().cancel();
  EXPECT_EQ(promise.future().state(), FutureState::Cancelled);
  EXPECT_EQ(teardown.state(), FutureState::Pending);
  teardownPromise.resolve();
  EXPECT_EQ(teardown.state(), FutureState::Succeeded);
}

TEST(FutureTest, CancelOfTerminalFutureIsNoop) {
  Promise<int> promise;
  int hookCalls = 0;
  promise.future().onCancel([&hookCalls]() {
    ++hookCalls;
    return Future<Void>::Resolved();
  });
  promise.resolve(5);
  auto teardown = promise.future().cancel();
  EXPECT_EQ(teardown.state(), FutureState::Succeeded);
  EXPECT_EQ(promise.future().state(), FutureState::Succeeded);
  EXPECT_EQ(hookCalls, 0);
}

TEST(FutureTest, HookOnAlreadyCancelledFutureRunsImmediately) {
  auto future = Future<int>::Cancelled();
  int hookCalls = 0;
  future.onCancel([&hookCalls]() {
    ++hookCalls;
    return Future<Void>::Resolved();
  });
  EXPECT_EQ(hookCalls, 1);

  auto resolved = Future<int>::Resolved(1);
  resolved.onCancel([&hookCalls]() {
    ++hookCalls;
    return Future<Void>::Resolved();
  });
  EXPECT_EQ(hookCalls, 1);
}

TEST(FutureTest, ThrowingHookYieldsFailedTeardown) {
  Promise<int> promise;
  promise.future().onCancel([]() -> Future<Void> { throw std::runtime_error("teardown failure"); });
  auto teardown = promise.future().cancel();
  EXPECT_EQ(promise.future().state(), FutureState::Cancelled);
  EXPECT_EQ(teardown.state(), FutureState::Failed);
  EXPECT_EQ(teardown.error().kind(), ErrorKind::Internal);
}

TEST(FutureTest, MapTransformsValue) {
  Promise<int> promise;
  auto mapped = promise.future().map([](int value) { return std::to_string(value * 2); });
  promise.resolve(21);
  EXPECT_EQ(mapped.value(), "42");

  auto unit = Future<int>::Resolved(1).map([](int) {});
  EXPECT_EQ(unit.state(), FutureState::Succeeded);
}

TEST(FutureTest, MapPropagatesFailure) {
  Promise<int> promise;
  bool called = false;
  auto mapped = promise.future().map([&called](int value) {
    called = true;
    return value;
  });
  promise.fail(Error(ErrorKind::ConnectionClosed, "gone"));
  EXPECT_FALSE(called);
  EXPECT_EQ(mapped.state(), FutureState::Failed);
  EXPECT_EQ(mapped.error().kind(), ErrorKind::ConnectionClosed);
}

TEST(FutureTest, MapCallbackExceptionFailsDownstream) {
  auto mapped = Future<int>::Resolved(1).map([](int) -> int { throw std::runtime_error("bad value"); });
  EXPECT_EQ(mapped.state(), FutureState::Failed);
  EXPECT_EQ(mapped.error().kind(), ErrorKind::Internal);
  EXPECT_EQ(mapped.error().message(), "bad value");

  auto rethrown = Future<int>::Resolved(1).map(
      [](int) -> int { throw FutureError(Error(ErrorKind::InvalidArgument, "bad path")); });
  EXPECT_EQ(rethrown.error().kind(), ErrorKind::InvalidArgument);
}

TEST(FutureTest, ThenFlattensInnerFuture) {
  Promise<int> outer;
  Promise<std::string> inner;
  auto composed = outer.future().then([inner](int) { return inner.future(); });
  outer.resolve(1);
  EXPECT_EQ(composed.state(), FutureState::Pending);
  inner.resolve("done");
  EXPECT_EQ(composed.value(), "done");
}

TEST(FutureTest, ChainRunsOnFailure) {
  auto recovered = Future<int>::Failed(Error(ErrorKind::DeviceError, "x")).chain([](const Future<int>& done) {
    return Future<int>::Resolved(done.state() == FutureState::Failed ? -1 : 1);
  });
  EXPECT_EQ(recovered.value(), -1);
}

TEST(FutureTest, CancelComposedCancelsPendingSource) {
  Promise<int> source;
  int sourceHook = 0;
  source.future().onCancel([&sourceHook]() {
    ++sourceHook;
    return Future<Void>::Resolved();
  });
  bool thenCalled = false;
  auto composed = source.future().then([&thenCalled](int value) {
    thenCalled = true;
    return Future<int>::Resolved(value);
  });
  std::vector<FutureState> observed;
  composed.onComplete([&observed](const Future<int>& done) { observed.push_back(done.state()); });

  (void)composed.cancel();
  EXPECT_EQ(source.future().state(), FutureState::Cancelled);
  EXPECT_EQ(composed.state(), FutureState::Cancelled);
  EXPECT_EQ(sourceHook, 1);
  EXPECT_FALSE(thenCalled);
  EXPECT_EQ(observed, (std::vector<FutureState>{FutureState::Cancelled}));
}

TEST(FutureTest, CancelComposedCancelsInnerOnceSourceResolved) {
  Promise<int> source;
  Promise<int> inner;
  int innerHook = 0;
  inner.future().onCancel([&innerHook]() {
    ++innerHook;
    return Future<Void>::Resolved();
  });
  auto composed = source.future().then([inner](int) { return inner.future(); });
  source.resolve(1);
  (void)composed.cancel();
  EXPECT_EQ(source.future().state(), FutureState::Succeeded);
  EXPECT_EQ(inner.future().state(), FutureState::Cancelled);
  EXPECT_EQ(composed.state(), FutureState::Cancelled);
  EXPECT_EQ(innerHook, 1);
}

TEST(FutureTest, SourceCancellationFlowsDownstream) {
  Promise<int> source;
  auto mapped = source.future().map([](int value) { return value + 1; });
  source.cancel();
  EXPECT_EQ(mapped.state(), FutureState::Cancelled);
}

TEST(FutureTest, WaitForTimesOutThenSucceeds) {
  Promise<int> promise;
  auto future = promise.future();
  EXPECT_FALSE(future.waitFor(std::chrono::milliseconds(10)));
  std::jthread resolver([promise] {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    promise.resolve(9);
  });
  EXPECT_EQ(future.get(), 9);
}

TEST(FutureTest, ConcurrentResolveAndCancelHaveSingleOutcome) {
  for (int round = 0; round < 200; ++round) {
    Promise<int> promise;
    auto future = promise.future();
    std::atomic<int> hookCalls{0};
    std::atomic<int> callbackCalls{0};
    future.onCancel([&hookCalls]() {
      ++hookCalls;
      return Future<Void>::Resolved();
    });
    future.onComplete([&callbackCalls](const Future<int>&) { ++callbackCalls; });

    std::atomic<bool> resolved{false};
    {
      std::jthread resolver([&] { resolved = promise.resolve(round); });
      std::jthread canceller([&] { (void)future.cancel(); });
    }

    EXPECT_TRUE(future.isTerminal());
    EXPECT_EQ(callbackCalls.load(), 1);
    if (resolved) {
      EXPECT_EQ(future.state(), FutureState::Succeeded);
      EXPECT_EQ(hookCalls.load(), 0);
    } else {
      EXPECT_EQ(future.state(), FutureState::Cancelled);
      EXPECT_EQ(hookCalls.load(), 1);
    }
  }
}

TEST(FutureTest, StateNames) {
  EXPECT_EQ(FutureStateName(FutureState::Pending), "Pending");
  EXPECT_EQ(FutureStateName(FutureState::Cancelled), "Cancelled");
}

}  // namespace companion
