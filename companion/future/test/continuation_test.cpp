#include "companion/continuation.hpp"

#include <gtest/gtest.h>

#include "companion/future.hpp"

namespace companion {

TEST(ContinuationTest, TypeNames) {
  EXPECT_EQ(ContinuationTypeName(ContinuationType::VideoStreaming), "VideoStreaming");
  EXPECT_EQ(ContinuationTypeName(ContinuationType::TargetOfflineWatch), "TargetOfflineWatch");
}

TEST(ContinuationTest, CancelReachesCompletionHook) {
  Promise<Void> promise;
  int hookCalls = 0;
  promise.future().onCancel([&hookCalls]() {
    ++hookCalls;
    return Future<Void>::Resolved();
  });
  Continuation continuation(ContinuationType::VideoStreaming, promise.future());
  EXPECT_EQ(continuation.type(), ContinuationType::VideoStreaming);
  EXPECT_FALSE(continuation.isTerminal());

  auto teardown = continuation.cancel();
  EXPECT_EQ(teardown.state(), FutureState::Succeeded);
  EXPECT_TRUE(continuation.isTerminal());
  EXPECT_EQ(continuation.completion().state(), FutureState::Cancelled);
  EXPECT_FALSE(promise.resolve());

  (void)continuation.cancel();
  EXPECT_EQ(hookCalls, 1);
}

TEST(ContinuationTest, StopRequestReplacesCancellation) {
  Promise<Void> promise;
  int hookCalls = 0;
  promise.future().onCancel([&hookCalls]() {
    ++hookCalls;
    return Future<Void>::Resolved();
  });
  int stopCalls = 0;
  Continuation continuation(ContinuationType::VideoStreaming, promise.future(), [&stopCalls, promise]() {
    ++stopCalls;
    promise.resolve();
    return promise.future();
  });

  auto teardown = continuation.cancel();
  EXPECT_TRUE(teardown.sameAs(promise.future()));
  EXPECT_EQ(continuation.completion().state(), FutureState::Succeeded);
  (void)continuation.cancel();
  EXPECT_EQ(stopCalls, 1);
  EXPECT_EQ(hookCalls, 0);
}

TEST(ContinuationTest, CompletionSharedWithProducer) {
  Promise<Void> promise;
  Continuation continuation(ContinuationType::TargetOfflineWatch, promise.future());
  EXPECT_TRUE(promise.resolve());
  EXPECT_TRUE(continuation.isTerminal());
  EXPECT_EQ(continuation.completion().state(), FutureState::Succeeded);
  EXPECT_EQ(continuation.cancel().state(), FutureState::Succeeded);
  EXPECT_EQ(continuation.completion().state(), FutureState::Succeeded);
}

}  // namespace companion
