#include "companion/continuation-registry.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "companion/continuation.hpp"
#include "companion/error.hpp"
#include "companion/future.hpp"

namespace companion {

namespace {

Continuation StreamingOf(const Promise<Void>& promise) {
  return {ContinuationType::VideoStreaming, promise.future()};
}

}  // namespace

TEST(ContinuationRegistryTest, IdsAreIncreasing) {
  ContinuationRegistry registry;
  Promise<Void> first;
  Promise<Void> second;
  auto firstId = registry.add(StreamingOf(first));
  auto secondId = registry.add(StreamingOf(second));
  ASSERT_TRUE(firstId.has_value());
  ASSERT_TRUE(secondId.has_value());
  EXPECT_LT(*firstId, *secondId);
  EXPECT_EQ(registry.size(), 2U);
  ASSERT_TRUE(registry.find(*secondId).has_value());
  EXPECT_EQ(registry.find(*secondId)->type(), ContinuationType::VideoStreaming);
  EXPECT_FALSE(registry.find(*secondId + 1).has_value());
}

TEST(ContinuationRegistryTest, RemovedOnceTerminalWhateverTheOutcome) {
  ContinuationRegistry registry;
  std::vector<uint64_t> removed;
  registry.setRemovalCallback([&removed](uint64_t id, const Continuation&) { removed.push_back(id); });

  Promise<Void> succeeded;
  Promise<Void> failed;
  Promise<Void> cancelled;
  const uint64_t succeededId = *registry.add(StreamingOf(succeeded));
  const uint64_t failedId = *registry.add(StreamingOf(failed));
  const uint64_t cancelledId = *registry.add(StreamingOf(cancelled));

  succeeded.resolve();
  EXPECT_EQ(registry.size(), 2U);
  failed.fail(Error(ErrorKind::ConnectionClosed, "relay gone"));
  (void)cancelled.future().cancel();

  EXPECT_TRUE(registry.empty());
  EXPECT_EQ(removed, (std::vector<uint64_t>{succeededId, failedId, cancelledId}));
}

TEST(ContinuationRegistryTest, AlreadyTerminalIsNotKept) {
  ContinuationRegistry registry;
  Promise<Void> done;
  done.resolve();
  ASSERT_TRUE(registry.add(StreamingOf(done)).has_value());
  EXPECT_TRUE(registry.empty());
}

TEST(ContinuationRegistryTest, ContinuationsInIdOrder) {
  ContinuationRegistry registry;
  Promise<Void> streaming;
  Promise<Void> watch;
  ASSERT_TRUE(registry.add(StreamingOf(streaming)).has_value());
  ASSERT_TRUE(registry.add(Continuation(ContinuationType::TargetOfflineWatch, watch.future())).has_value());
  const auto all = registry.continuations();
  ASSERT_EQ(all.size(), 2U);
  EXPECT_EQ(all[0].type(), ContinuationType::VideoStreaming);
  EXPECT_EQ(all[1].type(), ContinuationType::TargetOfflineWatch);
}

TEST(ContinuationRegistryTest, CloseRefusesAndCancelsLaterAdditions) {
  ContinuationRegistry registry;
  Promise<Void> live;
  ASSERT_TRUE(registry.add(StreamingOf(live)).has_value());

  const auto atClose = registry.close();
  ASSERT_EQ(atClose.size(), 1U);
  EXPECT_TRUE(registry.isClosed());
  EXPECT_EQ(registry.close().size(), 1U);

  Promise<Void> late;
  auto refused = registry.add(StreamingOf(late));
  ASSERT_FALSE(refused.has_value());
  EXPECT_EQ(refused.error().kind(), ErrorKind::InvalidState);
  EXPECT_EQ(late.future().state(), FutureState::Cancelled);

  // Closing does not cancel what was registered before.
  EXPECT_EQ(live.future().state(), FutureState::Pending);
  live.resolve();
  EXPECT_TRUE(registry.empty());
}

TEST(ContinuationRegistryTest, DestructionDetachesFromCompletions) {
  Promise<Void> pending;
  int nbRemovals = 0;
  {
    ContinuationRegistry registry;
    registry.setRemovalCallback([&nbRemovals](uint64_t, const Continuation&) { ++nbRemovals; });
    ASSERT_TRUE(registry.add(StreamingOf(pending)).has_value());
  }
  EXPECT_EQ(pending.future().state(), FutureState::Pending);
  pending.resolve();
  EXPECT_EQ(nbRemovals, 0);
}

}  // namespace companion
