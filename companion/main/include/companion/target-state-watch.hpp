#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

#include "companion/continuation.hpp"
#include "companion/event-reporter.hpp"
#include "companion/future.hpp"
#include "companion/target.hpp"

namespace companion {

// Polls the target state every 'interval' on a dedicated thread, reporting each change.
// Exposed as a TargetOfflineWatch continuation that succeeds once the target is observed Offline. Cancelling it stops
// the probing.
class TargetStateWatch {
 public:
  // 'reporter' may be null.
  TargetStateWatch(std::shared_ptr<Target> target, std::chrono::milliseconds interval,
                   std::shared_ptr<EventReporter> reporter);

  TargetStateWatch(const TargetStateWatch&) = delete;
  TargetStateWatch(TargetStateWatch&&) = delete;
  TargetStateWatch& operator=(const TargetStateWatch&) = delete;
  TargetStateWatch& operator=(TargetStateWatch&&) = delete;

  // Cancels the continuation if still pending and joins the probing thread.
  ~TargetStateWatch();

  [[nodiscard]] Continuation continuation() const {
    return {ContinuationType::TargetOfflineWatch, _offline.future()};
  }

 private:
  void run(const std::stop_token& stopToken);

  std::shared_ptr<Target> _target;
  std::shared_ptr<EventReporter> _reporter;
  std::chrono::milliseconds _interval;
  Promise<Void> _offline{"target-offline-watch"};
  std::mutex _mutex;
  std::condition_variable_any _cv;
  std::jthread _thread;
};

}  // namespace companion
