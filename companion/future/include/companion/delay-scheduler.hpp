#pragma once

#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "companion/error.hpp"
#include "companion/future.hpp"
#include "companion/timedef.hpp"

namespace companion {

// Single thread resolving timer futures at their deadline.
// Cancelling a timer future removes the timer. Timers still pending at destruction are cancelled.
class DelayScheduler {
 public:
  DelayScheduler();

  DelayScheduler(const DelayScheduler&) = delete;
  DelayScheduler(DelayScheduler&&) = delete;
  DelayScheduler& operator=(const DelayScheduler&) = delete;
  DelayScheduler& operator=(DelayScheduler&&) = delete;

  ~DelayScheduler();

  // Future resolved after 'delay'. Non positive delays resolve on the scheduler thread as soon as possible.
  [[nodiscard]] Future<Void> after(SteadyClock::duration delay);

  [[nodiscard]] std::size_t pendingTimers() const;

 private:
  struct Timer {
    uint64_t id;
    Promise<Void> promise;
  };

  void run(const std::stop_token& stopToken);

  void remove(uint64_t id);

  mutable std::mutex _mutex;
  std::condition_variable_any _cv;
  std::multimap<SteadyTimePoint, Timer> _timers;
  uint64_t _nextId{1};
  bool _stopped{false};
  std::jthread _thread;
};

// Race between 'future' and a timer of 'timeout'. The loser is cancelled. If the timer wins, the result fails
// with Timeout.
template <class T>
Future<T> WithTimeout(const Future<T>& future, SteadyClock::duration timeout, DelayScheduler& scheduler) {
  Promise<T> promise(future.name());
  Future<Void> timer = scheduler.after(timeout);

  promise.future().onCancel([future, timer]() {
    (void)timer.cancel();
    return future.cancel();
  });

  timer.onComplete([promise, future](const Future<Void>& done) {
    if (done.state() != FutureState::Succeeded) {
      return;
    }
    std::string name = future.name();
    if (promise.fail(Error(ErrorKind::Timeout, name.empty() ? std::string("operation timed out")
                                                            : std::move(name) + " timed out"))) {
      (void)future.cancel();
    }
  });

  future.onComplete([promise, timer](const Future<T>& done) {
    if (promise.adopt(done)) {
      (void)timer.cancel();
    }
  });
  return promise.future();
}

}  // namespace companion
