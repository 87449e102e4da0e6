#include "companion/delay-scheduler.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

#include "companion/future.hpp"
#include "companion/log.hpp"
#include "companion/timedef.hpp"

namespace companion {

DelayScheduler::DelayScheduler() : _thread([this](const std::stop_token& stopToken) { run(stopToken); }) {}

DelayScheduler::~DelayScheduler() {
  _thread.request_stop();
  if (_thread.joinable()) {
    _thread.join();
  }
  std::vector<Promise<Void>> leftovers;
  {
    std::scoped_lock lock(_mutex);
    _stopped = true;
    leftovers.reserve(_timers.size());
    for (auto& [deadline, timer] : _timers) {
      leftovers.push_back(std::move(timer.promise));
    }
    _timers.clear();
  }
  if (!leftovers.empty()) {
    log::debug("Cancelling {} pending timer(s) of stopped scheduler", leftovers.size());
  }
  for (const Promise<Void>& promise : leftovers) {
    promise.cancel();
  }
}

Future<Void> DelayScheduler::after(SteadyClock::duration delay) {
  Promise<Void> promise("timer");
  uint64_t id;
  {
    std::scoped_lock lock(_mutex);
    if (_stopped) {
      promise.cancel();
      return promise.future();
    }
    id = _nextId++;
    _timers.emplace(SteadyClock::now() + delay, Timer{id, promise});
  }
  _cv.notify_all();
  return promise.future().onCancel([this, id]() {
    remove(id);
    return Future<Void>::Resolved();
  });
}

std::size_t DelayScheduler::pendingTimers() const {
  std::scoped_lock lock(_mutex);
  return _timers.size();
}

void DelayScheduler::remove(uint64_t id) {
  std::scoped_lock lock(_mutex);
  for (auto it = _timers.begin(); it != _timers.end(); ++it) {
    if (it->second.id == id) {
      _timers.erase(it);
      return;
    }
  }
}

void DelayScheduler::run(const std::stop_token& stopToken) {
  std::unique_lock lock(_mutex);
  while (!stopToken.stop_requested()) {
    if (_timers.empty()) {
      _cv.wait(lock, stopToken, [this] { return !_timers.empty(); });
      continue;
    }
    const SteadyTimePoint deadline = _timers.begin()->first;
    if (SteadyClock::now() < deadline) {
      _cv.wait_until(lock, stopToken, deadline, [this, deadline] {
        return _timers.empty() || _timers.begin()->first < deadline || SteadyClock::now() >= deadline;
      });
      continue;
    }
    std::vector<Promise<Void>> expired;
    const SteadyTimePoint now = SteadyClock::now();
    while (!_timers.empty() && _timers.begin()->first <= now) {
      expired.push_back(std::move(_timers.begin()->second.promise));
      _timers.erase(_timers.begin());
    }
    lock.unlock();
    for (const Promise<Void>& promise : expired) {
      promise.resolve();
    }
    lock.lock();
  }
}

}  // namespace companion
