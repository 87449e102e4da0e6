#include "companion/target-state-watch.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

#include "companion/event-reporter.hpp"
#include "companion/future.hpp"
#include "companion/log.hpp"
#include "companion/target.hpp"

namespace companion {

TargetStateWatch::TargetStateWatch(std::shared_ptr<Target> target, std::chrono::milliseconds interval,
                                   std::shared_ptr<EventReporter> reporter)
    : _target(std::move(target)), _reporter(std::move(reporter)), _interval(interval) {
  if (!_target) {
    throw std::invalid_argument("TargetStateWatch requires a target");
  }
  if (_interval <= std::chrono::milliseconds{0}) {
    throw std::invalid_argument("TargetStateWatch interval must be > 0");
  }
  _offline.future().onCancel([this]() {
    _thread.request_stop();
    return Future<Void>::Resolved();
  });
  _thread = std::jthread([this](const std::stop_token& stopToken) { run(stopToken); });
}

TargetStateWatch::~TargetStateWatch() {
  (void)_offline.cancel();
  _thread.request_stop();
  if (_thread.joinable()) {
    _thread.join();
  }
}

void TargetStateWatch::run(const std::stop_token& stopToken) {
  TargetState lastState = _target->state();
  log::debug("Watching target {} every {} ms", _target->udid(), _interval.count());
  while (!stopToken.stop_requested()) {
    {
      std::unique_lock lock(_mutex);
      if (_cv.wait_for(lock, stopToken, _interval, [] { return false; }) || stopToken.stop_requested()) {
        break;
      }
    }
    const TargetState state = _target->refreshState();
    if (state == lastState) {
      continue;
    }
    log::info("Target {} went from {} to {}", _target->udid(), TargetStateName(lastState), TargetStateName(state));
    lastState = state;
    if (_reporter) {
      _reporter->report(EventSubject{EventName::TargetStateChanged, std::string(TargetStateName(state)), {}, {}});
    }
    if (state == TargetState::Offline) {
      _offline.resolve();
      break;
    }
  }
  log::debug("Stopped watching target {}", _target->udid());
}

}  // namespace companion
