#pragma once

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include "companion/event-fd.hpp"

namespace companion::internal {

// Work posted to the reactor thread from any thread. The wakeup eventfd interrupts the reactor poll.
class ReactorMailbox {
 public:
  using Task = std::function<void()>;

  // Returns false (and drops 'task') once closed.
  bool post(Task task) {
    {
      std::scoped_lock lock(_mutex);
      if (_closed) {
        return false;
      }
      _tasks.push_back(std::move(task));
    }
    _wakeupFd.notify();
    return true;
  }

  // Tasks posted so far, in posting order.
  std::vector<Task> drain() {
    std::vector<Task> tasks;
    std::scoped_lock lock(_mutex);
    tasks.swap(_tasks);
    return tasks;
  }

  // Drops pending tasks and refuses later ones.
  void close() {
    std::vector<Task> dropped;
    std::scoped_lock lock(_mutex);
    _closed = true;
    dropped.swap(_tasks);
  }

  [[nodiscard]] const EventFd& wakeupFd() const noexcept { return _wakeupFd; }

 private:
  std::mutex _mutex;
  std::vector<Task> _tasks;
  EventFd _wakeupFd;
  bool _closed{false};
};

}  // namespace companion::internal
