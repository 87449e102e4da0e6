#pragma once

#include <dlfcn.h>

#include <cstdlib>
#include <deque>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <utility>

namespace companion::test {

// Resolve the next definition of a libc symbol, so that a test translation unit can interpose a system call and
// still forward to the real implementation. Aborts if the symbol cannot be resolved.
template <typename Fn>
Fn ResolveNext(const char* name) {
  void* sym = ::dlsym(RTLD_NEXT, name);
  if (sym == nullptr) {
    std::abort();
  }
  return reinterpret_cast<Fn>(sym);
}

// FIFO of scripted outcomes consumed by interposed system calls.
template <class Action>
class ActionQueue {
 public:
  ActionQueue() = default;
  ActionQueue(const ActionQueue&) = delete;
  ActionQueue& operator=(const ActionQueue&) = delete;

  void reset() {
    std::scoped_lock<std::mutex> lock(_mutex);
    _actions.clear();
  }

  void setActions(std::initializer_list<Action> actions) {
    std::scoped_lock<std::mutex> lock(_mutex);
    _actions.assign(actions.begin(), actions.end());
  }

  [[nodiscard]] std::optional<Action> pop() {
    std::scoped_lock<std::mutex> lock(_mutex);
    if (_actions.empty()) {
      return std::nullopt;
    }
    Action front = std::move(_actions.front());
    _actions.pop_front();
    return front;
  }

 private:
  std::mutex _mutex;
  std::deque<Action> _actions;
};

}  // namespace companion::test
