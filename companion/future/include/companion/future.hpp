#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "companion/error.hpp"
#include "companion/log.hpp"

namespace companion {

// Value type of futures that carry no result.
using Void = std::monostate;

enum class FutureState : std::uint8_t { Pending, Succeeded, Failed, Cancelled };

[[nodiscard]] std::string_view FutureStateName(FutureState state) noexcept;

template <class T>
class Future;

template <class T>
class Promise;

// Invoked at most once when a pending future is cancelled. The returned future tracks the teardown work.
using CancelHook = std::function<Future<Void>()>;

namespace internal {

template <class R>
using VoidToUnit = std::conditional_t<std::is_void_v<R>, Void, R>;

template <class F, class T>
using MapResult = VoidToUnit<std::invoke_result_t<F&, const T&>>;

template <class F, class T>
MapResult<F, T> InvokeToValue(F& fn, const T& value) {
  if constexpr (std::is_void_v<std::invoke_result_t<F&, const T&>>) {
    std::invoke(fn, value);
    return Void{};
  } else {
    return std::invoke(fn, value);
  }
}

template <class T>
struct IsFuture : std::false_type {};

template <class T>
struct IsFuture<Future<T>> : std::true_type {};

// Shared state of a Future / Promise pair.
//
// The terminal transition and the start of callback dispatching happen under the same lock, and callbacks always
// run outside of it. While a dispatch is in progress, newly registered callbacks are queued behind the ones being
// run, so that callbacks of one future always run in registration order, exactly once.
template <class T>
class FutureCore : public std::enable_shared_from_this<FutureCore<T>> {
 public:
  using Callback = std::function<void(const std::shared_ptr<FutureCore>&)>;

  FutureCore() = default;

  explicit FutureCore(std::string name) : _name(std::move(name)) {}

  FutureCore(const FutureCore&) = delete;
  FutureCore& operator=(const FutureCore&) = delete;

  [[nodiscard]] FutureState state() const {
    std::scoped_lock lock(_mutex);
    return _state;
  }

  [[nodiscard]] std::string name() const {
    std::scoped_lock lock(_mutex);
    return _name;
  }

  void setName(std::string name) {
    std::scoped_lock lock(_mutex);
    _name = std::move(name);
  }

  bool resolve(T value) {
    CancelHook released;
    std::unique_lock lock(_mutex);
    if (_state != FutureState::Pending) {
      return false;
    }
    _value.emplace(std::move(value));
    _state = FutureState::Succeeded;
    released = std::exchange(_cancelHook, nullptr);
    dispatch(lock);
    return true;
  }

  bool fail(Error error) {
    CancelHook released;
    std::unique_lock lock(_mutex);
    if (_state != FutureState::Pending) {
      return false;
    }
    _error = std::move(error);
    _state = FutureState::Failed;
    released = std::exchange(_cancelHook, nullptr);
    dispatch(lock);
    return true;
  }

  // Transition to Cancelled if still pending. Returns the hook to run (possibly empty) when this call performed
  // the transition, std::nullopt otherwise. finishCancel() must be called afterwards to run the callbacks.
  std::optional<CancelHook> beginCancel() {
    std::scoped_lock lock(_mutex);
    if (_state != FutureState::Pending) {
      return std::nullopt;
    }
    _state = FutureState::Cancelled;
    _error = Error(ErrorKind::Cancelled, _name.empty() ? std::string("future cancelled") : _name + " cancelled");
    _dispatching = true;
    _cv.notify_all();
    return std::optional<CancelHook>(std::exchange(_cancelHook, nullptr));
  }

  void finishCancel() {
    std::unique_lock lock(_mutex);
    runCallbacks(lock);
  }

  // Store the hook if pending. Returns the hook back if it must run right away (future already cancelled),
  // an empty hook otherwise.
  CancelHook setCancelHook(CancelHook hook) {
    std::unique_lock lock(_mutex);
    if (_state == FutureState::Pending) {
      std::swap(_cancelHook, hook);
      lock.unlock();
      return nullptr;  // previous hook, if any, is dropped here outside of the lock
    }
    if (_state == FutureState::Cancelled) {
      return hook;
    }
    return nullptr;
  }

  void addCallback(Callback callback) {
    std::unique_lock lock(_mutex);
    if (_state == FutureState::Pending || _dispatching) {
      _callbacks.push_back(std::move(callback));
      return;
    }
    lock.unlock();
    invoke(callback, this->shared_from_this());
  }

  [[nodiscard]] const T& value() const {
    std::scoped_lock lock(_mutex);
    if (_state != FutureState::Succeeded) {
      throw FutureError(errorLocked());
    }
    return *_value;
  }

  [[nodiscard]] Error error() const {
    std::scoped_lock lock(_mutex);
    return errorLocked();
  }

  void wait() const {
    std::unique_lock lock(_mutex);
    _cv.wait(lock, [this] { return _state != FutureState::Pending; });
  }

  template <class Rep, class Period>
  bool waitFor(std::chrono::duration<Rep, Period> timeout) const {
    std::unique_lock lock(_mutex);
    return _cv.wait_for(lock, timeout, [this] { return _state != FutureState::Pending; });
  }

 private:
  [[nodiscard]] Error errorLocked() const {
    switch (_state) {
      case FutureState::Pending:
        return Error(ErrorKind::InvalidState, _name.empty() ? std::string("future is pending") : _name + " is pending");
      case FutureState::Succeeded:
        return Error(ErrorKind::InvalidState, _name.empty() ? std::string("future succeeded") : _name + " succeeded");
      default:
        return _error;
    }
  }

  void dispatch(std::unique_lock<std::mutex>& lock) {
    _dispatching = true;
    _cv.notify_all();
    runCallbacks(lock);
  }

  void runCallbacks(std::unique_lock<std::mutex>& lock) {
    const auto self = this->shared_from_this();
    while (true) {
      std::vector<Callback> batch;
      batch.swap(_callbacks);
      if (batch.empty()) {
        break;
      }
      lock.unlock();
      for (Callback& callback : batch) {
        invoke(callback, self);
      }
      batch.clear();
      lock.lock();
    }
    _dispatching = false;
  }

  void invoke(Callback& callback, const std::shared_ptr<FutureCore>& self) {
    try {
      callback(self);
    } catch (const std::exception& ex) {
      log::error("Callback of future '{}' threw: {}", name(), ex.what());
    }
  }

  mutable std::mutex _mutex;
  mutable std::condition_variable _cv;
  std::string _name;
  std::optional<T> _value;
  Error _error;
  std::vector<Callback> _callbacks;
  CancelHook _cancelHook;
  FutureState _state{FutureState::Pending};
  bool _dispatching{false};
};

inline Future<Void> RunCancelHook(const CancelHook& hook, std::string_view futureName);

}  // namespace internal

// Shared handle on the eventual outcome of an operation: Succeeded with a value, Failed with an Error, or Cancelled.
// Copies refer to the same result. The terminal state is reached at most once and never changes afterwards.
template <class T>
class Future {
 public:
  using value_type = T;

  [[nodiscard]] static Future Resolved(T value = T{});
  [[nodiscard]] static Future Failed(Error error);
  [[nodiscard]] static Future Cancelled(std::string name = {});

  [[nodiscard]] FutureState state() const { return _core->state(); }
  [[nodiscard]] bool isTerminal() const { return state() != FutureState::Pending; }

  // Throws FutureError if the future did not succeed.
  [[nodiscard]] const T& value() const { return _core->value(); }

  // The failure or cancellation cause. For pending or succeeded futures, an InvalidState error.
  [[nodiscard]] Error error() const { return _core->error(); }

  [[nodiscard]] std::string name() const { return _core->name(); }

  // Sets the diagnostic name, shared by all copies.
  Future named(std::string name) const {
    _core->setName(std::move(name));
    return *this;
  }

  // Register a callback invoked exactly once with this future once terminal, in registration order.
  // If the future is already terminal, the callback runs immediately on the calling thread.
  template <class F>
  Future onComplete(F&& callback) const;

  // Register the cancellation hook, replacing any previous one. Runs at most once, only if this future gets
  // cancelled while pending, or immediately if it is already cancelled.
  Future onCancel(CancelHook hook) const;

  // Request cancellation. No-op on a terminal future. Otherwise the future becomes Cancelled, the hook runs once,
  // then callbacks observe the Cancelled state. Returns the future of the teardown started by the hook.
  Future<Void> cancel() const;

  // fn: const T& -> U (void maps to Void).
  template <class F>
  auto map(F&& fn) const -> Future<internal::MapResult<F, T>>;

  // fn: const T& -> Future<U>. Only invoked on success.
  template <class F>
  auto then(F&& fn) const -> std::invoke_result_t<F&, const T&>;

  // fn: const Future<T>& -> Future<U>. Invoked on any terminal state.
  template <class F>
  auto chain(F&& fn) const -> std::invoke_result_t<F&, const Future<T>&>;

  [[nodiscard]] Future<Void> discardValue() const {
    return map([](const T&) {});
  }

  // Blocking helpers, meant for the process entry point and tests.
  void wait() const { _core->wait(); }

  template <class Rep, class Period>
  bool waitFor(std::chrono::duration<Rep, Period> timeout) const {
    return _core->waitFor(timeout);
  }

  // Blocks until terminal. Throws FutureError on failure or cancellation.
  T get() const {
    wait();
    return value();
  }

  [[nodiscard]] bool sameAs(const Future& other) const noexcept { return _core == other._core; }

 private:
  using Core = internal::FutureCore<T>;

  template <class>
  friend class Future;
  friend class Promise<T>;

  explicit Future(std::shared_ptr<Core> core) noexcept : _core(std::move(core)) {}

  std::shared_ptr<Core> _core;
};

// Resolver capability of a Future. Copies resolve the same future; the first terminal transition wins.
template <class T>
class Promise {
 public:
  Promise() : _core(std::make_shared<internal::FutureCore<T>>()) {}

  explicit Promise(std::string name) : _core(std::make_shared<internal::FutureCore<T>>(std::move(name))) {}

  [[nodiscard]] Future<T> future() const { return Future<T>(_core); }

  [[nodiscard]] bool isTerminal() const { return _core->state() != FutureState::Pending; }

  // Returns false (no-op) if the future is already terminal.
  bool resolve(T value) const { return _core->resolve(std::move(value)); }

  bool resolve() const
    requires std::is_same_v<T, Void>
  {
    return _core->resolve(Void{});
  }

  bool fail(Error error) const { return _core->fail(std::move(error)); }

  // Cancel from the producer side. Returns true if this call performed the transition.
  bool cancel() const {
    auto hook = _core->beginCancel();
    if (!hook) {
      return false;
    }
    if (*hook) {
      (void)internal::RunCancelHook(*hook, _core->name());
    }
    _core->finishCancel();
    return true;
  }

  // Resolve with the result of fn(), failing with the error of any exception it throws.
  template <class Fn>
  bool resolveWith(Fn&& fn) const {
    try {
      return resolve(std::invoke(std::forward<Fn>(fn)));
    } catch (const FutureError& ex) {
      return fail(ex.error());
    } catch (const std::exception& ex) {
      return fail(Error(ErrorKind::Internal, ex.what()));
    }
  }

  // Copy the terminal outcome of 'other' (which must be terminal).
  bool adopt(const Future<T>& other) const {
    switch (other.state()) {
      case FutureState::Succeeded:
        return resolve(other.value());
      case FutureState::Failed:
        return fail(other.error());
      case FutureState::Cancelled:
        return cancel();
      default:
        return false;
    }
  }

 private:
  std::shared_ptr<internal::FutureCore<T>> _core;
};

namespace internal {

// Tracks the inner future of a then/chain composition so that cancelling the composed future reaches it,
// including when it is created after the cancellation request.
class CancelLink {
 public:
  Future<Void> cancel() {
    CancelHook inner;
    {
      std::scoped_lock lock(_mutex);
      _cancelled = true;
      inner = std::exchange(_inner, nullptr);
    }
    if (inner) {
      return inner();
    }
    return Future<Void>::Resolved();
  }

  void attach(CancelHook inner) {
    {
      std::scoped_lock lock(_mutex);
      if (!_cancelled) {
        _inner = std::move(inner);
        return;
      }
    }
    (void)inner();
  }

  void detach() {
    CancelHook released;
    std::scoped_lock lock(_mutex);
    released = std::exchange(_inner, nullptr);
  }

 private:
  std::mutex _mutex;
  CancelHook _inner;
  bool _cancelled{false};
};

inline Future<Void> RunCancelHook(const CancelHook& hook, std::string_view futureName) {
  try {
    return hook();
  } catch (const FutureError& ex) {
    log::error("Cancellation hook of '{}' failed: {}", futureName, ex.what());
    return Future<Void>::Failed(ex.error());
  } catch (const std::exception& ex) {
    log::error("Cancellation hook of '{}' threw: {}", futureName, ex.what());
    return Future<Void>::Failed(Error(ErrorKind::Internal, ex.what()));
  }
}

}  // namespace internal

template <class T>
Future<T> Future<T>::Resolved(T value) {
  Promise<T> promise;
  promise.resolve(std::move(value));
  return promise.future();
}

template <class T>
Future<T> Future<T>::Failed(Error error) {
  Promise<T> promise;
  promise.fail(std::move(error));
  return promise.future();
}

template <class T>
Future<T> Future<T>::Cancelled(std::string name) {
  Promise<T> promise(std::move(name));
  promise.cancel();
  return promise.future();
}

template <class T>
template <class F>
Future<T> Future<T>::onComplete(F&& callback) const {
  _core->addCallback(
      [cb = std::forward<F>(callback)](const std::shared_ptr<Core>& core) mutable { cb(Future<T>(core)); });
  return *this;
}

template <class T>
Future<T> Future<T>::onCancel(CancelHook hook) const {
  CancelHook runNow = _core->setCancelHook(std::move(hook));
  if (runNow) {
    (void)internal::RunCancelHook(runNow, name());
  }
  return *this;
}

template <class T>
Future<Void> Future<T>::cancel() const {
  auto hook = _core->beginCancel();
  if (!hook) {
    return Future<Void>::Resolved();
  }
  Future<Void> teardown = Future<Void>::Resolved();
  if (*hook) {
    teardown = internal::RunCancelHook(*hook, name());
  }
  _core->finishCancel();
  return teardown;
}

template <class T>
template <class F>
auto Future<T>::chain(F&& fn) const -> std::invoke_result_t<F&, const Future<T>&> {
  using Result = std::invoke_result_t<F&, const Future<T>&>;
  static_assert(internal::IsFuture<Result>::value, "chain callback must return a Future");
  using U = typename Result::value_type;

  Promise<U> promise(name());
  auto link = std::make_shared<internal::CancelLink>();
  const Future<T> upstream = *this;

  // Cancellation flows to the nearest unresolved upstream: the source while pending, then the inner future.
  promise.future().onCancel([upstream, link]() {
    if (!upstream.isTerminal()) {
      (void)link->cancel();
      return upstream.cancel();
    }
    return link->cancel();
  });

  onComplete([promise, link, fn = std::forward<F>(fn)](const Future<T>& done) mutable {
    std::optional<Result> inner;
    try {
      inner.emplace(std::invoke(fn, done));
    } catch (const FutureError& ex) {
      promise.fail(ex.error());
      return;
    } catch (const std::exception& ex) {
      promise.fail(Error(ErrorKind::Internal, ex.what()));
      return;
    }
    link->attach([innerFuture = *inner]() { return innerFuture.cancel(); });
    inner->onComplete([promise, link](const Result& settled) {
      link->detach();
      promise.adopt(settled);
    });
  });
  return promise.future();
}

template <class T>
template <class F>
auto Future<T>::then(F&& fn) const -> std::invoke_result_t<F&, const T&> {
  using Result = std::invoke_result_t<F&, const T&>;
  static_assert(internal::IsFuture<Result>::value, "then callback must return a Future");

  return chain([fn = std::forward<F>(fn)](const Future<T>& done) mutable -> Result {
    switch (done.state()) {
      case FutureState::Succeeded:
        return std::invoke(fn, done.value());
      case FutureState::Failed:
        return Result::Failed(done.error());
      default:
        return Result::Cancelled(done.name());
    }
  });
}

template <class T>
template <class F>
auto Future<T>::map(F&& fn) const -> Future<internal::MapResult<F, T>> {
  using U = internal::MapResult<F, T>;

  return then([fn = std::forward<F>(fn)](const T& value) mutable {
    return Future<U>::Resolved(internal::InvokeToValue(fn, value));
  });
}

}  // namespace companion
