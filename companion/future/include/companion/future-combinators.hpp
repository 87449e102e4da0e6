#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "companion/error.hpp"
#include "companion/future.hpp"

namespace companion {

// Resolves once every input is terminal, whatever the outcome. Never fails.
template <class T>
Future<Void> AwaitAllSettled(const std::vector<Future<T>>& futures) {
  if (futures.empty()) {
    return Future<Void>::Resolved();
  }
  Promise<Void> promise("await-all-settled");
  auto remaining = std::make_shared<std::atomic<std::size_t>>(futures.size());
  for (const Future<T>& future : futures) {
    future.onComplete([promise, remaining](const Future<T>&) {
      if (remaining->fetch_sub(1, std::memory_order_acq_rel) == 1) {
        promise.resolve();
      }
    });
  }
  return promise.future();
}

// Resolves with the values of all inputs, in input order.
// The first failure fails the aggregate and cancels the remaining inputs. An input cancellation cancels the
// aggregate, and cancelling the aggregate cancels every input.
template <class T>
Future<std::vector<T>> AwaitAll(std::vector<Future<T>> futures) {
  if (futures.empty()) {
    return Future<std::vector<T>>::Resolved();
  }

  struct State {
    std::mutex mutex;
    std::vector<std::optional<T>> values;
    std::size_t remaining;
  };

  auto state = std::make_shared<State>();
  state->values.resize(futures.size());
  state->remaining = futures.size();

  Promise<std::vector<T>> promise("await-all");
  auto inputs = std::make_shared<const std::vector<Future<T>>>(std::move(futures));

  promise.future().onCancel([inputs]() {
    std::vector<Future<Void>> teardowns;
    teardowns.reserve(inputs->size());
    for (const Future<T>& input : *inputs) {
      teardowns.push_back(input.cancel());
    }
    return AwaitAllSettled(teardowns);
  });

  const auto cancelOthers = [inputs](std::size_t skipPos) {
    for (std::size_t pos = 0; pos < inputs->size(); ++pos) {
      if (pos != skipPos) {
        (void)(*inputs)[pos].cancel();
      }
    }
  };

  for (std::size_t pos = 0; pos < inputs->size(); ++pos) {
    (*inputs)[pos].onComplete([promise, state, cancelOthers, pos](const Future<T>& done) {
      switch (done.state()) {
        case FutureState::Succeeded: {
          std::vector<T> result;
          {
            std::scoped_lock lock(state->mutex);
            state->values[pos].emplace(done.value());
            if (--state->remaining != 0) {
              return;
            }
            result.reserve(state->values.size());
            for (std::optional<T>& value : state->values) {
              result.push_back(std::move(*value));
            }
          }
          promise.resolve(std::move(result));
          break;
        }
        case FutureState::Failed:
          if (promise.fail(done.error())) {
            cancelOthers(pos);
          }
          break;
        default:
          promise.cancel();
          break;
      }
    });
  }
  return promise.future();
}

// Adopts the outcome of the first input to become terminal and cancels the others.
template <class T>
Future<T> Race(std::vector<Future<T>> futures) {
  if (futures.empty()) {
    return Future<T>::Failed(Error(ErrorKind::InvalidArgument, "race of no futures"));
  }
  Promise<T> promise("race");
  auto inputs = std::make_shared<const std::vector<Future<T>>>(std::move(futures));

  promise.future().onCancel([inputs]() {
    std::vector<Future<Void>> teardowns;
    teardowns.reserve(inputs->size());
    for (const Future<T>& input : *inputs) {
      teardowns.push_back(input.cancel());
    }
    return AwaitAllSettled(teardowns);
  });

  for (std::size_t pos = 0; pos < inputs->size(); ++pos) {
    (*inputs)[pos].onComplete([promise, inputs, pos](const Future<T>& done) {
      if (!promise.adopt(done)) {
        return;
      }
      for (std::size_t other = 0; other < inputs->size(); ++other) {
        if (other != pos) {
          (void)(*inputs)[other].cancel();
        }
      }
    });
  }
  return promise.future();
}

}  // namespace companion
