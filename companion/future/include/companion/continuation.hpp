#pragma once

#include <cstdint>
#include <functional>
#include <string_view>
#include <utility>

#include "companion/future.hpp"

namespace companion {

enum class ContinuationType : std::uint8_t { VideoStreaming, TargetOfflineWatch };

[[nodiscard]] std::string_view ContinuationTypeName(ContinuationType type) noexcept;

// Long-lived operation spawned by a command, tracked by the server until its completion is terminal.
class Continuation {
 public:
  using StopRequest = std::function<Future<Void>()>;

  Continuation(ContinuationType type, Future<Void> completion) : _completion(std::move(completion)), _type(type) {}

  // 'stop' asks the operation to end the way it ends on its own, and returns the completion. It replaces the
  // cancellation of the completion in cancel().
  Continuation(ContinuationType type, Future<Void> completion, StopRequest stop)
      : _completion(std::move(completion)), _stop(std::move(stop)), _type(type) {}

  [[nodiscard]] ContinuationType type() const noexcept { return _type; }

  [[nodiscard]] const Future<Void>& completion() const noexcept { return _completion; }

  [[nodiscard]] bool isTerminal() const { return _completion.isTerminal(); }

  // Requests the operation to stop, or cancels the completion when there is no stop request. Returns the teardown
  // future of the underlying operation. No-op once the completion is terminal.
  Future<Void> cancel() const {
    if (_completion.isTerminal()) {
      return Future<Void>::Resolved();
    }
    return _stop ? _stop() : _completion.cancel();
  }

 private:
  Future<Void> _completion;
  StopRequest _stop;
  ContinuationType _type;
};

}  // namespace companion
