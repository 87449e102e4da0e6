#include "companion/continuation-registry.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "companion/continuation.hpp"
#include "companion/error.hpp"
#include "companion/future.hpp"
#include "companion/log.hpp"

namespace companion {

ContinuationRegistry::ContinuationRegistry() : _state(std::make_shared<State>()) {}

ContinuationRegistry::~ContinuationRegistry() {
  std::scoped_lock lock(_state->mutex);
  _state->onRemoval = nullptr;
}

void ContinuationRegistry::setRemovalCallback(RemovalCallback callback) {
  std::scoped_lock lock(_state->mutex);
  _state->onRemoval = std::move(callback);
}

std::expected<uint64_t, Error> ContinuationRegistry::add(Continuation continuation) {
  uint64_t id;
  {
    std::unique_lock lock(_state->mutex);
    if (_state->closed) {
      lock.unlock();
      log::info("Registry closed, cancelling {} continuation", ContinuationTypeName(continuation.type()));
      (void)continuation.cancel();
      return std::unexpected(Error(ErrorKind::InvalidState, "continuation registry is closed"));
    }
    id = _state->nextId++;
    _state->entries.emplace(id, continuation);
  }
  log::debug("Continuation {} ({}) registered", id, ContinuationTypeName(continuation.type()));

  // Runs immediately if the completion is already terminal.
  std::weak_ptr<State> weakState = _state;
  continuation.completion().onComplete([weakState, id](const Future<Void>&) {
    if (auto state = weakState.lock()) {
      state->remove(id);
    }
  });
  return id;
}

void ContinuationRegistry::State::remove(uint64_t id) {
  std::optional<Continuation> removed;
  RemovalCallback callback;
  {
    std::scoped_lock lock(mutex);
    auto it = entries.find(id);
    if (it == entries.end()) {
      return;
    }
    removed.emplace(std::move(it->second));
    entries.erase(it);
    callback = onRemoval;
  }
  log::debug("Continuation {} ({}) removed, {}", id, ContinuationTypeName(removed->type()),
             FutureStateName(removed->completion().state()));
  if (callback) {
    callback(id, *removed);
  }
}

std::optional<Continuation> ContinuationRegistry::find(uint64_t id) const {
  std::scoped_lock lock(_state->mutex);
  auto it = _state->entries.find(id);
  if (it == _state->entries.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t ContinuationRegistry::size() const {
  std::scoped_lock lock(_state->mutex);
  return _state->entries.size();
}

std::vector<Continuation> ContinuationRegistry::continuations() const {
  std::vector<Continuation> result;
  std::scoped_lock lock(_state->mutex);
  result.reserve(_state->entries.size());
  for (const auto& [id, continuation] : _state->entries) {
    result.push_back(continuation);
  }
  return result;
}

std::vector<Continuation> ContinuationRegistry::close() {
  std::scoped_lock lock(_state->mutex);
  if (!_state->closed) {
    _state->closed = true;
    log::debug("Continuation registry closed with {} live entries", _state->entries.size());
  }
  std::vector<Continuation> result;
  result.reserve(_state->entries.size());
  for (const auto& [id, continuation] : _state->entries) {
    result.push_back(continuation);
  }
  return result;
}

bool ContinuationRegistry::isClosed() const {
  std::scoped_lock lock(_state->mutex);
  return _state->closed;
}

}  // namespace companion
