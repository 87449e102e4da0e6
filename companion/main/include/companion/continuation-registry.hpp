#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "companion/continuation.hpp"
#include "companion/error.hpp"

namespace companion {

// Live continuations of a server, keyed by the id they were registered under.
//
// The registry only observes: an entry is removed as soon as its completion becomes terminal, whatever the outcome,
// and the underlying operation stays owned by whoever spawned it. Once closed, additions are refused and the
// continuation offered is cancelled.
class ContinuationRegistry {
 public:
  // Called with the id and continuation of each entry removed, from the thread completing it.
  using RemovalCallback = std::function<void(uint64_t, const Continuation&)>;

  ContinuationRegistry();

  ContinuationRegistry(const ContinuationRegistry&) = delete;
  ContinuationRegistry& operator=(const ContinuationRegistry&) = delete;

  // Detaches from the registered completions. Does not cancel them.
  ~ContinuationRegistry();

  void setRemovalCallback(RemovalCallback callback);

  // Registers 'continuation' under a fresh id. InvalidState if the registry is closed.
  std::expected<uint64_t, Error> add(Continuation continuation);

  [[nodiscard]] std::optional<Continuation> find(uint64_t id) const;

  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] bool empty() const { return size() == 0; }

  // Registered continuations, in id order.
  [[nodiscard]] std::vector<Continuation> continuations() const;

  // Refuses later additions. Returns the continuations registered at that time. Idempotent.
  std::vector<Continuation> close();

  [[nodiscard]] bool isClosed() const;

 private:
  struct State {
    void remove(uint64_t id);

    mutable std::mutex mutex;
    std::map<uint64_t, Continuation> entries;
    RemovalCallback onRemoval;
    uint64_t nextId{1};
    bool closed{false};
  };

  std::shared_ptr<State> _state;
};

}  // namespace companion
