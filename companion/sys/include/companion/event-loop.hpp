#pragma once

#include <cstdint>
#include <span>

#include "companion/base-fd.hpp"
#include "companion/event.hpp"
#include "companion/timedef.hpp"

namespace companion {

// Thin RAII wrapper over epoll.
// The event buffer starts with kInitialCapacity slots and doubles each time a poll returns exactly capacity()
// events. It never shrinks.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    EventBmp eventBmp;
    int fd;
  };

  EventLoop() noexcept = default;

  explicit EventLoop(SysDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&& rhs) noexcept;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&& rhs) noexcept;

  ~EventLoop();

  // Register fd with given events.
  // On error, throws std::system_error.
  void addOrThrow(EventFd event) const;

  // Register fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Modify fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Delete fd from monitoring. Logs on error.
  void del(int fd) const;

  // Polls for ready events up to the poll timeout.
  // Returns a span over an internal, reusable buffer.
  //  - On success: a non-empty span of ready events.
  //  - On timeout or EINTR: an empty span with non-null data().
  //  - On unrecoverable failure (already logged): an empty span with nullptr data().
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return _nbAllocatedEvents; }

  void updatePollTimeout(SysDuration pollTimeout);

 private:
  uint32_t _nbAllocatedEvents = 0;
  int _pollTimeoutMs = 0;
  BaseFd _baseFd;
  void* _pEvents = nullptr;
};

}  // namespace companion
