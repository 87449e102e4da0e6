#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "companion/error.hpp"
#include "companion/timedef.hpp"

namespace companion {

enum class EventName : std::uint8_t {
  Launched,
  Started,
  Stopped,
  ClientConnected,
  ClientDisconnected,
  CommandSucceeded,
  CommandFailed,
  ContinuationAdded,
  ContinuationRemoved,
  TargetStateChanged,
};

[[nodiscard]] std::string_view EventNameStr(EventName name) noexcept;

struct EventSubject {
  EventName name;

  // What the event is about: command name, client address, target state...
  std::string subject;

  std::optional<SysDuration> duration;

  std::optional<Error> error;

  // Single line JSON object, with 'metadata' merged in.
  [[nodiscard]] std::string json_str(const std::map<std::string, std::string>& metadata = {}) const;
};

// Sink of the lifecycle and command events of the companion. Implementations must be thread safe.
class EventReporter {
 public:
  virtual ~EventReporter() = default;

  virtual void report(const EventSubject& subject) = 0;

  // Key / value pair attached to every later report.
  virtual void addMetadata(std::string key, std::string value) = 0;
};

// Reports events as JSON lines on the companion logger.
class LogEventReporter : public EventReporter {
 public:
  void report(const EventSubject& subject) override;

  void addMetadata(std::string key, std::string value) override;

 private:
  std::mutex _mutex;
  std::map<std::string, std::string> _metadata;
};

}  // namespace companion
