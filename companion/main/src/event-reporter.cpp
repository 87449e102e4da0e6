#include "companion/event-reporter.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "companion/json-serializer.hpp"
#include "companion/log.hpp"

namespace {

struct EventLine {
  std::string_view event;
  std::optional<std::string_view> subject;
  std::optional<int64_t> duration_ms;
  std::optional<std::string> error;
};

}  // namespace

template <>
struct glz::meta<EventLine> {
  using T = EventLine;
  static constexpr auto value =
      glz::object("event", &T::event, "subject", &T::subject, "duration_ms", &T::duration_ms, "error", &T::error);
};

namespace companion {

std::string_view EventNameStr(EventName name) noexcept {
  switch (name) {
    case EventName::Launched:
      return "launched";
    case EventName::Started:
      return "started";
    case EventName::Stopped:
      return "stopped";
    case EventName::ClientConnected:
      return "client_connected";
    case EventName::ClientDisconnected:
      return "client_disconnected";
    case EventName::CommandSucceeded:
      return "command_succeeded";
    case EventName::CommandFailed:
      return "command_failed";
    case EventName::ContinuationAdded:
      return "continuation_added";
    case EventName::ContinuationRemoved:
      return "continuation_removed";
    case EventName::TargetStateChanged:
      return "target_state_changed";
    default:
      return "unknown";
  }
}

std::string EventSubject::json_str(const std::map<std::string, std::string>& metadata) const {
  EventLine line{EventNameStr(name), {}, {}, {}};
  if (!subject.empty()) {
    line.subject = subject;
  }
  if (duration) {
    line.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(*duration).count();
  }
  if (error) {
    line.error = error->describe();
  }
  std::string out = SerializeToJson(line);
  if (!metadata.empty() && out.size() > 2) {
    // metadata members are appended to the event object
    const std::string extra = SerializeToJson(metadata);
    out.back() = ',';
    out.append(extra, 1);
  }
  return out;
}

void LogEventReporter::report(const EventSubject& subject) {
  std::string line;
  {
    std::scoped_lock lock(_mutex);
    line = subject.json_str(_metadata);
  }
  if (subject.error) {
    log::warn("Event {}", line);
  } else {
    log::info("Event {}", line);
  }
}

void LogEventReporter::addMetadata(std::string key, std::string value) {
  std::scoped_lock lock(_mutex);
  _metadata.insert_or_assign(std::move(key), std::move(value));
}

}  // namespace companion
