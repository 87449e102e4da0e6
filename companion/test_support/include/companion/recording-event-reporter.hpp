#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "companion/event-reporter.hpp"

namespace companion::test {

// Keeps every reported event, in report order.
class RecordingEventReporter : public EventReporter {
 public:
  void report(const EventSubject& subject) override {
    std::scoped_lock lock(_mutex);
    _events.push_back(subject);
  }

  void addMetadata(std::string key, std::string value) override {
    std::scoped_lock lock(_mutex);
    _metadata.insert_or_assign(std::move(key), std::move(value));
  }

  [[nodiscard]] std::vector<EventSubject> events() const {
    std::scoped_lock lock(_mutex);
    return _events;
  }

  [[nodiscard]] std::size_t count(EventName name) const {
    std::scoped_lock lock(_mutex);
    return static_cast<std::size_t>(
        std::ranges::count_if(_events, [name](const EventSubject& event) { return event.name == name; }));
  }

  [[nodiscard]] std::vector<EventSubject> eventsNamed(EventName name) const {
    std::vector<EventSubject> result;
    std::scoped_lock lock(_mutex);
    std::ranges::copy_if(_events, std::back_inserter(result),
                         [name](const EventSubject& event) { return event.name == name; });
    return result;
  }

  [[nodiscard]] std::map<std::string, std::string> metadata() const {
    std::scoped_lock lock(_mutex);
    return _metadata;
  }

 private:
  mutable std::mutex _mutex;
  std::vector<EventSubject> _events;
  std::map<std::string, std::string> _metadata;
};

}  // namespace companion::test
