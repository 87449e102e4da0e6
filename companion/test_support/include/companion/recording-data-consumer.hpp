#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "companion/data-consumer.hpp"

namespace companion::test {

// What a RecordingDataConsumer received, observable after the consumer itself has been released.
class RecordedData {
 public:
  void append(std::string_view bytes) {
    std::scoped_lock lock(_mutex);
    _bytes.append(bytes);
    ++_nbChunks;
  }

  void markEndOfFile() {
    std::scoped_lock lock(_mutex);
    ++_nbEndOfFile;
  }

  void markDestroyed() {
    std::scoped_lock lock(_mutex);
    _destroyed = true;
  }

  [[nodiscard]] std::string bytes() const {
    std::scoped_lock lock(_mutex);
    return _bytes;
  }

  [[nodiscard]] std::size_t size() const {
    std::scoped_lock lock(_mutex);
    return _bytes.size();
  }

  [[nodiscard]] std::size_t nbChunks() const {
    std::scoped_lock lock(_mutex);
    return _nbChunks;
  }

  [[nodiscard]] std::size_t nbEndOfFile() const {
    std::scoped_lock lock(_mutex);
    return _nbEndOfFile;
  }

  [[nodiscard]] bool destroyed() const {
    std::scoped_lock lock(_mutex);
    return _destroyed;
  }

 private:
  mutable std::mutex _mutex;
  std::string _bytes;
  std::size_t _nbChunks{0};
  std::size_t _nbEndOfFile{0};
  bool _destroyed{false};
};

class RecordingDataConsumer : public DataConsumer {
 public:
  explicit RecordingDataConsumer(std::shared_ptr<RecordedData> recorded) : _recorded(std::move(recorded)) {}

  RecordingDataConsumer(const RecordingDataConsumer&) = delete;
  RecordingDataConsumer& operator=(const RecordingDataConsumer&) = delete;

  ~RecordingDataConsumer() override { _recorded->markDestroyed(); }

  void consumeData(std::string_view bytes) override { _recorded->append(bytes); }

  void consumeEndOfFile() override { _recorded->markEndOfFile(); }

 private:
  std::shared_ptr<RecordedData> _recorded;
};

}  // namespace companion::test
