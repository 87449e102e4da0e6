#include "companion/scripted-frame-source.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <utility>

#include "companion/error.hpp"
#include "companion/frame-source.hpp"
#include "companion/stream-attributes.hpp"
#include "companion/timedef.hpp"

namespace companion::test {

ScriptedFrameSource::ScriptedFrameSource() = default;

StreamAttributes ScriptedFrameSource::attributes() const {
  StreamAttributes attributes;
  attributes.set("width", int64_t{320})
      .set("height", int64_t{240})
      .set("pixel_format", std::string("BGRA"))
      .set("frames_per_second", int64_t{30})
      .set("encoding", std::string("bgra"));
  return attributes;
}

std::optional<Error> ScriptedFrameSource::open() {
  std::scoped_lock lock(_mutex);
  if (_openFailure) {
    return _openFailure;
  }
  _opened = true;
  return std::nullopt;
}

FrameRead ScriptedFrameSource::read(std::span<char> buffer, SysDuration timeout) {
  std::unique_lock lock(_mutex);
  _cv.wait_for(lock, timeout,
               [this] { return _interrupted || !_chunks.empty() || _finished || _readFailure.has_value(); });
  if (_interrupted) {
    return {FrameReadStatus::Interrupted};
  }
  if (!_chunks.empty()) {
    std::string& front = _chunks.front();
    const std::size_t len = std::min(front.size(), buffer.size());
    std::copy_n(front.data(), len, buffer.data());
    if (len == front.size()) {
      _chunks.pop_front();
    } else {
      front.erase(0, len);
    }
    return {FrameReadStatus::Data, len};
  }
  if (_readFailure) {
    return {FrameReadStatus::Error, 0, _readFailure};
  }
  if (_finished) {
    return {FrameReadStatus::EndOfStream};
  }
  return {FrameReadStatus::Timeout};
}

void ScriptedFrameSource::interrupt() noexcept {
  {
    std::scoped_lock lock(_mutex);
    _interrupted = true;
  }
  _cv.notify_all();
}

void ScriptedFrameSource::close() noexcept {
  std::scoped_lock lock(_mutex);
  _closed = true;
}

void ScriptedFrameSource::push(std::string bytes) {
  {
    std::scoped_lock lock(_mutex);
    _chunks.push_back(std::move(bytes));
  }
  _cv.notify_all();
}

void ScriptedFrameSource::finish() {
  {
    std::scoped_lock lock(_mutex);
    _finished = true;
  }
  _cv.notify_all();
}

void ScriptedFrameSource::failWith(Error error) {
  {
    std::scoped_lock lock(_mutex);
    _readFailure = std::move(error);
  }
  _cv.notify_all();
}

void ScriptedFrameSource::setOpenFailure(Error error) {
  std::scoped_lock lock(_mutex);
  _openFailure = std::move(error);
}

bool ScriptedFrameSource::opened() const {
  std::scoped_lock lock(_mutex);
  return _opened;
}

bool ScriptedFrameSource::closed() const {
  std::scoped_lock lock(_mutex);
  return _closed;
}

bool ScriptedFrameSource::interrupted() const {
  std::scoped_lock lock(_mutex);
  return _interrupted;
}

}  // namespace companion::test
