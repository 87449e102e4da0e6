#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <span>
#include <string>

#include "companion/error.hpp"
#include "companion/frame-source.hpp"
#include "companion/stream-attributes.hpp"
#include "companion/timedef.hpp"

namespace companion::test {

// In-memory FrameSource fed by the test.
class ScriptedFrameSource : public FrameSource {
 public:
  ScriptedFrameSource();

  [[nodiscard]] StreamAttributes attributes() const override;

  [[nodiscard]] std::optional<Error> open() override;

  [[nodiscard]] FrameRead read(std::span<char> buffer, SysDuration timeout) override;

  void interrupt() noexcept override;

  void close() noexcept override;

  // Next reads return 'bytes', split if larger than the read buffer.
  void push(std::string bytes);

  // Reads return EndOfStream once pushed bytes are consumed.
  void finish();

  // Reads fail with 'error' once pushed bytes are consumed.
  void failWith(Error error);

  // open() fails with 'error'.
  void setOpenFailure(Error error);

  [[nodiscard]] bool opened() const;
  [[nodiscard]] bool closed() const;
  [[nodiscard]] bool interrupted() const;

 private:
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::deque<std::string> _chunks;
  std::optional<Error> _openFailure;
  std::optional<Error> _readFailure;
  bool _finished{false};
  bool _opened{false};
  bool _closed{false};
  bool _interrupted{false};
};

}  // namespace companion::test
