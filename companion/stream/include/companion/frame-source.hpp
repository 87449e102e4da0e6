#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "companion/error.hpp"
#include "companion/stream-attributes.hpp"
#include "companion/timedef.hpp"

namespace companion {

enum class FrameReadStatus : std::uint8_t { Data, Timeout, EndOfStream, Interrupted, Error };

struct FrameRead {
  FrameReadStatus status{FrameReadStatus::Timeout};
  // Number of bytes written in the buffer when status is Data.
  std::size_t size{0};
  // Set when status is Error.
  std::optional<Error> error;
};

// Producer of the raw bytes of a video or bitmap stream.
// open, read and close are called from the streaming thread. attributes and interrupt may be called from any thread.
class FrameSource {
 public:
  virtual ~FrameSource() = default;

  // Format of the frames (width, height, pixel_format, frames_per_second, encoding).
  [[nodiscard]] virtual StreamAttributes attributes() const = 0;

  // Returns the failure cause, if any.
  [[nodiscard]] virtual std::optional<Error> open() = 0;

  // Waits at most 'timeout' for some bytes.
  [[nodiscard]] virtual FrameRead read(std::span<char> buffer, SysDuration timeout) = 0;

  // Makes a pending or future read return Interrupted.
  virtual void interrupt() noexcept = 0;

  virtual void close() noexcept = 0;
};

}  // namespace companion
