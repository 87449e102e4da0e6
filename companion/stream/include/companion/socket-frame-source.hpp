#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <span>

#include "companion/connection.hpp"
#include "companion/error.hpp"
#include "companion/frame-source.hpp"
#include "companion/stream-attributes.hpp"
#include "companion/timedef.hpp"
#include "companion/video-source-config.hpp"

namespace companion {

// Frames read from a TCP video relay. The relay pushes the encoded stream as soon as the connection is established
// and closes it at end of stream.
class SocketFrameSource : public FrameSource {
 public:
  // Throws std::invalid_argument on invalid config.
  explicit SocketFrameSource(VideoSourceConfig config);

  [[nodiscard]] StreamAttributes attributes() const override;

  [[nodiscard]] std::optional<Error> open() override;

  [[nodiscard]] FrameRead read(std::span<char> buffer, SysDuration timeout) override;

  void interrupt() noexcept override;

  void close() noexcept override;

  [[nodiscard]] const VideoSourceConfig& config() const noexcept { return _config; }

 private:
  VideoSourceConfig _config;
  std::mutex _mutex;
  Connection _cnx;
  std::atomic<bool> _interrupted{false};
};

}  // namespace companion
