#include "companion/socket-frame-source.hpp"

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <utility>

#include "companion/error.hpp"
#include "companion/log.hpp"
#include "companion/socket-ops.hpp"
#include "companion/stream-attributes.hpp"
#include "companion/tcp-connector.hpp"
#include "companion/timedef.hpp"
#include "companion/video-source-config.hpp"

namespace companion {

SocketFrameSource::SocketFrameSource(VideoSourceConfig config) : _config(std::move(config)) { _config.validate(); }

StreamAttributes SocketFrameSource::attributes() const {
  StreamAttributes attributes;
  attributes.set("width", static_cast<int64_t>(_config.width))
      .set("height", static_cast<int64_t>(_config.height))
      .set("pixel_format", _config.pixelFormat)
      .set("frames_per_second", static_cast<int64_t>(_config.framesPerSecond))
      .set("encoding", _config.encoding);
  return attributes;
}

std::optional<Error> SocketFrameSource::open() {
  ConnectResult result = ConnectTCP(_config.host, _config.port, _config.connectTimeout);
  if (result.failure) {
    return Error(ErrorKind::ConnectionClosed,
                 fmt::format("unable to connect to video relay {}:{}", _config.host, _config.port), result.err);
  }
  std::scoped_lock lock(_mutex);
  if (_interrupted.load()) {
    return Error(ErrorKind::Cancelled, "video relay connection interrupted");
  }
  _cnx = std::move(result.cnx);
  log::debug("Video relay {}:{} connected on fd # {}", _config.host, _config.port, _cnx.fd());
  return std::nullopt;
}

FrameRead SocketFrameSource::read(std::span<char> buffer, SysDuration timeout) {
  if (_interrupted.load()) {
    return {FrameReadStatus::Interrupted};
  }
  std::size_t nbRead = 0;
  const IoStatus status = RecvSome(_cnx.fd(), buffer.data(), buffer.size(), timeout, nbRead);
  switch (status) {
    case IoStatus::Ok:
      return {FrameReadStatus::Data, nbRead};
    case IoStatus::Timeout:
      return {FrameReadStatus::Timeout};
    case IoStatus::PeerClosed:
      // interrupt() shuts the socket down, which reads as a peer close.
      return {_interrupted.load() ? FrameReadStatus::Interrupted : FrameReadStatus::EndOfStream};
    default: {
      const int err = errno;
      if (_interrupted.load()) {
        return {FrameReadStatus::Interrupted};
      }
      return {FrameReadStatus::Error, 0,
              Error(ErrorKind::ConnectionClosed,
                    fmt::format("video relay {}:{} read error", _config.host, _config.port), err)};
    }
  }
}

void SocketFrameSource::interrupt() noexcept {
  _interrupted.store(true);
  std::scoped_lock lock(_mutex);
  if (_cnx && !ShutdownReadWrite(_cnx.fd())) {
    log::debug("Video relay fd # {} shutdown failed", _cnx.fd());
  }
}

void SocketFrameSource::close() noexcept {
  std::scoped_lock lock(_mutex);
  if (_cnx) {
    log::debug("Video relay fd # {} closing", _cnx.fd());
    _cnx.close();
  }
}

}  // namespace companion
