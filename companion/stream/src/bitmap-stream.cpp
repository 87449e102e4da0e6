#include "companion/bitmap-stream.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "companion/bitmap-stream-config.hpp"
#include "companion/continuation.hpp"
#include "companion/data-consumer.hpp"
#include "companion/delay-scheduler.hpp"
#include "companion/error.hpp"
#include "companion/frame-source.hpp"
#include "companion/future.hpp"
#include "companion/log.hpp"
#include "companion/stream-attributes.hpp"

namespace companion {

std::string_view StreamStateName(StreamState state) noexcept {
  switch (state) {
    case StreamState::Idle:
      return "Idle";
    case StreamState::Streaming:
      return "Streaming";
    case StreamState::Stopped:
      return "Stopped";
    default:
      return "Unknown";
  }
}

std::shared_ptr<BitmapStream> BitmapStream::Create(std::unique_ptr<FrameSource> source, DelayScheduler& scheduler,
                                                   BitmapStreamConfig config) {
  auto stream = std::make_shared<BitmapStream>(PrivateTag{}, std::move(source), scheduler, std::move(config));
  std::weak_ptr<BitmapStream> weakStream = stream;
  stream->_completion.future().onCancel([weakStream]() {
    if (auto self = weakStream.lock()) {
      self->stop(std::nullopt);
    }
    return Future<Void>::Resolved();
  });
  return stream;
}

BitmapStream::BitmapStream(PrivateTag, std::unique_ptr<FrameSource> source, DelayScheduler& scheduler,
                           BitmapStreamConfig config)
    : _config(std::move(config)), _source(std::move(source)), _scheduler(scheduler) {
  _config.validate();
  if (!_source) {
    throw std::invalid_argument("BitmapStream requires a frame source");
  }
}

BitmapStream::~BitmapStream() {
  if (_worker.joinable()) {
    if (onStreamingThread()) {
      // Last reference released by the streaming thread itself, on its way out.
      _worker.detach();
    } else {
      _worker.request_stop();
      _source->interrupt();
      _worker.join();
    }
  }
  // Sessions never started complete on destruction.
  _started.fail(Error(ErrorKind::InvalidState, "video stream destroyed"));
  _completion.resolve();
}

Future<StreamAttributes> BitmapStream::streamAttributes() const {
  StreamAttributes attributes = _source->attributes();
  attributes.set("state", std::string(StreamStateName(state())));
  return Future<StreamAttributes>::Resolved(std::move(attributes));
}

Future<Void> BitmapStream::startStreaming(std::unique_ptr<DataConsumer> consumer) {
  if (!consumer) {
    return Future<Void>::Failed(Error(ErrorKind::InvalidArgument, "video stream requires a consumer"));
  }
  {
    std::scoped_lock lock(_mutex);
    switch (_state) {
      case StreamState::Streaming:
        return Future<Void>::Failed(Error(ErrorKind::AlreadyStarted, "video stream already started"));
      case StreamState::Stopped:
        return Future<Void>::Failed(Error(ErrorKind::InvalidState, "video stream is stopped"));
      default:
        break;
    }
    _state = StreamState::Streaming;
    _consumer = std::move(consumer);
    _worker = std::jthread([self = shared_from_this()](const std::stop_token& stopToken) { self->run(stopToken); });
    _workerId = _worker.get_id();
  }
  log::info("Video stream started, waiting for the first chunk");

  std::weak_ptr<BitmapStream> weakSelf = weak_from_this();
  return WithTimeout(_started.future(), _config.startTimeout, _scheduler)
      .onComplete([weakSelf](const Future<Void>& started) {
        if (started.state() == FutureState::Succeeded) {
          return;
        }
        if (auto self = weakSelf.lock()) {
          if (started.state() == FutureState::Failed) {
            self->stop(started.error());
          } else {
            self->stop(std::nullopt);
          }
        }
      });
}

Future<Void> BitmapStream::stopStreaming() {
  {
    std::scoped_lock lock(_mutex);
    if (_state == StreamState::Idle) {
      return Future<Void>::Resolved();
    }
  }
  stop(std::nullopt);
  return _completion.future();
}

Continuation BitmapStream::continuation() {
  std::weak_ptr<BitmapStream> weakSelf = weak_from_this();
  return {ContinuationType::VideoStreaming, _completion.future(), [weakSelf]() {
            if (auto self = weakSelf.lock()) {
              self->stop(std::nullopt);
              return self->_completion.future();
            }
            // A destroyed session has completed.
            return Future<Void>::Resolved();
          }};
}

StreamState BitmapStream::state() const {
  std::scoped_lock lock(_mutex);
  return _state;
}

bool BitmapStream::onStreamingThread() const {
  std::scoped_lock lock(_mutex);
  return _workerId == std::this_thread::get_id();
}

void BitmapStream::run(const std::stop_token& stopToken) {
  if (std::optional<Error> failure = _source->open()) {
    log::error("Video stream source failed to open: {}", failure->describe());
    stop(std::move(failure));
    return;
  }
  std::vector<char> buffer(_config.chunkSize);
  while (!stopToken.stop_requested()) {
    FrameRead frame = _source->read(buffer, _config.readTimeout);
    switch (frame.status) {
      case FrameReadStatus::Data:
        try {
          forward(std::string_view(buffer.data(), frame.size));
        } catch (const std::exception& ex) {
          log::error("Video stream consumer failed: {}", ex.what());
          stop(Error(ErrorKind::Internal, fmt::format("video stream consumer failed: {}", ex.what())));
          return;
        }
        break;
      case FrameReadStatus::Timeout:
        break;
      case FrameReadStatus::EndOfStream:
        log::info("Video stream source reached end of stream after {} bytes", _bytesForwarded.load());
        stop(std::nullopt);
        return;
      case FrameReadStatus::Error:
        log::error("Video stream source failed: {}", frame.error->describe());
        stop(std::move(frame.error));
        return;
      default:
        // Interrupted by stop()
        return;
    }
  }
}

void BitmapStream::forward(std::string_view chunk) {
  _consumer->consumeData(chunk);
  if (_bytesForwarded.fetch_add(chunk.size()) == 0) {
    log::debug("Video stream forwarded its first chunk of {} bytes", chunk.size());
    _started.resolve();
  }
}

void BitmapStream::stop(std::optional<Error> cause) {
  StreamState previous;
  {
    std::scoped_lock lock(_mutex);
    previous = _state;
    if (previous == StreamState::Stopped) {
      return;
    }
    _state = StreamState::Stopped;
  }
  if (cause) {
    log::warn("Video stream stopping: {}", cause->describe());
  } else {
    log::info("Video stream stopping");
  }

  if (previous == StreamState::Streaming) {
    _worker.request_stop();
    _source->interrupt();
    if (!onStreamingThread() && _worker.joinable()) {
      _worker.join();
    }
    if (_consumer) {
      _consumer->consumeEndOfFile();
      _consumer.reset();
    }
    _source->close();
  }
  log::info("Video stream stopped, {} bytes forwarded", _bytesForwarded.load());

  _started.fail(cause ? *cause : Error(ErrorKind::ConnectionClosed, "video stream stopped before its first chunk"));
  if (cause) {
    _completion.fail(std::move(*cause));
  } else {
    _completion.resolve();
  }
}

}  // namespace companion
