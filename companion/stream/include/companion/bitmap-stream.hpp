#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>
#include <thread>

#include "companion/bitmap-stream-config.hpp"
#include "companion/continuation.hpp"
#include "companion/data-consumer.hpp"
#include "companion/delay-scheduler.hpp"
#include "companion/error.hpp"
#include "companion/frame-source.hpp"
#include "companion/future.hpp"
#include "companion/stream-attributes.hpp"

namespace companion {

enum class StreamState : std::uint8_t { Idle, Streaming, Stopped };

[[nodiscard]] std::string_view StreamStateName(StreamState state) noexcept;

// Streaming session forwarding the bytes of a FrameSource to a DataConsumer from a dedicated thread.
//
// State machine: Idle -> Streaming -> Stopped. A stopped session cannot be restarted. The session completion is
// exposed as a VideoStreaming continuation. Cancelling the continuation stops the session like stopStreaming()
// does, from any state, and the completion succeeds either way. Once stopStreaming() (or cancel) has returned, the
// consumer has received its end of file, has been released and will not see any more bytes.
//
// The streaming thread keeps the session alive while it runs, so a Streaming session needs to be stopped explicitly.
class BitmapStream : public std::enable_shared_from_this<BitmapStream> {
  struct PrivateTag {};

 public:
  // 'scheduler' must outlive the session. Throws std::invalid_argument on invalid config or null source.
  static std::shared_ptr<BitmapStream> Create(std::unique_ptr<FrameSource> source, DelayScheduler& scheduler,
                                              BitmapStreamConfig config = {});

  BitmapStream(PrivateTag, std::unique_ptr<FrameSource> source, DelayScheduler& scheduler,
               BitmapStreamConfig config);

  BitmapStream(const BitmapStream&) = delete;
  BitmapStream(BitmapStream&&) = delete;
  BitmapStream& operator=(const BitmapStream&) = delete;
  BitmapStream& operator=(BitmapStream&&) = delete;

  ~BitmapStream();

  // Fresh snapshot of the source attributes, plus the current state. Valid in any state.
  [[nodiscard]] Future<StreamAttributes> streamAttributes() const;

  // Starts forwarding to 'consumer'. Resolves when the first chunk has been forwarded, fails with Timeout (and stops
  // the session) if none arrives within the start timeout. Fails with AlreadyStarted when streaming and with
  // InvalidState when stopped, leaving the session untouched.
  Future<Void> startStreaming(std::unique_ptr<DataConsumer> consumer);

  // Idle: resolved no-op. Otherwise stops the session and returns its completion.
  Future<Void> stopStreaming();

  [[nodiscard]] Continuation continuation();

  [[nodiscard]] StreamState state() const;

  [[nodiscard]] std::size_t bytesForwarded() const noexcept { return _bytesForwarded.load(); }

 private:
  void run(const std::stop_token& stopToken);

  void forward(std::string_view chunk);

  // Transitions to Stopped, joins the streaming thread (unless called from it), releases the consumer and completes
  // the session, failed if 'cause' is set. No-op if already stopped.
  void stop(std::optional<Error> cause);

  [[nodiscard]] bool onStreamingThread() const;

  BitmapStreamConfig _config;
  std::unique_ptr<FrameSource> _source;
  DelayScheduler& _scheduler;
  Promise<Void> _completion{"video-stream"};
  Promise<Void> _started{"video-stream-start"};
  mutable std::mutex _mutex;
  StreamState _state{StreamState::Idle};
  std::unique_ptr<DataConsumer> _consumer;
  std::atomic<std::size_t> _bytesForwarded{0};
  std::thread::id _workerId;
  std::jthread _worker;
};

}  // namespace companion
