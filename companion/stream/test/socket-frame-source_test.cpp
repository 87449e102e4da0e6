#include "companion/socket-frame-source.hpp"

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>

#include "companion/bitmap-stream-config.hpp"
#include "companion/bitmap-stream.hpp"
#include "companion/delay-scheduler.hpp"
#include "companion/error.hpp"
#include "companion/fake-video-relay.hpp"
#include "companion/frame-source.hpp"
#include "companion/future.hpp"
#include "companion/recording-data-consumer.hpp"
#include "companion/test-util.hpp"
#include "companion/video-source-config.hpp"

namespace companion {

using namespace std::chrono_literals;

namespace {

VideoSourceConfig RelayConfig(const test::FakeVideoRelay& relay) {
  return VideoSourceConfig{}.withPort(relay.portStr()).withDimensions(1170, 2532).withConnectTimeout(2s);
}

}  // namespace

TEST(SocketFrameSourceTest, InvalidConfigThrows) {
  EXPECT_THROW(SocketFrameSource(VideoSourceConfig{}), std::invalid_argument);
}

TEST(SocketFrameSourceTest, AttributesFromConfig) {
  test::FakeVideoRelay relay;
  SocketFrameSource source(RelayConfig(relay).withFramesPerSecond(60));
  const StreamAttributes attributes = source.attributes();
  EXPECT_EQ(attributes.json_str(),
            R"({"encoding":"h264","frames_per_second":60,"height":2532,"pixel_format":"BGRA","width":1170})");
}

TEST(SocketFrameSourceTest, ReadsRelayBytesUntilEndOfStream) {
  test::FakeVideoRelay relay(std::string(100, 'f'), 1ms);
  SocketFrameSource source(RelayConfig(relay));
  ASSERT_EQ(source.open(), std::nullopt);

  std::array<char, 64> buffer;
  std::string received;
  while (received.size() < 300) {
    const FrameRead frame = source.read(buffer, 1s);
    ASSERT_EQ(frame.status, FrameReadStatus::Data);
    ASSERT_GT(frame.size, 0U);
    ASSERT_LE(frame.size, buffer.size());
    received.append(buffer.data(), frame.size);
  }
  EXPECT_EQ(received.find_first_not_of('f'), std::string::npos);

  relay.setPaused(true);
  ASSERT_TRUE(test::WaitFor([&relay] { return relay.activeClients() == 1U; }));
  relay.closeClients();
  FrameRead frame;
  do {
    frame = source.read(buffer, 1s);
  } while (frame.status == FrameReadStatus::Data);
  EXPECT_EQ(frame.status, FrameReadStatus::EndOfStream);
  source.close();
}

TEST(SocketFrameSourceTest, ReadTimesOutWhenRelayIsQuiet) {
  test::FakeVideoRelay relay;
  relay.setPaused(true);
  SocketFrameSource source(RelayConfig(relay));
  ASSERT_EQ(source.open(), std::nullopt);
  std::array<char, 16> buffer;
  EXPECT_EQ(source.read(buffer, 10ms).status, FrameReadStatus::Timeout);
}

TEST(SocketFrameSourceTest, InterruptWakesPendingRead) {
  test::FakeVideoRelay relay;
  relay.setPaused(true);
  SocketFrameSource source(RelayConfig(relay));
  ASSERT_EQ(source.open(), std::nullopt);
  source.interrupt();
  std::array<char, 16> buffer;
  EXPECT_EQ(source.read(buffer, 1s).status, FrameReadStatus::Interrupted);
}

TEST(SocketFrameSourceTest, OpenFailsWhenRelayIsDown) {
  uint16_t port;
  {
    test::LoopbackListener listener;
    port = listener.port();
  }
  SocketFrameSource source(VideoSourceConfig{}.withPort(std::to_string(port)).withConnectTimeout(500ms));
  const std::optional<Error> failure = source.open();
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->kind(), ErrorKind::ConnectionClosed);
}

TEST(SocketFrameSourceTest, BitmapStreamOverRelay) {
  test::FakeVideoRelay relay(std::string(512, 'r'), 2ms);
  DelayScheduler scheduler;
  auto recorded = std::make_shared<test::RecordedData>();
  auto stream = BitmapStream::Create(std::make_unique<SocketFrameSource>(RelayConfig(relay)), scheduler,
                                     BitmapStreamConfig{}.withStartTimeout(2s).withReadTimeout(10ms));

  auto started = stream->startStreaming(std::make_unique<test::RecordingDataConsumer>(recorded));
  ASSERT_TRUE(started.waitFor(5s));
  ASSERT_EQ(started.state(), FutureState::Succeeded);
  ASSERT_TRUE(test::WaitFor([&recorded] { return recorded->size() >= 2048U; }));

  ASSERT_TRUE(stream->stopStreaming().waitFor(5s));
  const auto sizeAtStop = recorded->size();
  EXPECT_TRUE(recorded->destroyed());
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(recorded->size(), sizeAtStop);
  EXPECT_TRUE(test::WaitFor([&relay] { return relay.activeClients() == 0U; }));
}

}  // namespace companion
