#include "companion/companion-config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

#include "companion/afc-connection-config.hpp"
#include "companion/bitmap-stream-config.hpp"
#include "companion/ports-config.hpp"
#include "companion/target-config.hpp"
#include "companion/video-source-config.hpp"

namespace companion {

using namespace std::chrono_literals;

TEST(CompanionConfigTest, DefaultsAreValid) {
  CompanionConfig config;
  EXPECT_EQ(config.ports.port, kDefaultControlPort);
  EXPECT_FALSE(config.terminateWhenOffline);
  EXPECT_NO_THROW(config.validate());
  EXPECT_NO_THROW(AfcConnectionConfig{}.validate());
  EXPECT_NO_THROW(BitmapStreamConfig{}.validate());
}

TEST(CompanionConfigTest, BuildersChain) {
  CompanionConfig config;
  config.withPort(0)
      .withPollInterval(20ms)
      .withTargetCheckInterval(50ms)
      .withTerminateWhenOffline()
      .withShutdownGracePeriod(1s)
      .withMaxFrameBytes(4096)
      .withMaxOutboundBufferBytes(8192)
      .withMaxDecompressedBytes(1 << 20);
  EXPECT_EQ(config.ports.port, 0);
  EXPECT_EQ(config.pollInterval, 20ms);
  EXPECT_EQ(config.targetCheckInterval, 50ms);
  EXPECT_TRUE(config.terminateWhenOffline);
  EXPECT_EQ(config.shutdownGracePeriod, 1s);
  EXPECT_EQ(config.maxFrameBytes, 4096U);
  EXPECT_EQ(config.maxOutboundBufferBytes, 8192U);
  EXPECT_EQ(config.maxDecompressedBytes, 1U << 20);
  EXPECT_NO_THROW(config.validate());

  PortsConfig ports;
  ports.withPort(1234).withReusePort().withTcpNoDelay(false);
  EXPECT_EQ(ports.port, 1234);
  EXPECT_TRUE(ports.reusePort);
  EXPECT_FALSE(ports.tcpNoDelay);
}

TEST(CompanionConfigTest, InvalidValuesThrow) {
  EXPECT_THROW(CompanionConfig{}.withPollInterval(0ms).validate(), std::invalid_argument);
  EXPECT_THROW(CompanionConfig{}.withPollInterval(2h).validate(), std::invalid_argument);
  EXPECT_THROW(CompanionConfig{}.withTargetCheckInterval(-1ms).validate(), std::invalid_argument);
  EXPECT_THROW(CompanionConfig{}.withShutdownGracePeriod(-1ms).validate(), std::invalid_argument);
  EXPECT_THROW(CompanionConfig{}.withMaxFrameBytes(8).validate(), std::invalid_argument);
  EXPECT_THROW(CompanionConfig{}.withMaxOutboundBufferBytes(100).validate(), std::invalid_argument);
  EXPECT_THROW(CompanionConfig{}.withMaxDecompressedBytes(0).validate(), std::invalid_argument);
}

TEST(CompanionConfigTest, AfcConnectionConfigValidation) {
  EXPECT_THROW(AfcConnectionConfig{}.withIoTimeout(0ms).validate(), std::invalid_argument);
  EXPECT_THROW(AfcConnectionConfig{}.withMaxPacketBytes(39).validate(), std::invalid_argument);
  EXPECT_THROW(AfcConnectionConfig{}.withFileChunkSize(0).validate(), std::invalid_argument);
  EXPECT_THROW(AfcConnectionConfig{}.withMaxPacketBytes(1024).withFileChunkSize(1024).validate(),
               std::invalid_argument);
  EXPECT_NO_THROW(AfcConnectionConfig{}.withMaxPacketBytes(1024).withFileChunkSize(512).validate());
}

TEST(CompanionConfigTest, BitmapStreamConfigValidation) {
  EXPECT_THROW(BitmapStreamConfig{}.withStartTimeout(0ms).validate(), std::invalid_argument);
  EXPECT_THROW(BitmapStreamConfig{}.withReadTimeout(0ms).validate(), std::invalid_argument);
  EXPECT_THROW(BitmapStreamConfig{}.withChunkSize(0).validate(), std::invalid_argument);
}

TEST(CompanionConfigTest, VideoSourceConfigValidation) {
  EXPECT_THROW(VideoSourceConfig{}.validate(), std::invalid_argument);
  EXPECT_NO_THROW(VideoSourceConfig{}.withPort("5000").validate());
  EXPECT_THROW(VideoSourceConfig{}.withPort("0").validate(), std::invalid_argument);
  EXPECT_THROW(VideoSourceConfig{}.withPort("70000").validate(), std::invalid_argument);
  EXPECT_THROW(VideoSourceConfig{}.withPort("12ab").validate(), std::invalid_argument);
  EXPECT_THROW(VideoSourceConfig{}.withPort("5000").withHost("").validate(), std::invalid_argument);
  EXPECT_THROW(VideoSourceConfig{}.withPort("5000").withFramesPerSecond(0).validate(), std::invalid_argument);
  EXPECT_THROW(VideoSourceConfig{}.withPort("5000").withConnectTimeout(0ms).validate(), std::invalid_argument);
}

TEST(CompanionConfigTest, TargetConfigValidation) {
  EXPECT_THROW(DeviceTargetConfig{}.validate(), std::invalid_argument);
  DeviceTargetConfig device;
  device.withUdid("00008110-000A").withAfcEndpoint("127.0.0.1", "62078");
  EXPECT_NO_THROW(device.validate());
  EXPECT_THROW(DeviceTargetConfig{device}.withConnectTimeout(0ms).validate(), std::invalid_argument);
  EXPECT_THROW(DeviceTargetConfig{device}.withVideo(VideoSourceConfig{}).validate(), std::invalid_argument);
  EXPECT_THROW(DeviceTargetConfig{device}.withAfcConnectionConfig(AfcConnectionConfig{}.withIoTimeout(0ms)).validate(),
               std::invalid_argument);

  EXPECT_THROW(SimulatorTargetConfig{}.withUdid("sim").validate(), std::invalid_argument);
  EXPECT_NO_THROW(SimulatorTargetConfig{}.withUdid("sim").withRoot("/tmp/sim").validate());
}

}  // namespace companion
