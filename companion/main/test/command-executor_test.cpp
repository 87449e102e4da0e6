#include "companion/command-executor.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "companion/delay-scheduler.hpp"
#include "companion/error.hpp"
#include "companion/fake-video-relay.hpp"
#include "companion/future.hpp"
#include "companion/gzip-codec.hpp"
#include "companion/host-file-paths.hpp"
#include "companion/rpc-protocol.hpp"
#include "companion/simulator-target.hpp"
#include "companion/target-config.hpp"
#include "companion/temporary-directory.hpp"
#include "companion/video-source-config.hpp"

namespace companion {

using namespace std::chrono_literals;

namespace {

using Fields = std::vector<std::string>;

class CommandExecutorTest : public ::testing::Test {
 protected:
  CommandExecutorTest() : root(scratch.path() / "data") {
    std::filesystem::create_directories(root / "Documents");
    WriteHostFile(root / "Documents" / "notes.txt", "hello companion");
  }

  CommandExecutor executorFor(SimulatorTargetConfig config) {
    return {std::make_shared<SimulatorTarget>(std::move(config)), temporaryDirectory, scheduler, 1U << 20};
  }

  SimulatorTargetConfig simulatorConfig() const {
    return SimulatorTargetConfig{}.withUdid("A1B2").withName("sim").withRoot(root.string());
  }

  Future<Fields> run(RpcCommand command, Fields fields) {
    return executor.execute(RpcFrame{1, static_cast<uint64_t>(command), std::move(fields)});
  }

  static Error awaitError(const Future<Fields>& result) {
    EXPECT_TRUE(result.waitFor(5s));
    EXPECT_EQ(result.state(), FutureState::Failed);
    return result.error();
  }

  static Fields awaitFields(const Future<Fields>& result) {
    EXPECT_TRUE(result.waitFor(5s));
    if (result.state() != FutureState::Succeeded) {
      ADD_FAILURE() << result.error().describe();
      return {};
    }
    return result.value();
  }

  TemporaryDirectory scratch;
  std::filesystem::path root;
  std::shared_ptr<TemporaryDirectory> temporaryDirectory = std::make_shared<TemporaryDirectory>();
  DelayScheduler scheduler;
  CommandExecutor executor = executorFor(simulatorConfig());
};

}  // namespace

TEST_F(CommandExecutorTest, RequiresTargetAndTemporaryDirectory) {
  EXPECT_THROW(CommandExecutor(nullptr, temporaryDirectory, scheduler, 1024), std::invalid_argument);
  EXPECT_THROW(CommandExecutor(std::make_shared<SimulatorTarget>(simulatorConfig()), nullptr, scheduler, 1024),
               std::invalid_argument);
}

TEST_F(CommandExecutorTest, Describe) {
  const Fields fields = awaitFields(run(RpcCommand::Describe, {}));
  ASSERT_EQ(fields.size(), 1U);
  EXPECT_NE(fields[0].find(R"("udid":"A1B2")"), std::string::npos);
  EXPECT_NE(fields[0].find(R"("type":"Simulator")"), std::string::npos);
}

TEST_F(CommandExecutorTest, ListPath) {
  WriteHostFile(root / "Documents" / "a.bin", "x");
  EXPECT_EQ(awaitFields(run(RpcCommand::ListPath, {"/Documents"})), (Fields{"a.bin", "notes.txt"}));
}

TEST_F(CommandExecutorTest, PullIdentity) {
  EXPECT_EQ(awaitFields(run(RpcCommand::Pull, {"/Documents/notes.txt"})), (Fields{"identity", "hello companion"}));
  // Staged copies do not accumulate.
  EXPECT_TRUE(std::filesystem::is_empty(temporaryDirectory->path()));
}

TEST_F(CommandExecutorTest, PullGzip) {
  const Fields fields = awaitFields(run(RpcCommand::Pull, {"/Documents/notes.txt", "gzip"}));
  ASSERT_EQ(fields.size(), 2U);
  EXPECT_EQ(fields[0], "gzip");
  std::string decompressed;
  ASSERT_TRUE(GzipDecompress(fields[1], 1024, decompressed));
  EXPECT_EQ(decompressed, "hello companion");
}

TEST_F(CommandExecutorTest, PullMissingFileFails) {
  const Error error = awaitError(run(RpcCommand::Pull, {"/Documents/missing.txt"}));
  EXPECT_EQ(error.kind(), ErrorKind::DeviceError);
}

TEST_F(CommandExecutorTest, PushIdentityAndGzip) {
  EXPECT_TRUE(awaitFields(run(RpcCommand::Push, {"/Documents", "plain.txt", "plain payload"})).empty());
  std::string compressed;
  GzipCompress("compressed payload", compressed);
  EXPECT_TRUE(awaitFields(run(RpcCommand::Push, {"/Documents", "packed.txt", compressed, "gzip"})).empty());

  EXPECT_EQ(ReadHostFile(root / "Documents" / "plain.txt"), "plain payload");
  EXPECT_EQ(ReadHostFile(root / "Documents" / "packed.txt"), "compressed payload");
  EXPECT_TRUE(std::filesystem::is_empty(temporaryDirectory->path()));
}

TEST_F(CommandExecutorTest, PushRejectsBadInput) {
  EXPECT_EQ(awaitError(run(RpcCommand::Push, {"/Documents", "../escape", "x"})).kind(), ErrorKind::InvalidArgument);
  EXPECT_EQ(awaitError(run(RpcCommand::Push, {"/Documents", "..", "x"})).kind(), ErrorKind::InvalidArgument);
  EXPECT_EQ(awaitError(run(RpcCommand::Push, {"/Documents", "", "x"})).kind(), ErrorKind::InvalidArgument);
  EXPECT_EQ(awaitError(run(RpcCommand::Push, {"/Documents", "f", "not gzip", "gzip"})).kind(),
            ErrorKind::InvalidArgument);
  EXPECT_EQ(awaitError(run(RpcCommand::Push, {"/Documents", "f", "x", "brotli"})).kind(), ErrorKind::InvalidArgument);
  EXPECT_FALSE(std::filesystem::exists(root / "Documents" / "f"));
}

TEST_F(CommandExecutorTest, PushBeyondDecompressionLimitFails) {
  std::string compressed;
  GzipCompress(std::string(std::size_t{2} << 20, 'z'), compressed);
  EXPECT_EQ(awaitError(run(RpcCommand::Push, {"/Documents", "big.bin", compressed, "gzip"})).kind(),
            ErrorKind::InvalidArgument);
}

TEST_F(CommandExecutorTest, MakeDirectoryMoveRemove) {
  EXPECT_TRUE(awaitFields(run(RpcCommand::MakeDirectory, {"/Archive/2024"})).empty());
  EXPECT_TRUE(std::filesystem::is_directory(root / "Archive" / "2024"));

  EXPECT_TRUE(awaitFields(run(RpcCommand::Move, {"/Archive/2024", "/Documents/notes.txt"})).empty());
  EXPECT_TRUE(std::filesystem::exists(root / "Archive" / "2024" / "notes.txt"));
  EXPECT_FALSE(std::filesystem::exists(root / "Documents" / "notes.txt"));

  EXPECT_TRUE(awaitFields(run(RpcCommand::Remove, {"/Archive", "/Documents"})).empty());
  EXPECT_FALSE(std::filesystem::exists(root / "Archive"));
  EXPECT_FALSE(std::filesystem::exists(root / "Documents"));
}

TEST_F(CommandExecutorTest, WrongFieldCountsAreInvalid) {
  EXPECT_EQ(awaitError(run(RpcCommand::ListPath, {})).kind(), ErrorKind::InvalidArgument);
  EXPECT_EQ(awaitError(run(RpcCommand::Pull, {"a", "identity", "extra"})).kind(), ErrorKind::InvalidArgument);
  EXPECT_EQ(awaitError(run(RpcCommand::Push, {"/Documents", "f"})).kind(), ErrorKind::InvalidArgument);
  EXPECT_EQ(awaitError(run(RpcCommand::Remove, {})).kind(), ErrorKind::InvalidArgument);
  EXPECT_EQ(awaitError(run(RpcCommand::Move, {"/Documents"})).kind(), ErrorKind::InvalidArgument);
  EXPECT_EQ(awaitError(run(RpcCommand::MakeDirectory, {"a", "b"})).kind(), ErrorKind::InvalidArgument);
}

TEST_F(CommandExecutorTest, UnknownAndSessionBoundCommandsAreInvalid) {
  EXPECT_EQ(awaitError(executor.execute(RpcFrame{1, 999, {}})).kind(), ErrorKind::InvalidArgument);
  EXPECT_EQ(awaitError(run(RpcCommand::StartVideo, {})).kind(), ErrorKind::InvalidArgument);
  EXPECT_EQ(awaitError(run(RpcCommand::StopVideo, {})).kind(), ErrorKind::InvalidArgument);
}

TEST_F(CommandExecutorTest, OfflineTargetFailsFileCommands) {
  std::filesystem::remove_all(root);
  EXPECT_EQ(awaitError(run(RpcCommand::ListPath, {"/"})).kind(), ErrorKind::InvalidState);
}

TEST_F(CommandExecutorTest, StreamAttributesWithoutVideoFails) {
  EXPECT_EQ(awaitError(run(RpcCommand::StreamAttributes, {})).kind(), ErrorKind::InvalidState);
}

TEST_F(CommandExecutorTest, StreamAttributesFromVideoSource) {
  test::FakeVideoRelay relay;
  CommandExecutor withVideo = executorFor(
      simulatorConfig().withVideo(VideoSourceConfig{}.withPort(relay.portStr()).withDimensions(1170, 2532)));
  const Fields fields =
      awaitFields(withVideo.execute(RpcFrame{1, static_cast<uint64_t>(RpcCommand::StreamAttributes), {}}));
  ASSERT_EQ(fields.size(), 1U);
  EXPECT_NE(fields[0].find(R"("width":1170)"), std::string::npos);
  EXPECT_NE(fields[0].find(R"("height":2532)"), std::string::npos);
  EXPECT_NE(fields[0].find(R"("encoding":"h264")"), std::string::npos);
}

}  // namespace companion
