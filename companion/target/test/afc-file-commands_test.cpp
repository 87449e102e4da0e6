#include "companion/afc-file-commands.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "companion/afc-client.hpp"
#include "companion/afc-connection-config.hpp"
#include "companion/afc-connection.hpp"
#include "companion/afc-protocol.hpp"
#include "companion/error.hpp"
#include "companion/fake-afc-device.hpp"
#include "companion/future.hpp"
#include "companion/host-file-paths.hpp"
#include "companion/temporary-directory.hpp"
#include "companion/test-util.hpp"

namespace companion {

using namespace std::chrono_literals;

namespace {

class AfcFileCommandsTest : public ::testing::Test {
 protected:
  AfcFileCommandsTest()
      : commands(AfcClient(std::make_shared<AfcConnection>(test::ConnectLoopback(device.port()).releaseFd(),
                                                           AfcConnectionConfig{}.withIoTimeout(2s)))) {
    device.addFile("/Documents/report.txt", "quarterly");
    device.addFile("/Documents/old/log.txt", "log");
  }

  template <class T>
  static FutureState Settle(const Future<T>& future) {
    EXPECT_TRUE(future.waitFor(5s));
    return future.state();
  }

  test::FakeAfcDevice device;
  TemporaryDirectory scratch;
  AfcFileCommands commands;
};

}  // namespace

TEST_F(AfcFileCommandsTest, ListPath) {
  auto listing = commands.listPath("/Documents");
  ASSERT_EQ(Settle(listing), FutureState::Succeeded);
  EXPECT_EQ(listing.value(), (std::vector<std::string>{"old", "report.txt"}));
}

TEST_F(AfcFileCommandsTest, PullWritesHostFile) {
  const std::filesystem::path destination = scratch.newPath("report.txt");
  auto pulled = commands.pull("/Documents/report.txt", destination);
  ASSERT_EQ(Settle(pulled), FutureState::Succeeded);
  EXPECT_EQ(pulled.value(), destination);
  EXPECT_EQ(ReadHostFile(destination), "quarterly");
}

TEST_F(AfcFileCommandsTest, PullMissingFileFailsWithDeviceError) {
  auto pulled = commands.pull("/Documents/missing.txt", scratch.newPath("missing.txt"));
  ASSERT_EQ(Settle(pulled), FutureState::Failed);
  EXPECT_EQ(pulled.error().kind(), ErrorKind::DeviceError);
  EXPECT_EQ(pulled.error().code(), static_cast<int64_t>(AfcStatus::ObjectNotFound));
}

TEST_F(AfcFileCommandsTest, PullIntoMissingHostDirectoryFails) {
  auto pulled = commands.pull("/Documents/report.txt", scratch.path() / "no" / "such" / "dir.txt");
  ASSERT_EQ(Settle(pulled), FutureState::Failed);
  EXPECT_EQ(pulled.error().kind(), ErrorKind::DeviceError);
}

TEST_F(AfcFileCommandsTest, PushKeepsFileName) {
  const std::filesystem::path source = scratch.path() / "photo.jpg";
  WriteHostFile(source, std::string(300000, 'p'));
  ASSERT_EQ(Settle(commands.push(source, "/Documents/")), FutureState::Succeeded);
  EXPECT_EQ(device.fileContent("/Documents/photo.jpg"), std::string(300000, 'p'));

  auto missingSource = commands.push(scratch.path() / "absent.jpg", "/Documents");
  ASSERT_EQ(missingSource.state(), FutureState::Failed);
  EXPECT_EQ(missingSource.error().kind(), ErrorKind::DeviceError);
}

TEST_F(AfcFileCommandsTest, RemoveRecursively) {
  ASSERT_EQ(Settle(commands.remove({"/Documents/old", "/Documents/report.txt"})), FutureState::Succeeded);
  EXPECT_FALSE(device.exists("/Documents/old/log.txt"));
  EXPECT_FALSE(device.exists("/Documents/report.txt"));
  EXPECT_TRUE(device.isDirectory("/Documents"));

  auto again = commands.remove({"/Documents/old"});
  ASSERT_EQ(Settle(again), FutureState::Failed);
  EXPECT_EQ(again.error().code(), static_cast<int64_t>(AfcStatus::ObjectNotFound));
}

TEST_F(AfcFileCommandsTest, MoveIntoDirectory) {
  ASSERT_EQ(Settle(commands.makeDirectory("/Archive")), FutureState::Succeeded);
  ASSERT_EQ(Settle(commands.move({"/Documents/report.txt", "/Documents/old"}, "/Archive")), FutureState::Succeeded);
  EXPECT_EQ(device.fileContent("/Archive/report.txt"), "quarterly");
  EXPECT_EQ(device.fileContent("/Archive/old/log.txt"), "log");
  EXPECT_FALSE(device.exists("/Documents/report.txt"));
}

}  // namespace companion
