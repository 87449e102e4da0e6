#include "companion/host-file-commands.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <filesystem>
#include <string>
#include <vector>

#include "companion/error.hpp"
#include "companion/future.hpp"
#include "companion/host-file-paths.hpp"
#include "companion/temporary-directory.hpp"

namespace companion {

namespace fs = std::filesystem;

namespace {

class HostFileCommandsTest : public ::testing::Test {
 protected:
  HostFileCommandsTest() : root(scratch.path() / "container"), commands(root) {
    fs::create_directories(root / "Documents" / "nested");
    WriteHostFile(root / "Documents" / "a.txt", "alpha");
    WriteHostFile(root / "Documents" / "nested" / "b.txt", "beta");
  }

  TemporaryDirectory scratch;
  fs::path root;
  HostFileCommands commands;
};

template <class T>
Error ErrorOf(const Future<T>& future) {
  EXPECT_EQ(future.state(), FutureState::Failed);
  return future.error();
}

}  // namespace

TEST_F(HostFileCommandsTest, ResolveStaysInsideRoot) {
  EXPECT_EQ(commands.resolve("/Documents/a.txt").value(), root / "Documents" / "a.txt");
  EXPECT_EQ(commands.resolve("Documents/./nested/../a.txt").value(), root / "Documents" / "a.txt");
  EXPECT_EQ(commands.resolve("/").value(), root);
  EXPECT_EQ(commands.resolve("").value(), root);
  EXPECT_EQ(commands.resolve("Documents/").value(), root / "Documents");
  EXPECT_EQ(commands.resolve("../outside").error().kind(), ErrorKind::InvalidArgument);
  EXPECT_EQ(commands.resolve("/Documents/../../outside").error().kind(), ErrorKind::InvalidArgument);
}

TEST_F(HostFileCommandsTest, ListPathSorted) {
  auto listing = commands.listPath("/Documents");
  ASSERT_EQ(listing.state(), FutureState::Succeeded);
  EXPECT_EQ(listing.value(), (std::vector<std::string>{"a.txt", "nested"}));

  const Error missing = ErrorOf(commands.listPath("/missing"));
  EXPECT_EQ(missing.kind(), ErrorKind::DeviceError);
  EXPECT_EQ(missing.code(), ENOENT);
}

TEST_F(HostFileCommandsTest, PullCopiesToHost) {
  const fs::path destination = scratch.newPath("pulled.txt");
  auto pulled = commands.pull("/Documents/a.txt", destination);
  ASSERT_EQ(pulled.state(), FutureState::Succeeded);
  EXPECT_EQ(pulled.value(), destination);
  EXPECT_EQ(ReadHostFile(destination), "alpha");

  EXPECT_EQ(ErrorOf(commands.pull("/Documents/missing.txt", destination)).code(), ENOENT);
  EXPECT_EQ(ErrorOf(commands.pull("/Documents", destination)).code(), EISDIR);
}

TEST_F(HostFileCommandsTest, PushKeepsFileName) {
  const fs::path source = scratch.path() / "upload.bin";
  WriteHostFile(source, "payload");
  ASSERT_EQ(commands.push(source, "/Documents/nested").state(), FutureState::Succeeded);
  EXPECT_EQ(ReadHostFile(root / "Documents" / "nested" / "upload.bin"), "payload");

  EXPECT_EQ(ErrorOf(commands.push(source, "/missing")).kind(), ErrorKind::DeviceError);
  EXPECT_EQ(ErrorOf(commands.push(scratch.path() / "nope.bin", "/Documents")).code(), ENOENT);
  EXPECT_EQ(ErrorOf(commands.push(source, "../..")).kind(), ErrorKind::InvalidArgument);
}

TEST_F(HostFileCommandsTest, RemoveIsRecursive) {
  ASSERT_EQ(commands.remove({"/Documents/nested", "Documents/a.txt"}).state(), FutureState::Succeeded);
  EXPECT_FALSE(fs::exists(root / "Documents" / "nested"));
  EXPECT_FALSE(fs::exists(root / "Documents" / "a.txt"));
  EXPECT_EQ(ErrorOf(commands.remove({"/Documents/nested"})).code(), ENOENT);
  EXPECT_EQ(ErrorOf(commands.remove({"/"})).kind(), ErrorKind::InvalidArgument);
  EXPECT_TRUE(fs::exists(root));
}

TEST_F(HostFileCommandsTest, MoveIntoDirectory) {
  ASSERT_EQ(commands.makeDirectory("/Archive/2024").state(), FutureState::Succeeded);
  EXPECT_TRUE(fs::is_directory(root / "Archive" / "2024"));
  ASSERT_EQ(commands.move({"/Documents/a.txt", "/Documents/nested/"}, "/Archive/2024").state(),
            FutureState::Succeeded);
  EXPECT_EQ(ReadHostFile(root / "Archive" / "2024" / "a.txt"), "alpha");
  EXPECT_EQ(ReadHostFile(root / "Archive" / "2024" / "nested" / "b.txt"), "beta");
  EXPECT_EQ(ErrorOf(commands.move({"/Documents/a.txt"}, "/Archive")).code(), ENOENT);
}

TEST(HostFilePathsTest, TargetPathHelpers) {
  EXPECT_EQ(TargetBaseName("/a/b/c.txt"), "c.txt");
  EXPECT_EQ(TargetBaseName("/a/b/"), "b");
  EXPECT_EQ(TargetBaseName("c.txt"), "c.txt");
  EXPECT_EQ(JoinTargetPath("/a", "b"), "/a/b");
  EXPECT_EQ(JoinTargetPath("/a/", "/b"), "/a/b");
  EXPECT_EQ(JoinTargetPath("", "b"), "/b");
}

TEST(HostFilePathsTest, ReadMissingFileThrows) {
  try {
    (void)ReadHostFile("/nonexistent/companion/file");
    FAIL() << "expected FutureError";
  } catch (const FutureError& ex) {
    EXPECT_EQ(ex.error().kind(), ErrorKind::DeviceError);
    EXPECT_EQ(ex.error().code(), ENOENT);
  }
}

}  // namespace companion
