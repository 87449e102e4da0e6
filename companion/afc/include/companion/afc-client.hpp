#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "companion/afc-connection.hpp"
#include "companion/afc-protocol.hpp"
#include "companion/future.hpp"

namespace companion {

// Typed AFC operations on top of an AfcConnection. Each operation maps to one or more exchanges on the shared
// connection, so operations issued concurrently are serialized in submission order.
class AfcClient {
 public:
  explicit AfcClient(std::shared_ptr<AfcConnection> connection);

  // Entry names of a directory, without "." and "..".
  Future<std::vector<std::string>> readDirectory(std::string_view path) const;

  // Returns the file handle.
  Future<uint64_t> fileOpen(std::string_view path, AfcFileMode mode) const;

  // Reads at most 'length' bytes. An empty result means end of file.
  Future<std::string> fileRead(uint64_t handle, uint64_t length) const;

  Future<Void> fileWrite(uint64_t handle, std::string bytes) const;

  Future<Void> fileClose(uint64_t handle) const;

  // Whole file content. The handle is closed whatever the outcome of the reads.
  Future<std::string> readFile(std::string_view path) const;

  // Creates or truncates 'path', then writes 'bytes' in chunks of the connection file chunk size.
  Future<Void> writeFile(std::string_view path, std::string bytes) const;

  Future<Void> removePath(std::string_view path) const;

  Future<Void> removePathAndContents(std::string_view path) const;

  Future<Void> makeDirectory(std::string_view path) const;

  Future<Void> renamePath(std::string_view from, std::string_view to) const;

  // Keys such as st_size, st_ifmt, st_mtime.
  Future<std::map<std::string, std::string>> fileInfo(std::string_view path) const;

  // Keys such as Model, FSTotalBytes, FSFreeBytes.
  Future<std::map<std::string, std::string>> deviceInfo() const;

  [[nodiscard]] const std::shared_ptr<AfcConnection>& connection() const noexcept { return _connection; }

 private:
  Future<Void> simpleRequest(AfcOperation operation, std::string params) const;

  std::shared_ptr<AfcConnection> _connection;
};

}  // namespace companion
