#include "companion/afc-client.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "companion/afc-connection.hpp"
#include "companion/afc-protocol.hpp"
#include "companion/error.hpp"
#include "companion/future.hpp"

namespace companion {

namespace {

struct ReadState {
  std::shared_ptr<AfcConnection> connection;
  uint64_t handle;
  std::size_t chunkSize;
  std::string content;
};

Future<std::string> ReadRemaining(const std::shared_ptr<ReadState>& state) {
  std::string params;
  AppendAfcU64(params, state->handle);
  AppendAfcU64(params, state->chunkSize);
  return state->connection->submit(AfcOperation::FileRead, std::move(params))
      .then([state](const AfcPacket& response) {
        state->content.append(response.data);
        if (response.data.size() < state->chunkSize) {
          return Future<std::string>::Resolved(std::move(state->content));
        }
        return ReadRemaining(state);
      });
}

struct WriteState {
  std::shared_ptr<AfcConnection> connection;
  uint64_t handle;
  std::size_t chunkSize;
  std::string content;
  std::size_t offset{0};
};

Future<Void> WriteRemaining(const std::shared_ptr<WriteState>& state) {
  const std::size_t len = std::min(state->chunkSize, state->content.size() - state->offset);
  std::string params;
  AppendAfcU64(params, state->handle);
  return state->connection
      ->submit(AfcOperation::FileWrite, std::move(params), state->content.substr(state->offset, len))
      .then([state, len](const AfcPacket&) {
        state->offset += len;
        if (state->offset >= state->content.size()) {
          return Future<Void>::Resolved();
        }
        return WriteRemaining(state);
      });
}

// Closes 'handle' once 'operation' is terminal, then forwards the outcome of 'operation'. A close failure
// only surfaces if the operation itself succeeded.
template <class T>
Future<T> CloseAfter(const AfcClient& client, uint64_t handle, const Future<T>& operation) {
  return operation.chain([client, handle](const Future<T>& done) {
    return client.fileClose(handle).chain([done](const Future<Void>& closed) {
      if (done.state() == FutureState::Succeeded && closed.state() == FutureState::Failed) {
        return Future<T>::Failed(closed.error());
      }
      return done;
    });
  });
}

}  // namespace

AfcClient::AfcClient(std::shared_ptr<AfcConnection> connection) : _connection(std::move(connection)) {
  if (!_connection) {
    throw std::invalid_argument("AfcClient requires a connection");
  }
}

Future<Void> AfcClient::simpleRequest(AfcOperation operation, std::string params) const {
  return _connection->submit(operation, std::move(params)).discardValue();
}

Future<std::vector<std::string>> AfcClient::readDirectory(std::string_view path) const {
  std::string params;
  AppendAfcPath(params, path);
  return _connection->submit(AfcOperation::ReadDirectory, std::move(params)).map([](const AfcPacket& response) {
    std::vector<std::string> entries = SplitAfcStrings(response.data);
    std::erase_if(entries, [](const std::string& entry) { return entry == "." || entry == ".."; });
    return entries;
  });
}

Future<uint64_t> AfcClient::fileOpen(std::string_view path, AfcFileMode mode) const {
  std::string params;
  AppendAfcU64(params, static_cast<uint64_t>(mode));
  AppendAfcPath(params, path);
  return _connection->submit(AfcOperation::FileOpen, std::move(params)).map([](const AfcPacket& response) {
    if (response.params.size() < sizeof(uint64_t)) {
      throw FutureError(Error(ErrorKind::ProtocolViolation, "AFC FileOpenResult without handle"));
    }
    return response.firstParam();
  });
}

Future<std::string> AfcClient::fileRead(uint64_t handle, uint64_t length) const {
  std::string params;
  AppendAfcU64(params, handle);
  AppendAfcU64(params, length);
  return _connection->submit(AfcOperation::FileRead, std::move(params)).map([](const AfcPacket& response) {
    return response.data;
  });
}

Future<Void> AfcClient::fileWrite(uint64_t handle, std::string bytes) const {
  std::string params;
  AppendAfcU64(params, handle);
  return _connection->submit(AfcOperation::FileWrite, std::move(params), std::move(bytes)).discardValue();
}

Future<Void> AfcClient::fileClose(uint64_t handle) const {
  std::string params;
  AppendAfcU64(params, handle);
  return simpleRequest(AfcOperation::FileClose, std::move(params));
}

Future<std::string> AfcClient::readFile(std::string_view path) const {
  const AfcClient client = *this;
  return fileOpen(path, AfcFileMode::ReadOnly)
      .then([client](uint64_t handle) {
        auto state = std::make_shared<ReadState>(
            ReadState{client._connection, handle, client._connection->config().fileChunkSize, {}});
        return CloseAfter(client, handle, ReadRemaining(state));
      })
      .named(fmt::format("afc-read-file {}", path));
}

Future<Void> AfcClient::writeFile(std::string_view path, std::string bytes) const {
  const AfcClient client = *this;
  return fileOpen(path, AfcFileMode::WriteTruncate)
      .then([client, bytes = std::move(bytes)](uint64_t handle) mutable {
        if (bytes.empty()) {
          return client.fileClose(handle);
        }
        auto state = std::make_shared<WriteState>(
            WriteState{client._connection, handle, client._connection->config().fileChunkSize, std::move(bytes)});
        return CloseAfter(client, handle, WriteRemaining(state));
      })
      .named(fmt::format("afc-write-file {}", path));
}

Future<Void> AfcClient::removePath(std::string_view path) const {
  std::string params;
  AppendAfcPath(params, path);
  return simpleRequest(AfcOperation::RemovePath, std::move(params));
}

Future<Void> AfcClient::removePathAndContents(std::string_view path) const {
  std::string params;
  AppendAfcPath(params, path);
  return simpleRequest(AfcOperation::RemovePathAndContents, std::move(params));
}

Future<Void> AfcClient::makeDirectory(std::string_view path) const {
  std::string params;
  AppendAfcPath(params, path);
  return simpleRequest(AfcOperation::MakeDirectory, std::move(params));
}

Future<Void> AfcClient::renamePath(std::string_view from, std::string_view to) const {
  std::string params;
  AppendAfcPath(params, from);
  AppendAfcPath(params, to);
  return simpleRequest(AfcOperation::RenamePath, std::move(params));
}

Future<std::map<std::string, std::string>> AfcClient::fileInfo(std::string_view path) const {
  std::string params;
  AppendAfcPath(params, path);
  return _connection->submit(AfcOperation::GetFileInfo, std::move(params)).map([](const AfcPacket& response) {
    return ParseAfcDictionary(response.data);
  });
}

Future<std::map<std::string, std::string>> AfcClient::deviceInfo() const {
  return _connection->submit(AfcOperation::GetDeviceInfo).map([](const AfcPacket& response) {
    return ParseAfcDictionary(response.data);
  });
}

}  // namespace companion
