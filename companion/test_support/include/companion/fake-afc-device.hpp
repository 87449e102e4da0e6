#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "companion/afc-protocol.hpp"
#include "companion/connection.hpp"
#include "companion/test-util.hpp"

namespace companion::test {

// In-process AFC peer serving an in-memory file system over loopback TCP.
// Connections are served concurrently, each one strictly request by request.
class FakeAfcDevice {
 public:
  FakeAfcDevice();

  FakeAfcDevice(const FakeAfcDevice&) = delete;
  FakeAfcDevice& operator=(const FakeAfcDevice&) = delete;

  ~FakeAfcDevice();

  [[nodiscard]] uint16_t port() const noexcept { return _listener.port(); }

  [[nodiscard]] std::string portStr() const { return _listener.portStr(); }

  // File system content. Parent directories are created as needed.
  void addFile(std::string_view path, std::string content);
  void addDirectory(std::string_view path);

  [[nodiscard]] std::optional<std::string> fileContent(std::string_view path) const;
  [[nodiscard]] bool exists(std::string_view path) const;
  [[nodiscard]] bool isDirectory(std::string_view path) const;

  void setDeviceInfo(std::map<std::string, std::string> deviceInfo);

  // Delay applied before each response.
  void setResponseDelay(std::chrono::milliseconds delay);

  // The next response carries a request id that does not match the request.
  void corruptNextResponseId();

  // The next response starts with a bad magic.
  void corruptNextMagic();

  // The next response is a well framed packet of 'operation' (a successful Status, or an empty payload),
  // whatever the request was.
  void answerNextWith(AfcOperation operation);

  // Requests are read but left unanswered while true.
  void setSilent(bool silent);

  // Drops every open connection.
  void dropConnections();

  // Stops accepting and drops every open connection. Idempotent.
  void stop();

  [[nodiscard]] std::size_t connectionsAccepted() const noexcept { return _connectionsAccepted.load(); }

  [[nodiscard]] std::size_t requestsReceived() const noexcept { return _requestsReceived.load(); }

  // Operations received, in arrival order, over all connections.
  [[nodiscard]] std::vector<AfcOperation> receivedOperations() const;

  // Request ids received, in arrival order, over all connections.
  [[nodiscard]] std::vector<uint64_t> receivedRequestIds() const;

 private:
  struct Node {
    bool directory{false};
    std::string content;
  };

  struct OpenFile {
    std::string path;
    std::size_t offset{0};
  };

  void acceptLoop(const std::stop_token& stopToken);
  void serve(const std::stop_token& stopToken, Connection cnx);

  // Builds the response for one request, under _mutex.
  AfcPacket handle(const AfcPacket& request);

  void ensureParents(const std::string& path);
  [[nodiscard]] std::vector<std::string> children(const std::string& path) const;

  mutable std::mutex _mutex;
  std::map<std::string, Node> _nodes;
  std::map<uint64_t, OpenFile> _openFiles;
  std::map<std::string, std::string> _deviceInfo;
  std::vector<AfcOperation> _receivedOperations;
  std::vector<uint64_t> _receivedRequestIds;
  std::vector<int> _openFds;
  std::chrono::milliseconds _responseDelay{0};
  uint64_t _nextHandle{1};
  bool _corruptNextId{false};
  bool _corruptNextMagic{false};
  std::optional<AfcOperation> _nextResponseOperation;
  bool _silent{false};
  std::atomic<std::size_t> _connectionsAccepted{0};
  std::atomic<std::size_t> _requestsReceived{0};
  LoopbackListener _listener;
  std::vector<std::jthread> _servers;
  std::jthread _acceptor;
};

}  // namespace companion::test
