#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "companion/connection.hpp"
#include "companion/rpc-protocol.hpp"
#include "companion/timedef.hpp"

namespace companion::test {

// Blocking control protocol client, driven from the test thread.
// Every frame received is kept, in arrival order.
class ControlClient {
 public:
  explicit ControlClient(uint16_t port);

  // Sends a request and returns its id.
  uint64_t send(RpcCommand command, std::vector<std::string> fields = {});

  // Sends raw bytes, bypassing the framing.
  void sendRaw(std::string_view bytes);

  // Ok or Failed response of 'requestId', waiting up to 'timeout' for it.
  std::optional<RpcFrame> awaitReply(uint64_t requestId, std::chrono::milliseconds timeout = std::chrono::seconds{5});

  // First frame of 'requestId' with status 'status'.
  std::optional<RpcFrame> awaitFrame(uint64_t requestId, RpcStatus status,
                                     std::chrono::milliseconds timeout = std::chrono::seconds{5});

  // send() followed by awaitReply().
  std::optional<RpcFrame> call(RpcCommand command, std::vector<std::string> fields = {},
                               std::chrono::milliseconds timeout = std::chrono::seconds{5});

  // Reads what arrives during 'duration'.
  void pump(std::chrono::milliseconds duration);

  // Every frame received so far.
  [[nodiscard]] const std::vector<RpcFrame>& received() const noexcept { return _received; }

  // Frames received so far for 'requestId'.
  [[nodiscard]] std::vector<RpcFrame> framesOf(uint64_t requestId) const;

  // Total size of the StreamChunk frames received so far for 'requestId'.
  [[nodiscard]] std::size_t streamBytes(uint64_t requestId) const;

  // True once the server closed the connection.
  [[nodiscard]] bool peerClosed() const noexcept { return _peerClosed; }

  // Waits up to 'timeout' for the server to close the connection.
  bool awaitPeerClose(std::chrono::milliseconds timeout = std::chrono::seconds{5});

  void close() noexcept { _cnx.close(); }

 private:
  // Reads once, waiting up to 'timeout'. Returns false when nothing arrived.
  bool readOnce(SysDuration timeout);

  [[nodiscard]] std::optional<RpcFrame> findReceived(uint64_t requestId, std::optional<RpcStatus> status) const;

  Connection _cnx;
  RpcFrameDecoder _decoder;
  std::vector<RpcFrame> _received;
  uint64_t _nextRequestId{1};
  bool _peerClosed{false};
};

}  // namespace companion::test
