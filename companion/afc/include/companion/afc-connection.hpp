#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <thread>

#include "companion/afc-connection-config.hpp"
#include "companion/afc-protocol.hpp"
#include "companion/base-fd.hpp"
#include "companion/error.hpp"
#include "companion/future.hpp"

namespace companion {

// Single AFC conversation over one connected socket.
//
// Requests are queued in submission order and exchanged one at a time by a dedicated worker thread: at most one
// request is in flight, and its response must echo its request id and be of the operation AfcExpectedResponse
// gives for the request. Any framing error or unexpected response faults the connection: the in-flight request
// fails with ProtocolViolation (or Timeout / ConnectionClosed), every queued request fails with ConnectionClosed,
// and later submissions fail immediately. A non zero Status response only fails its own request with DeviceError.
// An idle connection is watched for peer close, which faults it as well.
//
// Futures are resolved from the worker thread, outside of any internal lock.
class AfcConnection {
 public:
  // 'socket' must be a connected, non-blocking stream socket. Throws std::invalid_argument on invalid config.
  explicit AfcConnection(BaseFd socket, AfcConnectionConfig config = {});

  AfcConnection(const AfcConnection&) = delete;
  AfcConnection(AfcConnection&&) = delete;
  AfcConnection& operator=(const AfcConnection&) = delete;
  AfcConnection& operator=(AfcConnection&&) = delete;

  // Closes the connection and joins the worker.
  ~AfcConnection();

  // Queue a request. The returned future succeeds with the response packet (Status with code 0, Data, or
  // FileOpenResult). Cancelling it while queued removes the request; cancelling it while in flight lets the
  // exchange complete without delivering its result.
  Future<AfcPacket> submit(AfcOperation operation, std::string params = {}, std::string data = {});

  // Stop the conversation. Queued and in flight requests fail with ConnectionClosed. Idempotent.
  void close();

  [[nodiscard]] bool isAlive() const;

  // Number of queued requests, plus one if a request is in flight.
  [[nodiscard]] std::size_t pendingRequests() const;

  [[nodiscard]] const AfcConnectionConfig& config() const noexcept;

 private:
  class Channel;

  // Shared with the worker, which may outlive this object when the last owner is released from a callback it runs.
  std::shared_ptr<Channel> _channel;
  std::jthread _worker;
};

}  // namespace companion
