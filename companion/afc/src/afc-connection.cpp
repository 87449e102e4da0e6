#include "companion/afc-connection.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "companion/afc-connection-config.hpp"
#include "companion/afc-protocol.hpp"
#include "companion/base-fd.hpp"
#include "companion/error.hpp"
#include "companion/future.hpp"
#include "companion/log.hpp"
#include "companion/socket-ops.hpp"
#include "companion/timedef.hpp"

namespace companion {

namespace {

// Period of the check of an idle connection for a peer close.
constexpr std::chrono::milliseconds kIdleCheckInterval{50};

Error IoError(IoStatus status, std::string_view step, std::chrono::milliseconds ioTimeout) {
  switch (status) {
    case IoStatus::Timeout:
      return {ErrorKind::Timeout, fmt::format("AFC {} timed out after {} ms", step, ioTimeout.count())};
    case IoStatus::PeerClosed:
      return {ErrorKind::ConnectionClosed, fmt::format("AFC peer closed the connection during {}", step)};
    default:
      return {ErrorKind::ConnectionClosed, fmt::format("AFC I/O error during {}", step), errno};
  }
}

}  // namespace

class AfcConnection::Channel {
 public:
  Channel(BaseFd socket, AfcConnectionConfig config) : _config(std::move(config)), _socket(std::move(socket)) {}

  Future<AfcPacket> submit(const std::shared_ptr<Channel>& self, AfcOperation operation, std::string params,
                           std::string data);

  void run(const std::stop_token& stopToken);

  // Mark the connection dead and fail everything that is still queued. Does not touch the in flight request.
  void fault(const Error& cause, bool unexpected);

  void close() { fault(Error(ErrorKind::ConnectionClosed, "AFC connection closed"), false); }

  bool isAlive() const {
    std::scoped_lock lock(_mutex);
    return _alive;
  }

  std::size_t pendingRequests() const {
    std::scoped_lock lock(_mutex);
    return _queue.size() + (_inFlight ? 1U : 0U);
  }

  const AfcConnectionConfig& config() const noexcept { return _config; }

 private:
  struct Request {
    uint64_t id;
    AfcOperation operation;
    std::string params;
    std::string data;
    Promise<AfcPacket> promise;
  };

  // Exchanges one request. Returns the error to fault the connection with, if any.
  std::optional<Error> exchange(Request& request);

  // Nothing may arrive while no request is in flight: end of stream and unsolicited bytes both fault the connection.
  std::optional<Error> checkIdle();

  void removeQueued(uint64_t id);

  mutable std::mutex _mutex;
  std::condition_variable_any _cv;
  std::deque<Request> _queue;
  AfcConnectionConfig _config;
  BaseFd _socket;
  uint64_t _nextRequestId{0};
  bool _alive{true};
  bool _inFlight{false};
};

Future<AfcPacket> AfcConnection::Channel::submit(const std::shared_ptr<Channel>& self, AfcOperation operation,
                                                 std::string params, std::string data) {
  Promise<AfcPacket> promise;
  uint64_t id;
  {
    std::scoped_lock lock(_mutex);
    if (!_alive) {
      promise.fail(Error(ErrorKind::ConnectionClosed,
                         fmt::format("AFC connection is closed, {} not sent", AfcOperationName(operation))));
      return promise.future();
    }
    id = _nextRequestId++;
    promise.future().named(fmt::format("afc-{}-{}", AfcOperationName(operation), id));
    _queue.push_back(Request{id, operation, std::move(params), std::move(data), promise});
  }
  _cv.notify_all();
  log::trace("AFC request {} {} queued", id, AfcOperationName(operation));

  std::weak_ptr<Channel> weakSelf = self;
  return promise.future().onCancel([weakSelf, id]() {
    if (auto channel = weakSelf.lock()) {
      channel->removeQueued(id);
    }
    return Future<Void>::Resolved();
  });
}

void AfcConnection::Channel::removeQueued(uint64_t id) {
  std::optional<Request> removed;
  std::scoped_lock lock(_mutex);
  for (auto it = _queue.begin(); it != _queue.end(); ++it) {
    if (it->id == id) {
      log::debug("AFC request {} removed from queue", id);
      removed.emplace(std::move(*it));
      _queue.erase(it);
      return;
    }
  }
}

void AfcConnection::Channel::fault(const Error& cause, bool unexpected) {
  std::deque<Request> queued;
  {
    std::scoped_lock lock(_mutex);
    if (_alive) {
      _alive = false;
      if (unexpected) {
        log::error("AFC connection on fd # {} faulted: {}", _socket.fd(), cause.describe());
      } else {
        log::debug("AFC connection on fd # {} closing", _socket.fd());
      }
      // Unblocks a worker waiting for a response.
      if (!ShutdownReadWrite(_socket.fd())) {
        log::debug("AFC shutdown of fd # {} failed", _socket.fd());
      }
    }
    queued.swap(_queue);
  }
  _cv.notify_all();
  for (Request& request : queued) {
    request.promise.fail(Error(ErrorKind::ConnectionClosed,
                               fmt::format("AFC connection faulted before request {} was sent: {}", request.id,
                                           cause.message())));
  }
}

void AfcConnection::Channel::run(const std::stop_token& stopToken) {
  while (true) {
    std::optional<Request> request;
    {
      std::unique_lock lock(_mutex);
      const bool woken =
          _cv.wait_for(lock, stopToken, kIdleCheckInterval, [this] { return !_queue.empty() || !_alive; });
      if (!_alive || stopToken.stop_requested()) {
        break;
      }
      if (!woken) {
        lock.unlock();
        if (std::optional<Error> cause = checkIdle()) {
          fault(*cause, true);
        }
        continue;
      }
      request.emplace(std::move(_queue.front()));
      _queue.pop_front();
      _inFlight = true;
    }

    std::optional<Error> faultCause = exchange(*request);

    {
      std::scoped_lock lock(_mutex);
      _inFlight = false;
    }
    if (faultCause) {
      request->promise.fail(*faultCause);
      fault(*faultCause, true);
    }
  }
  // Requests that raced with the stop request.
  close();
}

std::optional<Error> AfcConnection::Channel::checkIdle() {
  char byte;
  std::size_t nbRead = 0;
  const IoStatus status = RecvSome(_socket.fd(), &byte, 1, SysDuration::zero(), nbRead);
  switch (status) {
    case IoStatus::Timeout:
      return std::nullopt;
    case IoStatus::Ok:
      return Error(ErrorKind::ProtocolViolation, "AFC peer sent data while no request was in flight");
    default:
      return IoError(status, "idle wait", _config.ioTimeout);
  }
}

std::optional<Error> AfcConnection::Channel::exchange(Request& request) {
  const int fd = _socket.fd();
  const std::string_view operationName = AfcOperationName(request.operation);

  const std::string encoded =
      EncodeAfcPacket(AfcPacket{request.id, request.operation, std::move(request.params), std::move(request.data)});
  if (encoded.size() > _config.maxPacketBytes) {
    // Nothing was written, the conversation is still consistent.
    request.promise.fail(Error(ErrorKind::InvalidArgument,
                               fmt::format("AFC {} request of {} bytes exceeds limit of {}", operationName,
                                           encoded.size(), _config.maxPacketBytes)));
    return std::nullopt;
  }

  IoStatus status = SendAll(fd, encoded, _config.ioTimeout);
  if (status != IoStatus::Ok) {
    return IoError(status, "request write", _config.ioTimeout);
  }

  std::array<char, kAfcHeaderSize> headerBuf;
  status = RecvExact(fd, headerBuf.data(), headerBuf.size(), _config.ioTimeout);
  if (status != IoStatus::Ok) {
    return IoError(status, "response header read", _config.ioTimeout);
  }
  auto header = DecodeAfcHeader(std::string_view(headerBuf.data(), headerBuf.size()), _config.maxPacketBytes);
  if (!header) {
    return header.error();
  }
  if (header->requestId != request.id) {
    return Error(ErrorKind::ProtocolViolation, fmt::format("AFC response for request {} while {} is in flight",
                                                           header->requestId, request.id));
  }

  AfcPacket response;
  response.requestId = header->requestId;
  response.operation = static_cast<AfcOperation>(header->operation);
  response.params.resize(header->paramsLength());
  response.data.resize(header->dataLength());
  if (!response.params.empty()) {
    status = RecvExact(fd, response.params.data(), response.params.size(), _config.ioTimeout);
    if (status != IoStatus::Ok) {
      return IoError(status, "response parameters read", _config.ioTimeout);
    }
  }
  if (!response.data.empty()) {
    status = RecvExact(fd, response.data.data(), response.data.size(), _config.ioTimeout);
    if (status != IoStatus::Ok) {
      return IoError(status, "response data read", _config.ioTimeout);
    }
  }

  log::trace("AFC request {} {} answered by {} ({} bytes)", request.id, operationName,
             AfcOperationName(response.operation), header->totalLength);

  if (response.operation == AfcOperation::Status) {
    if (response.params.size() < sizeof(uint64_t)) {
      return Error(ErrorKind::ProtocolViolation, "AFC Status response without status code");
    }
    const uint64_t code = response.firstParam();
    if (code != 0) {
      log::debug("AFC request {} {} failed with status {}", request.id, operationName, code);
      request.promise.fail(AfcStatusError(code));
      return std::nullopt;
    }
  }
  const AfcOperation expected = AfcExpectedResponse(request.operation);
  if (response.operation != expected) {
    return Error(ErrorKind::ProtocolViolation, fmt::format("AFC {} response to request {} {}, expected {}",
                                                           AfcOperationName(response.operation), request.id,
                                                           operationName, AfcOperationName(expected)));
  }
  // No-op if the caller cancelled in the meantime.
  request.promise.resolve(std::move(response));
  return std::nullopt;
}

AfcConnection::AfcConnection(BaseFd socket, AfcConnectionConfig config) {
  config.validate();
  const int fd = socket.fd();
  _channel = std::make_shared<Channel>(std::move(socket), std::move(config));
  _worker = std::jthread([channel = _channel](const std::stop_token& stopToken) { channel->run(stopToken); });
  log::debug("AFC connection on fd # {} opened", fd);
}

AfcConnection::~AfcConnection() {
  _channel->close();
  _worker.request_stop();
  if (_worker.get_id() == std::this_thread::get_id()) {
    // Last owner released from a callback running on the worker itself.
    _worker.detach();
  } else if (_worker.joinable()) {
    _worker.join();
  }
}

Future<AfcPacket> AfcConnection::submit(AfcOperation operation, std::string params, std::string data) {
  return _channel->submit(_channel, operation, std::move(params), std::move(data));
}

void AfcConnection::close() { _channel->close(); }

bool AfcConnection::isAlive() const { return _channel->isAlive(); }

std::size_t AfcConnection::pendingRequests() const { return _channel->pendingRequests(); }

const AfcConnectionConfig& AfcConnection::config() const noexcept { return _channel->config(); }

}  // namespace companion
