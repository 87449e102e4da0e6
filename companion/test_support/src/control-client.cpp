#include "companion/control-client.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "companion/rpc-protocol.hpp"
#include "companion/socket-ops.hpp"
#include "companion/test-util.hpp"
#include "companion/timedef.hpp"

namespace companion::test {

namespace {

constexpr std::size_t kMaxTestFrameBytes = std::size_t{1} << 26;

}  // namespace

ControlClient::ControlClient(uint16_t port) : _cnx(ConnectLoopback(port)), _decoder(kMaxTestFrameBytes) {}

uint64_t ControlClient::send(RpcCommand command, std::vector<std::string> fields) {
  const uint64_t requestId = _nextRequestId++;
  sendRaw(EncodeRpcFrame(RpcFrame{requestId, static_cast<uint64_t>(command), std::move(fields)}));
  return requestId;
}

void ControlClient::sendRaw(std::string_view bytes) {
  if (SendAll(_cnx.fd(), bytes, std::chrono::seconds{5}) != IoStatus::Ok) {
    throw std::runtime_error("control client write failed");
  }
}

bool ControlClient::readOnce(SysDuration timeout) {
  if (_peerClosed) {
    return false;
  }
  std::array<char, 1 << 16> buf;
  std::size_t nbRead = 0;
  switch (RecvSome(_cnx.fd(), buf.data(), buf.size(), timeout, nbRead)) {
    case IoStatus::Ok:
      break;
    case IoStatus::Timeout:
      return false;
    default:
      _peerClosed = true;
      return false;
  }
  _decoder.feed(std::string_view(buf.data(), nbRead));
  while (auto frame = _decoder.next()) {
    _received.push_back(std::move(*frame));
  }
  if (_decoder.failed()) {
    throw std::runtime_error("control client received a malformed frame");
  }
  return true;
}

std::optional<RpcFrame> ControlClient::findReceived(uint64_t requestId, std::optional<RpcStatus> status) const {
  for (const RpcFrame& frame : _received) {
    if (frame.requestId != requestId) {
      continue;
    }
    if (status ? frame.code == static_cast<uint64_t>(*status)
               : (frame.code == static_cast<uint64_t>(RpcStatus::Ok) ||
                  frame.code == static_cast<uint64_t>(RpcStatus::Failed))) {
      return frame;
    }
  }
  return std::nullopt;
}

std::optional<RpcFrame> ControlClient::awaitReply(uint64_t requestId, std::chrono::milliseconds timeout) {
  std::optional<RpcFrame> reply;
  WaitFor(
      [&] {
        reply = findReceived(requestId, std::nullopt);
        if (!reply && !_peerClosed) {
          (void)readOnce(std::chrono::milliseconds{10});
          reply = findReceived(requestId, std::nullopt);
        }
        return reply.has_value() || _peerClosed;
      },
      timeout, std::chrono::milliseconds{0});
  return reply;
}

std::optional<RpcFrame> ControlClient::awaitFrame(uint64_t requestId, RpcStatus status,
                                                  std::chrono::milliseconds timeout) {
  std::optional<RpcFrame> found;
  WaitFor(
      [&] {
        found = findReceived(requestId, status);
        if (!found && !_peerClosed) {
          (void)readOnce(std::chrono::milliseconds{10});
          found = findReceived(requestId, status);
        }
        return found.has_value() || _peerClosed;
      },
      timeout, std::chrono::milliseconds{0});
  return found;
}

std::optional<RpcFrame> ControlClient::call(RpcCommand command, std::vector<std::string> fields,
                                            std::chrono::milliseconds timeout) {
  return awaitReply(send(command, std::move(fields)), timeout);
}

void ControlClient::pump(std::chrono::milliseconds duration) {
  const auto deadline = SteadyClock::now() + duration;
  while (!_peerClosed) {
    const auto now = SteadyClock::now();
    if (now >= deadline) {
      break;
    }
    (void)readOnce(deadline - now);
  }
}

std::vector<RpcFrame> ControlClient::framesOf(uint64_t requestId) const {
  std::vector<RpcFrame> frames;
  for (const RpcFrame& frame : _received) {
    if (frame.requestId == requestId) {
      frames.push_back(frame);
    }
  }
  return frames;
}

std::size_t ControlClient::streamBytes(uint64_t requestId) const {
  std::size_t total = 0;
  for (const RpcFrame& frame : _received) {
    if (frame.requestId == requestId && frame.code == static_cast<uint64_t>(RpcStatus::StreamChunk)) {
      for (const std::string& field : frame.fields) {
        total += field.size();
      }
    }
  }
  return total;
}

bool ControlClient::awaitPeerClose(std::chrono::milliseconds timeout) {
  return WaitFor(
      [this] {
        (void)readOnce(std::chrono::milliseconds{10});
        return _peerClosed;
      },
      timeout, std::chrono::milliseconds{0});
}

}  // namespace companion::test
