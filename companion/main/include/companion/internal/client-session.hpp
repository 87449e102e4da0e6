#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "companion/bitmap-stream.hpp"
#include "companion/connection.hpp"
#include "companion/rpc-protocol.hpp"

namespace companion::internal {

// State of one control client, owned and accessed by the reactor thread only.
struct ClientSession {
  ClientSession(Connection connection, uint64_t id, std::size_t maxFrameBytes)
      : cnx(std::move(connection)), decoder(maxFrameBytes), id(id) {}

  [[nodiscard]] std::size_t pendingBytes() const noexcept { return outBuffer.size() - outPos; }

  Connection cnx;
  RpcFrameDecoder decoder;
  std::string outBuffer;
  std::size_t outPos{0};
  uint64_t id;
  // Video stream started by this client, if any.
  std::shared_ptr<BitmapStream> stream;
  uint64_t streamRequestId{0};
  std::size_t droppedChunks{0};
  bool waitingWritable{false};
  bool closeWhenFlushed{false};
  bool broken{false};
};

}  // namespace companion::internal
