#pragma once

#include <string_view>

namespace companion {

// Sink of a byte stream. Calls are made from a single thread at a time.
class DataConsumer {
 public:
  virtual ~DataConsumer() = default;

  virtual void consumeData(std::string_view bytes) = 0;

  // Called once, after the last consumeData.
  virtual void consumeEndOfFile() = 0;
};

}  // namespace companion
