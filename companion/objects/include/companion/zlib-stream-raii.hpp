#pragma once

#include <zlib.h>

#include <cstdint>

namespace companion {

struct ZStreamRAII {
  enum class Type : int8_t { compress, decompress };

  // Initialize a gzip z_stream for decompression.
  // Throws std::runtime_error on failure.
  ZStreamRAII();

  // Initialize a gzip z_stream for compression.
  // Throws std::runtime_error on failure.
  explicit ZStreamRAII(int8_t level);

  // z_stream is not moveable or copyable - delete these operations
  ZStreamRAII(const ZStreamRAII&) = delete;
  ZStreamRAII(ZStreamRAII&&) noexcept = delete;
  ZStreamRAII& operator=(const ZStreamRAII&) = delete;
  ZStreamRAII& operator=(ZStreamRAII&&) noexcept = delete;

  ~ZStreamRAII();

  z_stream stream{};

 private:
  Type _type;
};

}  // namespace companion
