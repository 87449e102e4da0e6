#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace companion {

inline constexpr int8_t kDefaultGzipLevel = 6;

// Appends the gzip compressed form of 'data' to 'out'.
// Throws std::runtime_error on zlib failure.
void GzipCompress(std::string_view data, std::string& out, int8_t level = kDefaultGzipLevel);

// Appends the decompressed form of the gzip member 'input' to 'out'.
// Returns false if the input is corrupted, truncated, followed by trailing bytes, or if it would decompress to
// more than 'maxDecompressedBytes'. 'out' content is unspecified in that case.
[[nodiscard]] bool GzipDecompress(std::string_view input, std::size_t maxDecompressedBytes, std::string& out,
                                  std::size_t decoderChunkSize = std::size_t{1} << 16);

}  // namespace companion
