#include "companion/gzip-codec.hpp"

#include <spdlog/fmt/fmt.h>
#include <zconf.h>
#include <zlib.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "companion/log.hpp"
#include "companion/zlib-stream-raii.hpp"

namespace companion {

void GzipCompress(std::string_view data, std::string& out, int8_t level) {
  ZStreamRAII zs(level);

  auto& zstream = zs.stream;

  zstream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  zstream.avail_in = static_cast<uInt>(data.size());

  const auto maxCompressedSize = static_cast<std::size_t>(deflateBound(&zstream, static_cast<uLong>(data.size())));

  const auto initialSize = out.size();
  out.resize(initialSize + maxCompressedSize);

  zstream.next_out = reinterpret_cast<unsigned char*>(out.data() + initialSize);
  zstream.avail_out = static_cast<decltype(zstream.avail_out)>(maxCompressedSize);

  const auto rc = deflate(&zstream, Z_FINISH);
  if (rc != Z_STREAM_END) {
    throw std::runtime_error(fmt::format("Error {} during gzip compression", rc));
  }

  out.resize(initialSize + maxCompressedSize - zstream.avail_out);
}

bool GzipDecompress(std::string_view input, std::size_t maxDecompressedBytes, std::string& out,
                    std::size_t decoderChunkSize) {
  ZStreamRAII zs;
  auto& stream = zs.stream;

  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  stream.avail_in = static_cast<uInt>(input.size());

  const auto initialSize = out.size();

  while (true) {
    const auto alreadyDecompressed = out.size() - initialSize;
    if (alreadyDecompressed >= maxDecompressedBytes) {
      // One more byte of room to detect whether the stream really ends at the limit.
      std::string extra(1, '\0');
      stream.next_out = reinterpret_cast<unsigned char*>(extra.data());
      stream.avail_out = 1;
      const auto ret = inflate(&stream, Z_NO_FLUSH);
      if (ret == Z_STREAM_END && stream.avail_out == 1) {
        return stream.avail_in == 0;
      }
      log::debug("GzipDecompress - reached max decompressed size of {}", maxDecompressedBytes);
      return false;
    }
    const auto chunk = std::min(decoderChunkSize, maxDecompressedBytes - alreadyDecompressed);
    const auto previousSize = out.size();
    out.resize(previousSize + chunk);

    stream.next_out = reinterpret_cast<unsigned char*>(out.data() + previousSize);
    stream.avail_out = static_cast<uInt>(chunk);

    const auto ret = inflate(&stream, Z_NO_FLUSH);
    out.resize(previousSize + chunk - stream.avail_out);
    if (ret == Z_STREAM_END) {
      return stream.avail_in == 0;
    }
    if (ret != Z_OK) {
      log::error("GzipDecompress - inflate failed with error {}", ret);
      return false;
    }
    if (stream.avail_in == 0 && stream.avail_out != 0) {
      // Input exhausted before the end of the gzip member.
      log::debug("GzipDecompress - truncated input");
      return false;
    }
  }
}

}  // namespace companion
