#include "companion/zlib-stream-raii.hpp"

#include <spdlog/fmt/fmt.h>
#include <zconf.h>
#include <zlib.h>

#include <cstdint>
#include <stdexcept>

#include "companion/log.hpp"

namespace companion {

namespace {
// gzip wrapper around the deflate format
constexpr int kGzipWindowBits = MAX_WBITS + 16;
}  // namespace

ZStreamRAII::ZStreamRAII() : _type(Type::decompress) {
  const auto ret = inflateInit2(&stream, kGzipWindowBits);
  if (ret != Z_OK) {
    throw std::runtime_error(fmt::format("Error from inflateInit2 - error {}", ret));
  }
}

ZStreamRAII::ZStreamRAII(int8_t level) : _type(Type::compress) {
  const auto ret = deflateInit2(&stream, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
  if (ret != Z_OK) {
    throw std::runtime_error(fmt::format("Error from deflateInit2 - error {}", ret));
  }
}

ZStreamRAII::~ZStreamRAII() {
  switch (_type) {
    case Type::decompress: {
      const auto ret = inflateEnd(&stream);
      if (ret != Z_OK) {
        log::error("zlib: inflateEnd returned {} (ignored)", ret);
      }
      break;
    }
    case Type::compress: {
      const auto ret = deflateEnd(&stream);
      if (ret != Z_OK) {
        log::error("zlib: deflateEnd returned {} (ignored)", ret);
      }
      break;
    }
  }
}

}  // namespace companion
