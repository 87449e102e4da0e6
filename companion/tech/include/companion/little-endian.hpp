#pragma once

#include <cstdint>

namespace companion {

// Read a 64-bit little-endian value.
constexpr uint64_t Read64LE(const char* data) noexcept {
  uint64_t value = 0;
  for (int idx = 7; idx >= 0; --idx) {
    value = (value << 8) | static_cast<uint64_t>(static_cast<unsigned char>(data[idx]));
  }
  return value;
}

// Write a 64-bit little-endian value.
constexpr void Write64LE(char* data, uint64_t value) noexcept {
  for (int idx = 0; idx < 8; ++idx) {
    data[idx] = static_cast<char>(value & 0xFF);
    value >>= 8;
  }
}

}  // namespace companion
