#include "companion/little-endian.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>

namespace companion {

TEST(LittleEndianTest, WriteLayout) {
  std::array<char, 8> buf{};
  Write64LE(buf.data(), 0x0807060504030201ULL);
  for (int idx = 0; idx < 8; ++idx) {
    EXPECT_EQ(static_cast<int>(buf[static_cast<std::size_t>(idx)]), idx + 1);
  }
}

TEST(LittleEndianTest, ReadHighBytes) {
  std::array<char, 8> buf;
  buf.fill(static_cast<char>(0xFF));
  EXPECT_EQ(Read64LE(buf.data()), UINT64_MAX);
}

TEST(LittleEndianTest, Constexpr) {
  static_assert([] {
    std::array<char, 8> buf{};
    Write64LE(buf.data(), 40);
    return Read64LE(buf.data()) == 40;
  }());
}

}  // namespace companion
