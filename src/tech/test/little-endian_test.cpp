#include "little-endian.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <limits>

namespace tnc {

TEST(LittleEndian, StoreUnsigned32) {
  std::array<char, 4> buf{};
  char *end = StoreLittleEndian(static_cast<uint32_t>(0x075BCD15), buf.data());

  EXPECT_EQ(end, buf.data() + buf.size());
  EXPECT_EQ(buf, (std::array<char, 4>{'\x15', '\xcd', '\x5b', '\x07'}));
}

TEST(LittleEndian, StoreSigned64) {
  std::array<char, 8> buf{};
  StoreLittleEndian(static_cast<int64_t>(1700000000), buf.data());
  EXPECT_EQ(buf, (std::array<char, 8>{'\x00', '\xf1', '\x53', '\x65', '\x00', '\x00', '\x00', '\x00'}));

  StoreLittleEndian(static_cast<int64_t>(-2), buf.data());
  EXPECT_EQ(buf, (std::array<char, 8>{'\xfe', '\xff', '\xff', '\xff', '\xff', '\xff', '\xff', '\xff'}));
}

TEST(LittleEndian, LoadInverseOfStore) {
  std::array<char, 8> buf{};
  for (int64_t val : {std::numeric_limits<int64_t>::min(), static_cast<int64_t>(-1), static_cast<int64_t>(0),
                      static_cast<int64_t>(42), std::numeric_limits<int64_t>::max()}) {
    StoreLittleEndian(val, buf.data());
    EXPECT_EQ(LoadLittleEndian<int64_t>(buf.data()), val);
  }

  StoreLittleEndian(std::numeric_limits<uint32_t>::max(), buf.data());
  EXPECT_EQ(LoadLittleEndian<uint32_t>(buf.data()), std::numeric_limits<uint32_t>::max());
}

TEST(LittleEndian, Constexpr) {
  static constexpr auto kBuf = [] {
    std::array<char, 2> buf{};
    StoreLittleEndian(static_cast<uint16_t>(0x0102), buf.data());
    return buf;
  }();
  static_assert(kBuf[0] == '\x02' && kBuf[1] == '\x01');
  static_assert(LoadLittleEndian<uint16_t>(kBuf.data()) == 0x0102);
}

}  // namespace tnc
