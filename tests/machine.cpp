#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <limits>

#include "aidb/machine.hpp"

TEST(LittleEndian, U32ByteOrder)
{
  std::array<std::byte, 4> buf = {};
  writeLEu32(Bytes(buf), 0, 0xDEADBEEF);

  // least significant byte first
  EXPECT_EQ(0xEF, static_cast<u8>(buf[0]));
  EXPECT_EQ(0xBE, static_cast<u8>(buf[1]));
  EXPECT_EQ(0xAD, static_cast<u8>(buf[2]));
  EXPECT_EQ(0xDE, static_cast<u8>(buf[3]));
  EXPECT_EQ(0xDEADBEEFu, readLEu32(ConstBytes(buf), 0));
}

TEST(LittleEndian, U64AtOffset)
{
  std::array<std::byte, 16> buf = {};
  writeLEu64(Bytes(buf), 3, 0x0102030405060708ULL);

  EXPECT_EQ(0, static_cast<u8>(buf[2]));
  EXPECT_EQ(0x08, static_cast<u8>(buf[3]));
  EXPECT_EQ(0x01, static_cast<u8>(buf[10]));
  EXPECT_EQ(0, static_cast<u8>(buf[11]));
  EXPECT_EQ(0x0102030405060708ULL, readLEu64(ConstBytes(buf), 3));
}

TEST(LittleEndian, NegativeIntegers)
{
  std::array<std::byte, 8> buf = {};
  writeLEi64(Bytes(buf), 0, -2);

  EXPECT_EQ(0xFE, static_cast<u8>(buf[0]));
  for (std::size_t i = 1; i < buf.size(); i++)
  {
    EXPECT_EQ(0xFF, static_cast<u8>(buf[i]));
  }
  EXPECT_EQ(-2, readLEi64(ConstBytes(buf), 0));

  writeLEi64(Bytes(buf), 0, std::numeric_limits<i64>::min());
  EXPECT_EQ(std::numeric_limits<i64>::min(), readLEi64(ConstBytes(buf), 0));
}

TEST(LittleEndian, DoublesKeepTheirBits)
{
  std::array<std::byte, 8> buf = {};
  writeLEf64(Bytes(buf), 0, 1.0);
  // 0x3FF0000000000000
  EXPECT_EQ(0xF0, static_cast<u8>(buf[6]));
  EXPECT_EQ(0x3F, static_cast<u8>(buf[7]));
  EXPECT_EQ(1.0, readLEf64(ConstBytes(buf), 0));

  writeLEf64(Bytes(buf), 0, -0.0);
  EXPECT_TRUE(std::signbit(readLEf64(ConstBytes(buf), 0)));
}

TEST(LittleEndian, StringBytes)
{
  std::array<std::byte, 8> buf = {};
  writeBytes(Bytes(buf), 2, "hi");
  EXPECT_EQ(0, static_cast<u8>(buf[1]));
  EXPECT_EQ('h', static_cast<char>(buf[2]));
  EXPECT_EQ("hi", readBytes(ConstBytes(buf), 2, 2));
}
