#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i8 = std::int8_t;
using i64 = std::int64_t;

using Bytes = std::span<std::byte>;
using ConstBytes = std::span<const std::byte>;

// everything on disk is little endian, regardless of the host

inline void writeLEu8(Bytes out, std::size_t offset, u8 v)
{
  out[offset] = static_cast<std::byte>(v);
}

inline u8 readLEu8(ConstBytes in, std::size_t offset)
{
  return static_cast<u8>(in[offset]);
}

inline void writeLEu16(Bytes out, std::size_t offset, u16 v)
{
  out[offset + 0] = static_cast<std::byte>((v >> 0) & 0xFF);
  out[offset + 1] = static_cast<std::byte>((v >> 8) & 0xFF);
}

inline u16 readLEu16(ConstBytes in, std::size_t offset)
{
  return static_cast<u16>((static_cast<u16>(in[offset + 0]) << 0) |
                          (static_cast<u16>(in[offset + 1]) << 8));
}

inline void writeLEu32(Bytes out, std::size_t offset, u32 v)
{
  for (std::size_t i = 0; i < 4; i++)
  {
    out[offset + i] = static_cast<std::byte>((v >> (8 * i)) & 0xFF);
  }
}

inline u32 readLEu32(ConstBytes in, std::size_t offset)
{
  u32 v = 0;
  for (std::size_t i = 0; i < 4; i++)
  {
    v |= static_cast<u32>(in[offset + i]) << (8 * i);
  }
  return v;
}

inline void writeLEu64(Bytes out, std::size_t offset, u64 v)
{
  for (std::size_t i = 0; i < 8; i++)
  {
    out[offset + i] = static_cast<std::byte>((v >> (8 * i)) & 0xFF);
  }
}

inline u64 readLEu64(ConstBytes in, std::size_t offset)
{
  u64 v = 0;
  for (std::size_t i = 0; i < 8; i++)
  {
    v |= static_cast<u64>(in[offset + i]) << (8 * i);
  }
  return v;
}

inline void writeLEi64(Bytes out, std::size_t offset, i64 v)
{
  writeLEu64(out, offset, static_cast<u64>(v));
}

inline i64 readLEi64(ConstBytes in, std::size_t offset)
{
  return static_cast<i64>(readLEu64(in, offset));
}

inline void writeLEf64(Bytes out, std::size_t offset, double v)
{
  static_assert(sizeof(double) == sizeof(u64), "IEEE-754 double must be 8 bytes");
  u64 bits;
  std::memcpy(&bits, &v, sizeof(bits));
  writeLEu64(out, offset, bits);
}

inline double readLEf64(ConstBytes in, std::size_t offset)
{
  const u64 bits = readLEu64(in, offset);
  double v;
  std::memcpy(&v, &bits, sizeof(v));
  return v;
}

inline void writeBytes(Bytes out, std::size_t offset, std::string_view s)
{
  std::memcpy(out.data() + offset, s.data(), s.size());
}

inline std::string_view readBytes(ConstBytes in, std::size_t offset, std::size_t n)
{
  return std::string_view(reinterpret_cast<const char *>(in.data() + offset), n);
}
