#pragma once

#include "aidb/blocks/block_header.hpp"
#include "aidb/value.hpp"

// what every index maps: an integer key to the row holding it
struct IndexEntry
{
  i64 key;
  RowPointer row;

  // i64 key, u64 row block, u16 row offset
  static constexpr std::size_t ENCODED_SIZE = 18;

  void encode(Bytes out, std::size_t offset) const
  {
    writeLEi64(out, offset, key);
    writeLEu64(out, offset + 8, row.block);
    writeLEu16(out, offset + 16, row.offset);
  }

  static IndexEntry decode(ConstBytes in, std::size_t offset)
  {
    return IndexEntry{readLEi64(in, offset), RowPointer{readLEu64(in, offset + 8), readLEu16(in, offset + 16)}};
  }

  friend bool operator==(const IndexEntry &, const IndexEntry &) = default;
};

// one end of a key range
struct Bound
{
  enum Kind
  {
    Included,
    Excluded,
    Unbounded,
  } kind = Unbounded;
  i64 key = 0;

  static Bound included(i64 key) { return Bound{Included, key}; }
  static Bound excluded(i64 key) { return Bound{Excluded, key}; }
  static Bound unbounded() { return Bound{Unbounded, 0}; }

  // key is not below this bound
  bool admitsFromBelow(i64 k) const noexcept
  {
    return kind == Unbounded || (kind == Included ? k >= key : k > key);
  }

  // key is not above this bound
  bool admitsFromAbove(i64 k) const noexcept
  {
    return kind == Unbounded || (kind == Included ? k <= key : k < key);
  }
};

inline IndexTag readIndexTag(ConstBytes block)
{
  return static_cast<IndexTag>(readLEu8(block, 0));
}
