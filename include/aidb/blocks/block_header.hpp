#pragma once

#include "aidb/machine.hpp"
#include "aidb/errors.hpp"

#include <vector>

// block 0 is always the superblock, so 0 also marks the end of every chain
const BlockIndex NULL_BLOCK = 0;
const BlockIndex SUPERBLOCK_INDEX = 0;

// row offsets and the bytes used in a data block are u16, so a block is at most 64 KiB
const u32 MIN_BLOCK_SIZE = 128;
const u32 MAX_BLOCK_SIZE = 1 << 16;

// throws unless blockSize is in [MIN_BLOCK_SIZE, MAX_BLOCK_SIZE]
inline void checkBlockSize(u64 blockSize)
{
  if (blockSize < MIN_BLOCK_SIZE || blockSize > MAX_BLOCK_SIZE)
  {
    std::ostringstream ss;
    ss << "block size " << blockSize << " outside [" << MIN_BLOCK_SIZE << ", " << MAX_BLOCK_SIZE << "]";
    throw StorageError(ss.str());
  }
}

// every chained block (schema, text, free) starts with the index of the next one
const std::size_t CHAIN_NEXT_OFFSET = 0;
const std::size_t CHAIN_HEADER_SIZE = sizeof(u64);

// first byte of an index block
enum class IndexTag : u8
{
  BTreeMeta = 1,
  BTreeInternal,
  BTreeLeaf,
  HashDirectory,
  HashBucket,
  HashOverflow,
};

// one block worth of bytes. the size is whatever the store was formatted with
struct Block
{
  std::vector<std::byte> buf;

  Block() = default;
  explicit Block(std::size_t size) : buf(size, static_cast<std::byte>(0)) {}

  std::size_t size() const noexcept { return buf.size(); }

  Bytes bytes() noexcept { return Bytes(buf.data(), buf.size()); }
  ConstBytes bytes() const noexcept { return ConstBytes(buf.data(), buf.size()); }

  // the part of a chained block after its next pointer
  Bytes payload() noexcept { return bytes().subspan(CHAIN_HEADER_SIZE); }
  ConstBytes payload() const noexcept { return bytes().subspan(CHAIN_HEADER_SIZE); }

  BlockIndex next() const { return readLEu64(bytes(), CHAIN_NEXT_OFFSET); }
  void setNext(BlockIndex next) { writeLEu64(bytes(), CHAIN_NEXT_OFFSET, next); }

  friend bool operator==(const Block &a, const Block &b) { return a.buf == b.buf; }
};
