#pragma once

#include "aidb/blocks/block_header.hpp"

#include <iostream>
#include <vector>

// the byte store a Pager sits on. a backend only knows fixed size blocks,
// nothing about what is in them
class StorageBackend
{
public:
  virtual ~StorageBackend() = default;

  virtual void readBlock(BlockIndex index, Bytes out) = 0;
  virtual void writeBlock(BlockIndex index, ConstBytes in) = 0;
  virtual u64 blockCount() const = 0;
  // appends one zeroed block and returns its index
  virtual BlockIndex growByOneBlock() = 0;
};

// blocks laid out back to back in a stream, block i at offset i * blockSize.
// works with a std::fstream for files and a std::stringstream for scratch stores
class StreamBackend : public StorageBackend
{
public:
  StreamBackend(std::iostream &stream, u32 blockSize, bool verbose = false);

  void readBlock(BlockIndex index, Bytes out) override;
  void writeBlock(BlockIndex index, ConstBytes in) override;
  u64 blockCount() const override { return m_blockCount; }
  BlockIndex growByOneBlock() override;

private:
  std::iostream &m_stream;
  u32 m_blockSize;
  u64 m_blockCount;
  bool m_verbose;
};

// keeps every block in memory. capacity of 0 means it can grow without bound
class MemoryBackend : public StorageBackend
{
public:
  explicit MemoryBackend(u32 blockSize, u64 capacity = 0)
      : m_blockSize(blockSize), m_capacity(capacity)
  {
    checkBlockSize(m_blockSize);
  }

  void readBlock(BlockIndex index, Bytes out) override;
  void writeBlock(BlockIndex index, ConstBytes in) override;
  u64 blockCount() const override { return m_blocks.size(); }
  BlockIndex growByOneBlock() override;

private:
  u32 m_blockSize;
  u64 m_capacity;
  std::vector<std::vector<std::byte>> m_blocks;
};
