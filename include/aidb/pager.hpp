#pragma once

#include "aidb/backend.hpp"

#include <list>
#include <mutex>
#include <unordered_map>

// counts of block traffic, reset between operations to see what a query touched
struct IoStats
{
  u64 backendReads = 0;
  u64 cacheHits = 0;
  u64 writes = 0;
  u64 allocations = 0;
};

// the block device. every block read or write in the engine goes through here.
// writes go straight to the backend, reads are served from a small LRU cache
class Pager
{
public:
  Pager(StorageBackend &backend, u32 blockSize, u32 cacheBlocks = 64);

  u32 blockSize() const noexcept { return m_blockSize; }
  u64 size() const;

  // a copy of the block, so callers can edit and write it back
  [[nodiscard]] Block read(BlockIndex index);
  void write(BlockIndex index, const Block &block);
  // grow the backend by a zeroed block
  [[nodiscard]] BlockIndex allocateNew();

  Block blank() const { return Block(m_blockSize); }

  IoStats stats() const;
  void resetStats();
  void dropCache();

private:
  void cachePut(BlockIndex index, const Block &block);

  StorageBackend &m_backend;
  u32 m_blockSize;
  u32 m_cacheBlocks;

  // front is most recently used
  std::list<BlockIndex> m_lru;
  std::unordered_map<BlockIndex, std::pair<Block, std::list<BlockIndex>::iterator>> m_cache;
  IoStats m_stats;
  mutable std::mutex m_mutex;
};
