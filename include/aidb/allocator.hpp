#pragma once

#include "aidb/blocks/superblock.hpp"

#include <unordered_set>

// the free blocks are kept as a linked list with the head stored in the `SuperBlock`
struct FreeBlock
{
  static constexpr std::size_t MARKER_OFFSET = CHAIN_HEADER_SIZE;
  static constexpr std::array<char, 8> MARKER = {'a', 'i', 'd', 'b', 'f', 'r', 'e', 'e'};

  static void format(Block &block, BlockIndex next);
  static bool isFree(const Block &block);
};

// hands out blocks, reusing freed ones before growing the store.
// the set of free blocks is the in-use tag: it is rebuilt from disk by `load` and
// catches a block being freed twice
class Allocator
{
public:
  Allocator(Pager &pager, SuperBlockManager &super, u64 maxBlocks = 0)
      : m_pager(pager), m_super(super), m_maxBlocks(maxBlocks)
  {
  }

  // walk the free list of the loaded superblock
  void load();

  // returns a zeroed block that nothing else is using
  [[nodiscard]] BlockIndex allocate();
  void free(BlockIndex index);

  bool isFree(BlockIndex index) const { return m_free.count(index) != 0; }
  u64 freeCount() const noexcept { return m_free.size(); }

private:
  Pager &m_pager;
  SuperBlockManager &m_super;
  u64 m_maxBlocks;
  std::unordered_set<BlockIndex> m_free;
};
