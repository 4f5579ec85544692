#include "aidb/allocator.hpp"

#include <algorithm>

void FreeBlock::format(Block &block, BlockIndex next)
{
  Bytes b = block.bytes();
  std::fill(b.begin(), b.end(), static_cast<std::byte>(0));
  block.setNext(next);
  writeBytes(b, MARKER_OFFSET, std::string_view(MARKER.data(), MARKER.size()));
}

bool FreeBlock::isFree(const Block &block)
{
  return readBytes(block.bytes(), MARKER_OFFSET, MARKER.size()) ==
         std::string_view(MARKER.data(), MARKER.size());
}

void Allocator::load()
{
  m_free.clear();

  const SuperBlock &sb = m_super.current();
  BlockIndex index = sb.freelistHead;
  while (index != NULL_BLOCK)
  {
    if (index >= sb.blockCount)
    {
      throw FreeListCorrupt(index, "free list points past the end of the store");
    }
    if (!m_free.insert(index).second)
    {
      throw FreeListCorrupt(index, "free list has a cycle");
    }

    const Block block = m_pager.read(index);
    if (!FreeBlock::isFree(block))
    {
      throw FreeListCorrupt(index, "block on the free list is not marked free");
    }
    index = block.next();
  }
}

BlockIndex Allocator::allocate()
{
  SuperBlock sb = m_super.current();

  if (sb.freelistHead != NULL_BLOCK)
  {
    const BlockIndex index = sb.freelistHead;
    const Block head = m_pager.read(index);
    if (!FreeBlock::isFree(head))
    {
      throw FreeListCorrupt(index, "expected a free block at the head of the free list");
    }

    // update the head of the linked list
    sb.freelistHead = head.next();
    m_super.commit(sb);
    m_free.erase(index);
    m_pager.write(index, m_pager.blank());
    return index;
  }

  if (m_maxBlocks != 0 && sb.blockCount >= m_maxBlocks)
  {
    std::ostringstream ss;
    ss << "store is at its limit of " << m_maxBlocks << " blocks";
    throw AllocatorExhausted(ss.str());
  }

  // append to the store instead. a backend left longer than the superblock says
  // (a crash after growing) gets its spare blocks reused first
  BlockIndex index = sb.blockCount;
  if (m_pager.size() > sb.blockCount)
  {
    m_pager.write(index, m_pager.blank());
  }
  else
  {
    index = m_pager.allocateNew();
    if (index != sb.blockCount)
    {
      std::ostringstream ss;
      ss << "backend grew to block " << index << ", expected " << sb.blockCount;
      throw IOFailure(index, ss.str());
    }
  }

  sb.blockCount = index + 1;
  m_super.commit(sb);
  return index;
}

void Allocator::free(BlockIndex index)
{
  SuperBlock sb = m_super.current();
  if (index == SUPERBLOCK_INDEX || index >= sb.blockCount)
  {
    throw BlockOutOfRange(index, sb.blockCount);
  }
  if (isFree(index))
  {
    throw DoubleFree(index);
  }

  Block block = m_pager.blank();
  FreeBlock::format(block, sb.freelistHead);
  m_pager.write(index, block);

  sb.freelistHead = index;
  m_super.commit(sb);
  m_free.insert(index);
}
