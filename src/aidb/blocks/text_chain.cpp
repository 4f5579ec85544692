#include "aidb/blocks/text_chain.hpp"

#include <algorithm>
#include <vector>

u64 TextChains::blocksFor(u64 length) const noexcept
{
  if (length == 0)
  {
    return 1;
  }
  return length / capacity() + (length % capacity() != 0 ? 1 : 0);
}

void TextChains::checkLength(BlockIndex start, u64 length) const
{
  // a chain cannot hold more blocks than the store has
  if (blocksFor(length) > m_pager.size())
  {
    throw TextChainTruncated(start, length, 0);
  }
}

BlockIndex TextChains::write(std::string_view text)
{
  const std::size_t cap = capacity();
  std::vector<BlockIndex> written;

  try
  {
    BlockIndex current = m_allocator.allocate();
    written.push_back(current);
    std::size_t offset = 0;

    while (true)
    {
      const std::size_t n = std::min(cap, text.size() - offset);
      Block block = m_pager.blank();
      writeBytes(block.payload(), 0, text.substr(offset, n));
      offset += n;

      // fill each block to capacity before chaining to the next
      BlockIndex next = NULL_BLOCK;
      if (offset < text.size())
      {
        next = m_allocator.allocate();
        written.push_back(next);
      }
      block.setNext(next);
      m_pager.write(current, block);

      if (next == NULL_BLOCK)
      {
        break;
      }
      current = next;
    }
  }
  catch (const StorageError &)
  {
    // hand back what was taken so a failed write leaks nothing
    for (BlockIndex index : written)
    {
      m_allocator.free(index);
    }
    throw;
  }

  return written.front();
}

std::string TextChains::read(BlockIndex start, u64 length)
{
  checkLength(start, length);

  std::string text;
  text.reserve(length);

  BlockIndex index = start;
  BlockIndex last = start;
  while (text.size() < length)
  {
    if (index == NULL_BLOCK)
    {
      throw TextChainTruncated(last, length, text.size());
    }

    const Block block = m_pager.read(index);
    const std::size_t n = std::min<u64>(capacity(), length - text.size());
    text.append(readBytes(block.payload(), 0, n));

    last = index;
    index = block.next();
  }

  return text;
}

void TextChains::free(BlockIndex start, u64 length)
{
  checkLength(start, length);

  BlockIndex index = start;
  BlockIndex last = start;
  for (u64 i = 0; i < blocksFor(length); i++)
  {
    if (index == NULL_BLOCK)
    {
      throw TextChainTruncated(last, length, i * capacity());
    }

    // read the pointer before the block is overwritten by the free list
    const BlockIndex next = m_pager.read(index).next();
    m_allocator.free(index);
    last = index;
    index = next;
  }
}
