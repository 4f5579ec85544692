#pragma once

#include "aidb/allocator.hpp"

#include <string>
#include <string_view>

// strings too long to sit in a row live in a chain of text blocks:
// [u64 next text block][bytes to the end of the block]
// the length is kept with the row, not in the chain. text blocks are never
// edited once written, a changed string gets a new chain
class TextChains
{
public:
  TextChains(Pager &pager, Allocator &allocator) : m_pager(pager), m_allocator(allocator) {}

  // returns the first block of the new chain
  [[nodiscard]] BlockIndex write(std::string_view text);
  std::string read(BlockIndex start, u64 length);
  void free(BlockIndex start, u64 length);

  // payload bytes per text block
  std::size_t capacity() const noexcept { return m_pager.blockSize() - CHAIN_HEADER_SIZE; }
  u64 blocksFor(u64 length) const noexcept;

private:
  // throws TextChainTruncated for a length no chain in this store could hold
  void checkLength(BlockIndex start, u64 length) const;

  Pager &m_pager;
  Allocator &m_allocator;
};
