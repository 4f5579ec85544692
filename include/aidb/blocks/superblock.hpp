#pragma once

#include "aidb/pager.hpp"
#include "aidb/options.hpp"

#include <istream>
#include <optional>

const std::array<char, 4> SUPERBLOCK_MAGIC = {'a', 'i', 'd', 'b'};
const u32 FORMAT_VERSION = 1;

// the header for the store, always block 0.
// everything else in the store is reachable from the two root pointers
struct SuperBlock
{
  static constexpr std::size_t MAGIC_OFFSET = 0;
  static constexpr std::size_t VERSION_OFFSET = 4;
  static constexpr std::size_t BLOCK_SIZE_OFFSET = 8;
  static constexpr std::size_t BLOCK_COUNT_OFFSET = 16;
  static constexpr std::size_t SCHEMA_OFFSET = 24;
  static constexpr std::size_t FREELIST_OFFSET = 32;
  static constexpr std::size_t JOURNAL_OFFSET = 40;
  static constexpr std::size_t ENCODED_SIZE = 48;

  u32 version = FORMAT_VERSION;
  u64 blockSize = DEFAULT_BLOCK_SIZE;
  u64 blockCount = 1;
  BlockIndex schemaBlock = NULL_BLOCK;   // when 0 there are no tables
  BlockIndex freelistHead = NULL_BLOCK;  // when 0 no free blocks, the store must grow
  BlockIndex journalBlock = NULL_BLOCK;  // reserved for the write-ahead journal

  void encode(Block &block) const;
  static SuperBlock decode(const Block &block);

  // read the block size out of a stream holding a store, without knowing it up front
  static std::optional<u32> peekBlockSize(std::istream &in);

  friend bool operator==(const SuperBlock &, const SuperBlock &) = default;
};

// owns block 0. the in memory copy is always what was last committed
class SuperBlockManager
{
public:
  explicit SuperBlockManager(Pager &pager) : m_pager(pager) {}

  // write a fresh superblock to an empty store
  SuperBlock format();
  SuperBlock load();
  // rewrite block 0 with every field in one block write
  void commit(const SuperBlock &sb);

  const SuperBlock &current() const noexcept { return m_current; }

private:
  Pager &m_pager;
  SuperBlock m_current;
};
