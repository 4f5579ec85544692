#pragma once

#include "aidb/allocator.hpp"
#include "aidb/index/index_entry.hpp"

#include <optional>
#include <vector>

/* static hash index. 2^bits buckets, each a chain of blocks.
 *
 * directory: u8 tag, u8 bucket bits, u16 pad, u32 pad, u64 next directory block, u64 entry count,
 *            then u64 bucket heads (0 = bucket not created yet). only the first directory
 *            block's entry count is used
 * bucket:    u8 tag, u8 pad, u16 count, u32 pad, u64 overflow block, then entries
 *
 * overflow blocks carry their own tag but are laid out like the bucket they extend */
struct HashBucket
{
  static constexpr std::size_t COUNT_OFFSET = 2;
  static constexpr std::size_t OVERFLOW_OFFSET = 8;
  static constexpr std::size_t HEADER_SIZE = 16;

  BlockIndex index = NULL_BLOCK;
  bool overflow = false;
  BlockIndex next = NULL_BLOCK;
  std::vector<IndexEntry> entries;

  void encode(Block &block) const;
  static HashBucket decode(BlockIndex index, const Block &block);

  static std::size_t capacity(u32 blockSize) noexcept;
};

class HashIndex
{
public:
  static constexpr u8 MAX_BUCKET_BITS = 20;

  static constexpr std::size_t DIR_BITS_OFFSET = 1;
  static constexpr std::size_t DIR_NEXT_OFFSET = 8;
  static constexpr std::size_t DIR_COUNT_OFFSET = 16;
  static constexpr std::size_t DIR_HEADER_SIZE = 24;

  // the directory, with every bucket still unallocated
  [[nodiscard]] static BlockIndex create(Pager &pager, Allocator &allocator, u8 bucketBits);

  HashIndex(Pager &pager, Allocator &allocator, BlockIndex directory);

  void insert(i64 key, RowPointer row);
  // the first entry for key in its bucket chain
  std::optional<RowPointer> search(i64 key);
  std::vector<RowPointer> searchAll(i64 key);
  bool remove(i64 key);
  bool remove(i64 key, RowPointer row);

  u64 size();
  u8 bucketBits() const noexcept { return m_bits; }
  u64 bucketCount() const noexcept { return u64(1) << m_bits; }
  u64 bucketOf(i64 key) const noexcept;

  void destroy();
  // every entry hashes to the bucket it is in and the count matches
  void check();

  static u64 hash(i64 key) noexcept;

private:
  struct Slot
  {
    BlockIndex directory;
    std::size_t offset;
  };

  std::size_t headsPerDirectory() const noexcept;
  std::vector<BlockIndex> directoryBlocks();
  Slot slotOf(u64 bucket);
  BlockIndex head(u64 bucket);
  // every bucket head, reading each directory block once
  std::vector<BlockIndex> heads();
  void setHead(u64 bucket, BlockIndex block);
  void addToCount(i64 delta);

  HashBucket load(BlockIndex index);
  void store(const HashBucket &bucket);

  bool removeWhere(i64 key, const std::optional<RowPointer> &row);

  Pager &m_pager;
  Allocator &m_allocator;
  BlockIndex m_directory;
  u8 m_bits;
  std::vector<BlockIndex> m_chain;
};
