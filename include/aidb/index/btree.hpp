#pragma once

#include "aidb/allocator.hpp"
#include "aidb/index/index_entry.hpp"

#include <optional>
#include <vector>

/* B+Tree over blocks. Nodes refer to each other by block index only.
 *
 * meta:     u8 tag, u8 pad, u16 leaf capacity, u16 internal capacity, u16 pad,
 *           u64 root, u64 height, u64 entry count
 * internal: u8 tag, u8 pad, u16 key count, u32 pad, u64 child0, then (i64 key, u64 child) pairs.
 *           keys in child i are within [key i-1, key i]
 * leaf:     u8 tag, u8 pad, u16 count, u32 pad, u64 prev leaf, u64 next leaf, then entries sorted
 *           by key, equal keys in the order they were inserted
 *
 * the meta block never moves, so it is what identifies the tree. node capacities are
 * chosen when the tree is created and kept in the meta block */
struct BTreeNode
{
  static constexpr std::size_t COUNT_OFFSET = 2;
  static constexpr std::size_t INTERNAL_CHILD0_OFFSET = 8;
  static constexpr std::size_t INTERNAL_HEADER_SIZE = 16;
  static constexpr std::size_t INTERNAL_PAIR_SIZE = 16;
  static constexpr std::size_t LEAF_PREV_OFFSET = 8;
  static constexpr std::size_t LEAF_NEXT_OFFSET = 16;
  static constexpr std::size_t LEAF_HEADER_SIZE = 24;

  BlockIndex index = NULL_BLOCK;
  bool leaf = true;

  // internal nodes
  std::vector<i64> keys;
  std::vector<BlockIndex> children;

  // leaves
  std::vector<IndexEntry> entries;
  BlockIndex prev = NULL_BLOCK;
  BlockIndex next = NULL_BLOCK;

  void encode(Block &block) const;
  static BTreeNode decode(BlockIndex index, const Block &block);

  static std::size_t maxLeafEntries(u32 blockSize) noexcept;
  static std::size_t maxInternalKeys(u32 blockSize) noexcept;
};

class BTreeCursor;

class BTree
{
public:
  // an empty tree: a meta block and a root leaf.
  // a capacity of 0 fills the block, anything above that is clamped to it
  [[nodiscard]] static BlockIndex create(Pager &pager, Allocator &allocator, u16 leafCapacity = 0,
                                         u16 internalCapacity = 0);

  BTree(Pager &pager, Allocator &allocator, BlockIndex meta);

  void insert(i64 key, RowPointer row);
  // the first inserted entry for key
  std::optional<RowPointer> search(i64 key);
  std::vector<RowPointer> searchAll(i64 key);
  // removes the first inserted entry for key
  bool remove(i64 key);
  bool remove(i64 key, RowPointer row);
  BTreeCursor range(Bound low, Bound high);

  u64 size();
  u64 height();
  std::size_t leafCapacity() const noexcept { return m_leafCapacity; }
  std::size_t internalCapacity() const noexcept { return m_internalCapacity; }

  // free every block of the tree, meta included
  void destroy();
  // walk the whole tree and throw IndexCorrupt on the first broken invariant
  void check();

private:
  friend class BTreeCursor;

  static constexpr std::size_t META_LEAF_CAPACITY_OFFSET = 2;
  static constexpr std::size_t META_INTERNAL_CAPACITY_OFFSET = 4;
  static constexpr std::size_t META_ROOT_OFFSET = 8;
  static constexpr std::size_t META_HEIGHT_OFFSET = 16;
  static constexpr std::size_t META_COUNT_OFFSET = 24;

  struct Meta
  {
    BlockIndex root;
    u64 height;
    u64 count;
  };

  struct PathStep
  {
    BlockIndex node;
    std::size_t child;
  };
  using Path = std::vector<PathStep>;

  Meta loadMeta();
  void storeMeta(const Meta &meta);
  BTreeNode load(BlockIndex index);
  void store(const BTreeNode &node);

  // the leftmost leaf that can hold key, with the internal nodes on the way
  BTreeNode descend(const Meta &meta, i64 key, bool rightmost, Path &path);
  BTreeNode descendLeftmost(BlockIndex from, Path &path);
  // move to the leaf after the current one, keeping the path in step
  std::optional<BTreeNode> nextLeaf(const BTreeNode &leaf, Path &path);

  // every block a split of the leaf at the end of path can need, taken before
  // anything is written so running out of space leaves the tree as it was
  std::vector<BlockIndex> reserveSplits(const Path &path);
  void insertIntoParent(Meta &meta, Path &path, std::vector<BlockIndex> &spare, BlockIndex left, i64 separator,
                        BlockIndex right);
  bool removeWhere(i64 key, const std::optional<RowPointer> &row);
  void rebalanceLeaf(Meta &meta, Path &path, BTreeNode &leaf);
  void rebalanceInternal(Meta &meta, Path &path, BTreeNode &node);

  std::size_t leafMin() const noexcept { return m_leafCapacity / 2; }
  std::size_t internalMin() const noexcept { return m_internalCapacity / 2; }

  u64 checkNode(BlockIndex index, u64 depth, const Meta &meta, std::optional<i64> low, std::optional<i64> high,
                std::vector<BlockIndex> &leaves);

  Pager &m_pager;
  Allocator &m_allocator;
  BlockIndex m_meta;
  std::size_t m_leafCapacity;
  std::size_t m_internalCapacity;
};

// walks the leaves of a key range, one leaf in memory at a time.
// the tree must not change while a cursor is in use
class BTreeCursor
{
public:
  BTreeCursor(const BTree &tree, Bound low, Bound high) : m_tree(tree), m_low(low), m_high(high) {}

  std::optional<IndexEntry> next();
  // go back to the start of the range
  void restart() noexcept;

private:
  BTree m_tree;
  Bound m_low;
  Bound m_high;
  bool m_started = false;
  bool m_done = false;
  BTreeNode m_leaf;
  std::size_t m_pos = 0;
};
