#include "aidb/index/btree.hpp"

#include <algorithm>

namespace
{

std::string tagName(IndexTag tag)
{
  std::ostringstream ss;
  ss << "tag " << static_cast<int>(tag);
  return ss.str();
}

// smallest node sizes that still let splits and merges work
const std::size_t MIN_LEAF_CAPACITY = 2;
const std::size_t MIN_INTERNAL_CAPACITY = 3;

std::size_t clampCapacity(std::size_t requested, std::size_t fits, std::size_t minimum)
{
  if (requested == 0 || requested > fits)
  {
    return fits;
  }
  return std::max(requested, minimum);
}

} // namespace

std::size_t BTreeNode::maxLeafEntries(u32 blockSize) noexcept
{
  return (blockSize - LEAF_HEADER_SIZE) / IndexEntry::ENCODED_SIZE;
}

std::size_t BTreeNode::maxInternalKeys(u32 blockSize) noexcept
{
  return (blockSize - INTERNAL_HEADER_SIZE) / INTERNAL_PAIR_SIZE;
}

void BTreeNode::encode(Block &block) const
{
  std::fill(block.buf.begin(), block.buf.end(), static_cast<std::byte>(0));
  Bytes b = block.bytes();

  if (leaf)
  {
    writeLEu8(b, 0, static_cast<u8>(IndexTag::BTreeLeaf));
    writeLEu16(b, COUNT_OFFSET, static_cast<u16>(entries.size()));
    writeLEu64(b, LEAF_PREV_OFFSET, prev);
    writeLEu64(b, LEAF_NEXT_OFFSET, next);
    for (std::size_t i = 0; i < entries.size(); i++)
    {
      entries[i].encode(b, LEAF_HEADER_SIZE + i * IndexEntry::ENCODED_SIZE);
    }
    return;
  }

  writeLEu8(b, 0, static_cast<u8>(IndexTag::BTreeInternal));
  writeLEu16(b, COUNT_OFFSET, static_cast<u16>(keys.size()));
  writeLEu64(b, INTERNAL_CHILD0_OFFSET, children.front());
  for (std::size_t i = 0; i < keys.size(); i++)
  {
    const std::size_t at = INTERNAL_HEADER_SIZE + i * INTERNAL_PAIR_SIZE;
    writeLEi64(b, at, keys[i]);
    writeLEu64(b, at + 8, children[i + 1]);
  }
}

BTreeNode BTreeNode::decode(BlockIndex index, const Block &block)
{
  const ConstBytes b = block.bytes();
  const u32 blockSize = static_cast<u32>(block.size());

  BTreeNode node;
  node.index = index;

  const IndexTag tag = readIndexTag(b);
  const u16 count = readLEu16(b, COUNT_OFFSET);

  if (tag == IndexTag::BTreeLeaf)
  {
    if (count > maxLeafEntries(blockSize))
    {
      throw IndexCorrupt(index, "leaf claims " + std::to_string(count) + " entries");
    }
    node.leaf = true;
    node.prev = readLEu64(b, LEAF_PREV_OFFSET);
    node.next = readLEu64(b, LEAF_NEXT_OFFSET);
    node.entries.reserve(count);
    for (u16 i = 0; i < count; i++)
    {
      node.entries.push_back(IndexEntry::decode(b, LEAF_HEADER_SIZE + i * IndexEntry::ENCODED_SIZE));
      if (i > 0 && node.entries[i - 1].key > node.entries[i].key)
      {
        throw IndexCorrupt(index, "leaf keys out of order");
      }
    }
    return node;
  }

  if (tag != IndexTag::BTreeInternal)
  {
    throw IndexCorrupt(index, "expected a B+Tree node, found " + tagName(tag));
  }
  if (count == 0 || count > maxInternalKeys(blockSize))
  {
    throw IndexCorrupt(index, "internal node claims " + std::to_string(count) + " keys");
  }

  node.leaf = false;
  node.children.reserve(count + 1);
  node.keys.reserve(count);
  node.children.push_back(readLEu64(b, INTERNAL_CHILD0_OFFSET));
  for (u16 i = 0; i < count; i++)
  {
    const std::size_t at = INTERNAL_HEADER_SIZE + i * INTERNAL_PAIR_SIZE;
    node.keys.push_back(readLEi64(b, at));
    node.children.push_back(readLEu64(b, at + 8));
    if (i > 0 && node.keys[i - 1] > node.keys[i])
    {
      throw IndexCorrupt(index, "internal keys out of order");
    }
  }
  for (BlockIndex child : node.children)
  {
    if (child == NULL_BLOCK)
    {
      throw IndexCorrupt(index, "internal node has a null child");
    }
  }
  return node;
}

BlockIndex BTree::create(Pager &pager, Allocator &allocator, u16 leafCapacity, u16 internalCapacity)
{
  const u32 bs = pager.blockSize();
  const std::size_t leafCap = clampCapacity(leafCapacity, BTreeNode::maxLeafEntries(bs), MIN_LEAF_CAPACITY);
  const std::size_t internalCap =
      clampCapacity(internalCapacity, BTreeNode::maxInternalKeys(bs), MIN_INTERNAL_CAPACITY);

  const BlockIndex meta = allocator.allocate();
  BlockIndex root = NULL_BLOCK;
  try
  {
    root = allocator.allocate();

    BTreeNode leaf;
    leaf.index = root;
    Block block = pager.blank();
    leaf.encode(block);
    pager.write(root, block);

    Block m = pager.blank();
    writeLEu8(m.bytes(), 0, static_cast<u8>(IndexTag::BTreeMeta));
    writeLEu16(m.bytes(), META_LEAF_CAPACITY_OFFSET, static_cast<u16>(leafCap));
    writeLEu16(m.bytes(), META_INTERNAL_CAPACITY_OFFSET, static_cast<u16>(internalCap));
    writeLEu64(m.bytes(), META_ROOT_OFFSET, root);
    writeLEu64(m.bytes(), META_HEIGHT_OFFSET, 1);
    writeLEu64(m.bytes(), META_COUNT_OFFSET, 0);
    pager.write(meta, m);
  }
  catch (const StorageError &)
  {
    if (root != NULL_BLOCK)
    {
      allocator.free(root);
    }
    allocator.free(meta);
    throw;
  }
  return meta;
}

BTree::BTree(Pager &pager, Allocator &allocator, BlockIndex meta)
    : m_pager(pager), m_allocator(allocator), m_meta(meta)
{
  const Block block = m_pager.read(m_meta);
  if (readIndexTag(block.bytes()) != IndexTag::BTreeMeta)
  {
    throw IndexCorrupt(m_meta, "expected a B+Tree meta block, found " + tagName(readIndexTag(block.bytes())));
  }

  const u32 bs = m_pager.blockSize();
  m_leafCapacity = readLEu16(block.bytes(), META_LEAF_CAPACITY_OFFSET);
  m_internalCapacity = readLEu16(block.bytes(), META_INTERNAL_CAPACITY_OFFSET);
  if (m_leafCapacity < MIN_LEAF_CAPACITY || m_leafCapacity > BTreeNode::maxLeafEntries(bs) ||
      m_internalCapacity < MIN_INTERNAL_CAPACITY || m_internalCapacity > BTreeNode::maxInternalKeys(bs))
  {
    throw IndexCorrupt(m_meta, "node capacities do not fit the block size");
  }
}

BTree::Meta BTree::loadMeta()
{
  const Block block = m_pager.read(m_meta);
  if (readIndexTag(block.bytes()) != IndexTag::BTreeMeta)
  {
    throw IndexCorrupt(m_meta, "expected a B+Tree meta block, found " + tagName(readIndexTag(block.bytes())));
  }

  Meta meta{readLEu64(block.bytes(), META_ROOT_OFFSET), readLEu64(block.bytes(), META_HEIGHT_OFFSET),
            readLEu64(block.bytes(), META_COUNT_OFFSET)};
  if (meta.root == NULL_BLOCK || meta.height == 0)
  {
    throw IndexCorrupt(m_meta, "meta block has no root");
  }
  return meta;
}

void BTree::storeMeta(const Meta &meta)
{
  Block block = m_pager.read(m_meta);
  writeLEu64(block.bytes(), META_ROOT_OFFSET, meta.root);
  writeLEu64(block.bytes(), META_HEIGHT_OFFSET, meta.height);
  writeLEu64(block.bytes(), META_COUNT_OFFSET, meta.count);
  m_pager.write(m_meta, block);
}

BTreeNode BTree::load(BlockIndex index)
{
  if (index == NULL_BLOCK || index >= m_pager.size())
  {
    throw IndexCorrupt(index, "B+Tree points outside the store");
  }
  return BTreeNode::decode(index, m_pager.read(index));
}

void BTree::store(const BTreeNode &node)
{
  Block block = m_pager.blank();
  node.encode(block);
  m_pager.write(node.index, block);
}

BTreeNode BTree::descend(const Meta &meta, i64 key, bool rightmost, Path &path)
{
  BTreeNode node = load(meta.root);
  while (!node.leaf)
  {
    if (path.size() + 1 >= meta.height)
    {
      throw IndexCorrupt(node.index, "B+Tree is deeper than its height");
    }
    // equal keys sit right of their separator, inserts go after them
    const auto it = rightmost ? std::upper_bound(node.keys.begin(), node.keys.end(), key)
                              : std::lower_bound(node.keys.begin(), node.keys.end(), key);
    const std::size_t child = static_cast<std::size_t>(it - node.keys.begin());
    path.push_back(PathStep{node.index, child});
    node = load(node.children[child]);
  }
  return node;
}

BTreeNode BTree::descendLeftmost(BlockIndex from, Path &path)
{
  BTreeNode node = load(from);
  while (!node.leaf)
  {
    if (path.size() > m_pager.size())
    {
      throw IndexCorrupt(node.index, "B+Tree has a cycle");
    }
    path.push_back(PathStep{node.index, 0});
    node = load(node.children.front());
  }
  return node;
}

std::optional<BTreeNode> BTree::nextLeaf(const BTreeNode &leaf, Path &path)
{
  if (leaf.next == NULL_BLOCK)
  {
    return std::nullopt;
  }

  while (!path.empty())
  {
    const PathStep step = path.back();
    const BTreeNode parent = load(step.node);
    if (step.child + 1 < parent.children.size())
    {
      path.back().child = step.child + 1;
      BTreeNode next = descendLeftmost(parent.children[step.child + 1], path);
      if (next.index != leaf.next)
      {
        throw IndexCorrupt(leaf.index, "leaf chain disagrees with the tree");
      }
      return next;
    }
    path.pop_back();
  }
  throw IndexCorrupt(leaf.index, "leaf chain runs past the last leaf");
}

void BTree::insert(i64 key, RowPointer row)
{
  Meta meta = loadMeta();
  Path path;
  BTreeNode leaf = descend(meta, key, true, path);

  const auto pos = std::upper_bound(leaf.entries.begin(), leaf.entries.end(), key,
                                    [](i64 k, const IndexEntry &e) { return k < e.key; });
  leaf.entries.insert(pos, IndexEntry{key, row});
  meta.count++;

  if (leaf.entries.size() <= m_leafCapacity)
  {
    store(leaf);
    storeMeta(meta);
    return;
  }

  std::vector<BlockIndex> spare = reserveSplits(path);
  BTreeNode right;
  right.index = spare.back();
  spare.pop_back();
  right.leaf = true;
  const std::size_t mid = leaf.entries.size() / 2;
  right.entries.assign(leaf.entries.begin() + mid, leaf.entries.end());
  leaf.entries.resize(mid);

  right.prev = leaf.index;
  right.next = leaf.next;
  if (leaf.next != NULL_BLOCK)
  {
    BTreeNode after = load(leaf.next);
    after.prev = right.index;
    store(after);
  }
  leaf.next = right.index;

  store(right);
  store(leaf);
  insertIntoParent(meta, path, spare, leaf.index, right.entries.front().key, right.index);
  storeMeta(meta);
}

std::vector<BlockIndex> BTree::reserveSplits(const Path &path)
{
  // the leaf, each full ancestor, and a new root when they are all full
  std::size_t needed = 1;
  bool rootSplits = true;
  for (auto step = path.rbegin(); step != path.rend(); ++step)
  {
    if (load(step->node).keys.size() < m_internalCapacity)
    {
      rootSplits = false;
      break;
    }
    needed++;
  }
  if (rootSplits)
  {
    needed++;
  }

  std::vector<BlockIndex> spare;
  try
  {
    while (spare.size() < needed)
    {
      spare.push_back(m_allocator.allocate());
    }
  }
  catch (const StorageError &)
  {
    for (BlockIndex index : spare)
    {
      m_allocator.free(index);
    }
    throw;
  }
  return spare;
}

void BTree::insertIntoParent(Meta &meta, Path &path, std::vector<BlockIndex> &spare, BlockIndex left, i64 separator,
                             BlockIndex right)
{
  if (path.empty())
  {
    BTreeNode root;
    root.index = spare.back();
    spare.pop_back();
    root.leaf = false;
    root.keys = {separator};
    root.children = {left, right};
    store(root);
    meta.root = root.index;
    meta.height++;
    return;
  }

  const PathStep step = path.back();
  path.pop_back();
  BTreeNode parent = load(step.node);
  parent.keys.insert(parent.keys.begin() + step.child, separator);
  parent.children.insert(parent.children.begin() + step.child + 1, right);

  if (parent.keys.size() <= m_internalCapacity)
  {
    store(parent);
    return;
  }

  // the middle key moves up and lives in neither half
  const std::size_t mid = parent.keys.size() / 2;
  const i64 promoted = parent.keys[mid];

  BTreeNode sibling;
  sibling.index = spare.back();
  spare.pop_back();
  sibling.leaf = false;
  sibling.keys.assign(parent.keys.begin() + mid + 1, parent.keys.end());
  sibling.children.assign(parent.children.begin() + mid + 1, parent.children.end());
  parent.keys.resize(mid);
  parent.children.resize(mid + 1);

  store(sibling);
  store(parent);
  insertIntoParent(meta, path, spare, parent.index, promoted, sibling.index);
}

std::optional<RowPointer> BTree::search(i64 key)
{
  const Meta meta = loadMeta();
  Path path;
  BTreeNode leaf = descend(meta, key, false, path);

  // duplicates may start in the leaf after the one the separators lead to
  while (true)
  {
    const auto it = std::lower_bound(leaf.entries.begin(), leaf.entries.end(), key,
                                     [](const IndexEntry &e, i64 k) { return e.key < k; });
    if (it != leaf.entries.end())
    {
      if (it->key == key)
      {
        return it->row;
      }
      return std::nullopt;
    }
    if (leaf.next == NULL_BLOCK)
    {
      return std::nullopt;
    }
    leaf = load(leaf.next);
  }
}

std::vector<RowPointer> BTree::searchAll(i64 key)
{
  std::vector<RowPointer> rows;
  BTreeCursor cursor = range(Bound::included(key), Bound::included(key));
  while (std::optional<IndexEntry> e = cursor.next())
  {
    rows.push_back(e->row);
  }
  return rows;
}

bool BTree::remove(i64 key)
{
  return removeWhere(key, std::nullopt);
}

bool BTree::remove(i64 key, RowPointer row)
{
  return removeWhere(key, row);
}

bool BTree::removeWhere(i64 key, const std::optional<RowPointer> &row)
{
  Meta meta = loadMeta();
  Path path;
  BTreeNode leaf = descend(meta, key, false, path);

  std::size_t pos = static_cast<std::size_t>(
      std::lower_bound(leaf.entries.begin(), leaf.entries.end(), key,
                       [](const IndexEntry &e, i64 k) { return e.key < k; }) -
      leaf.entries.begin());

  while (true)
  {
    for (; pos < leaf.entries.size(); pos++)
    {
      const IndexEntry &e = leaf.entries[pos];
      if (e.key != key)
      {
        return false;
      }
      if (!row.has_value() || e.row == *row)
      {
        leaf.entries.erase(leaf.entries.begin() + static_cast<std::ptrdiff_t>(pos));
        meta.count--;

        if (path.empty() || leaf.entries.size() >= leafMin())
        {
          store(leaf);
        }
        else
        {
          rebalanceLeaf(meta, path, leaf);
        }
        storeMeta(meta);
        return true;
      }
    }

    std::optional<BTreeNode> next = nextLeaf(leaf, path);
    if (!next.has_value())
    {
      return false;
    }
    leaf = std::move(*next);
    pos = 0;
  }
}

void BTree::rebalanceLeaf(Meta &meta, Path &path, BTreeNode &leaf)
{
  BTreeNode parent = load(path.back().node);
  const std::size_t i = path.back().child;

  std::optional<BTreeNode> left;
  if (i > 0)
  {
    left = load(parent.children[i - 1]);
    if (left->entries.size() > leafMin())
    {
      leaf.entries.insert(leaf.entries.begin(), left->entries.back());
      left->entries.pop_back();
      parent.keys[i - 1] = leaf.entries.front().key;
      store(*left);
      store(leaf);
      store(parent);
      return;
    }
  }

  std::optional<BTreeNode> right;
  if (i + 1 < parent.children.size())
  {
    right = load(parent.children[i + 1]);
    if (right->entries.size() > leafMin())
    {
      leaf.entries.push_back(right->entries.front());
      right->entries.erase(right->entries.begin());
      parent.keys[i] = right->entries.front().key;
      store(*right);
      store(leaf);
      store(parent);
      return;
    }
  }

  // neither sibling can spare an entry, so two leaves become one
  BTreeNode *keep;
  BTreeNode *gone;
  std::size_t separator;
  if (left.has_value())
  {
    keep = &*left;
    gone = &leaf;
    separator = i - 1;
  }
  else
  {
    keep = &leaf;
    gone = &*right;
    separator = i;
  }

  keep->entries.insert(keep->entries.end(), gone->entries.begin(), gone->entries.end());
  keep->next = gone->next;
  if (gone->next != NULL_BLOCK)
  {
    BTreeNode after = load(gone->next);
    after.prev = keep->index;
    store(after);
  }
  parent.keys.erase(parent.keys.begin() + static_cast<std::ptrdiff_t>(separator));
  parent.children.erase(parent.children.begin() + static_cast<std::ptrdiff_t>(separator) + 1);

  store(*keep);
  m_allocator.free(gone->index);

  path.pop_back();
  rebalanceInternal(meta, path, parent);
}

void BTree::rebalanceInternal(Meta &meta, Path &path, BTreeNode &node)
{
  if (path.empty())
  {
    // a root left with one child hands the root over to it
    if (node.keys.empty())
    {
      meta.root = node.children.front();
      meta.height--;
      m_allocator.free(node.index);
    }
    else
    {
      store(node);
    }
    return;
  }

  if (node.keys.size() >= internalMin())
  {
    store(node);
    return;
  }

  BTreeNode parent = load(path.back().node);
  const std::size_t i = path.back().child;

  std::optional<BTreeNode> left;
  if (i > 0)
  {
    left = load(parent.children[i - 1]);
    if (left->keys.size() > internalMin())
    {
      // rotate through the parent
      node.keys.insert(node.keys.begin(), parent.keys[i - 1]);
      node.children.insert(node.children.begin(), left->children.back());
      parent.keys[i - 1] = left->keys.back();
      left->keys.pop_back();
      left->children.pop_back();
      store(*left);
      store(node);
      store(parent);
      return;
    }
  }

  std::optional<BTreeNode> right;
  if (i + 1 < parent.children.size())
  {
    right = load(parent.children[i + 1]);
    if (right->keys.size() > internalMin())
    {
      node.keys.push_back(parent.keys[i]);
      node.children.push_back(right->children.front());
      parent.keys[i] = right->keys.front();
      right->keys.erase(right->keys.begin());
      right->children.erase(right->children.begin());
      store(*right);
      store(node);
      store(parent);
      return;
    }
  }

  // the separator comes down between the two halves
  BTreeNode *keep;
  BTreeNode *gone;
  std::size_t separator;
  if (left.has_value())
  {
    keep = &*left;
    gone = &node;
    separator = i - 1;
  }
  else
  {
    keep = &node;
    gone = &*right;
    separator = i;
  }

  keep->keys.push_back(parent.keys[separator]);
  keep->keys.insert(keep->keys.end(), gone->keys.begin(), gone->keys.end());
  keep->children.insert(keep->children.end(), gone->children.begin(), gone->children.end());
  parent.keys.erase(parent.keys.begin() + static_cast<std::ptrdiff_t>(separator));
  parent.children.erase(parent.children.begin() + static_cast<std::ptrdiff_t>(separator) + 1);

  store(*keep);
  m_allocator.free(gone->index);

  path.pop_back();
  rebalanceInternal(meta, path, parent);
}

BTreeCursor BTree::range(Bound low, Bound high)
{
  return BTreeCursor(*this, low, high);
}

u64 BTree::size()
{
  return loadMeta().count;
}

u64 BTree::height()
{
  return loadMeta().height;
}

void BTree::destroy()
{
  const Meta meta = loadMeta();

  std::vector<BlockIndex> pending = {meta.root};
  std::vector<BlockIndex> nodes;
  while (!pending.empty())
  {
    const BlockIndex index = pending.back();
    pending.pop_back();
    if (nodes.size() > m_pager.size())
    {
      throw IndexCorrupt(index, "B+Tree has a cycle");
    }
    const BTreeNode node = load(index);
    nodes.push_back(index);
    if (!node.leaf)
    {
      pending.insert(pending.end(), node.children.begin(), node.children.end());
    }
  }

  // every node is read before any is freed, so a corrupt tree frees nothing
  for (BlockIndex index : nodes)
  {
    m_allocator.free(index);
  }
  m_allocator.free(m_meta);
}

u64 BTree::checkNode(BlockIndex index, u64 depth, const Meta &meta, std::optional<i64> low,
                     std::optional<i64> high, std::vector<BlockIndex> &leaves)
{
  if (depth > meta.height)
  {
    throw IndexCorrupt(index, "B+Tree is deeper than its height");
  }

  const BTreeNode node = load(index);
  const bool isRoot = index == meta.root;

  auto inBounds = [&](i64 key) {
    return (!low.has_value() || key >= *low) && (!high.has_value() || key <= *high);
  };

  if (node.leaf)
  {
    if (depth != meta.height)
    {
      throw IndexCorrupt(index, "leaf at depth " + std::to_string(depth) + " in a tree of height " +
                                    std::to_string(meta.height));
    }
    if (!isRoot && node.entries.size() < leafMin())
    {
      throw IndexCorrupt(index, "leaf is underfull");
    }
    if (node.entries.size() > m_leafCapacity)
    {
      throw IndexCorrupt(index, "leaf is overfull");
    }
    for (const IndexEntry &e : node.entries)
    {
      if (!inBounds(e.key))
      {
        throw IndexCorrupt(index, "leaf key " + std::to_string(e.key) + " outside its separators");
      }
    }
    leaves.push_back(index);
    return node.entries.size();
  }

  if (!isRoot && node.keys.size() < internalMin())
  {
    throw IndexCorrupt(index, "internal node is underfull");
  }
  if (node.keys.size() > m_internalCapacity)
  {
    throw IndexCorrupt(index, "internal node is overfull");
  }
  for (i64 key : node.keys)
  {
    if (!inBounds(key))
    {
      throw IndexCorrupt(index, "separator " + std::to_string(key) + " outside its parent's range");
    }
  }

  u64 total = 0;
  for (std::size_t c = 0; c < node.children.size(); c++)
  {
    const std::optional<i64> childLow = c == 0 ? low : std::optional<i64>(node.keys[c - 1]);
    const std::optional<i64> childHigh = c == node.keys.size() ? high : std::optional<i64>(node.keys[c]);
    total += checkNode(node.children[c], depth + 1, meta, childLow, childHigh, leaves);
  }
  return total;
}

void BTree::check()
{
  const Meta meta = loadMeta();

  std::vector<BlockIndex> leaves;
  const u64 total = checkNode(meta.root, 1, meta, std::nullopt, std::nullopt, leaves);
  if (total != meta.count)
  {
    std::ostringstream ss;
    ss << "meta block counts " << meta.count << " entries, leaves hold " << total;
    throw IndexCorrupt(m_meta, ss.str());
  }

  for (std::size_t i = 0; i < leaves.size(); i++)
  {
    const BTreeNode leaf = load(leaves[i]);
    const BlockIndex prev = i == 0 ? NULL_BLOCK : leaves[i - 1];
    const BlockIndex next = i + 1 == leaves.size() ? NULL_BLOCK : leaves[i + 1];
    if (leaf.prev != prev || leaf.next != next)
    {
      throw IndexCorrupt(leaf.index, "leaf siblings do not match the tree order");
    }
  }
}

std::optional<IndexEntry> BTreeCursor::next()
{
  if (m_done)
  {
    return std::nullopt;
  }

  if (!m_started)
  {
    const BTree::Meta meta = m_tree.loadMeta();
    BTree::Path path;
    if (m_low.kind == Bound::Unbounded)
    {
      m_leaf = m_tree.descendLeftmost(meta.root, path);
      m_pos = 0;
    }
    else
    {
      m_leaf = m_tree.descend(meta, m_low.key, false, path);
      m_pos = static_cast<std::size_t>(
          std::lower_bound(m_leaf.entries.begin(), m_leaf.entries.end(), m_low.key,
                           [](const IndexEntry &e, i64 k) { return e.key < k; }) -
          m_leaf.entries.begin());
    }
    m_started = true;
  }

  while (true)
  {
    while (m_pos >= m_leaf.entries.size())
    {
      if (m_leaf.next == NULL_BLOCK)
      {
        m_done = true;
        return std::nullopt;
      }
      m_leaf = m_tree.load(m_leaf.next);
      m_pos = 0;
    }

    const IndexEntry e = m_leaf.entries[m_pos++];
    if (!m_low.admitsFromBelow(e.key))
    {
      continue;
    }
    if (!m_high.admitsFromAbove(e.key))
    {
      m_done = true;
      return std::nullopt;
    }
    return e;
  }
}

void BTreeCursor::restart() noexcept
{
  m_started = false;
  m_done = false;
  m_leaf = BTreeNode();
  m_pos = 0;
}
