#include "aidb/index/hash_index.hpp"

#include <algorithm>

std::size_t HashBucket::capacity(u32 blockSize) noexcept
{
  return (blockSize - HEADER_SIZE) / IndexEntry::ENCODED_SIZE;
}

void HashBucket::encode(Block &block) const
{
  std::fill(block.buf.begin(), block.buf.end(), static_cast<std::byte>(0));
  Bytes b = block.bytes();
  writeLEu8(b, 0, static_cast<u8>(overflow ? IndexTag::HashOverflow : IndexTag::HashBucket));
  writeLEu16(b, COUNT_OFFSET, static_cast<u16>(entries.size()));
  writeLEu64(b, OVERFLOW_OFFSET, next);
  for (std::size_t i = 0; i < entries.size(); i++)
  {
    entries[i].encode(b, HEADER_SIZE + i * IndexEntry::ENCODED_SIZE);
  }
}

HashBucket HashBucket::decode(BlockIndex index, const Block &block)
{
  const ConstBytes b = block.bytes();
  const IndexTag tag = readIndexTag(b);
  if (tag != IndexTag::HashBucket && tag != IndexTag::HashOverflow)
  {
    throw IndexCorrupt(index, "expected a hash bucket, found tag " + std::to_string(static_cast<int>(tag)));
  }

  const u16 count = readLEu16(b, COUNT_OFFSET);
  if (count > capacity(static_cast<u32>(block.size())))
  {
    throw IndexCorrupt(index, "hash bucket claims " + std::to_string(count) + " entries");
  }

  HashBucket bucket;
  bucket.index = index;
  bucket.overflow = tag == IndexTag::HashOverflow;
  bucket.next = readLEu64(b, OVERFLOW_OFFSET);
  bucket.entries.reserve(count);
  for (u16 i = 0; i < count; i++)
  {
    bucket.entries.push_back(IndexEntry::decode(b, HEADER_SIZE + i * IndexEntry::ENCODED_SIZE));
  }
  return bucket;
}

u64 HashIndex::hash(i64 key) noexcept
{
  // splitmix64 finalizer
  u64 x = static_cast<u64>(key);
  x ^= x >> 30;
  x *= 0xbf58476d1ce4e5b9ULL;
  x ^= x >> 27;
  x *= 0x94d049bb133111ebULL;
  x ^= x >> 31;
  return x;
}

u64 HashIndex::bucketOf(i64 key) const noexcept
{
  return hash(key) & (bucketCount() - 1);
}

BlockIndex HashIndex::create(Pager &pager, Allocator &allocator, u8 bucketBits)
{
  if (bucketBits > MAX_BUCKET_BITS)
  {
    std::ostringstream ss;
    ss << "hash bucket bits must be at most " << static_cast<int>(MAX_BUCKET_BITS) << ", got "
       << static_cast<int>(bucketBits);
    throw StorageError(ss.str());
  }

  const u64 buckets = u64(1) << bucketBits;
  const u64 perBlock = (pager.blockSize() - DIR_HEADER_SIZE) / sizeof(u64);
  const u64 blocks = (buckets + perBlock - 1) / perBlock;

  std::vector<BlockIndex> chain;
  try
  {
    for (u64 i = 0; i < blocks; i++)
    {
      chain.push_back(allocator.allocate());
    }
    // written back to front so each block knows its successor
    for (u64 i = blocks; i-- > 0;)
    {
      Block block = pager.blank();
      writeLEu8(block.bytes(), 0, static_cast<u8>(IndexTag::HashDirectory));
      writeLEu8(block.bytes(), DIR_BITS_OFFSET, bucketBits);
      writeLEu64(block.bytes(), DIR_NEXT_OFFSET, i + 1 < blocks ? chain[i + 1] : NULL_BLOCK);
      pager.write(chain[i], block);
    }
  }
  catch (const StorageError &)
  {
    for (BlockIndex index : chain)
    {
      allocator.free(index);
    }
    throw;
  }
  return chain.front();
}

HashIndex::HashIndex(Pager &pager, Allocator &allocator, BlockIndex directory)
    : m_pager(pager), m_allocator(allocator), m_directory(directory)
{
  const Block block = m_pager.read(m_directory);
  if (readIndexTag(block.bytes()) != IndexTag::HashDirectory)
  {
    throw IndexCorrupt(m_directory, "expected a hash directory");
  }
  m_bits = readLEu8(block.bytes(), DIR_BITS_OFFSET);
  if (m_bits > MAX_BUCKET_BITS)
  {
    throw IndexCorrupt(m_directory, "hash directory has " + std::to_string(m_bits) + " bucket bits");
  }
  // the directory never changes shape after create, walk it once
  m_chain = directoryBlocks();
}

std::size_t HashIndex::headsPerDirectory() const noexcept
{
  return (m_pager.blockSize() - DIR_HEADER_SIZE) / sizeof(u64);
}

std::vector<BlockIndex> HashIndex::directoryBlocks()
{
  const std::size_t expected = (bucketCount() + headsPerDirectory() - 1) / headsPerDirectory();

  std::vector<BlockIndex> chain;
  BlockIndex index = m_directory;
  while (index != NULL_BLOCK)
  {
    if (chain.size() >= expected)
    {
      throw IndexCorrupt(index, "hash directory is longer than its bucket count needs");
    }
    const Block block = m_pager.read(index);
    if (readIndexTag(block.bytes()) != IndexTag::HashDirectory)
    {
      throw IndexCorrupt(index, "expected a hash directory");
    }
    chain.push_back(index);
    index = readLEu64(block.bytes(), DIR_NEXT_OFFSET);
  }
  if (chain.size() != expected)
  {
    throw IndexCorrupt(chain.back(), "hash directory ends early");
  }
  return chain;
}

HashIndex::Slot HashIndex::slotOf(u64 bucket)
{
  const std::size_t per = headsPerDirectory();
  return Slot{m_chain[bucket / per], DIR_HEADER_SIZE + (bucket % per) * sizeof(u64)};
}

BlockIndex HashIndex::head(u64 bucket)
{
  const Slot slot = slotOf(bucket);
  const BlockIndex index = readLEu64(m_pager.read(slot.directory).bytes(), slot.offset);
  if (index >= m_pager.size())
  {
    throw IndexCorrupt(slot.directory, "bucket " + std::to_string(bucket) + " points outside the store");
  }
  return index;
}

std::vector<BlockIndex> HashIndex::heads()
{
  const std::size_t per = headsPerDirectory();
  const u64 limit = m_pager.size();

  std::vector<BlockIndex> all;
  all.reserve(bucketCount());
  for (BlockIndex directory : m_chain)
  {
    const Block block = m_pager.read(directory);
    for (std::size_t i = 0; i < per && all.size() < bucketCount(); i++)
    {
      const BlockIndex index = readLEu64(block.bytes(), DIR_HEADER_SIZE + i * sizeof(u64));
      if (index >= limit)
      {
        throw IndexCorrupt(directory, "bucket " + std::to_string(all.size()) + " points outside the store");
      }
      all.push_back(index);
    }
  }
  return all;
}

void HashIndex::setHead(u64 bucket, BlockIndex block)
{
  const Slot slot = slotOf(bucket);
  Block dir = m_pager.read(slot.directory);
  writeLEu64(dir.bytes(), slot.offset, block);
  m_pager.write(slot.directory, dir);
}

void HashIndex::addToCount(i64 delta)
{
  Block dir = m_pager.read(m_directory);
  const u64 count = readLEu64(dir.bytes(), DIR_COUNT_OFFSET);
  writeLEu64(dir.bytes(), DIR_COUNT_OFFSET, count + static_cast<u64>(delta));
  m_pager.write(m_directory, dir);
}

u64 HashIndex::size()
{
  return readLEu64(m_pager.read(m_directory).bytes(), DIR_COUNT_OFFSET);
}

HashBucket HashIndex::load(BlockIndex index)
{
  if (index == NULL_BLOCK || index >= m_pager.size())
  {
    throw IndexCorrupt(index, "hash chain points outside the store");
  }
  return HashBucket::decode(index, m_pager.read(index));
}

void HashIndex::store(const HashBucket &bucket)
{
  Block block = m_pager.blank();
  bucket.encode(block);
  m_pager.write(bucket.index, block);
}

void HashIndex::insert(i64 key, RowPointer row)
{
  const u64 bucket = bucketOf(key);
  const std::size_t cap = HashBucket::capacity(m_pager.blockSize());

  BlockIndex index = head(bucket);
  if (index == NULL_BLOCK)
  {
    HashBucket fresh;
    fresh.index = m_allocator.allocate();
    fresh.entries.push_back(IndexEntry{key, row});
    store(fresh);
    setHead(bucket, fresh.index);
    addToCount(1);
    return;
  }

  // the first block in the chain with room takes it, otherwise the chain grows
  const u64 limit = m_pager.size();
  for (u64 hops = 0;; hops++)
  {
    if (hops >= limit)
    {
      throw IndexCorrupt(index, "hash overflow chain has a cycle");
    }
    HashBucket current = load(index);
    if (current.entries.size() < cap)
    {
      current.entries.push_back(IndexEntry{key, row});
      store(current);
      addToCount(1);
      return;
    }
    if (current.next == NULL_BLOCK)
    {
      HashBucket overflow;
      overflow.index = m_allocator.allocate();
      overflow.overflow = true;
      overflow.entries.push_back(IndexEntry{key, row});
      store(overflow);

      current.next = overflow.index;
      store(current);
      addToCount(1);
      return;
    }
    index = current.next;
  }
}

std::optional<RowPointer> HashIndex::search(i64 key)
{
  const u64 limit = m_pager.size();
  BlockIndex index = head(bucketOf(key));
  for (u64 hops = 0; index != NULL_BLOCK; hops++)
  {
    if (hops >= limit)
    {
      throw IndexCorrupt(index, "hash overflow chain has a cycle");
    }
    const HashBucket bucket = load(index);
    for (const IndexEntry &e : bucket.entries)
    {
      if (e.key == key)
      {
        return e.row;
      }
    }
    index = bucket.next;
  }
  return std::nullopt;
}

std::vector<RowPointer> HashIndex::searchAll(i64 key)
{
  std::vector<RowPointer> rows;
  const u64 limit = m_pager.size();
  BlockIndex index = head(bucketOf(key));
  for (u64 hops = 0; index != NULL_BLOCK; hops++)
  {
    if (hops >= limit)
    {
      throw IndexCorrupt(index, "hash overflow chain has a cycle");
    }
    const HashBucket bucket = load(index);
    for (const IndexEntry &e : bucket.entries)
    {
      if (e.key == key)
      {
        rows.push_back(e.row);
      }
    }
    index = bucket.next;
  }
  return rows;
}

bool HashIndex::remove(i64 key)
{
  return removeWhere(key, std::nullopt);
}

bool HashIndex::remove(i64 key, RowPointer row)
{
  return removeWhere(key, row);
}

bool HashIndex::removeWhere(i64 key, const std::optional<RowPointer> &row)
{
  const u64 limit = m_pager.size();
  std::optional<HashBucket> previous;
  BlockIndex index = head(bucketOf(key));

  for (u64 hops = 0; index != NULL_BLOCK; hops++)
  {
    if (hops >= limit)
    {
      throw IndexCorrupt(index, "hash overflow chain has a cycle");
    }
    HashBucket bucket = load(index);
    const auto it = std::find_if(bucket.entries.begin(), bucket.entries.end(), [&](const IndexEntry &e) {
      return e.key == key && (!row.has_value() || e.row == *row);
    });

    if (it != bucket.entries.end())
    {
      bucket.entries.erase(it);
      // the head block stays even when empty, overflow blocks go as soon as they are
      if (bucket.entries.empty() && previous.has_value())
      {
        previous->next = bucket.next;
        store(*previous);
        m_allocator.free(bucket.index);
      }
      else
      {
        store(bucket);
      }
      addToCount(-1);
      return true;
    }

    index = bucket.next;
    previous = std::move(bucket);
  }
  return false;
}

void HashIndex::destroy()
{
  std::vector<BlockIndex> blocks;
  const std::vector<BlockIndex> bucketHeads = heads();
  const u64 limit = m_pager.size();

  for (BlockIndex index : bucketHeads)
  {
    for (u64 hops = 0; index != NULL_BLOCK; hops++)
    {
      if (hops >= limit)
      {
        throw IndexCorrupt(index, "hash overflow chain has a cycle");
      }
      blocks.push_back(index);
      index = load(index).next;
    }
  }

  for (BlockIndex index : blocks)
  {
    m_allocator.free(index);
  }
  for (BlockIndex index : m_chain)
  {
    m_allocator.free(index);
  }
}

void HashIndex::check()
{
  const u64 limit = m_pager.size();
  u64 total = 0;
  const std::vector<BlockIndex> bucketHeads = heads();

  for (u64 b = 0; b < bucketCount(); b++)
  {
    BlockIndex index = bucketHeads[b];
    bool first = true;
    for (u64 hops = 0; index != NULL_BLOCK; hops++)
    {
      if (hops >= limit)
      {
        throw IndexCorrupt(index, "hash overflow chain has a cycle");
      }
      const HashBucket bucket = load(index);
      if (bucket.overflow == first)
      {
        throw IndexCorrupt(index, first ? "bucket head is tagged as overflow" : "overflow block is tagged as a bucket head");
      }
      if (!first && bucket.entries.empty())
      {
        throw IndexCorrupt(index, "empty overflow block left in the chain");
      }
      for (const IndexEntry &e : bucket.entries)
      {
        if (bucketOf(e.key) != b)
        {
          throw IndexCorrupt(index, "key " + std::to_string(e.key) + " is in the wrong bucket");
        }
      }
      total += bucket.entries.size();
      first = false;
      index = bucket.next;
    }
  }

  if (total != size())
  {
    std::ostringstream ss;
    ss << "directory counts " << size() << " entries, buckets hold " << total;
    throw IndexCorrupt(m_directory, ss.str());
  }
}
