#include "aidb/pager.hpp"

Pager::Pager(StorageBackend &backend, u32 blockSize, u32 cacheBlocks)
    : m_backend(backend), m_blockSize(blockSize), m_cacheBlocks(cacheBlocks)
{
  checkBlockSize(m_blockSize);
}

u64 Pager::size() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_backend.blockCount();
}

Block Pager::read(BlockIndex index)
{
  std::lock_guard<std::mutex> lock(m_mutex);

  auto it = m_cache.find(index);
  if (it != m_cache.end())
  {
    m_stats.cacheHits++;
    // promote to most recently used
    m_lru.splice(m_lru.begin(), m_lru, it->second.second);
    return it->second.first;
  }

  const u64 count = m_backend.blockCount();
  if (index >= count)
  {
    throw BlockOutOfRange(index, count);
  }

  Block block(m_blockSize);
  m_backend.readBlock(index, block.bytes());
  m_stats.backendReads++;
  cachePut(index, block);
  return block;
}

void Pager::write(BlockIndex index, const Block &block)
{
  if (block.size() != m_blockSize)
  {
    std::ostringstream ss;
    ss << "write of " << block.size() << " bytes, block size is " << m_blockSize;
    throw IOFailure(index, ss.str());
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  const u64 count = m_backend.blockCount();
  if (index >= count)
  {
    throw BlockOutOfRange(index, count);
  }

  try
  {
    m_backend.writeBlock(index, block.bytes());
  }
  catch (const IOFailure &)
  {
    // the backend may or may not hold the new bytes now, so forget what we had
    auto it = m_cache.find(index);
    if (it != m_cache.end())
    {
      m_lru.erase(it->second.second);
      m_cache.erase(it);
    }
    throw;
  }
  m_stats.writes++;
  cachePut(index, block);
}

BlockIndex Pager::allocateNew()
{
  std::lock_guard<std::mutex> lock(m_mutex);
  const BlockIndex index = m_backend.growByOneBlock();
  m_stats.allocations++;
  return index;
}

IoStats Pager::stats() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_stats;
}

void Pager::resetStats()
{
  std::lock_guard<std::mutex> lock(m_mutex);
  m_stats = IoStats();
}

void Pager::dropCache()
{
  std::lock_guard<std::mutex> lock(m_mutex);
  m_cache.clear();
  m_lru.clear();
}

void Pager::cachePut(BlockIndex index, const Block &block)
{
  if (m_cacheBlocks == 0)
  {
    return;
  }

  auto it = m_cache.find(index);
  if (it != m_cache.end())
  {
    it->second.first = block;
    m_lru.splice(m_lru.begin(), m_lru, it->second.second);
    return;
  }

  // evict the least recently used block. nothing is dirty so there is nothing to flush
  while (m_cache.size() >= m_cacheBlocks)
  {
    m_cache.erase(m_lru.back());
    m_lru.pop_back();
  }

  m_lru.push_front(index);
  m_cache.emplace(index, std::make_pair(block, m_lru.begin()));
}
