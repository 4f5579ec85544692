#include "aidb/blocks/superblock.hpp"

#include <algorithm>

void SuperBlock::encode(Block &block) const
{
  Bytes b = block.bytes();
  std::fill(b.begin(), b.end(), static_cast<std::byte>(0));
  writeBytes(b, MAGIC_OFFSET, std::string_view(SUPERBLOCK_MAGIC.data(), SUPERBLOCK_MAGIC.size()));
  writeLEu32(b, VERSION_OFFSET, version);
  writeLEu64(b, BLOCK_SIZE_OFFSET, blockSize);
  writeLEu64(b, BLOCK_COUNT_OFFSET, blockCount);
  writeLEu64(b, SCHEMA_OFFSET, schemaBlock);
  writeLEu64(b, FREELIST_OFFSET, freelistHead);
  writeLEu64(b, JOURNAL_OFFSET, journalBlock);
}

SuperBlock SuperBlock::decode(const Block &block)
{
  ConstBytes b = block.bytes();
  if (b.size() < ENCODED_SIZE)
  {
    throw CorruptSuperBlock(SUPERBLOCK_INDEX, "block too small for a superblock");
  }

  const std::string_view magic = readBytes(b, MAGIC_OFFSET, SUPERBLOCK_MAGIC.size());
  if (magic != std::string_view(SUPERBLOCK_MAGIC.data(), SUPERBLOCK_MAGIC.size()))
  {
    throw CorruptSuperBlock(SUPERBLOCK_INDEX, "bad magic signature");
  }

  SuperBlock sb;
  sb.version = readLEu32(b, VERSION_OFFSET);
  if (sb.version != FORMAT_VERSION)
  {
    std::ostringstream ss;
    ss << "format version " << sb.version << ", expected " << FORMAT_VERSION;
    throw CorruptSuperBlock(SUPERBLOCK_INDEX, ss.str());
  }

  sb.blockSize = readLEu64(b, BLOCK_SIZE_OFFSET);
  sb.blockCount = readLEu64(b, BLOCK_COUNT_OFFSET);
  sb.schemaBlock = readLEu64(b, SCHEMA_OFFSET);
  sb.freelistHead = readLEu64(b, FREELIST_OFFSET);
  sb.journalBlock = readLEu64(b, JOURNAL_OFFSET);

  if (sb.blockSize < MIN_BLOCK_SIZE || sb.blockSize > MAX_BLOCK_SIZE)
  {
    std::ostringstream ss;
    ss << "block size " << sb.blockSize << " outside [" << MIN_BLOCK_SIZE << ", " << MAX_BLOCK_SIZE << "]";
    throw CorruptSuperBlock(SUPERBLOCK_INDEX, ss.str());
  }
  if (sb.blockCount == 0)
  {
    throw CorruptSuperBlock(SUPERBLOCK_INDEX, "block count of 0");
  }
  if (sb.schemaBlock >= sb.blockCount || sb.freelistHead >= sb.blockCount)
  {
    throw CorruptSuperBlock(SUPERBLOCK_INDEX, "root pointer past the end of the store");
  }

  return sb;
}

std::optional<u32> SuperBlock::peekBlockSize(std::istream &in)
{
  std::array<char, BLOCK_COUNT_OFFSET> head;
  in.clear();
  if (!in.seekg(0) || !in.read(head.data(), head.size()))
  {
    in.clear();
    return std::nullopt;
  }

  const ConstBytes b(reinterpret_cast<const std::byte *>(head.data()), head.size());
  if (readBytes(b, MAGIC_OFFSET, SUPERBLOCK_MAGIC.size()) !=
      std::string_view(SUPERBLOCK_MAGIC.data(), SUPERBLOCK_MAGIC.size()))
  {
    return std::nullopt;
  }

  const u64 blockSize = readLEu64(b, BLOCK_SIZE_OFFSET);
  if (blockSize < MIN_BLOCK_SIZE || blockSize > MAX_BLOCK_SIZE)
  {
    return std::nullopt;
  }
  return static_cast<u32>(blockSize);
}

SuperBlock SuperBlockManager::format()
{
  checkBlockSize(m_pager.blockSize());
  if (m_pager.size() != 0)
  {
    throw IOFailure(SUPERBLOCK_INDEX, "cannot format a store that already has blocks");
  }

  const BlockIndex index = m_pager.allocateNew();
  if (index != SUPERBLOCK_INDEX)
  {
    throw IOFailure(index, "backend did not start at block 0");
  }

  SuperBlock sb;
  sb.blockSize = m_pager.blockSize();
  sb.blockCount = 1;
  commit(sb);
  return sb;
}

SuperBlock SuperBlockManager::load()
{
  const u64 count = m_pager.size();
  if (count == 0)
  {
    throw CorruptSuperBlock(SUPERBLOCK_INDEX, "store is empty");
  }

  SuperBlock sb = SuperBlock::decode(m_pager.read(SUPERBLOCK_INDEX));
  if (sb.blockSize != m_pager.blockSize())
  {
    std::ostringstream ss;
    ss << "store has block size " << sb.blockSize << ", opened with " << m_pager.blockSize();
    throw CorruptSuperBlock(SUPERBLOCK_INDEX, ss.str());
  }
  if (sb.blockCount > count)
  {
    std::ostringstream ss;
    ss << "superblock counts " << sb.blockCount << " blocks, backend holds " << count;
    throw CorruptSuperBlock(SUPERBLOCK_INDEX, ss.str());
  }

  m_current = sb;
  return sb;
}

void SuperBlockManager::commit(const SuperBlock &sb)
{
  Block block = m_pager.blank();
  sb.encode(block);
  m_pager.write(SUPERBLOCK_INDEX, block);
  m_current = sb;
}
