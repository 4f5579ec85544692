#include "aidb/archive.hpp"

#include <algorithm>

std::vector<ArchivedBlock> snapshot(Database &db)
{
  std::vector<ArchivedBlock> blocks;
  db.forEachLiveBlock([&](BlockIndex index, ConstBytes bytes) {
    Block copy(bytes.size());
    std::copy(bytes.begin(), bytes.end(), copy.buf.begin());
    blocks.push_back(ArchivedBlock{index, std::move(copy)});
  });
  return blocks;
}

void restore(StorageBackend &backend, u32 blockSize, const std::vector<ArchivedBlock> &blocks)
{
  if (backend.blockCount() != 0)
  {
    throw IOFailure("can only restore into an empty backend");
  }

  const auto super = std::find_if(blocks.begin(), blocks.end(),
                                  [](const ArchivedBlock &b) { return b.index == SUPERBLOCK_INDEX; });
  if (super == blocks.end())
  {
    throw CorruptSuperBlock(SUPERBLOCK_INDEX, "archive has no superblock");
  }
  SuperBlock sb = SuperBlock::decode(super->block);
  if (sb.blockSize != blockSize)
  {
    std::ostringstream ss;
    ss << "archive has block size " << sb.blockSize << ", restoring with " << blockSize;
    throw CorruptSuperBlock(SUPERBLOCK_INDEX, ss.str());
  }

  std::vector<bool> present(sb.blockCount, false);
  for (const ArchivedBlock &b : blocks)
  {
    if (b.index >= sb.blockCount)
    {
      throw BlockOutOfRange(b.index, sb.blockCount);
    }
    if (b.block.size() != blockSize)
    {
      throw IOFailure(b.index, "archived block is " + std::to_string(b.block.size()) + " bytes");
    }
    if (present[b.index])
    {
      throw IOFailure(b.index, "archived twice");
    }
    present[b.index] = true;
  }

  // no cache, every block is written once
  Pager pager(backend, blockSize, 0);
  for (u64 i = 0; i < sb.blockCount; i++)
  {
    (void)pager.allocateNew();
  }
  for (const ArchivedBlock &b : blocks)
  {
    pager.write(b.index, b.block);
  }

  // gaps are chained lowest index first
  BlockIndex head = NULL_BLOCK;
  for (u64 i = sb.blockCount; i-- > 1;)
  {
    if (present[i])
    {
      continue;
    }
    Block block = pager.blank();
    FreeBlock::format(block, head);
    pager.write(i, block);
    head = i;
  }

  sb.freelistHead = head;
  SuperBlockManager(pager).commit(sb);
}
