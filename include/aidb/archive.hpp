#pragma once

#include "aidb/database.hpp"

#include <vector>

// one live block as an archiver sees it
struct ArchivedBlock
{
  BlockIndex index;
  Block block;
};

// copies of every live block of the store, in index order
std::vector<ArchivedBlock> snapshot(Database &db);

// writes the blocks to an empty backend at their indices. block 0 must be among
// them. every index below the superblock's block count that is missing becomes
// a free block, and the free list is rebuilt from those
void restore(StorageBackend &backend, u32 blockSize, const std::vector<ArchivedBlock> &blocks);
