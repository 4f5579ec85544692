#pragma once

#include "aidb/blocks/block_header.hpp"

const u32 DEFAULT_BLOCK_SIZE = 4096;

// settings fixed when a store is opened.
// block size is only used when formatting a new store, an existing store must match it
struct Options
{
  u32 blockSize = DEFAULT_BLOCK_SIZE;

  // number of blocks kept in the pager's read cache. 0 disables caching
  u32 cacheBlocks = 64;

  // upper bound on the total number of blocks, including block 0. 0 is unlimited
  u64 maxBlocks = 0;

  // entries per B+Tree node. 0 means as many as fit in a block, larger values are clamped
  u16 btreeLeafCapacity = 0;
  u16 btreeInternalCapacity = 0;

  // new hash indexes get 2^hashBucketBits buckets
  u8 hashBucketBits = 6;

  // log formatting and recoverable backend oddities to std::cerr
  bool verbose = false;
};
