#include <gtest/gtest.h>

#include "database_fixture.hpp"

std::string pattern(std::size_t n)
{
  std::string s(n, '\0');
  for (std::size_t i = 0; i < n; i++)
  {
    s[i] = static_cast<char>('a' + i % 26);
  }
  return s;
}

TEST(TextChain, ShortTextOneBlock)
{
  MemoryStore store;
  const std::string text = "twenty bytes of text";
  ASSERT_EQ(20u, text.size());

  const BlockIndex start = store.texts.write(text);
  EXPECT_NE(NULL_BLOCK, start);
  EXPECT_EQ(NULL_BLOCK, store.pager.read(start).next());
  EXPECT_EQ(text, store.texts.read(start, text.size()));
}

/* text fills each block to capacity before moving to the next */
TEST(TextChain, SpansSeveralBlocks)
{
  MemoryStore store;
  const std::size_t cap = store.texts.capacity();
  ASSERT_EQ(248u, cap);

  const std::string text = pattern(cap * 3 + 17);
  EXPECT_EQ(4u, store.texts.blocksFor(text.size()));

  const u64 before = store.super.current().blockCount;
  const BlockIndex start = store.texts.write(text);
  EXPECT_EQ(before + 4, store.super.current().blockCount);
  EXPECT_EQ(text, store.texts.read(start, text.size()));

  // exactly full blocks need no extra one
  EXPECT_EQ(2u, store.texts.blocksFor(cap * 2));
  EXPECT_EQ(1u, store.texts.blocksFor(0));
}

TEST(TextChain, FreeReleasesEveryBlock)
{
  MemoryStore store;
  const std::string text = pattern(600);
  const BlockIndex start = store.texts.write(text);

  store.texts.free(start, text.size());
  EXPECT_EQ(3u, store.allocator.freeCount());
  EXPECT_TRUE(store.allocator.isFree(start));
}

TEST(TextChain, Truncated)
{
  MemoryStore store;
  const std::string text = pattern(600);
  const BlockIndex start = store.texts.write(text);

  // cut the chain after the second block
  const BlockIndex second = store.pager.read(start).next();
  Block block = store.pager.read(second);
  block.setNext(NULL_BLOCK);
  store.pager.write(second, block);

  try
  {
    (void)store.texts.read(start, text.size());
    FAIL() << "expected TextChainTruncated";
  }
  catch (const TextChainTruncated &e)
  {
    EXPECT_EQ(600u, e.expected());
    EXPECT_EQ(2 * store.texts.capacity(), e.found());
    EXPECT_EQ(second, e.block());
  }
}

/* a write that cannot get all of its blocks gives back the ones it took */
TEST(TextChain, FailedWriteLeaksNothing)
{
  MemoryStore store(256, 3);
  EXPECT_THROW((void)store.texts.write(pattern(600)), AllocatorExhausted);
  EXPECT_EQ(2u, store.allocator.freeCount());
  EXPECT_EQ(store.allocator.freeCount() + 1, store.super.current().blockCount);
}

/* a length no chain in the store could hold is reported before anything is read */
TEST(TextChain, ImpossibleLength)
{
  MemoryStore store;
  const BlockIndex start = store.texts.write(pattern(20));

  EXPECT_THROW((void)store.texts.read(start, ~u64(0)), TextChainTruncated);
  EXPECT_THROW((void)store.texts.read(start, store.texts.capacity() * 64), TextChainTruncated);
  EXPECT_THROW(store.texts.free(start, ~u64(0)), TextChainTruncated);
  EXPECT_EQ(0u, store.allocator.freeCount());
  EXPECT_EQ(pattern(20), store.texts.read(start, 20));
}
