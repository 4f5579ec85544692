#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

#include "database_fixture.hpp"
#include "aidb/database.hpp"

std::vector<ColumnDef> userColumns()
{
  return {{"id", DataType::Integer}, {"name", DataType::Text}, {"score", DataType::Real}};
}

Options smallBlocks()
{
  Options options;
  options.blockSize = 256;
  options.btreeLeafCapacity = 4;
  options.btreeInternalCapacity = 3;
  options.hashBucketBits = 2;
  return options;
}

TEST(Database, FormatsEmptyBackend)
{
  MemoryBackend backend(256);
  Database db(backend, smallBlocks());
  EXPECT_EQ(1u, backend.blockCount());
  EXPECT_TRUE(db.tables().empty());
  EXPECT_EQ(256u, db.superBlock().blockSize);
}

TEST(Database, CreateTable)
{
  MemoryBackend backend(256);
  Database db(backend, smallBlocks());
  db.createTable("users", userColumns());

  EXPECT_EQ((std::vector<std::string>{"users"}), db.tables());
  const TableDef users = db.table("users");
  EXPECT_EQ(userColumns(), users.columns);
  EXPECT_NE(NULL_BLOCK, users.firstDataBlock);

  EXPECT_THROW(db.createTable("users", userColumns()), TableExists);
  EXPECT_THROW(db.createTable("empty", {}), RowShapeError);
  EXPECT_THROW(db.createTable("twice", {{"a", DataType::Integer}, {"a", DataType::Text}}), RowShapeError);
  EXPECT_THROW(db.table("missing"), NotFound);
}

TEST(Database, RowLifecycle)
{
  MemoryBackend backend(256);
  Database db(backend, smallBlocks());
  db.createTable("users", userColumns());

  const RowPointer p = db.insert("users", Row{i64(1), std::string("ada lovelace"), 9.5});
  EXPECT_EQ((Row{i64(1), std::string("ada lovelace"), 9.5}), db.read("users", p));

  const RowPointer q = db.update("users", p, Row{i64(1), std::string("ada"), Value()});
  EXPECT_EQ((Row{i64(1), std::string("ada"), Value()}), db.read("users", q));

  db.remove("users", q);
  EXPECT_FALSE(db.read("users", q).has_value());
  EXPECT_THROW(db.remove("users", q), NotFound);
  EXPECT_THROW(db.insert("users", Row{i64(1)}), RowShapeError);
  EXPECT_THROW(db.insert("nobody", Row{i64(1)}), NotFound);
}

/* every index of the table follows inserts, updates and removes */
TEST(Database, IndexesFollowMutations)
{
  MemoryBackend backend(256);
  Database db(backend, smallBlocks());
  db.createTable("users", userColumns());

  std::vector<RowPointer> rows;
  for (i64 i = 0; i < 50; i++)
  {
    rows.push_back(db.insert("users", Row{i, std::string("user ") + std::to_string(i), Value()}));
  }

  // existing rows are indexed when the index is made
  db.createIndex("users", "id", IndexKind::BTree);
  db.createIndex("users", "id", IndexKind::Hash);
  EXPECT_EQ(2u, db.table("users").indexes.size());

  const RowPointer late = db.insert("users", Row{i64(100), std::string("late"), Value()});
  EXPECT_EQ((std::vector<RowPointer>{late}), db.lookup("users", "id", 100));
  EXPECT_EQ((std::vector<RowPointer>{rows[7]}), db.lookup("users", "id", 7));

  db.remove("users", rows[7]);
  EXPECT_TRUE(db.lookup("users", "id", 7).empty());

  const RowPointer moved = db.update("users", rows[8], Row{i64(800), std::string("eight hundred"), 1.0});
  EXPECT_TRUE(db.lookup("users", "id", 8).empty());
  EXPECT_EQ((std::vector<RowPointer>{moved}), db.lookup("users", "id", 800));

  const std::vector<RowPointer> between = db.range("users", "id", Bound::included(5), Bound::excluded(10));
  ASSERT_EQ(3u, between.size());
  EXPECT_EQ(rows[5], between[0]);
  EXPECT_EQ(rows[6], between[1]);
  EXPECT_EQ(rows[9], between[2]);

  db.checkIndexes("users");
}

TEST(Database, IndexErrors)
{
  MemoryBackend backend(256);
  Database db(backend, smallBlocks());
  db.createTable("users", userColumns());

  EXPECT_THROW(db.createIndex("users", "name", IndexKind::BTree), RowShapeError);
  EXPECT_THROW(db.createIndex("users", "nope", IndexKind::BTree), NotFound);
  EXPECT_THROW(db.lookup("users", "id", 1), NotFound);

  db.createIndex("users", "id", IndexKind::Hash);
  EXPECT_THROW(db.createIndex("users", "id", IndexKind::Hash), TableExists);
  // hash indexes have no order to walk
  EXPECT_THROW(db.range("users", "id", Bound::unbounded(), Bound::unbounded()), NotFound);
}

/* null keys are not indexed */
TEST(Database, NullsSkipIndexes)
{
  MemoryBackend backend(256);
  Database db(backend, smallBlocks());
  db.createTable("t", {{"k", DataType::Integer}});
  db.createIndex("t", "k", IndexKind::BTree);

  const RowPointer p = db.insert("t", Row{Value()});
  (void)db.insert("t", Row{i64(3)});
  EXPECT_EQ(1u, db.range("t", "k", Bound::unbounded(), Bound::unbounded()).size());
  db.remove("t", p);
  db.checkIndexes("t");
}

TEST(Database, DropTableFreesEverything)
{
  MemoryBackend backend(256);
  Database db(backend, smallBlocks());
  db.createTable("users", userColumns());
  db.createIndex("users", "id", IndexKind::BTree);
  db.createIndex("users", "id", IndexKind::Hash);
  for (i64 i = 0; i < 40; i++)
  {
    (void)db.insert("users", Row{i, std::string("a name long enough for a chain"), 0.5});
  }

  db.dropTable("users");
  EXPECT_TRUE(db.tables().empty());
  EXPECT_EQ(db.superBlock().blockCount - 1, db.freeBlocks());
  EXPECT_EQ(NULL_BLOCK, db.superBlock().schemaBlock);
  EXPECT_THROW(db.dropTable("users"), NotFound);
}

TEST(Database, IoStats)
{
  MemoryBackend backend(256);
  Database db(backend, smallBlocks());
  db.createTable("t", {{"k", DataType::Integer}});
  const RowPointer p = db.insert("t", Row{i64(1)});

  db.resetIoStats();
  (void)db.read("t", p);
  (void)db.read("t", p);
  const IoStats stats = db.ioStats();
  EXPECT_EQ(0u, stats.writes);
  EXPECT_GE(stats.cacheHits, 2u);
}

/* everything written survives closing and reopening the file */
TEST_F(TempFileFixture, ReopenFromFile)
{
  RowPointer alice;
  {
    std::fstream f = open(true);
    StreamBackend backend(f, 256);
    Database db(backend, smallBlocks());
    db.createTable("users", userColumns());
    db.createIndex("users", "id", IndexKind::BTree);
    for (i64 i = 0; i < 30; i++)
    {
      (void)db.insert("users", Row{i, std::string("someone ") + std::to_string(i), Value()});
    }
    alice = db.insert("users", Row{i64(99), std::string("alice in wonderland"), 3.5});
    db.remove("users", db.lookup("users", "id", 4).at(0));
  }

  std::fstream f = open();
  const std::optional<u32> blockSize = SuperBlock::peekBlockSize(f);
  ASSERT_EQ(256u, blockSize);

  Options options = smallBlocks();
  options.blockSize = *blockSize;
  StreamBackend backend(f, options.blockSize);
  Database db(backend, options);

  EXPECT_EQ((std::vector<std::string>{"users"}), db.tables());
  EXPECT_EQ((Row{i64(99), std::string("alice in wonderland"), 3.5}), db.read("users", alice));
  EXPECT_EQ((std::vector<RowPointer>{alice}), db.lookup("users", "id", 99));
  EXPECT_TRUE(db.lookup("users", "id", 4).empty());

  u64 rows = 0;
  db.scan("users", [&](RowPointer, const Row &) {
    rows++;
    return true;
  });
  EXPECT_EQ(30u, rows);
  db.checkIndexes("users");
}

/* freed blocks are still free after a reopen */
TEST_F(TempFileFixture, FreeListSurvivesReopen)
{
  u64 freeBefore = 0;
  {
    std::fstream f = open(true);
    StreamBackend backend(f, 256);
    Database db(backend, smallBlocks());
    db.createTable("a", {{"k", DataType::Integer}});
    db.createTable("b", {{"k", DataType::Integer}});
    db.dropTable("a");
    freeBefore = db.freeBlocks();
    ASSERT_GT(freeBefore, 0u);
  }

  std::fstream f = open();
  StreamBackend backend(f, 256);
  Database db(backend, smallBlocks());
  EXPECT_EQ(freeBefore, db.freeBlocks());
  EXPECT_EQ((std::vector<std::string>{"b"}), db.tables());
}

TEST_F(TempFileFixture, WrongBlockSize)
{
  {
    std::fstream f = open(true);
    StreamBackend backend(f, 256);
    Database db(backend, smallBlocks());
  }

  std::fstream f = open();
  StreamBackend backend(f, 512);
  Options options;
  options.blockSize = 512;
  EXPECT_THROW({ Database db(backend, options); }, CorruptSuperBlock);
}

/* running out of blocks partway through an insert leaves no row without its index entries */
TEST(Database, FailedIndexInsertLeavesNoRow)
{
  MemoryBackend backend(256);
  Options options = smallBlocks();
  options.btreeLeafCapacity = 2;
  options.maxBlocks = 40;
  Database db(backend, options);
  db.createTable("t", {{"k", DataType::Integer}});
  db.createIndex("t", "k", IndexKind::BTree);
  db.createIndex("t", "k", IndexKind::Hash);

  std::vector<RowPointer> stored;
  i64 failedKey = -1;
  for (i64 k = 0; k < 10000; k++)
  {
    try
    {
      stored.push_back(db.insert("t", Row{k}));
    }
    catch (const AllocatorExhausted &)
    {
      failedKey = k;
      break;
    }
  }
  ASSERT_GE(failedKey, 0);

  db.checkIndexes("t");
  EXPECT_TRUE(db.lookup("t", "k", failedKey).empty());
  EXPECT_EQ(stored.size(), db.range("t", "k", Bound::unbounded(), Bound::unbounded()).size());
  u64 rows = 0;
  db.scan("t", [&](RowPointer, const Row &) {
    rows++;
    return true;
  });
  EXPECT_EQ(stored.size(), rows);

  // every stored row can still be removed with its entries
  for (RowPointer p : stored)
  {
    db.remove("t", p);
  }
  db.checkIndexes("t");
  EXPECT_TRUE(db.range("t", "k", Bound::unbounded(), Bound::unbounded()).empty());
}

/* an update that cannot move the row keeps the old row and its entries */
TEST(Database, FailedMoveKeepsOldRow)
{
  MemoryBackend backend(256);
  Options options = smallBlocks();
  options.maxBlocks = 12;
  Database db(backend, options);
  db.createTable("t", {{"k", DataType::Integer}, {"s", DataType::Text}});
  db.createIndex("t", "k", IndexKind::Hash);
  const RowPointer p = db.insert("t", Row{i64(1), Value()});

  // a long string needs more text blocks than the store has left
  const std::string huge(256 * 16, 'x');
  EXPECT_THROW((void)db.update("t", p, Row{i64(2), huge}), AllocatorExhausted);

  EXPECT_EQ((Row{i64(1), Value()}), db.read("t", p));
  EXPECT_EQ((std::vector<RowPointer>{p}), db.lookup("t", "k", 1));
  EXPECT_TRUE(db.lookup("t", "k", 2).empty());
  db.checkIndexes("t");
}

TEST(Database, BlockSizeOutOfRange)
{
  Options options;
  options.blockSize = 32;
  EXPECT_THROW({ MemoryBackend tiny(32); }, StorageError);

  MemoryBackend backend(256);
  EXPECT_THROW({ Database db(backend, options); }, StorageError);
  EXPECT_EQ(0u, backend.blockCount());

  std::stringstream ss;
  EXPECT_THROW({ StreamBackend zero(ss, 0); }, StorageError);
  EXPECT_THROW({ StreamBackend huge(ss, MAX_BLOCK_SIZE + 1); }, StorageError);
}

/* the largest block size still has room for row offsets and the used count */
TEST(Database, LargestBlocks)
{
  MemoryBackend backend(MAX_BLOCK_SIZE);
  Options options;
  options.blockSize = MAX_BLOCK_SIZE;
  Database db(backend, options);
  db.createTable("t", {{"k", DataType::Integer}});
  db.createIndex("t", "k", IndexKind::BTree);

  // 10 bytes a row, more than one block's worth
  std::vector<RowPointer> stored;
  for (i64 k = 0; k < 8000; k++)
  {
    stored.push_back(db.insert("t", Row{k}));
  }

  u64 rows = 0;
  db.scan("t", [&](RowPointer, const Row &) {
    rows++;
    return true;
  });
  EXPECT_EQ(8000u, rows);
  EXPECT_EQ((Row{i64(7999)}), db.read("t", stored.back()));
  EXPECT_EQ((std::vector<RowPointer>{stored[6553]}), db.lookup("t", "k", 6553));
  db.checkIndexes("t");
}
