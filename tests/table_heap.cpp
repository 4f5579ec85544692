#include <gtest/gtest.h>

#include "database_fixture.hpp"
#include "aidb/blocks/data_block.hpp"

class TableHeapTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    table = TableDef{"T", {{"a", DataType::Integer}, {"b", DataType::Text}}, TableHeap::create(store.allocator), {}};
  }

  TableHeap heap() { return TableHeap(store.pager, store.allocator, store.texts, table); }

  std::vector<Row> scanAll()
  {
    std::vector<Row> rows;
    heap().scan([&](RowPointer, const Row &row) {
      rows.push_back(row);
      return true;
    });
    return rows;
  }

  MemoryStore store;
  TableDef table;
};

TEST_F(TableHeapTest, InsertThenRead)
{
  const RowPointer p = heap().insert(Row{i64(1), std::string("one")});
  EXPECT_EQ(table.firstDataBlock, p.block);
  EXPECT_EQ(DataBlock::HEADER_SIZE, p.offset);

  const RowPointer q = heap().insert(Row{i64(2), Value()});
  EXPECT_EQ(p.block, q.block);
  EXPECT_EQ(p.offset + 27, q.offset);

  EXPECT_EQ((Row{i64(1), std::string("one")}), heap().read(p));
  EXPECT_EQ((Row{i64(2), Value()}), heap().read(q));

  const DataBlock db(store.pager.read(p.block));
  EXPECT_EQ(2u, db.rowCount());
  EXPECT_EQ(27u + 11u, db.used());
}

/* when the last block is full a new one is linked onto the chain */
TEST_F(TableHeapTest, ChainGrows)
{
  std::vector<RowPointer> pointers;
  for (i64 i = 0; i < 30; i++)
  {
    pointers.push_back(heap().insert(Row{i, std::string("row number ") + std::to_string(i)}));
  }

  const std::vector<BlockIndex> blocks = heap().blocks();
  EXPECT_GT(blocks.size(), 3u);
  EXPECT_EQ(table.firstDataBlock, blocks.front());

  const std::vector<Row> rows = scanAll();
  ASSERT_EQ(30u, rows.size());
  for (i64 i = 0; i < 30; i++)
  {
    EXPECT_EQ(i, std::get<i64>(rows[i][0]));
    EXPECT_EQ(std::string("row number ") + std::to_string(i), std::get<std::string>(rows[i][1]));
    EXPECT_EQ(rows[i], heap().read(pointers[i]));
  }
}

TEST_F(TableHeapTest, RemoveLeavesTombstone)
{
  const RowPointer p = heap().insert(Row{i64(1), std::string("a long string that needs blocks")});
  const RowPointer q = heap().insert(Row{i64(2), std::string("b")});
  const u64 freeBefore = store.allocator.freeCount();

  heap().remove(p);
  EXPECT_FALSE(heap().read(p).has_value());
  EXPECT_EQ((Row{i64(2), std::string("b")}), heap().read(q));
  // the text chain went with the row
  EXPECT_EQ(freeBefore + 1, store.allocator.freeCount());

  EXPECT_THROW(heap().remove(p), NotFound);
  ASSERT_EQ(1u, scanAll().size());
}

TEST_F(TableHeapTest, UpdateInPlace)
{
  const RowPointer p = heap().insert(Row{i64(1), std::string("first long string")});
  const RowPointer moved = heap().update(p, Row{i64(5), std::string("second long string")});
  EXPECT_EQ(p, moved);
  EXPECT_EQ((Row{i64(5), std::string("second long string")}), heap().read(p));
  // old chain freed, new one in use
  EXPECT_EQ(1u, store.allocator.freeCount());
}

/* a row that changes size is moved, the old spot becomes a tombstone */
TEST_F(TableHeapTest, UpdateMoves)
{
  const RowPointer p = heap().insert(Row{i64(1), std::string("x")});
  const RowPointer q = heap().update(p, Row{Value(), std::string("x")});
  EXPECT_NE(p, q);
  EXPECT_FALSE(heap().read(p).has_value());
  EXPECT_EQ((Row{Value(), std::string("x")}), heap().read(q));
  EXPECT_EQ(1u, scanAll().size());
}

TEST_F(TableHeapTest, BadPointers)
{
  const RowPointer p = heap().insert(Row{i64(1), std::string("x")});
  EXPECT_THROW(heap().read(RowPointer{p.block, static_cast<u16>(p.offset + 1)}), NotFound);
  EXPECT_THROW(heap().read(RowPointer{NULL_BLOCK, 12}), NotFound);

  const BlockIndex spare = store.allocator.allocate();
  store.allocator.free(spare);
  EXPECT_THROW(heap().read(RowPointer{spare, 12}), NotFound);
}

TEST_F(TableHeapTest, RowTooLarge)
{
  TableDef wide{"W", {}, TableHeap::create(store.allocator), {}};
  Row row;
  for (int i = 0; i < 20; i++)
  {
    wide.columns.push_back(ColumnDef{"c" + std::to_string(i), DataType::Text});
    row.emplace_back(std::string("v"));
  }
  // 1 + 20 * 17 bytes does not fit in 244
  EXPECT_THROW((void)TableHeap(store.pager, store.allocator, store.texts, wide).insert(row), RowShapeError);
}

TEST_F(TableHeapTest, ScanStopsEarly)
{
  for (i64 i = 0; i < 5; i++)
  {
    (void)heap().insert(Row{i, Value()});
  }
  int seen = 0;
  heap().scan([&](RowPointer, const Row &) { return ++seen < 2; });
  EXPECT_EQ(2, seen);
}

/* dropping frees every data block and the text of live rows */
TEST_F(TableHeapTest, Drop)
{
  for (i64 i = 0; i < 20; i++)
  {
    const RowPointer p = heap().insert(Row{i, std::string("long enough to chain ") + std::to_string(i)});
    if (i % 3 == 0)
    {
      heap().remove(p);
    }
  }
  heap().drop();
  EXPECT_EQ(store.super.current().blockCount - 1, store.allocator.freeCount());
}
