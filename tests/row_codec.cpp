#include <gtest/gtest.h>

#include "database_fixture.hpp"
#include "aidb/blocks/row_codec.hpp"

TableDef twoColumns()
{
  return TableDef{"T", {{"a", DataType::Integer}, {"b", DataType::Text}}, 1, {}};
}

std::vector<u8> asBytes(const std::vector<std::byte> &v)
{
  std::vector<u8> out;
  for (std::byte b : v)
  {
    out.push_back(static_cast<u8>(b));
  }
  return out;
}

/* short text sits in the row zero padded to 8 bytes */
TEST(RowCodec, InlineTextLayout)
{
  MemoryStore store;
  const std::vector<std::byte> bytes = RowCodec::encode(Row{i64(42), std::string("hi")}, twoColumns(), store.texts);

  const std::vector<u8> expected = {
      0x02,
      0x01, 0x2A, 0, 0, 0, 0, 0, 0, 0,
      0x03, 0x02, 0, 0, 0, 0, 0, 0, 0, 'h', 'i', 0, 0, 0, 0, 0, 0,
  };
  EXPECT_EQ(expected, asBytes(bytes));
  // nothing went to text blocks
  EXPECT_EQ(1u, store.super.current().blockCount);

  const DecodedRow decoded = RowCodec::decode(ConstBytes(bytes.data(), bytes.size()), twoColumns(), store.texts);
  ASSERT_TRUE(std::holds_alternative<Row>(decoded));
  EXPECT_EQ((Row{i64(42), std::string("hi")}), std::get<Row>(decoded));
}

TEST(RowCodec, EightBytesStillInline)
{
  MemoryStore store;
  const Row row{i64(1), std::string("12345678")};
  const std::vector<std::byte> bytes = RowCodec::encode(row, twoColumns(), store.texts);
  EXPECT_EQ(1u, store.super.current().blockCount);
  EXPECT_TRUE(RowCodec::textRefs(ConstBytes(bytes.data(), bytes.size())).empty());
  EXPECT_EQ(row, std::get<Row>(RowCodec::decode(ConstBytes(bytes.data(), bytes.size()), twoColumns(), store.texts)));
}

/* longer text goes to a chain and the row keeps the first block */
TEST(RowCodec, LongTextIsIndirect)
{
  MemoryStore store;
  const std::string text = "twenty bytes of text";
  const Row row{i64(-7), text};
  const std::vector<std::byte> bytes = RowCodec::encode(row, twoColumns(), store.texts);
  const ConstBytes b(bytes.data(), bytes.size());

  EXPECT_EQ(27u, bytes.size());
  EXPECT_EQ(TagText, readLEu8(b, 10));
  EXPECT_EQ(20u, readLEu64(b, 11));
  const BlockIndex start = readLEu64(b, 19);
  EXPECT_EQ(text, store.texts.read(start, text.size()));

  const std::vector<TextRef> refs = RowCodec::textRefs(b);
  ASSERT_EQ(1u, refs.size());
  EXPECT_EQ((TextRef{start, 20}), refs[0]);

  EXPECT_EQ(row, std::get<Row>(RowCodec::decode(b, twoColumns(), store.texts)));
}

TEST(RowCodec, NullsAndReals)
{
  MemoryStore store;
  const TableDef table{"R", {{"x", DataType::Real}, {"y", DataType::Integer}, {"z", DataType::Text}}, 1, {}};
  const Row row{3.25, Value(), Value()};

  EXPECT_EQ(1u + 9 + 1 + 1, RowCodec::sizeOf(row, table));
  const std::vector<std::byte> bytes = RowCodec::encode(row, table, store.texts);
  ASSERT_EQ(12u, bytes.size());
  EXPECT_EQ(TagReal, readLEu8(ConstBytes(bytes.data(), bytes.size()), 1));
  EXPECT_EQ(TagNull, readLEu8(ConstBytes(bytes.data(), bytes.size()), 10));
  EXPECT_EQ(row, std::get<Row>(RowCodec::decode(ConstBytes(bytes.data(), bytes.size()), table, store.texts)));
}

TEST(RowCodec, ShapeErrors)
{
  MemoryStore store;
  EXPECT_THROW(RowCodec::encode(Row{i64(1)}, twoColumns(), store.texts), RowShapeError);
  EXPECT_THROW(RowCodec::encode(Row{std::string("x"), std::string("y")}, twoColumns(), store.texts), RowShapeError);
  EXPECT_THROW(RowCodec::sizeOf(Row{i64(1), 2.0}, twoColumns()), RowShapeError);
}

/* a count byte of 128 would read back as a tombstone */
TEST(RowCodec, TooManyColumns)
{
  MemoryStore store;
  TableDef wide{"wide", {}, 1, {}};
  for (std::size_t i = 0; i <= MAX_COLUMNS; i++)
  {
    wide.columns.push_back(ColumnDef{"c" + std::to_string(i), DataType::Integer});
  }
  const Row row(wide.columns.size(), Value(i64(1)));
  EXPECT_THROW(RowCodec::encode(row, wide, store.texts), RowShapeError);

  wide.columns.pop_back();
  const Row fits(wide.columns.size(), Value(i64(1)));
  const std::vector<std::byte> bytes = RowCodec::encode(fits, wide, store.texts);
  EXPECT_EQ(fits, std::get<Row>(RowCodec::decode(ConstBytes(bytes.data(), bytes.size()), wide, store.texts)));

  const TableDef none{"none", {}, 1, {}};
  EXPECT_THROW(RowCodec::encode(Row{}, none, store.texts), RowShapeError);
}

/* a tombstone negates the column count and can still be measured */
TEST(RowCodec, Tombstone)
{
  MemoryStore store;
  std::vector<std::byte> bytes = RowCodec::encode(Row{i64(42), std::string("hi")}, twoColumns(), store.texts);
  Bytes b(bytes.data(), bytes.size());

  EXPECT_FALSE(RowCodec::isTombstone(b));
  RowCodec::tombstone(b);
  EXPECT_TRUE(RowCodec::isTombstone(b));
  EXPECT_EQ(static_cast<i8>(-2), static_cast<i8>(readLEu8(b, 0)));
  EXPECT_EQ(bytes.size(), RowCodec::encodedSize(b));
  EXPECT_TRUE(std::holds_alternative<Deleted>(RowCodec::decode(b, twoColumns(), store.texts)));
}

TEST(RowCodec, CorruptBytes)
{
  MemoryStore store;
  std::vector<std::byte> bytes = RowCodec::encode(Row{i64(42), std::string("hi")}, twoColumns(), store.texts);

  // unknown tag
  bytes[1] = static_cast<std::byte>(9);
  EXPECT_THROW(RowCodec::encodedSize(ConstBytes(bytes.data(), bytes.size()), 4, 12), RowShapeError);

  // runs past the end
  bytes[1] = static_cast<std::byte>(TagInteger);
  EXPECT_THROW(RowCodec::encodedSize(ConstBytes(bytes.data(), 15)), RowShapeError);

  // column count disagrees with the table
  bytes[0] = static_cast<std::byte>(1);
  EXPECT_THROW(RowCodec::decode(ConstBytes(bytes.data(), bytes.size()), twoColumns(), store.texts), RowShapeError);
}

TEST(RowCodec, ErrorNamesBlock)
{
  std::vector<std::byte> bytes(4, static_cast<std::byte>(0));
  bytes[0] = static_cast<std::byte>(1);
  bytes[1] = static_cast<std::byte>(7);
  try
  {
    (void)RowCodec::encodedSize(ConstBytes(bytes.data(), bytes.size()), 12, 40);
    FAIL() << "expected RowShapeError";
  }
  catch (const RowShapeError &e)
  {
    EXPECT_EQ(12u, e.block());
    EXPECT_NE(std::string::npos, std::string(e.what()).find("offset 40"));
  }
}
