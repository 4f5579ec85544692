#pragma once

#include "aidb/blocks/row_codec.hpp"

#include <functional>
#include <optional>

// a table's rows live in a chain of data blocks:
// [u64 next data block][u16 row count][u16 bytes used] then the rows, packed
struct DataBlock
{
  static constexpr std::size_t NEXT_OFFSET = 0;
  static constexpr std::size_t ROW_COUNT_OFFSET = 8;
  static constexpr std::size_t USED_OFFSET = 10;
  static constexpr std::size_t HEADER_SIZE = 12;

  Block block;

  explicit DataBlock(Block b) : block(std::move(b)) {}

  BlockIndex next() const { return block.next(); }
  void setNext(BlockIndex next) { block.setNext(next); }

  u16 rowCount() const { return readLEu16(block.bytes(), ROW_COUNT_OFFSET); }
  void setRowCount(u16 count) { writeLEu16(block.bytes(), ROW_COUNT_OFFSET, count); }

  u16 used() const { return readLEu16(block.bytes(), USED_OFFSET); }
  void setUsed(u16 used) { writeLEu16(block.bytes(), USED_OFFSET, used); }

  std::size_t capacity() const noexcept { return block.size() - HEADER_SIZE; }
  std::size_t freeSpace() const { return capacity() - used(); }

  // bytes from offset to the end of the used region
  ConstBytes rowAt(std::size_t offset) const { return block.bytes().subspan(offset, rowSpan(offset)); }
  Bytes rowAt(std::size_t offset) { return block.bytes().subspan(offset, rowSpan(offset)); }

private:
  std::size_t rowSpan(std::size_t offset) const
  {
    const std::size_t end = HEADER_SIZE + used();
    if (offset < HEADER_SIZE || offset >= end || end > block.size())
    {
      std::ostringstream ss;
      ss << "row offset " << offset << " outside the " << used() << " bytes in use";
      throw RowShapeError(ss.str());
    }
    return end - offset;
  }
};

// the rows of one table. holds no state of its own beyond the table definition,
// every call reads the chain from the first data block
class TableHeap
{
public:
  TableHeap(Pager &pager, Allocator &allocator, TextChains &texts, const TableDef &table)
      : m_pager(pager), m_allocator(allocator), m_texts(texts), m_table(table)
  {
  }

  // a new empty chain for a table
  [[nodiscard]] static BlockIndex create(Allocator &allocator);

  [[nodiscard]] RowPointer insert(const Row &row);
  // empty if the row has been deleted
  std::optional<Row> read(RowPointer ptr);
  void remove(RowPointer ptr);
  // in place when the row keeps its size, otherwise the row moves
  [[nodiscard]] RowPointer update(RowPointer ptr, const Row &row);
  // whether update would keep the row at ptr
  bool fitsInPlace(RowPointer ptr, const Row &row);

  // visits live rows in storage order. return false to stop
  void scan(const std::function<bool(RowPointer, const Row &)> &visit);

  // free the data blocks and every text chain the rows own
  void drop();

  std::vector<BlockIndex> blocks();

private:
  // checks ptr is the start of a row in a data block of this table
  DataBlock locate(RowPointer ptr);
  void freeTexts(ConstBytes row, RowPointer ptr);

  Pager &m_pager;
  Allocator &m_allocator;
  TextChains &m_texts;
  const TableDef &m_table;
};
