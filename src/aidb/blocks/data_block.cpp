#include "aidb/blocks/data_block.hpp"

#include <algorithm>
#include <limits>

BlockIndex TableHeap::create(Allocator &allocator)
{
  // a zeroed block is an empty data block: no next block, no rows
  return allocator.allocate();
}

std::vector<BlockIndex> TableHeap::blocks()
{
  std::vector<BlockIndex> chain;
  const u64 limit = m_pager.size();

  BlockIndex index = m_table.firstDataBlock;
  while (index != NULL_BLOCK)
  {
    if (chain.size() >= limit)
    {
      throw StorageError(index, "data block chain of table " + m_table.name + " has a cycle");
    }
    chain.push_back(index);
    index = m_pager.read(index).next();
  }
  return chain;
}

DataBlock TableHeap::locate(RowPointer ptr)
{
  if (ptr.block == NULL_BLOCK || m_allocator.isFree(ptr.block))
  {
    throw NotFound(ptr.block, "not a data block of table " + m_table.name);
  }

  DataBlock db(m_pager.read(ptr.block));
  std::size_t at = DataBlock::HEADER_SIZE;
  for (u16 r = 0; r < db.rowCount() && at <= ptr.offset; r++)
  {
    if (at == ptr.offset)
    {
      return db;
    }
    at += RowCodec::encodedSize(db.rowAt(at), ptr.block, at);
  }

  std::ostringstream ss;
  ss << "no row starts at offset " << ptr.offset;
  throw NotFound(ptr.block, ss.str());
}

void TableHeap::freeTexts(ConstBytes row, RowPointer ptr)
{
  for (const TextRef &ref : RowCodec::textRefs(row, ptr.block, ptr.offset))
  {
    m_texts.free(ref.start, ref.length);
  }
}

RowPointer TableHeap::insert(const Row &row)
{
  const std::size_t size = RowCodec::sizeOf(row, m_table);
  const std::size_t capacity = m_pager.blockSize() - DataBlock::HEADER_SIZE;
  if (size > capacity)
  {
    std::ostringstream ss;
    ss << "row of " << size << " bytes does not fit in a data block of " << capacity;
    throw RowShapeError(ss.str());
  }

  // find the end of the chain
  BlockIndex last = m_table.firstDataBlock;
  DataBlock db(m_pager.read(last));
  const u64 limit = m_pager.size();
  for (u64 hops = 0; db.next() != NULL_BLOCK; hops++)
  {
    if (hops >= limit)
    {
      throw StorageError(last, "data block chain of table " + m_table.name + " has a cycle");
    }
    last = db.next();
    db = DataBlock(m_pager.read(last));
  }

  const std::vector<std::byte> encoded = RowCodec::encode(row, m_table, m_texts);

  BlockIndex next = NULL_BLOCK;
  try
  {
    if (db.freeSpace() >= size && db.rowCount() < std::numeric_limits<u16>::max())
    {
      const u16 offset = static_cast<u16>(DataBlock::HEADER_SIZE + db.used());
      std::copy(encoded.begin(), encoded.end(), db.block.buf.begin() + offset);
      db.setRowCount(static_cast<u16>(db.rowCount() + 1));
      db.setUsed(static_cast<u16>(db.used() + size));
      m_pager.write(last, db.block);
      return RowPointer{last, offset};
    }

    // the row goes first into a fresh block, then the chain is extended to it
    next = m_allocator.allocate();
    DataBlock fresh(m_pager.blank());
    std::copy(encoded.begin(), encoded.end(), fresh.block.buf.begin() + DataBlock::HEADER_SIZE);
    fresh.setRowCount(1);
    fresh.setUsed(static_cast<u16>(size));
    m_pager.write(next, fresh.block);

    db.setNext(next);
    m_pager.write(last, db.block);
    return RowPointer{next, static_cast<u16>(DataBlock::HEADER_SIZE)};
  }
  catch (const StorageError &)
  {
    freeTexts(ConstBytes(encoded.data(), encoded.size()), RowPointer{last, 0});
    if (next != NULL_BLOCK)
    {
      m_allocator.free(next);
    }
    throw;
  }
}

std::optional<Row> TableHeap::read(RowPointer ptr)
{
  const DataBlock db = locate(ptr);
  DecodedRow decoded = RowCodec::decode(db.rowAt(ptr.offset), m_table, m_texts, ptr.block, ptr.offset);
  if (std::holds_alternative<Deleted>(decoded))
  {
    return std::nullopt;
  }
  return std::move(std::get<Row>(decoded));
}

void TableHeap::remove(RowPointer ptr)
{
  DataBlock db = locate(ptr);
  Bytes row = db.rowAt(ptr.offset);
  if (RowCodec::isTombstone(row))
  {
    throw NotFound(ptr.block, "row already deleted");
  }

  const std::vector<TextRef> refs = RowCodec::textRefs(row, ptr.block, ptr.offset);
  RowCodec::tombstone(row);
  m_pager.write(ptr.block, db.block);

  for (const TextRef &ref : refs)
  {
    m_texts.free(ref.start, ref.length);
  }
}

RowPointer TableHeap::update(RowPointer ptr, const Row &row)
{
  DataBlock db = locate(ptr);
  Bytes old = db.rowAt(ptr.offset);
  if (RowCodec::isTombstone(old))
  {
    throw NotFound(ptr.block, "row already deleted");
  }

  const std::size_t oldSize = RowCodec::encodedSize(old, ptr.block, ptr.offset);
  if (RowCodec::sizeOf(row, m_table) != oldSize)
  {
    // the row moves. insert first so a failed insert leaves the old row alone
    const RowPointer moved = insert(row);
    remove(ptr);
    return moved;
  }

  const std::vector<TextRef> refs = RowCodec::textRefs(old, ptr.block, ptr.offset);
  const std::vector<std::byte> encoded = RowCodec::encode(row, m_table, m_texts);
  std::copy(encoded.begin(), encoded.end(), old.begin());
  m_pager.write(ptr.block, db.block);

  // text blocks are never edited, the old chains go once the row points elsewhere
  for (const TextRef &ref : refs)
  {
    m_texts.free(ref.start, ref.length);
  }
  return ptr;
}

bool TableHeap::fitsInPlace(RowPointer ptr, const Row &row)
{
  const DataBlock db = locate(ptr);
  const ConstBytes old = db.rowAt(ptr.offset);
  if (RowCodec::isTombstone(old))
  {
    throw NotFound(ptr.block, "row already deleted");
  }
  return RowCodec::sizeOf(row, m_table) == RowCodec::encodedSize(old, ptr.block, ptr.offset);
}

void TableHeap::scan(const std::function<bool(RowPointer, const Row &)> &visit)
{
  for (BlockIndex index : blocks())
  {
    const DataBlock db(m_pager.read(index));
    std::size_t at = DataBlock::HEADER_SIZE;
    for (u16 r = 0; r < db.rowCount(); r++)
    {
      const ConstBytes bytes = db.rowAt(at);
      const std::size_t size = RowCodec::encodedSize(bytes, index, at);
      DecodedRow decoded = RowCodec::decode(bytes, m_table, m_texts, index, at);
      if (const Row *row = std::get_if<Row>(&decoded); row != nullptr)
      {
        if (!visit(RowPointer{index, static_cast<u16>(at)}, *row))
        {
          return;
        }
      }
      at += size;
    }
  }
}

void TableHeap::drop()
{
  for (BlockIndex index : blocks())
  {
    const DataBlock db(m_pager.read(index));
    std::size_t at = DataBlock::HEADER_SIZE;
    for (u16 r = 0; r < db.rowCount(); r++)
    {
      const ConstBytes bytes = db.rowAt(at);
      // a tombstone's text went when it was deleted
      if (!RowCodec::isTombstone(bytes))
      {
        freeTexts(bytes, RowPointer{index, static_cast<u16>(at)});
      }
      at += RowCodec::encodedSize(bytes, index, at);
    }
    m_allocator.free(index);
  }
}
