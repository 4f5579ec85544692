#include "aidb/blocks/row_codec.hpp"

#include <algorithm>

namespace
{

std::string describe(std::size_t offset, const std::string &message)
{
  std::ostringstream ss;
  ss << "row at offset " << offset << ": " << message;
  return ss.str();
}

[[noreturn]] void fail(BlockIndex block, std::size_t offset, const std::string &message)
{
  if (block == NULL_BLOCK)
  {
    throw RowShapeError(describe(offset, message));
  }
  throw RowShapeError(block, describe(offset, message));
}

std::size_t valueSize(u8 tag, BlockIndex block, std::size_t offset)
{
  switch (tag)
  {
  case TagNull:
    return TAG_SIZE;
  case TagInteger:
  case TagReal:
    return TAG_SIZE + NUMBER_SIZE;
  case TagText:
    return TAG_SIZE + TEXT_SIZE;
  default:
    fail(block, offset, "unknown value tag " + std::to_string(tag));
  }
}

void checkShape(const Row &row, const TableDef &table)
{
  // the count byte is signed and 0 or less marks a tombstone
  if (table.columns.empty() || table.columns.size() > MAX_COLUMNS)
  {
    std::ostringstream ss;
    ss << "table " << table.name << " has " << table.columns.size() << " columns, rows hold 1 to " << MAX_COLUMNS;
    throw RowShapeError(ss.str());
  }
  if (row.size() != table.columns.size())
  {
    std::ostringstream ss;
    ss << "table " << table.name << " has " << table.columns.size() << " columns, row has " << row.size();
    throw RowShapeError(ss.str());
  }

  for (std::size_t i = 0; i < row.size(); i++)
  {
    const std::optional<DataType> type = valueType(row[i]);
    if (type.has_value() && *type != table.columns[i].type)
    {
      std::ostringstream ss;
      ss << "column " << table.columns[i].name << " of table " << table.name << " is "
         << dataTypeName(table.columns[i].type) << ", got " << dataTypeName(*type);
      throw RowShapeError(ss.str());
    }
  }
}

} // namespace

std::size_t RowCodec::sizeOf(const Row &row, const TableDef &table)
{
  checkShape(row, table);

  std::size_t size = ROW_HEADER_SIZE;
  for (const Value &v : row)
  {
    switch (v.index())
    {
    case 0:
      size += TAG_SIZE;
      break;
    case 1:
    case 2:
      size += TAG_SIZE + NUMBER_SIZE;
      break;
    default:
      size += TAG_SIZE + TEXT_SIZE;
      break;
    }
  }
  return size;
}

TextSlot RowCodec::textSlot(std::string_view text, TextChains &texts)
{
  if (text.size() <= INLINE_TEXT_MAX)
  {
    InlineText slot;
    std::copy(text.begin(), text.end(), slot.bytes.begin());
    return slot;
  }
  return IndirectText{texts.write(text)};
}

std::vector<std::byte> RowCodec::encode(const Row &row, const TableDef &table, TextChains &texts)
{
  std::vector<std::byte> out(sizeOf(row, table), static_cast<std::byte>(0));
  Bytes b(out.data(), out.size());

  writeLEu8(b, 0, static_cast<u8>(row.size()));
  std::size_t at = ROW_HEADER_SIZE;

  std::vector<TextRef> written;
  try
  {
    for (const Value &v : row)
    {
      if (const i64 *i = std::get_if<i64>(&v); i != nullptr)
      {
        writeLEu8(b, at, TagInteger);
        writeLEi64(b, at + TAG_SIZE, *i);
        at += TAG_SIZE + NUMBER_SIZE;
      }
      else if (const double *d = std::get_if<double>(&v); d != nullptr)
      {
        writeLEu8(b, at, TagReal);
        writeLEf64(b, at + TAG_SIZE, *d);
        at += TAG_SIZE + NUMBER_SIZE;
      }
      else if (const std::string *s = std::get_if<std::string>(&v); s != nullptr)
      {
        writeLEu8(b, at, TagText);
        writeLEu64(b, at + TAG_SIZE, s->size());

        const TextSlot slot = textSlot(*s, texts);
        if (const InlineText *inl = std::get_if<InlineText>(&slot); inl != nullptr)
        {
          writeBytes(b, at + TAG_SIZE + 8, std::string_view(inl->bytes.data(), inl->bytes.size()));
        }
        else
        {
          const BlockIndex start = std::get<IndirectText>(slot).start;
          written.push_back(TextRef{start, s->size()});
          writeLEu64(b, at + TAG_SIZE + 8, start);
        }
        at += TAG_SIZE + TEXT_SIZE;
      }
      else
      {
        writeLEu8(b, at, TagNull);
        at += TAG_SIZE;
      }
    }
  }
  catch (const StorageError &)
  {
    for (const TextRef &ref : written)
    {
      texts.free(ref.start, ref.length);
    }
    throw;
  }

  return out;
}

std::size_t RowCodec::encodedSize(ConstBytes bytes, BlockIndex block, std::size_t offset)
{
  if (bytes.empty())
  {
    fail(block, offset, "no room for a row header");
  }

  const i8 count = static_cast<i8>(readLEu8(bytes, 0));
  const int columns = count < 0 ? -static_cast<int>(count) : count;

  std::size_t at = ROW_HEADER_SIZE;
  for (int c = 0; c < columns; c++)
  {
    if (at >= bytes.size())
    {
      fail(block, offset, "row runs past the end of the block");
    }
    at += valueSize(readLEu8(bytes, at), block, offset);
  }
  if (at > bytes.size())
  {
    fail(block, offset, "row runs past the end of the block");
  }
  return at;
}

bool RowCodec::isTombstone(ConstBytes bytes) noexcept
{
  return static_cast<i8>(readLEu8(bytes, 0)) <= 0;
}

void RowCodec::tombstone(Bytes bytes)
{
  const i8 count = static_cast<i8>(readLEu8(bytes, 0));
  if (count > 0)
  {
    writeLEu8(bytes, 0, static_cast<u8>(static_cast<i8>(-count)));
  }
}

std::vector<TextRef> RowCodec::textRefs(ConstBytes bytes, BlockIndex block, std::size_t offset)
{
  const std::size_t size = encodedSize(bytes, block, offset);
  const i8 count = static_cast<i8>(readLEu8(bytes, 0));
  const int columns = count < 0 ? -static_cast<int>(count) : count;

  std::vector<TextRef> refs;
  std::size_t at = ROW_HEADER_SIZE;
  for (int c = 0; c < columns && at < size; c++)
  {
    const u8 tag = readLEu8(bytes, at);
    if (tag == TagText)
    {
      const u64 length = readLEu64(bytes, at + TAG_SIZE);
      if (length > INLINE_TEXT_MAX)
      {
        refs.push_back(TextRef{readLEu64(bytes, at + TAG_SIZE + 8), length});
      }
    }
    at += valueSize(tag, block, offset);
  }
  return refs;
}

DecodedRow RowCodec::decode(ConstBytes bytes, const TableDef &table, TextChains &texts,
                            BlockIndex block, std::size_t offset)
{
  const std::size_t size = encodedSize(bytes, block, offset);
  if (isTombstone(bytes))
  {
    return Deleted{};
  }

  const std::size_t columns = readLEu8(bytes, 0);
  if (columns != table.columns.size())
  {
    std::ostringstream ss;
    ss << "stored with " << columns << " columns, table " << table.name << " has " << table.columns.size();
    fail(block, offset, ss.str());
  }

  Row row;
  row.reserve(columns);
  std::size_t at = ROW_HEADER_SIZE;
  for (std::size_t c = 0; c < columns && at < size; c++)
  {
    const u8 tag = readLEu8(bytes, at);
    switch (tag)
    {
    case TagNull:
      row.emplace_back(std::monostate{});
      break;
    case TagInteger:
      row.emplace_back(readLEi64(bytes, at + TAG_SIZE));
      break;
    case TagReal:
      row.emplace_back(readLEf64(bytes, at + TAG_SIZE));
      break;
    case TagText:
    {
      const u64 length = readLEu64(bytes, at + TAG_SIZE);
      if (length <= INLINE_TEXT_MAX)
      {
        row.emplace_back(std::string(readBytes(bytes, at + TAG_SIZE + 8, length)));
      }
      else
      {
        // long text costs one or more extra block reads
        row.emplace_back(texts.read(readLEu64(bytes, at + TAG_SIZE + 8), length));
      }
      break;
    }
    default:
      fail(block, offset, "unknown value tag " + std::to_string(tag));
    }

    const std::optional<DataType> type = valueType(row.back());
    if (type.has_value() && *type != table.columns[c].type)
    {
      std::ostringstream ss;
      ss << "column " << table.columns[c].name << " holds " << dataTypeName(*type) << ", expected "
         << dataTypeName(table.columns[c].type);
      fail(block, offset, ss.str());
    }

    at += valueSize(tag, block, offset);
  }

  return row;
}
