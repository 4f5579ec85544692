#include "aidb/blocks/schema.hpp"

#include <limits>

const char *indexKindName(IndexKind kind) noexcept
{
  switch (kind)
  {
  case IndexKind::BTree:
    return "BTREE";
  case IndexKind::Hash:
    return "HASH";
  }
  return "UNKNOWN";
}

std::optional<std::size_t> TableDef::columnIndex(std::string_view column) const noexcept
{
  for (std::size_t i = 0; i < columns.size(); i++)
  {
    if (columns[i].name == column)
    {
      return i;
    }
  }
  return std::nullopt;
}

namespace
{

class Writer
{
public:
  void u8v(u8 v) { m_out.push_back(static_cast<std::byte>(v)); }

  void u16v(u16 v)
  {
    grow(2);
    writeLEu16(tail(2), 0, v);
  }

  void u32v(u32 v)
  {
    grow(4);
    writeLEu32(tail(4), 0, v);
  }

  void u64v(u64 v)
  {
    grow(8);
    writeLEu64(tail(8), 0, v);
  }

  void name(std::string_view s, const char *what)
  {
    if (s.size() > std::numeric_limits<u16>::max())
    {
      throw SchemaDecodeError(std::string(what) + " name longer than 65535 bytes");
    }
    u16v(static_cast<u16>(s.size()));
    grow(s.size());
    writeBytes(tail(s.size()), 0, s);
  }

  std::vector<std::byte> &bytes() { return m_out; }

private:
  void grow(std::size_t n) { m_out.resize(m_out.size() + n); }
  Bytes tail(std::size_t n) { return Bytes(m_out.data() + m_out.size() - n, n); }

  std::vector<std::byte> m_out;
};

class Reader
{
public:
  explicit Reader(ConstBytes in) : m_in(in) {}

  u8 u8v() { return readLEu8(need(1), 0); }
  u16 u16v() { return readLEu16(need(2), 0); }
  u32 u32v() { return readLEu32(need(4), 0); }
  u64 u64v() { return readLEu64(need(8), 0); }

  std::string name()
  {
    const u16 n = u16v();
    return std::string(readBytes(need(n), 0, n));
  }

  std::size_t offset() const noexcept { return m_offset; }

private:
  ConstBytes need(std::size_t n)
  {
    if (m_offset + n > m_in.size())
    {
      std::ostringstream ss;
      ss << "schema truncated at byte " << m_offset << ", needed " << n << " more of " << m_in.size();
      throw SchemaDecodeError(ss.str());
    }
    ConstBytes b = m_in.subspan(m_offset, n);
    m_offset += n;
    return b;
  }

  ConstBytes m_in;
  std::size_t m_offset = 0;
};

DataType decodeType(u8 tag, std::size_t offset)
{
  switch (tag)
  {
  case static_cast<u8>(DataType::Integer):
  case static_cast<u8>(DataType::Real):
  case static_cast<u8>(DataType::Text):
    return static_cast<DataType>(tag);
  default:
  {
    std::ostringstream ss;
    ss << "unknown column type tag " << static_cast<int>(tag) << " at byte " << offset;
    throw SchemaDecodeError(ss.str());
  }
  }
}

} // namespace

std::vector<std::byte> SchemaCodec::encode(const std::vector<TableDef> &tables)
{
  Writer w;
  w.u32v(0); // length, patched below
  w.u32v(static_cast<u32>(tables.size()));

  for (const TableDef &t : tables)
  {
    if (t.columns.empty() || t.columns.size() > MAX_COLUMNS)
    {
      std::ostringstream ss;
      ss << "table " << t.name << " has " << t.columns.size() << " columns, must be 1 to " << MAX_COLUMNS;
      throw SchemaDecodeError(ss.str());
    }
    if (t.indexes.size() > std::numeric_limits<u8>::max())
    {
      throw SchemaDecodeError("table " + t.name + " has more than 255 indexes");
    }

    w.name(t.name, "table");
    w.u8v(static_cast<u8>(t.columns.size()));
    for (const ColumnDef &c : t.columns)
    {
      w.name(c.name, "column");
      w.u8v(static_cast<u8>(c.type));
    }
    w.u64v(t.firstDataBlock);
    w.u8v(static_cast<u8>(t.indexes.size()));
    for (const IndexDef &i : t.indexes)
    {
      w.u8v(static_cast<u8>(i.kind));
      w.u8v(i.column);
      w.u64v(i.meta);
    }
  }

  std::vector<std::byte> &out = w.bytes();
  writeLEu32(Bytes(out.data(), out.size()), 0, static_cast<u32>(out.size() - LENGTH_PREFIX));
  return std::move(out);
}

std::vector<TableDef> SchemaCodec::decode(ConstBytes bytes)
{
  Reader prefix(bytes);
  const u32 length = prefix.u32v();
  if (LENGTH_PREFIX + static_cast<std::size_t>(length) > bytes.size())
  {
    std::ostringstream ss;
    ss << "schema declares " << length << " bytes, only " << bytes.size() - LENGTH_PREFIX << " present";
    throw SchemaDecodeError(ss.str());
  }

  Reader r(bytes.subspan(LENGTH_PREFIX, length));
  const u32 count = r.u32v();

  std::vector<TableDef> tables;
  for (u32 t = 0; t < count; t++)
  {
    TableDef table;
    table.name = r.name();

    const u8 columns = r.u8v();
    if (columns == 0 || columns > MAX_COLUMNS)
    {
      std::ostringstream ss;
      ss << "table " << table.name << " has " << static_cast<int>(columns) << " columns";
      throw SchemaDecodeError(ss.str());
    }
    for (u8 c = 0; c < columns; c++)
    {
      ColumnDef column;
      column.name = r.name();
      const std::size_t at = r.offset();
      column.type = decodeType(r.u8v(), at);
      table.columns.push_back(std::move(column));
    }

    table.firstDataBlock = r.u64v();

    const u8 indexes = r.u8v();
    for (u8 i = 0; i < indexes; i++)
    {
      IndexDef index;
      const u8 kind = r.u8v();
      if (kind != static_cast<u8>(IndexKind::BTree) && kind != static_cast<u8>(IndexKind::Hash))
      {
        std::ostringstream ss;
        ss << "unknown index kind " << static_cast<int>(kind) << " on table " << table.name;
        throw SchemaDecodeError(ss.str());
      }
      index.kind = static_cast<IndexKind>(kind);
      index.column = r.u8v();
      if (index.column >= table.columns.size())
      {
        std::ostringstream ss;
        ss << "index on column " << static_cast<int>(index.column) << " of table " << table.name
           << " which has " << table.columns.size() << " columns";
        throw SchemaDecodeError(ss.str());
      }
      index.meta = r.u64v();
      table.indexes.push_back(index);
    }

    tables.push_back(std::move(table));
  }

  if (r.offset() != length)
  {
    std::ostringstream ss;
    ss << (length - r.offset()) << " trailing bytes after " << count << " tables";
    throw SchemaDecodeError(ss.str());
  }

  return tables;
}

std::vector<TableDef> SchemaStore::load()
{
  const BlockIndex first = m_super.current().schemaBlock;
  if (first == NULL_BLOCK)
  {
    m_length = 0;
    return {};
  }

  std::string bytes;
  try
  {
    const std::string prefix = m_chains.read(first, SchemaCodec::LENGTH_PREFIX);
    const u32 length = readLEu32(ConstBytes(reinterpret_cast<const std::byte *>(prefix.data()), prefix.size()), 0);
    bytes = m_chains.read(first, SchemaCodec::LENGTH_PREFIX + static_cast<u64>(length));
  }
  catch (const TextChainTruncated &e)
  {
    throw SchemaDecodeError(e.block(), "schema chain ends early");
  }

  m_length = bytes.size();
  return SchemaCodec::decode(ConstBytes(reinterpret_cast<const std::byte *>(bytes.data()), bytes.size()));
}

void SchemaStore::save(const std::vector<TableDef> &tables)
{
  const BlockIndex old = m_super.current().schemaBlock;
  if (old != NULL_BLOCK && m_length == 0)
  {
    // never loaded, find out how long the old chain is
    load();
  }
  const u64 oldLength = m_length;

  BlockIndex first = NULL_BLOCK;
  u64 length = 0;
  if (!tables.empty())
  {
    const std::vector<std::byte> bytes = SchemaCodec::encode(tables);
    first = m_chains.write(std::string_view(reinterpret_cast<const char *>(bytes.data()), bytes.size()));
    length = bytes.size();
  }

  // switch the root pointer, then drop the old chain
  SuperBlock sb = m_super.current();
  sb.schemaBlock = first;
  m_super.commit(sb);
  m_length = length;

  if (old != NULL_BLOCK)
  {
    m_chains.free(old, oldLength);
  }
}
