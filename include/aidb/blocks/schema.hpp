#pragma once

#include "aidb/blocks/text_chain.hpp"
#include "aidb/value.hpp"

#include <optional>
#include <string>
#include <vector>

// the row header is a signed byte, so that is all the columns a table can have
const std::size_t MAX_COLUMNS = 127;

struct ColumnDef
{
  std::string name;
  DataType type;

  friend bool operator==(const ColumnDef &, const ColumnDef &) = default;
};

enum class IndexKind : u8
{
  BTree = 1,
  Hash = 2,
};

const char *indexKindName(IndexKind kind) noexcept;

struct IndexDef
{
  IndexKind kind;
  u8 column;        // ordinal of the indexed column
  BlockIndex meta;  // block identifying the index, it never moves

  friend bool operator==(const IndexDef &, const IndexDef &) = default;
};

struct TableDef
{
  std::string name;
  std::vector<ColumnDef> columns;
  BlockIndex firstDataBlock = NULL_BLOCK;
  std::vector<IndexDef> indexes;

  std::optional<std::size_t> columnIndex(std::string_view column) const noexcept;

  friend bool operator==(const TableDef &, const TableDef &) = default;
};

/* schema encoding, every integer little endian:
 *   u32 length of what follows, u32 table count, then per table
 *   u16 name length, name, u8 column count,
 *   per column: u16 name length, name, u8 type tag
 *   u64 first data block, u8 index count,
 *   per index: u8 kind, u8 column ordinal, u64 meta block */
class SchemaCodec
{
public:
  static std::vector<std::byte> encode(const std::vector<TableDef> &tables);
  static std::vector<TableDef> decode(ConstBytes bytes);

  static constexpr std::size_t LENGTH_PREFIX = sizeof(u32);
};

// keeps the encoded schema in a chain of schema blocks hanging off the superblock.
// the chain is replaced as a whole on every save
class SchemaStore
{
public:
  SchemaStore(SuperBlockManager &super, TextChains &chains) : m_super(super), m_chains(chains) {}

  std::vector<TableDef> load();
  void save(const std::vector<TableDef> &tables);

private:
  SuperBlockManager &m_super;
  // schema blocks share the text block layout, next pointer then payload
  TextChains &m_chains;
  u64 m_length = 0;
};
