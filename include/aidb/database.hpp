#pragma once

#include "aidb/blocks/data_block.hpp"
#include "aidb/blocks/schema.hpp"
#include "aidb/index/btree.hpp"
#include "aidb/index/hash_index.hpp"
#include "aidb/options.hpp"
#include "aidb/scheduler.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// a store opened over a backend. formats the backend when it is empty,
// otherwise loads the superblock, free list and schema from it
class Database
{
public:
  explicit Database(StorageBackend &backend, const Options &options = Options(),
                    std::unique_ptr<MutationScheduler> scheduler = nullptr);

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  void createTable(const std::string &name, const std::vector<ColumnDef> &columns);
  // frees the table's rows, text and indexes
  void dropTable(const std::string &name);
  std::vector<std::string> tables();
  TableDef table(const std::string &name);

  RowPointer insert(const std::string &table, const Row &row);
  std::optional<Row> read(const std::string &table, RowPointer ptr);
  // the row may move, use the returned pointer from now on
  RowPointer update(const std::string &table, RowPointer ptr, const Row &row);
  void remove(const std::string &table, RowPointer ptr);
  // visit must not call back into the database
  void scan(const std::string &table, const std::function<bool(RowPointer, const Row &)> &visit);

  // indexes the rows already in the table. only Integer columns can be indexed
  void createIndex(const std::string &table, const std::string &column, IndexKind kind);
  // rows whose column equals key, through any index on the column
  std::vector<RowPointer> lookup(const std::string &table, const std::string &column, i64 key);
  // rows in key order, needs a B+Tree index on the column
  std::vector<RowPointer> range(const std::string &table, const std::string &column, Bound low, Bound high);
  // throws IndexCorrupt if any index of the table is broken
  void checkIndexes(const std::string &table);

  // every block that is not on the free list, block 0 first
  void forEachLiveBlock(const std::function<void(BlockIndex, ConstBytes)> &visit);

  IoStats ioStats() const { return m_pager.stats(); }
  void resetIoStats() { m_pager.resetStats(); }
  SuperBlock superBlock() const { return m_super.current(); }
  u64 freeBlocks() const noexcept { return m_allocator.freeCount(); }
  const Options &options() const noexcept { return m_options; }

private:
  const TableDef &find(const std::string &name) const;
  static std::size_t columnOf(const TableDef &table, const std::string &column);
  TableHeap heap(const TableDef &table);
  // hash indexes are opened once and kept, their directory is read on open
  void openIndex(const IndexDef &index);
  HashIndex &hashIndex(const IndexDef &index);

  // adds row to every index of table, or to none of them
  void addToIndexes(const TableDef &table, const Row &row, RowPointer ptr);
  // false if the index has no entry for row
  bool removeEntry(const IndexDef &index, const Row &row, RowPointer ptr);
  void removeFromIndexes(const TableDef &table, const Row &row, RowPointer ptr);
  // stores the row and indexes it. a failure leaves neither behind
  RowPointer insertRow(const TableDef &table, TableHeap &rows, const Row &row);
  void destroyIndex(const IndexDef &index);
  void saveSchema(const std::vector<TableDef> &tables);

  Options m_options;
  Pager m_pager;
  SuperBlockManager m_super;
  Allocator m_allocator;
  TextChains m_texts;
  SchemaStore m_schema;
  std::unique_ptr<MutationScheduler> m_scheduler;
  std::vector<TableDef> m_tables;
  std::unordered_map<BlockIndex, HashIndex> m_hashes;
};
