#include "aidb/database.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <unordered_set>

Database::Database(StorageBackend &backend, const Options &options, std::unique_ptr<MutationScheduler> scheduler)
    : m_options(options),
      m_pager(backend, options.blockSize, options.cacheBlocks),
      m_super(m_pager),
      m_allocator(m_pager, m_super, options.maxBlocks),
      m_texts(m_pager, m_allocator),
      m_schema(m_super, m_texts),
      m_scheduler(std::move(scheduler))
{
  if (!m_scheduler)
  {
    m_scheduler = std::make_unique<SingleWriterScheduler>();
  }

  if (m_pager.size() == 0)
  {
    m_super.format();
    if (m_options.verbose)
    {
      std::cerr << "database: formatted new store with " << m_options.blockSize << " byte blocks" << std::endl;
    }
  }
  else
  {
    m_super.load();
  }

  m_allocator.load();
  m_tables = m_schema.load();
  for (const TableDef &t : m_tables)
  {
    for (const IndexDef &index : t.indexes)
    {
      openIndex(index);
    }
  }

  if (m_options.verbose)
  {
    std::cerr << "database: " << m_super.current().blockCount << " blocks, " << m_allocator.freeCount()
              << " free, " << m_tables.size() << " tables" << std::endl;
  }
}

const TableDef &Database::find(const std::string &name) const
{
  const auto it = std::find_if(m_tables.begin(), m_tables.end(), [&](const TableDef &t) { return t.name == name; });
  if (it == m_tables.end())
  {
    throw NotFound("no table named " + name);
  }
  return *it;
}

std::size_t Database::columnOf(const TableDef &table, const std::string &column)
{
  const std::optional<std::size_t> ordinal = table.columnIndex(column);
  if (!ordinal.has_value())
  {
    throw NotFound("table " + table.name + " has no column " + column);
  }
  return *ordinal;
}

void Database::openIndex(const IndexDef &index)
{
  if (index.kind == IndexKind::Hash)
  {
    m_hashes.emplace(index.meta, HashIndex(m_pager, m_allocator, index.meta));
  }
}

HashIndex &Database::hashIndex(const IndexDef &index)
{
  const auto it = m_hashes.find(index.meta);
  if (it == m_hashes.end())
  {
    throw IndexCorrupt(index.meta, "hash index was never opened");
  }
  return it->second;
}

TableHeap Database::heap(const TableDef &table)
{
  return TableHeap(m_pager, m_allocator, m_texts, table);
}

void Database::saveSchema(const std::vector<TableDef> &tables)
{
  m_schema.save(tables);
  m_tables = tables;
}

void Database::createTable(const std::string &name, const std::vector<ColumnDef> &columns)
{
  m_scheduler->exclusive([&] {
    if (std::any_of(m_tables.begin(), m_tables.end(), [&](const TableDef &t) { return t.name == name; }))
    {
      throw TableExists("table " + name + " already exists");
    }
    if (name.empty())
    {
      throw RowShapeError("a table needs a name");
    }
    if (columns.empty() || columns.size() > MAX_COLUMNS)
    {
      std::ostringstream ss;
      ss << "a table has between 1 and " << MAX_COLUMNS << " columns, " << name << " has " << columns.size();
      throw RowShapeError(ss.str());
    }

    std::unordered_set<std::string> seen;
    for (const ColumnDef &c : columns)
    {
      if (c.name.empty() || !seen.insert(c.name).second)
      {
        throw RowShapeError("table " + name + " has an empty or repeated column name '" + c.name + "'");
      }
    }

    TableDef def{name, columns, TableHeap::create(m_allocator), {}};
    std::vector<TableDef> next = m_tables;
    next.push_back(def);
    try
    {
      saveSchema(next);
    }
    catch (const StorageError &)
    {
      m_allocator.free(def.firstDataBlock);
      throw;
    }

    if (m_options.verbose)
    {
      std::cerr << "database: created table " << name << " at block " << def.firstDataBlock << std::endl;
    }
  });
}

void Database::dropTable(const std::string &name)
{
  m_scheduler->exclusive([&] {
    const TableDef def = find(name);

    std::vector<TableDef> next;
    std::copy_if(m_tables.begin(), m_tables.end(), std::back_inserter(next),
                 [&](const TableDef &t) { return t.name != name; });
    // the schema stops pointing at the table before its blocks are freed
    saveSchema(next);

    for (const IndexDef &index : def.indexes)
    {
      destroyIndex(index);
    }
    heap(def).drop();
  });
}

std::vector<std::string> Database::tables()
{
  std::vector<std::string> names;
  m_scheduler->shared([&] {
    for (const TableDef &t : m_tables)
    {
      names.push_back(t.name);
    }
  });
  return names;
}

TableDef Database::table(const std::string &name)
{
  TableDef def;
  m_scheduler->shared([&] { def = find(name); });
  return def;
}

void Database::addToIndexes(const TableDef &table, const Row &row, RowPointer ptr)
{
  std::size_t done = 0;
  try
  {
    for (; done < table.indexes.size(); done++)
    {
      const IndexDef &index = table.indexes[done];
      // nulls are not indexed
      const i64 *key = std::get_if<i64>(&row.at(index.column));
      if (key == nullptr)
      {
        continue;
      }
      if (index.kind == IndexKind::BTree)
      {
        BTree(m_pager, m_allocator, index.meta).insert(*key, ptr);
      }
      else
      {
        hashIndex(index).insert(*key, ptr);
      }
    }
  }
  catch (const StorageError &)
  {
    // the index that threw is unchanged, take the entry back out of the ones before it
    for (std::size_t i = 0; i < done; i++)
    {
      (void)removeEntry(table.indexes[i], row, ptr);
    }
    throw;
  }
}

bool Database::removeEntry(const IndexDef &index, const Row &row, RowPointer ptr)
{
  const i64 *key = std::get_if<i64>(&row.at(index.column));
  if (key == nullptr)
  {
    return true;
  }
  return index.kind == IndexKind::BTree ? BTree(m_pager, m_allocator, index.meta).remove(*key, ptr)
                                        : hashIndex(index).remove(*key, ptr);
}

void Database::removeFromIndexes(const TableDef &table, const Row &row, RowPointer ptr)
{
  for (const IndexDef &index : table.indexes)
  {
    if (!removeEntry(index, row, ptr))
    {
      std::ostringstream ss;
      ss << indexKindName(index.kind) << " index on " << table.name << "." << table.columns[index.column].name
         << " has no entry for " << row.at(index.column) << " at " << ptr;
      throw IndexCorrupt(index.meta, ss.str());
    }
  }
}

RowPointer Database::insertRow(const TableDef &table, TableHeap &rows, const Row &row)
{
  const RowPointer ptr = rows.insert(row);
  try
  {
    addToIndexes(table, row, ptr);
  }
  catch (const StorageError &)
  {
    rows.remove(ptr);
    throw;
  }
  return ptr;
}

void Database::destroyIndex(const IndexDef &index)
{
  if (index.kind == IndexKind::BTree)
  {
    BTree(m_pager, m_allocator, index.meta).destroy();
  }
  else
  {
    const auto it = m_hashes.find(index.meta);
    if (it == m_hashes.end())
    {
      HashIndex(m_pager, m_allocator, index.meta).destroy();
      return;
    }
    it->second.destroy();
    m_hashes.erase(it);
  }
}

RowPointer Database::insert(const std::string &table, const Row &row)
{
  RowPointer ptr{};
  m_scheduler->exclusive([&] {
    const TableDef &def = find(table);
    TableHeap rows = heap(def);
    ptr = insertRow(def, rows, row);
  });
  return ptr;
}

std::optional<Row> Database::read(const std::string &table, RowPointer ptr)
{
  std::optional<Row> row;
  m_scheduler->shared([&] { row = heap(find(table)).read(ptr); });
  return row;
}

RowPointer Database::update(const std::string &table, RowPointer ptr, const Row &row)
{
  RowPointer moved{};
  m_scheduler->exclusive([&] {
    const TableDef &def = find(table);
    TableHeap rows = heap(def);

    const std::optional<Row> old = rows.read(ptr);
    if (!old.has_value())
    {
      throw NotFound(ptr.block, "row already deleted");
    }
    if (rows.fitsInPlace(ptr, row))
    {
      // the pointer stays, so the new entries can go in before the row changes
      addToIndexes(def, row, ptr);
      try
      {
        moved = rows.update(ptr, row);
      }
      catch (const StorageError &)
      {
        removeFromIndexes(def, row, ptr);
        throw;
      }
    }
    else
    {
      moved = insertRow(def, rows, row);
      rows.remove(ptr);
    }
    removeFromIndexes(def, *old, ptr);
  });
  return moved;
}

void Database::remove(const std::string &table, RowPointer ptr)
{
  m_scheduler->exclusive([&] {
    const TableDef &def = find(table);
    TableHeap rows = heap(def);

    const std::optional<Row> old = rows.read(ptr);
    if (!old.has_value())
    {
      throw NotFound(ptr.block, "row already deleted");
    }
    rows.remove(ptr);
    removeFromIndexes(def, *old, ptr);
  });
}

void Database::scan(const std::string &table, const std::function<bool(RowPointer, const Row &)> &visit)
{
  m_scheduler->shared([&] { heap(find(table)).scan(visit); });
}

void Database::createIndex(const std::string &table, const std::string &column, IndexKind kind)
{
  m_scheduler->exclusive([&] {
    const TableDef &def = find(table);
    const std::size_t ordinal = columnOf(def, column);
    if (def.columns[ordinal].type != DataType::Integer)
    {
      throw RowShapeError("column " + column + " of table " + table + " is " +
                          dataTypeName(def.columns[ordinal].type) + ", only INTEGER columns can be indexed");
    }
    for (const IndexDef &index : def.indexes)
    {
      if (index.column == ordinal && index.kind == kind)
      {
        throw TableExists("table " + table + " already has a " + indexKindName(kind) + " index on " + column);
      }
    }

    IndexDef index{kind, static_cast<u8>(ordinal), NULL_BLOCK};
    index.meta = kind == IndexKind::BTree
                     ? BTree::create(m_pager, m_allocator, m_options.btreeLeafCapacity,
                                     m_options.btreeInternalCapacity)
                     : HashIndex::create(m_pager, m_allocator, m_options.hashBucketBits);

    try
    {
      openIndex(index);
      TableDef single = def;
      single.indexes = {index};
      heap(def).scan([&](RowPointer ptr, const Row &row) {
        addToIndexes(single, row, ptr);
        return true;
      });

      std::vector<TableDef> next = m_tables;
      for (TableDef &t : next)
      {
        if (t.name == table)
        {
          t.indexes.push_back(index);
        }
      }
      saveSchema(next);
    }
    catch (const StorageError &)
    {
      destroyIndex(index);
      throw;
    }

    if (m_options.verbose)
    {
      std::cerr << "database: " << indexKindName(kind) << " index on " << table << "." << column << " at block "
                << index.meta << std::endl;
    }
  });
}

std::vector<RowPointer> Database::lookup(const std::string &table, const std::string &column, i64 key)
{
  std::vector<RowPointer> rows;
  m_scheduler->shared([&] {
    const TableDef &def = find(table);
    const std::size_t ordinal = columnOf(def, column);
    for (const IndexDef &index : def.indexes)
    {
      if (index.column != ordinal)
      {
        continue;
      }
      rows = index.kind == IndexKind::BTree ? BTree(m_pager, m_allocator, index.meta).searchAll(key)
                                            : hashIndex(index).searchAll(key);
      return;
    }
    throw NotFound("no index on " + table + "." + column);
  });
  return rows;
}

std::vector<RowPointer> Database::range(const std::string &table, const std::string &column, Bound low, Bound high)
{
  std::vector<RowPointer> rows;
  m_scheduler->shared([&] {
    const TableDef &def = find(table);
    const std::size_t ordinal = columnOf(def, column);
    for (const IndexDef &index : def.indexes)
    {
      if (index.column != ordinal || index.kind != IndexKind::BTree)
      {
        continue;
      }
      BTreeCursor cursor = BTree(m_pager, m_allocator, index.meta).range(low, high);
      while (std::optional<IndexEntry> e = cursor.next())
      {
        rows.push_back(e->row);
      }
      return;
    }
    throw NotFound("no B+Tree index on " + table + "." + column);
  });
  return rows;
}

void Database::checkIndexes(const std::string &table)
{
  m_scheduler->shared([&] {
    const TableDef &def = find(table);
    for (const IndexDef &index : def.indexes)
    {
      if (index.kind == IndexKind::BTree)
      {
        BTree(m_pager, m_allocator, index.meta).check();
      }
      else
      {
        hashIndex(index).check();
      }
    }
  });
}

void Database::forEachLiveBlock(const std::function<void(BlockIndex, ConstBytes)> &visit)
{
  m_scheduler->shared([&] {
    const u64 count = m_super.current().blockCount;
    for (BlockIndex index = 0; index < count; index++)
    {
      if (m_allocator.isFree(index))
      {
        continue;
      }
      const Block block = m_pager.read(index);
      visit(index, block.bytes());
    }
  });
}
