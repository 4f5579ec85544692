#include "aidb/database.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

void printPrompt()
{
  std::cout << "aidb: ";
}

void printUsage(const char *program)
{
  std::cerr << "usage: " << program << " <file> [--block-size N] [--verbose]" << std::endl;
}

void describe(const TableDef &table)
{
  std::cout << table.name << " (first data block " << table.firstDataBlock << ")" << std::endl;
  for (const ColumnDef &c : table.columns)
  {
    std::cout << "  " << c.name << " " << dataTypeName(c.type) << std::endl;
  }
  for (const IndexDef &i : table.indexes)
  {
    std::cout << "  " << indexKindName(i.kind) << " index on " << table.columns.at(i.column).name << " at block "
              << i.meta << std::endl;
  }
}

void run(Database &db, const std::string &command, const std::string &arg)
{
  if (command == ".tables")
  {
    for (const std::string &name : db.tables())
    {
      std::cout << name << std::endl;
    }
  }
  else if (command == ".describe")
  {
    describe(db.table(arg));
  }
  else if (command == ".scan")
  {
    u64 rows = 0;
    db.scan(arg, [&](RowPointer ptr, const Row &row) {
      std::cout << ptr << " " << row << std::endl;
      rows++;
      return true;
    });
    std::cout << rows << " rows" << std::endl;
  }
  else if (command == ".stats")
  {
    const IoStats stats = db.ioStats();
    std::cout << "backend reads " << stats.backendReads << ", cache hits " << stats.cacheHits << ", writes "
              << stats.writes << ", allocations " << stats.allocations << std::endl;
  }
  else if (command == ".blocks")
  {
    const SuperBlock sb = db.superBlock();
    u64 live = 0;
    db.forEachLiveBlock([&](BlockIndex, ConstBytes) { live++; });
    std::cout << "block size " << sb.blockSize << ", " << sb.blockCount << " blocks, " << live << " live, "
              << db.freeBlocks() << " free" << std::endl;
    std::cout << "schema at " << sb.schemaBlock << ", free list at " << sb.freelistHead << std::endl;
  }
  else
  {
    std::cout << "Unknown command " << command << std::endl;
  }
}

int main(int argc, char **argv)
{
  if (argc < 2)
  {
    printUsage(argv[0]);
    return 1;
  }

  const std::string path = argv[1];
  Options options;
  bool blockSizeGiven = false;
  for (int i = 2; i < argc; i++)
  {
    if (std::strcmp(argv[i], "--block-size") == 0 && i + 1 < argc)
    {
      const unsigned long size = std::strtoul(argv[++i], nullptr, 10);
      if (size < MIN_BLOCK_SIZE || size > MAX_BLOCK_SIZE)
      {
        std::cerr << "block size must be between " << MIN_BLOCK_SIZE << " and " << MAX_BLOCK_SIZE << std::endl;
        return 1;
      }
      options.blockSize = static_cast<u32>(size);
      blockSizeGiven = true;
    }
    else if (std::strcmp(argv[i], "--verbose") == 0)
    {
      options.verbose = true;
    }
    else
    {
      printUsage(argv[0]);
      return 1;
    }
  }

  std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
  if (!file)
  {
    // a missing file becomes a new store
    file.open(path, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
  }
  if (!file)
  {
    std::cerr << "Failed to open " << path << std::endl;
    return 1;
  }

  if (!blockSizeGiven)
  {
    if (const std::optional<u32> stored = SuperBlock::peekBlockSize(file); stored.has_value())
    {
      options.blockSize = *stored;
    }
  }

  try
  {
    StreamBackend backend(file, options.blockSize, options.verbose);
    Database db(backend, options);

    std::string input;
    while (true)
    {
      printPrompt();
      if (!std::getline(std::cin, input) || input == ".quit")
      {
        break;
      }
      if (input.empty())
      {
        continue;
      }

      std::istringstream line(input);
      std::string command;
      std::string arg;
      line >> command >> arg;

      try
      {
        // .stats reports on the command before it
        if (command != ".stats")
        {
          db.resetIoStats();
        }
        run(db, command, arg);
      }
      catch (const StorageError &e)
      {
        std::cout << "Error: " << e.what() << std::endl;
      }
    }
  }
  catch (const StorageError &e)
  {
    std::cerr << "Failed to open " << path << ": " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
