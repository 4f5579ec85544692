#pragma once

#include "aidb/machine.hpp"

#include <exception>
#include <sstream>
#include <string>

using BlockIndex = u64;

// base of every error raised by the storage engine.
// the message names the block the problem was found in, when there is one
class StorageError : public std::exception
{
private:
  std::string m_message;
  BlockIndex m_block;
  bool m_hasBlock;

public:
  explicit StorageError(const std::string &message)
      : m_message(message), m_block(0), m_hasBlock(false)
  {
  }

  StorageError(BlockIndex block, const std::string &message)
      : m_block(block), m_hasBlock(true)
  {
    std::ostringstream ss;
    ss << "Block " << block << ": " << message;
    m_message = ss.str();
  }

  inline BlockIndex block() const noexcept { return m_block; }
  inline bool hasBlock() const noexcept { return m_hasBlock; }

  const char *what() const noexcept override
  {
    return m_message.c_str();
  }
};

// bad magic or version in block 0. the store cannot be used
class CorruptSuperBlock : public StorageError
{
public:
  using StorageError::StorageError;
};

class SchemaDecodeError : public StorageError
{
public:
  using StorageError::StorageError;
};

// a row that does not match the column definitions of its table
class RowShapeError : public StorageError
{
public:
  using StorageError::StorageError;
};

class TextChainTruncated : public StorageError
{
public:
  TextChainTruncated(BlockIndex block, u64 expected, u64 found)
      : StorageError(block, message(expected, found)), m_expected(expected), m_found(found)
  {
  }

  inline u64 expected() const noexcept { return m_expected; }
  inline u64 found() const noexcept { return m_found; }

private:
  static std::string message(u64 expected, u64 found)
  {
    std::ostringstream ss;
    ss << "text chain ended after " << found << " of " << expected << " bytes";
    return ss.str();
  }

  u64 m_expected;
  u64 m_found;
};

class BlockOutOfRange : public StorageError
{
public:
  BlockOutOfRange(BlockIndex block, u64 blockCount)
      : StorageError(block, message(blockCount)), m_blockCount(blockCount)
  {
  }

  inline u64 blockCount() const noexcept { return m_blockCount; }

private:
  static std::string message(u64 blockCount)
  {
    std::ostringstream ss;
    ss << "out of range, store has " << blockCount << " blocks";
    return ss.str();
  }

  u64 m_blockCount;
};

// the storage backend failed. not retried here, retrying is up to the backend
class IOFailure : public StorageError
{
public:
  using StorageError::StorageError;
};

class DoubleFree : public StorageError
{
public:
  explicit DoubleFree(BlockIndex block) : StorageError(block, "freed while already on the free list") {}
};

class AllocatorExhausted : public StorageError
{
public:
  using StorageError::StorageError;
};

class FreeListCorrupt : public StorageError
{
public:
  using StorageError::StorageError;
};

// an index node failed a structural check. only the index is affected
class IndexCorrupt : public StorageError
{
public:
  using StorageError::StorageError;
};

class TableExists : public StorageError
{
public:
  using StorageError::StorageError;
};

class NotFound : public StorageError
{
public:
  using StorageError::StorageError;
};
