#include "aidb/backend.hpp"

#include <algorithm>

StreamBackend::StreamBackend(std::iostream &stream, u32 blockSize, bool verbose)
    : m_stream(stream), m_blockSize(blockSize), m_blockCount(0), m_verbose(verbose)
{
  checkBlockSize(m_blockSize);
  if (!m_stream)
  {
    throw IOFailure("Failed to open database stream");
  }

  m_stream.seekg(0, std::ios::end);
  const std::streamoff size = m_stream.tellg();
  if (!m_stream || size < 0)
  {
    throw IOFailure("Failed to get size of database stream");
  }

  // a trailing partial block is still a block, it is zero padded when read
  m_blockCount = (static_cast<u64>(size) + m_blockSize - 1) / m_blockSize;
}

void StreamBackend::readBlock(BlockIndex index, Bytes out)
{
  if (index >= m_blockCount)
  {
    throw BlockOutOfRange(index, m_blockCount);
  }

  m_stream.clear();
  if (!m_stream.seekg(static_cast<std::streamoff>(index * m_blockSize)))
  {
    throw IOFailure(index, "Failed in seeking to read");
  }

  m_stream.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(m_blockSize));
  const std::streamsize got = m_stream.gcount();
  if (got < static_cast<std::streamsize>(m_blockSize))
  {
    if (!m_stream.eof())
    {
      throw IOFailure(index, "Failed to read");
    }
    if (m_verbose)
    {
      std::cerr << "backend: block " << index << " is " << got << " bytes, padding with zero" << std::endl;
    }
    std::fill(out.begin() + got, out.end(), static_cast<std::byte>(0));
    m_stream.clear();
  }
}

void StreamBackend::writeBlock(BlockIndex index, ConstBytes in)
{
  if (index >= m_blockCount)
  {
    throw BlockOutOfRange(index, m_blockCount);
  }

  m_stream.clear();
  if (!m_stream.seekp(static_cast<std::streamoff>(index * m_blockSize)))
  {
    throw IOFailure(index, "Failed in seeking to write");
  }
  if (!m_stream.write(reinterpret_cast<const char *>(in.data()), static_cast<std::streamsize>(in.size())))
  {
    throw IOFailure(index, "Failed to write");
  }
  if (!m_stream.flush())
  {
    throw IOFailure(index, "Failed to flush");
  }
}

BlockIndex StreamBackend::growByOneBlock()
{
  const BlockIndex index = m_blockCount;
  const std::vector<std::byte> zeros(m_blockSize, static_cast<std::byte>(0));

  m_blockCount++;
  try
  {
    writeBlock(index, ConstBytes(zeros.data(), zeros.size()));
  }
  catch (const IOFailure &)
  {
    m_blockCount--;
    throw AllocatorExhausted(index, "backend could not grow");
  }
  return index;
}

void MemoryBackend::readBlock(BlockIndex index, Bytes out)
{
  if (index >= m_blocks.size())
  {
    throw BlockOutOfRange(index, m_blocks.size());
  }
  std::copy(m_blocks[index].begin(), m_blocks[index].end(), out.begin());
}

void MemoryBackend::writeBlock(BlockIndex index, ConstBytes in)
{
  if (index >= m_blocks.size())
  {
    throw BlockOutOfRange(index, m_blocks.size());
  }
  std::copy(in.begin(), in.end(), m_blocks[index].begin());
}

BlockIndex MemoryBackend::growByOneBlock()
{
  if (m_capacity != 0 && m_blocks.size() >= m_capacity)
  {
    throw AllocatorExhausted(m_blocks.size(), "memory backend is full");
  }
  m_blocks.emplace_back(m_blockSize, static_cast<std::byte>(0));
  return m_blocks.size() - 1;
}
