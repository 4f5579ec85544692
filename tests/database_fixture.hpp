#pragma once

#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <unistd.h>

#include "aidb/blocks/text_chain.hpp"

class TempFileFixture : public ::testing::Test
{
protected:
  void SetUp() override
  {
    m_name = makeUniqueName();
    path = std::filesystem::temp_directory_path() / m_name;
  }

  void TearDown() override {
    if (HasFailure())
    {
      std::cerr << "Failed database file at: " << path << std::endl;
    }
    else
    {
      if (std::filesystem::exists(path))
      {
        std::filesystem::remove(path);
      }
    }
  }

  // truncates on the first open of a test, keeps the contents after that
  std::fstream open(bool truncate = false)
  {
    auto mode = std::ios::in | std::ios::out | std::ios::binary;
    if (truncate || !std::filesystem::exists(path))
    {
      mode |= std::ios::trunc;
    }
    return std::fstream(path, mode);
  }

  std::filesystem::path path;

private:
    std::string makeUniqueName()
    {
      auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
      unsigned long pid = static_cast<unsigned long>(::getpid());
      char buf[128];
      std::snprintf(buf, sizeof(buf), "test_tmp_%lx_%lx", static_cast<unsigned long>(now), pid);
      return std::string(buf);
    }

    std::string m_name;
};

/* a formatted store held in memory with the block layers wired up.
 * small blocks so chains and splits happen with little data */
struct MemoryStore
{
  explicit MemoryStore(u32 blockSize = 256, u64 maxBlocks = 0)
      : backend(blockSize), pager(backend, blockSize), super(pager), allocator(pager, super, maxBlocks),
        texts(pager, allocator)
  {
    super.format();
    allocator.load();
  }

  MemoryBackend backend;
  Pager pager;
  SuperBlockManager super;
  Allocator allocator;
  TextChains texts;
};
