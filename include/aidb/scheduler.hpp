#pragma once

#include <functional>
#include <mutex>
#include <shared_mutex>

// decides when a piece of work on the store may run.
// a mutation holds exclusive access until all of its block writes are done
class MutationScheduler
{
public:
  virtual ~MutationScheduler() = default;

  virtual void exclusive(const std::function<void()> &work) = 0;
  virtual void shared(const std::function<void()> &work) = 0;
};

// one writer at a time, any number of readers when no writer is running
class SingleWriterScheduler : public MutationScheduler
{
public:
  void exclusive(const std::function<void()> &work) override
  {
    std::unique_lock lock(m_mutex);
    work();
  }

  void shared(const std::function<void()> &work) override
  {
    std::shared_lock lock(m_mutex);
    work();
  }

private:
  std::shared_mutex m_mutex;
};
