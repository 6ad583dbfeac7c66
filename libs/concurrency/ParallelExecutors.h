#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "IParallelExecutor.h"
#include "runner.hpp"

/**
 * @file ParallelExecutors.h
 * @brief Executor policies for spreading independent trials over threads.
 *
 *  - SingleThreadExecutor: tasks run inline on the caller's thread. Used by
 *    the unit tests and when a run must stay on one core.
 *  - ThreadPoolExecutor<N>: a pool owned by the executor for its lifetime.
 *    This is the CLI default.
 *  - BoostRunnerExecutor: posts to the process-wide Boost.Asio runner, whose
 *    size comes from the `ncpu` environment variable.
 *
 * A Monte Carlo run produces the same counts under every executor.
 */
namespace concurrency
{
  namespace detail
  {
    // Run task and settle promise with its result or its exception.
    inline void runAndSettle(const std::function<void()>& task, std::promise<void>& promise)
    {
      try
	{
	  task();
	}
      catch (...)
	{
	  promise.set_exception(std::current_exception());
	  return;
	}
      promise.set_value();
    }

    inline std::size_t hardwareThreadCount()
    {
      const unsigned int hw = std::thread::hardware_concurrency();
      return hw != 0 ? hw : 2;
    }
  }

  /**
   * @brief Runs every task immediately on the calling thread.
   *
   * The returned future is already ready; a throwing task leaves its
   * exception in the future.
   */
  class SingleThreadExecutor : public IParallelExecutor
  {
  public:
    std::future<void> submit(std::function<void()> task) override
    {
      std::promise<void> promise;
      std::future<void> result = promise.get_future();
      detail::runAndSettle(task, promise);
      return result;
    }
  };

  /**
   * @brief Posts tasks to the shared runner pool.
   *
   * The first submission in a process sizes the runner with getNCpus().
   */
  class BoostRunnerExecutor : public IParallelExecutor
  {
  public:
    std::future<void> submit(std::function<void()> task) override
    {
      runner::ensure_initialized(getNCpus());

      auto promise = std::make_shared<std::promise<void>>();
      std::future<void> result = promise->get_future();

      // The runner's own boost::unique_future is not used; completion is
      // reported through the std::promise so callers see a std::future.
      runner::instance().post([task = std::move(task), promise]() {
	detail::runAndSettle(task, *promise);
      });

      return result;
    }
  };

  /**
   * @brief Executor that owns a fixed number of worker threads.
   *
   * The pool size is N, or the constructor argument; 0 selects
   * std::thread::hardware_concurrency(). Tasks still queued when the executor
   * is destroyed are run before the workers are joined.
   */
  template <std::size_t N = 0>
  class ThreadPoolExecutor : public IParallelExecutor
  {
  public:
    ThreadPoolExecutor()
      : ThreadPoolExecutor(N)
    {}

    explicit ThreadPoolExecutor(std::size_t numThreads)
      : mWorkers(),
	mPending(),
	mQueueMutex(),
	mQueueNotEmpty(),
	mShuttingDown(false)
    {
      const std::size_t poolSize = (numThreads != 0) ? numThreads : detail::hardwareThreadCount();
      mWorkers.reserve(poolSize);

      try
	{
	  while (mWorkers.size() < poolSize)
	    mWorkers.emplace_back(&ThreadPoolExecutor::processQueue, this);
	}
      catch (...)
	{
	  shutdown();
	  throw;
	}
    }

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    ~ThreadPoolExecutor()
    {
      shutdown();
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto job = std::make_shared<std::packaged_task<void()>>(std::move(task));
      std::future<void> result = job->get_future();

      {
	std::lock_guard<std::mutex> lock(mQueueMutex);
	if (mShuttingDown)
	  throw std::runtime_error("ThreadPoolExecutor::submit - executor is shutting down");

	mPending.emplace_back([job]() { (*job)(); });
      }

      mQueueNotEmpty.notify_one();
      return result;
    }

    std::size_t getNumThreads() const
    {
      return mWorkers.size();
    }

  private:
    void shutdown()
    {
      {
	std::lock_guard<std::mutex> lock(mQueueMutex);
	mShuttingDown = true;
      }
      mQueueNotEmpty.notify_all();

      for (std::thread& worker : mWorkers)
	if (worker.joinable())
	  worker.join();
    }

    // Worker body: exits once shutdown is requested and the queue is empty.
    void processQueue()
    {
      while (true)
	{
	  std::function<void()> job;

	  {
	    std::unique_lock<std::mutex> lock(mQueueMutex);
	    mQueueNotEmpty.wait(lock, [this]() { return mShuttingDown || !mPending.empty(); });

	    if (mPending.empty())
	      return;

	    job = std::move(mPending.front());
	    mPending.pop_front();
	  }

	  job();
	}
    }

    std::vector<std::thread> mWorkers;
    std::deque<std::function<void()>> mPending;
    std::mutex mQueueMutex;
    std::condition_variable mQueueNotEmpty;
    bool mShuttingDown;
  };
}
