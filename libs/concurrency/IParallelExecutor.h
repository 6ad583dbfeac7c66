#pragma once

#include <exception>
#include <functional>
#include <future>
#include <vector>

namespace concurrency
{
  /**
   * @brief Interface shared by the executor policies in ParallelExecutors.h.
   *
   * Executors are passed to parallel_for_ranges() by reference and held by
   * the Monte Carlo aggregator through a shared_ptr.
   */
  class IParallelExecutor
  {
  public:
    virtual ~IParallelExecutor() = default;

    // Queue task for execution. A task that throws stores the exception in
    // the returned future.
    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Blocks until every future has completed, then rethrows the exception
    // of the earliest failed future in the vector.
    virtual void waitAll(std::vector<std::future<void>>& futures)
    {
      std::exception_ptr earliestFailure;

      for (std::future<void>& pending : futures)
	{
	  try
	    {
	      pending.get();
	    }
	  catch (...)
	    {
	      if (!earliestFailure)
		earliestFailure = std::current_exception();
	    }
	}

      if (earliestFailure)
	std::rethrow_exception(earliestFailure);
    }
  };
}
