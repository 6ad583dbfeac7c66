#pragma once

#include <cstddef>    // for std::size_t
#include <thread>     // for std::thread::hardware_concurrency()
#include <vector>     // for std::vector
#include <future>     // for std::future
#include <algorithm>  // for std::min

namespace concurrency {

  // Number of chunks used when the caller gives no chunk size hint.
  inline std::size_t default_chunk_count()
  {
    const unsigned hw = std::thread::hardware_concurrency();
    return hw ? hw : 2;
  }

  // Split [0…total) into contiguous ranges, submit one task per range to
  // exec, and waitAll. rangeBody(start, end) is called once per range with a
  // half-open interval. When chunkSizeHint is 0 the work is divided into
  // default_chunk_count() ranges.
  //
  // Ranges never overlap, so rangeBody may keep range-local state and publish
  // it once at the end of the range.
  template<typename Executor, typename RangeBody>
  void parallel_for_ranges(std::size_t total, Executor& exec, RangeBody rangeBody,
			   std::size_t chunkSizeHint = 0)
  {
    if (total == 0) return;

    std::size_t chunkSize = chunkSizeHint;
    if (chunkSize == 0) {
      const std::size_t numTasks = default_chunk_count();
      chunkSize = (total + numTasks - 1) / numTasks; // ceil-divide
    }

    std::vector<std::future<void>> futures;
    futures.reserve((total + chunkSize - 1) / chunkSize);
    for (std::size_t start = 0; start < total; start += chunkSize)
      {
	const std::size_t end = std::min(total, start + chunkSize);
	futures.emplace_back(exec.submit([=, &rangeBody]() {
	  rangeBody(start, end);
	}));
      }
    exec.waitAll(futures);
  }

  // Per-index convenience wrapper: body(p) is called once for every p in [0…total).
  template<typename Executor, typename Body>
  void parallel_for(std::size_t total, Executor& exec, Body body) {
    parallel_for_ranges(total, exec, [&body](std::size_t start, std::size_t end) {
      for (std::size_t p = start; p < end; ++p) {
	body(p);
      }
    });
  }
}
