#include <catch2/catch_test_macros.hpp>
#include "ParallelFor.h"
#include "ParallelExecutors.h"
#include <atomic>
#include <mutex>
#include <numeric>
#include <stdexcept>
#include <utility>
#include <vector>
#include <algorithm>

using namespace concurrency;

TEST_CASE("parallel_for visits every index once", "[parallel_for]")
{
  SECTION("SingleThreadExecutor")
  {
    SingleThreadExecutor executor;
    std::vector<int> results(10, 0);

    parallel_for(10, executor, [&results](std::size_t i) {
      results[i] = static_cast<int>(i * 2);
    });

    for (std::size_t i = 0; i < 10; ++i)
      REQUIRE(results[i] == static_cast<int>(i * 2));
  }

  SECTION("ThreadPoolExecutor")
  {
    ThreadPoolExecutor<4> executor;
    std::vector<std::atomic<int>> visited(1000);
    for (auto& v : visited) v.store(0);

    parallel_for(1000, executor, [&visited](std::size_t i) {
      visited[i].fetch_add(1, std::memory_order_relaxed);
    });

    for (std::size_t i = 0; i < visited.size(); ++i)
      REQUIRE(visited[i].load() == 1);
  }

  SECTION("Zero iterations submits nothing")
  {
    SingleThreadExecutor executor;
    std::atomic<int> counter{0};
    parallel_for(0, executor, [&counter](std::size_t) { counter.fetch_add(1); });
    REQUIRE(counter.load() == 0);
  }
}

TEST_CASE("parallel_for_ranges partitions the index space", "[parallel_for_ranges]")
{
  ThreadPoolExecutor<4> executor;
  std::mutex rangesMutex;
  std::vector<std::pair<std::size_t, std::size_t>> ranges;

  auto collect = [&](std::size_t start, std::size_t end) {
    std::lock_guard<std::mutex> lock(rangesMutex);
    ranges.emplace_back(start, end);
  };

  SECTION("Explicit chunk size")
  {
    parallel_for_ranges(103, executor, collect, 10);

    REQUIRE(ranges.size() == 11);
    std::sort(ranges.begin(), ranges.end());
    std::size_t expectedStart = 0;
    for (const auto& r : ranges) {
      REQUIRE(r.first == expectedStart);
      REQUIRE(r.second > r.first);
      REQUIRE(r.second - r.first <= 10);
      expectedStart = r.second;
    }
    REQUIRE(expectedStart == 103);
  }

  SECTION("Chunk larger than total yields one range")
  {
    parallel_for_ranges(7, executor, collect, 100);
    REQUIRE(ranges.size() == 1);
    REQUIRE(ranges.front() == std::make_pair(std::size_t(0), std::size_t(7)));
  }

  SECTION("Default chunking covers the whole interval")
  {
    parallel_for_ranges(5000, executor, collect);

    std::size_t covered = 0;
    for (const auto& r : ranges)
      covered += r.second - r.first;
    REQUIRE(covered == 5000);
    REQUIRE(ranges.size() <= default_chunk_count());
  }
}

TEST_CASE("parallel_for_ranges supports range-local reduction", "[parallel_for_ranges]")
{
  ThreadPoolExecutor<3> executor;
  std::mutex mergeMutex;
  unsigned long long total = 0;

  parallel_for_ranges(10000, executor, [&](std::size_t start, std::size_t end) {
    unsigned long long local = 0;
    for (std::size_t i = start; i < end; ++i)
      local += i;
    std::lock_guard<std::mutex> lock(mergeMutex);
    total += local;
  }, 64);

  REQUIRE(total == 10000ULL * 9999ULL / 2ULL);
}

TEST_CASE("parallel_for_ranges rethrows a failing range", "[parallel_for_ranges]")
{
  ThreadPoolExecutor<2> executor;
  std::atomic<int> finished{0};

  REQUIRE_THROWS_AS(
    parallel_for_ranges(40, executor, [&finished](std::size_t start, std::size_t) {
      if (start == 20)
        throw std::invalid_argument("bad range");
      finished.fetch_add(1);
    }, 10),
    std::invalid_argument);

  REQUIRE(finished.load() == 3);
}
