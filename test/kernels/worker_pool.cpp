#include "infera/kernels/WorkerPool.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace infera::kernels;

TEST(worker_pool, covers_every_index_once) {
  WorkerPool pool(4);
  std::vector<std::atomic<int>> hits(1000);
  pool.parallelFor(hits.size(), 7, [&](std::size_t begin, std::size_t end) {
    for (std::size_t i = begin; i < end; ++i) {
      hits[i].fetch_add(1);
    }
  });
  for (const auto &h : hits) {
    EXPECT_EQ(h.load(), 1);
  }
}

TEST(worker_pool, single_thread_runs_inline) {
  WorkerPool pool(1);
  EXPECT_EQ(pool.threadCount(), 1u);
  const auto caller = std::this_thread::get_id();
  std::size_t calls = 0;
  pool.parallelFor(100, 1, [&](std::size_t begin, std::size_t end) {
    EXPECT_EQ(std::this_thread::get_id(), caller);
    EXPECT_EQ(begin, 0u);
    EXPECT_EQ(end, 100u);
    ++calls;
  });
  EXPECT_EQ(calls, 1u);
}

TEST(worker_pool, empty_range_never_calls) {
  WorkerPool pool(2);
  bool called = false;
  pool.parallelFor(0, 1, [&](std::size_t, std::size_t) { called = true; });
  EXPECT_FALSE(called);
}

TEST(worker_pool, rethrows_after_all_chunks_finish) {
  WorkerPool pool(3);
  std::atomic<std::size_t> done{0};
  EXPECT_THROW(pool.parallelFor(64, 1,
                                [&](std::size_t begin, std::size_t end) {
                                  done += end - begin;
                                  if (begin == 0) {
                                    throw std::runtime_error("chunk failed");
                                  }
                                }),
               std::runtime_error);
  EXPECT_EQ(done.load(), 64u);
  // The pool stays usable.
  std::atomic<std::size_t> sum{0};
  pool.parallelFor(10, 1, [&](std::size_t begin, std::size_t end) {
    sum += end - begin;
  });
  EXPECT_EQ(sum.load(), 10u);
}

TEST(worker_pool, nested_parallel_for_does_not_deadlock) {
  WorkerPool pool(2);
  std::atomic<std::size_t> total{0};
  pool.parallelFor(8, 1, [&](std::size_t begin, std::size_t end) {
    for (std::size_t i = begin; i < end; ++i) {
      pool.parallelFor(16, 1, [&](std::size_t b, std::size_t e) {
        total += e - b;
      });
    }
  });
  EXPECT_EQ(total.load(), 8u * 16u);
}

TEST(worker_pool, concurrent_callers) {
  WorkerPool pool(3);
  std::atomic<std::size_t> total{0};
  std::vector<std::thread> callers;
  for (int t = 0; t < 4; ++t) {
    callers.emplace_back([&] {
      for (int r = 0; r < 20; ++r) {
        pool.parallelFor(50, 4, [&](std::size_t begin, std::size_t end) {
          total += end - begin;
        });
      }
    });
  }
  for (auto &c : callers) {
    c.join();
  }
  EXPECT_EQ(total.load(), 4u * 20u * 50u);
}
