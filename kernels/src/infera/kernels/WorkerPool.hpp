#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace infera::kernels {

// Fixed set of worker threads executing parallelFor batches. A caller
// waiting on its batch runs queued chunks itself, so nested and concurrent
// parallelFor calls cannot starve each other. A pool of one thread runs
// everything inline on the caller.
class WorkerPool {
public:
  using RangeFn = std::function<void(std::size_t begin, std::size_t end)>;

  // threads == 0 selects std::thread::hardware_concurrency().
  explicit WorkerPool(std::size_t threads = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  std::size_t threadCount() const { return m_threadCount; }

  // Splits [0, total) into chunks of at least `grain` items and blocks until
  // all of them ran. The first exception thrown by fn is rethrown here once
  // every started chunk has finished.
  void parallelFor(std::size_t total, std::size_t grain, const RangeFn &fn);

  // Process-wide pool, created on first use.
  static WorkerPool &global();
  // Sets the size of the global pool; throws std::logic_error once the
  // global pool exists.
  static void configureGlobal(std::size_t threads);

private:
  struct Batch;

  void workerLoop();
  bool runOne(std::unique_lock<std::mutex> &lock);
  static void runChunks(Batch &batch);

  std::size_t m_threadCount;
  std::vector<std::thread> m_threads;
  std::mutex m_mutex;
  std::condition_variable m_cv;
  std::deque<std::shared_ptr<Batch>> m_queue;
  bool m_stop = false;
};

} // namespace infera::kernels
