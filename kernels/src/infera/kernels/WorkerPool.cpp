#include "infera/kernels/WorkerPool.hpp"
#include "infera/diag/logging.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <stdexcept>

namespace infera::kernels {

struct WorkerPool::Batch {
  const RangeFn *fn;
  std::size_t total;
  std::size_t chunkSize;
  std::size_t chunkCount;
  std::atomic<std::size_t> next{0};
  std::atomic<std::size_t> finished{0};
  std::mutex mutex;
  std::condition_variable cv;
  std::exception_ptr error;
};

WorkerPool::WorkerPool(std::size_t threads) {
  if (threads == 0) {
    threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  }
  m_threadCount = threads;
  // The calling thread participates, so n threads need n - 1 workers.
  m_threads.reserve(threads - 1);
  for (std::size_t i = 1; i < threads; ++i) {
    m_threads.emplace_back(&WorkerPool::workerLoop, this);
  }
  INFERA_DEBUG("worker pool started with {} threads", threads);
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard lock{m_mutex};
    m_stop = true;
  }
  m_cv.notify_all();
  for (auto &t : m_threads) {
    t.join();
  }
}

void WorkerPool::runChunks(Batch &batch) {
  while (true) {
    std::size_t chunk = batch.next.fetch_add(1);
    if (chunk >= batch.chunkCount) {
      return;
    }
    std::size_t begin = chunk * batch.chunkSize;
    std::size_t end = std::min(batch.total, begin + batch.chunkSize);
    try {
      (*batch.fn)(begin, end);
    } catch (...) {
      std::lock_guard lock{batch.mutex};
      if (!batch.error) {
        batch.error = std::current_exception();
      }
    }
    if (batch.finished.fetch_add(1) + 1 == batch.chunkCount) {
      std::lock_guard lock{batch.mutex};
      batch.cv.notify_all();
    }
  }
}

bool WorkerPool::runOne(std::unique_lock<std::mutex> &lock) {
  if (m_queue.empty()) {
    return false;
  }
  std::shared_ptr<Batch> batch = std::move(m_queue.front());
  m_queue.pop_front();
  lock.unlock();
  runChunks(*batch);
  lock.lock();
  return true;
}

void WorkerPool::workerLoop() {
  std::unique_lock lock{m_mutex};
  while (true) {
    m_cv.wait(lock, [&] { return m_stop || !m_queue.empty(); });
    if (m_stop && m_queue.empty()) {
      return;
    }
    runOne(lock);
  }
}

void WorkerPool::parallelFor(std::size_t total, std::size_t grain,
                             const RangeFn &fn) {
  if (total == 0) {
    return;
  }
  grain = std::max<std::size_t>(grain, 1);
  if (m_threads.empty() || total <= grain) {
    fn(0, total);
    return;
  }

  auto batch = std::make_shared<Batch>();
  batch->fn = &fn;
  batch->total = total;
  // A few chunks per thread keeps uneven chunks from idling workers.
  std::size_t target = m_threadCount * 4;
  batch->chunkSize = std::max(grain, (total + target - 1) / target);
  batch->chunkCount = (total + batch->chunkSize - 1) / batch->chunkSize;

  {
    std::lock_guard lock{m_mutex};
    std::size_t helpers = std::min(m_threads.size(), batch->chunkCount - 1);
    for (std::size_t i = 0; i < helpers; ++i) {
      m_queue.push_back(batch);
    }
  }
  m_cv.notify_all();

  runChunks(*batch);

  // Help with other queued work while chunks of this batch are still running
  // elsewhere.
  while (batch->finished.load() < batch->chunkCount) {
    std::unique_lock lock{m_mutex};
    if (runOne(lock)) {
      continue;
    }
    lock.unlock();
    std::unique_lock batchLock{batch->mutex};
    batch->cv.wait(batchLock, [&] {
      return batch->finished.load() >= batch->chunkCount;
    });
  }

  if (batch->error) {
    std::rethrow_exception(batch->error);
  }
}

namespace {

std::mutex g_globalMutex;
std::size_t g_globalThreads = 0;
std::unique_ptr<WorkerPool> g_globalPool;

} // namespace

WorkerPool &WorkerPool::global() {
  std::lock_guard lock{g_globalMutex};
  if (!g_globalPool) {
    g_globalPool = std::make_unique<WorkerPool>(g_globalThreads);
  }
  return *g_globalPool;
}

void WorkerPool::configureGlobal(std::size_t threads) {
  std::lock_guard lock{g_globalMutex};
  if (g_globalPool) {
    throw std::logic_error(
        "WorkerPool::configureGlobal called after the global pool was created");
  }
  g_globalThreads = threads;
}

} // namespace infera::kernels
