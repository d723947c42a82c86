/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file worker_pool.hpp
 * @brief WorkerPool - bounded fire-and-forget job pool.
 *
 * Architecture:
 *   Submit() (single producer thread)
 *        | round-robin
 *   Worker[0..N-1] SPSC Queue -> WorkerThread -> Handler
 *
 * Features:
 * - Lock-free SPSC per-worker queues with a fixed depth
 * - A full pool rejects the job instead of growing (backpressure)
 * - Function pointer handler with opaque context
 * - Flush() for draining in tests and shutdown
 * - -fno-exceptions -fno-rtti compatible
 *
 * @tparam Job Movable, default-constructible job type.
 *
 * Usage:
 *   struct Reply { ... };
 *   mcping::WorkerPoolConfig cfg;
 *   cfg.worker_num = 2;
 *   mcping::WorkerPool<Reply> pool(cfg, &HandleReply, this);
 *   pool.Start();
 *   if (!pool.Submit(Reply{...})) { ... dropped ... }
 *   pool.Shutdown();
 */

#ifndef MCPING_WORKER_POOL_HPP_
#define MCPING_WORKER_POOL_HPP_

#include "mcping/platform.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace mcping {

// ============================================================================
// AdaptiveBackoff - Three-phase backoff: spin -> yield -> sleep
// ============================================================================

namespace detail {

/**
 * @brief Adaptive backoff strategy for busy-wait loops.
 *
 * Spins with a CPU relax hint, then yields, then sleeps 50us.
 */
class AdaptiveBackoff {
 public:
  void Reset() noexcept { spin_count_ = 0U; }

  void Wait() noexcept {
    if (spin_count_ < kSpinLimit) {
      const uint32_t iters = 1U << spin_count_;
      for (uint32_t i = 0U; i < iters; ++i) {
        CpuRelax();
      }
      ++spin_count_;
    } else if (spin_count_ < kSpinLimit + kYieldLimit) {
      std::this_thread::yield();
      ++spin_count_;
    } else {
      std::this_thread::sleep_for(std::chrono::microseconds(50));
    }
  }

  bool InSpinPhase() const noexcept { return spin_count_ < kSpinLimit; }

 private:
  static constexpr uint32_t kSpinLimit = 6U;
  static constexpr uint32_t kYieldLimit = 4U;

  static void CpuRelax() noexcept {
#if defined(__x86_64__) || defined(__i386__)
    __builtin_ia32_pause();
#elif defined(__aarch64__) || defined(__arm__)
    asm volatile("yield" ::: "memory");
#else
    std::this_thread::yield();
#endif
  }

  uint32_t spin_count_{0U};
};

}  // namespace detail

// ============================================================================
// Configuration
// ============================================================================

static constexpr uint32_t kDefaultWorkerQueueDepth = 1024U;
/** Upper bound for a single queue and for a pool's total depth. */
static constexpr uint32_t kMaxWorkerQueueDepth = 1U << 20U;
static constexpr uint32_t kMaxWorkerNum = 64U;

struct WorkerPoolConfig {
  uint32_t worker_num{1U};
  /** Total pending jobs across all workers before Submit() rejects. */
  uint32_t queue_depth{kDefaultWorkerQueueDepth};
};

// ============================================================================
// SpscQueue - Lock-free single-producer single-consumer ring buffer
// ============================================================================

/**
 * @brief Bounded SPSC ring buffer with cache-line-aligned counters.
 *
 * Capacity is rounded up to the next power of 2 and clamped to
 * kMaxWorkerQueueDepth.
 */
template <typename T>
class SpscQueue {
 public:
  explicit SpscQueue(uint32_t min_capacity) noexcept
      : capacity_(NextPowerOf2(min_capacity)),
        mask_(capacity_ - 1U),
        buffer_(capacity_) {}

  SpscQueue(const SpscQueue&) = delete;
  SpscQueue& operator=(const SpscQueue&) = delete;

  /** @return false if the queue is full; @p item is left untouched. */
  bool TryPush(T& item) noexcept {
    const uint32_t wp = write_pos_.load(std::memory_order_relaxed);
    const uint32_t rp = read_pos_.load(std::memory_order_acquire);
    if (wp - rp >= capacity_) {
      return false;
    }
    buffer_[wp & mask_] = std::move(item);
    write_pos_.store(wp + 1U, std::memory_order_release);
    return true;
  }

  bool TryPop(T& item) noexcept {
    const uint32_t rp = read_pos_.load(std::memory_order_relaxed);
    const uint32_t wp = write_pos_.load(std::memory_order_acquire);
    if (rp == wp) {
      return false;
    }
    item = std::move(buffer_[rp & mask_]);
    read_pos_.store(rp + 1U, std::memory_order_release);
    return true;
  }

  bool Empty() const noexcept {
    return read_pos_.load(std::memory_order_acquire) ==
           write_pos_.load(std::memory_order_acquire);
  }

  uint32_t Capacity() const noexcept { return capacity_; }

 private:
  static uint32_t NextPowerOf2(uint32_t v) noexcept {
    if (v == 0U) {
      return 1U;
    }
    if (v >= kMaxWorkerQueueDepth) {
      return kMaxWorkerQueueDepth;
    }
    --v;
    v |= v >> 1U;
    v |= v >> 2U;
    v |= v >> 4U;
    v |= v >> 8U;
    v |= v >> 16U;
    return v + 1U;
  }

  const uint32_t capacity_;
  const uint32_t mask_;
  alignas(kCacheLineSize) std::atomic<uint32_t> write_pos_{0U};
  alignas(kCacheLineSize) std::atomic<uint32_t> read_pos_{0U};
  std::vector<T> buffer_;
};

// ============================================================================
// WorkerPool Statistics
// ============================================================================

struct WorkerPoolStats {
  uint64_t dispatched{0U};
  uint64_t processed{0U};
  uint64_t rejected{0U};
};

// ============================================================================
// WorkerPool
// ============================================================================

template <typename Job>
class WorkerPool {
 public:
  /** Invoked on a worker thread for every accepted job. */
  using Handler = void (*)(Job& job, void* ctx);

  WorkerPool(const WorkerPoolConfig& cfg, Handler handler,
             void* ctx = nullptr) noexcept
      : worker_num_(ClampWorkers(cfg.worker_num)),
        per_worker_depth_(PerWorkerDepth(cfg.queue_depth, worker_num_)),
        handler_(handler),
        ctx_(ctx) {}

  ~WorkerPool() noexcept {
    if (running_.load(std::memory_order_acquire)) {
      Shutdown();
    }
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // ======================== Lifecycle ========================

  void Start() {
    if (running_.load(std::memory_order_acquire)) {
      return;
    }
    shutdown_.store(false, std::memory_order_release);

    workers_.reserve(worker_num_);
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      workers_.push_back(std::make_unique<WorkerContext>(per_worker_depth_));
    }
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      worker_threads_.emplace_back(&WorkerPool::WorkerLoop, this, i);
    }
    running_.store(true, std::memory_order_release);
  }

  /** @brief Stop accepting jobs, drain queues, join all threads. */
  void Shutdown() noexcept {
    if (!running_.load(std::memory_order_acquire)) {
      return;
    }
    shutdown_.store(true, std::memory_order_release);

    for (uint32_t i = 0U; i < worker_num_; ++i) {
      { std::lock_guard<std::mutex> lk(workers_[i]->mtx); }
      workers_[i]->cv.notify_one();
    }
    for (auto& t : worker_threads_) {
      if (t.joinable()) {
        t.join();
      }
    }

    workers_.clear();
    worker_threads_.clear();
    running_.store(false, std::memory_order_release);
  }

  /** @brief Block until every accepted job has been handled. */
  void Flush() const noexcept {
    while (running_.load(std::memory_order_acquire) &&
           processed_.load(std::memory_order_acquire) !=
               dispatched_.load(std::memory_order_acquire)) {
      std::this_thread::sleep_for(std::chrono::microseconds(100));
    }
  }

  // ======================== Submit API ========================

  /**
   * @brief Queue a job on the next worker with room (round-robin).
   *
   * Must be called from a single producer thread.
   *
   * @return false if the pool is not running or every queue is full.
   */
  bool Submit(Job&& job) noexcept {
    if (!running_.load(std::memory_order_acquire) ||
        shutdown_.load(std::memory_order_acquire)) {
      rejected_.fetch_add(1U, std::memory_order_relaxed);
      return false;
    }
    const uint32_t start = next_worker_++ % worker_num_;
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      const uint32_t wid = (start + i) % worker_num_;
      if (workers_[wid]->queue.TryPush(job)) {
        dispatched_.fetch_add(1U, std::memory_order_release);
        { std::lock_guard<std::mutex> lk(workers_[wid]->mtx); }
        workers_[wid]->cv.notify_one();
        return true;
      }
    }
    rejected_.fetch_add(1U, std::memory_order_relaxed);
    return false;
  }

  // ======================== Query ========================

  WorkerPoolStats GetStats() const noexcept {
    WorkerPoolStats s;
    s.dispatched = dispatched_.load(std::memory_order_relaxed);
    s.processed = processed_.load(std::memory_order_relaxed);
    s.rejected = rejected_.load(std::memory_order_relaxed);
    return s;
  }

  uint32_t WorkerCount() const noexcept { return worker_num_; }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

 private:
  static uint32_t ClampWorkers(uint32_t n) noexcept {
    if (n == 0U) return 1U;
    return (n > kMaxWorkerNum) ? kMaxWorkerNum : n;
  }

  static uint32_t PerWorkerDepth(uint32_t total, uint32_t workers) noexcept {
    uint32_t depth = (total > 0U) ? total : kDefaultWorkerQueueDepth;
    if (depth > kMaxWorkerQueueDepth) {
      depth = kMaxWorkerQueueDepth;
    }
    const uint32_t per = depth / workers;
    return (per > 0U) ? per : 1U;
  }

  void WorkerLoop(uint32_t worker_id) noexcept {
    WorkerContext& ctx = *workers_[worker_id];
    Job job;
    detail::AdaptiveBackoff backoff;

    while (!shutdown_.load(std::memory_order_acquire)) {
      if (ctx.queue.TryPop(job)) {
        handler_(job, ctx_);
        processed_.fetch_add(1U, std::memory_order_release);
        backoff.Reset();
        continue;
      }

      if (backoff.InSpinPhase()) {
        backoff.Wait();
        continue;
      }

      std::unique_lock<std::mutex> lk(ctx.mtx);
      ctx.cv.wait_for(lk, std::chrono::milliseconds(10), [&] {
        return !ctx.queue.Empty() || shutdown_.load(std::memory_order_acquire);
      });
      backoff.Reset();
    }

    // Drain remaining
    while (ctx.queue.TryPop(job)) {
      handler_(job, ctx_);
      processed_.fetch_add(1U, std::memory_order_release);
    }
  }

  struct WorkerContext {
    SpscQueue<Job> queue;
    std::mutex mtx;
    std::condition_variable cv;

    explicit WorkerContext(uint32_t depth) noexcept : queue(depth) {}
    WorkerContext(const WorkerContext&) = delete;
    WorkerContext& operator=(const WorkerContext&) = delete;
  };

  const uint32_t worker_num_;
  const uint32_t per_worker_depth_;
  Handler handler_;
  void* ctx_;

  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_{false};

  alignas(kCacheLineSize) std::atomic<uint64_t> dispatched_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> processed_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> rejected_{0U};
  uint32_t next_worker_{0U};  ///< Touched only by the producer thread.

  std::vector<std::unique_ptr<WorkerContext>> workers_;
  std::vector<std::thread> worker_threads_;
};

}  // namespace mcping

#endif  // MCPING_WORKER_POOL_HPP_
