/**
 * @file executor.hpp
 * @brief TaskExecutor - elastic worker thread pool that runs admitted tasks.
 *
 * Architecture:
 *   Post() -> job deque (mutex + condvar)
 *                  |
 *            Worker[0..N-1] -> job()
 *
 * Workers are spawned on demand: Post() starts a new worker whenever no
 * idle worker is available to take the job, up to max_workers. A bulkhead
 * slot therefore maps to a running thread as long as the pool has not hit
 * its ceiling; past the ceiling jobs wait in FIFO order.
 *
 * If a worker thread cannot be started (thread limit, out of memory), the
 * pool keeps the jobs it can serve with the workers it already has and
 * refuses a job only when no worker exists at all.
 *
 * Shutdown() stops accepting jobs, lets workers finish everything already
 * queued, then joins them.
 */

#ifndef ISOL_EXECUTOR_HPP_
#define ISOL_EXECUTOR_HPP_

#include "isol/log.hpp"
#include "isol/vocabulary.hpp"

#include <cstdint>

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace isol {

// ============================================================================
// Configuration
// ============================================================================

static constexpr uint32_t kDefaultMinWorkers = 2U;
static constexpr uint32_t kDefaultMaxWorkers = 256U;

struct ExecutorConfig {
  using ThreadFactory = std::function<std::thread(std::function<void()>)>;

  uint32_t min_workers{kDefaultMinWorkers};
  uint32_t max_workers{kDefaultMaxWorkers};
  /// Starts one worker thread running the given loop. Empty uses
  /// std::thread; set it to name, pin or prioritize workers.
  ThreadFactory thread_factory;
};

struct ExecutorStats {
  uint32_t workers{0U};
  uint32_t idle{0U};
  uint32_t queued{0U};
  uint64_t posted{0U};
  uint64_t completed{0U};
};

// ============================================================================
// TaskExecutor
// ============================================================================

class TaskExecutor final {
 public:
  using Job = std::function<void()>;

  explicit TaskExecutor(const ExecutorConfig& cfg = ExecutorConfig{})
      : max_workers_(cfg.max_workers > 0U ? cfg.max_workers : 1U),
        thread_factory_(cfg.thread_factory) {
    const uint32_t initial = (cfg.min_workers < max_workers_) ? cfg.min_workers : max_workers_;
    std::lock_guard<std::mutex> lk(mtx_);
    for (uint32_t i = 0U; i < initial; ++i) {
      if (!TrySpawnLocked()) {
        ISOL_LOG_WARN("Executor", "started %zu of %u initial workers", workers_.size(), initial);
        break;
      }
    }
  }

  ~TaskExecutor() { Shutdown(); }

  TaskExecutor(const TaskExecutor&) = delete;
  TaskExecutor& operator=(const TaskExecutor&) = delete;
  TaskExecutor(TaskExecutor&&) = delete;
  TaskExecutor& operator=(TaskExecutor&&) = delete;

  /**
   * @brief Queue a job for execution on a worker thread.
   *
   * A failed attempt to grow the pool is logged; the job stays queued for
   * the existing workers.
   *
   * @return ExecutorError::kShutdown once Shutdown() has begun,
   *         ExecutorError::kEmptyJob for an empty callable,
   *         ExecutorError::kNoWorker if no worker exists and none could be
   *         started. The job is not queued in any error case.
   */
  expected<void, ExecutorError> Post(Job job) {
    if (ISOL_UNLIKELY(!job)) {
      return expected<void, ExecutorError>::error(ExecutorError::kEmptyJob);
    }
    bool grow_failed = false;
    size_t workers = 0U;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (ISOL_UNLIKELY(shutdown_)) {
        return expected<void, ExecutorError>::error(ExecutorError::kShutdown);
      }
      if (idle_ <= jobs_.size() && workers_.size() < max_workers_) {
        grow_failed = !TrySpawnLocked();
        if (grow_failed && workers_.empty()) {
          return expected<void, ExecutorError>::error(ExecutorError::kNoWorker);
        }
      }
      jobs_.push_back(std::move(job));
      ++posted_;
      workers = workers_.size();
    }
    if (grow_failed) {
      ISOL_LOG_WARN("Executor", "cannot start worker, job queued for %zu existing workers",
                    workers);
    }
    cv_.notify_one();
    return expected<void, ExecutorError>::success();
  }

  /**
   * @brief Stop accepting jobs, run the ones already queued, join workers.
   *
   * Must not be called from a worker thread.
   */
  void Shutdown() {
    std::vector<std::thread> threads;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      shutdown_ = true;
      threads.swap(workers_);
    }
    cv_.notify_all();
    for (auto& t : threads) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

  bool IsShutdown() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return shutdown_;
  }

  ExecutorStats GetStats() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    ExecutorStats s;
    s.workers = static_cast<uint32_t>(workers_.size());
    s.idle = static_cast<uint32_t>(idle_);
    s.queued = static_cast<uint32_t>(jobs_.size());
    s.posted = posted_;
    s.completed = completed_;
    return s;
  }

 private:
  /// False if the thread could not be started; the pool is unchanged then.
  bool TrySpawnLocked() {
    std::function<void()> loop = [this]() { WorkerLoop(); };
    workers_.reserve(workers_.size() + 1U);
    try {
      if (thread_factory_) {
        workers_.push_back(thread_factory_(std::move(loop)));
      } else {
        workers_.emplace_back(std::move(loop));
      }
    } catch (const std::system_error& e) {
      ISOL_LOG_ERROR("Executor", "worker thread start failed: %s", e.what());
      return false;
    }
    return true;
  }

  void WorkerLoop() {
    std::unique_lock<std::mutex> lk(mtx_);
    while (true) {
      ++idle_;
      cv_.wait(lk, [this] { return shutdown_ || !jobs_.empty(); });
      --idle_;
      if (jobs_.empty()) {
        // shutdown_ with nothing left to run
        return;
      }
      Job job = std::move(jobs_.front());
      jobs_.pop_front();

      lk.unlock();
      try {
        job();
      } catch (const std::exception& e) {
        ISOL_LOG_ERROR("Executor", "job escaped with exception: %s", e.what());
      }
      lk.lock();
      ++completed_;
    }
  }

  const uint32_t max_workers_;
  const ExecutorConfig::ThreadFactory thread_factory_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  std::vector<std::thread> workers_;
  size_t idle_{0U};
  uint64_t posted_{0U};
  uint64_t completed_{0U};
  bool shutdown_{false};
};

}  // namespace isol

#endif  // ISOL_EXECUTOR_HPP_
