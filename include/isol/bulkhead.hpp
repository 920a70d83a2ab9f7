/**
 * @file bulkhead.hpp
 * @brief Named concurrency + queue limiter for one downstream dependency.
 *
 * Admission, evaluated in order on every Execute():
 *   1. active < max_concurrent   -> take a slot, post the task to a worker
 *   2. queued < max_queue_size   -> join the FIFO queue, arm queue_timeout
 *   3. otherwise                 -> reject with ErrorCode::kQueueFull
 *
 * When a running task finishes, its slot passes to the oldest queued task.
 * A queued task leaves the queue exactly once, under the instance mutex,
 * by one of: slot grant, queue timeout, drain. The path that removed it
 * settles it.
 *
 * Lock order: instance mutex -> scheduler mutex / executor mutex. No user
 * callable and no promise is ever completed under the instance mutex.
 */

#ifndef ISOL_BULKHEAD_HPP_
#define ISOL_BULKHEAD_HPP_

#include "isol/completion.hpp"
#include "isol/error.hpp"
#include "isol/executor.hpp"
#include "isol/log.hpp"
#include "isol/metrics.hpp"
#include "isol/platform.hpp"
#include "isol/timer.hpp"
#include "isol/vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace isol {

// ============================================================================
// Configuration and Statistics
// ============================================================================

struct BulkheadConfig {
  std::string name;
  uint32_t max_concurrent{10U};
  uint32_t max_queue_size{50U};
  /// Maximum time a task may wait in the queue; zero or negative waits forever.
  std::chrono::milliseconds queue_timeout{30000};
};

struct BulkheadStats {
  std::string name;
  uint32_t active_count{0U};
  uint32_t queued_count{0U};
  uint64_t total_executed{0U};  ///< Ran to completion, success or failure.
  uint64_t total_failed{0U};    ///< Subset of total_executed that threw.
  uint64_t total_rejected{0U};
  uint64_t total_timeout{0U};
  double average_execution_time_ms{0.0};
  double average_wait_time_ms{0.0};
  uint32_t max_concurrent{0U};
  uint32_t max_queue_size{0U};

  /// True when the next Execute() would be rejected with kQueueFull.
  bool Saturated() const noexcept {
    return static_cast<uint64_t>(active_count) + queued_count >=
           static_cast<uint64_t>(max_concurrent) + max_queue_size;
  }
};

// ============================================================================
// Bulkhead
// ============================================================================

class Bulkhead final {
 public:
  Bulkhead(BulkheadConfig cfg, TaskExecutor& executor, TimerScheduler& timers,
           MetricsSink& metrics = NullMetricsSink::Instance())
      : cfg_(std::move(cfg)), executor_(executor), timers_(timers), metrics_(metrics) {
    ISOL_LOG_INFO("Bulkhead", "created %s: max_concurrent=%u max_queue=%u queue_timeout=%lldms",
                  cfg_.name.c_str(), cfg_.max_concurrent, cfg_.max_queue_size,
                  static_cast<long long>(cfg_.queue_timeout.count()));
  }

  /**
   * @brief Drains (rejecting queued work, awaiting running work), then
   *        fences off any timeout callback still in flight.
   */
  ~Bulkhead() {
    Drain().wait();
    gate_.Close();
  }

  Bulkhead(const Bulkhead&) = delete;
  Bulkhead& operator=(const Bulkhead&) = delete;
  Bulkhead(Bulkhead&&) = delete;
  Bulkhead& operator=(Bulkhead&&) = delete;

  // --------------------------------------------------------------------------
  // Execution
  // --------------------------------------------------------------------------

  /**
   * @brief Run @p task under this bulkhead's limits.
   *
   * Never blocks. The returned future yields the task's value, rethrows
   * the task's own exception unchanged, or throws IsolationError with
   * kQueueFull, kQueueTimeout, kDraining, kShutdown or kNoWorker.
   */
  template <typename F>
  auto Execute(F&& task) {
    auto state = MakeTaskState(std::forward<F>(task));
    auto fut = state->GetFuture();
    Submit(MakeWork(state));
    return fut;
  }

  /**
   * @brief Type-erased admission entry point used by Execute() and by
   *        BulkheadManager to attach permit release to settlement.
   */
  void Submit(Work work) {
    auto w = std::make_shared<Work>(std::move(work));
    std::unique_lock<std::mutex> lk(mtx_);

    if (draining_) {
      lk.unlock();
      ISOL_LOG_DEBUG("Bulkhead", "%s: rejected, draining", cfg_.name.c_str());
      w->reject(ErrorCode::kDraining, cfg_.name);
      return;
    }

    if (active_ < cfg_.max_concurrent) {
      ++active_;
      const Snapshot snap = SnapshotLocked();
      lk.unlock();
      EmitLoad(snap);
      Dispatch(std::move(w));
      return;
    }

    if (queue_.size() >= cfg_.max_queue_size) {
      ++total_rejected_;
      lk.unlock();
      ISOL_LOG_DEBUG("Bulkhead", "%s: rejected, queue full", cfg_.name.c_str());
      EmitCounter(metrics_, "bulkhead.rejected", cfg_.name);
      w->reject(ErrorCode::kQueueFull, cfg_.name);
      return;
    }

    const uint64_t id = next_entry_id_++;
    queue_.push_back(Queued{id, w, SteadyClock::now(), std::nullopt});
    if (cfg_.queue_timeout.count() > 0) {
      auto armed = timers_.Schedule(cfg_.queue_timeout,
                                    gate_.Wrap([this, id]() { OnQueueTimeout(id); }));
      if (!armed) {
        queue_.pop_back();
        ++total_rejected_;
        lk.unlock();
        ISOL_LOG_WARN("Bulkhead", "%s: cannot arm queue timeout, rejecting", cfg_.name.c_str());
        EmitCounter(metrics_, "bulkhead.rejected", cfg_.name);
        w->reject(ErrorCode::kQueueFull, cfg_.name);
        return;
      }
      queue_.back().timer = armed.value();
    }
    const Snapshot snap = SnapshotLocked();
    lk.unlock();
    ISOL_LOG_DEBUG("Bulkhead", "%s: queued (%u waiting)", cfg_.name.c_str(), snap.queued);
    EmitLoad(snap);
  }

  // --------------------------------------------------------------------------
  // Lifecycle
  // --------------------------------------------------------------------------

  /**
   * @brief Reject every queued task with kDraining and wait for running
   *        tasks to finish.
   *
   * New submissions are rejected with kDraining until the returned future
   * is ready; after that the bulkhead admits work again.
   */
  std::future<void> Drain() {
    std::promise<void> done;
    std::future<void> fut = done.get_future();
    std::deque<Queued> dropped;
    bool quiescent = false;
    uint32_t active = 0U;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      draining_ = true;
      dropped.swap(queue_);
      for (auto& q : dropped) {
        CancelTimerLocked(q);
      }
      active = active_;
      quiescent = QuiescentLocked();
      if (quiescent) {
        draining_ = false;
        saturated_ = false;
      } else {
        drain_waiters_.push_back(std::move(done));
      }
    }

    ISOL_LOG_INFO("Bulkhead", "%s: drain started, dropping %zu queued, awaiting %u active",
                  cfg_.name.c_str(), dropped.size(), active);
    for (auto& q : dropped) {
      q.work->reject(ErrorCode::kDraining, cfg_.name);
    }
    if (quiescent) {
      ISOL_LOG_INFO("Bulkhead", "%s: drained", cfg_.name.c_str());
      done.set_value();
    }
    return fut;
  }

  /**
   * @brief Zero the counters and averages. Running and queued tasks are
   *        left alone.
   */
  void Reset() {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      total_executed_ = 0U;
      total_failed_ = 0U;
      total_rejected_ = 0U;
      total_timeout_ = 0U;
      exec_time_sum_ms_ = 0.0;
      wait_time_sum_ms_ = 0.0;
      wait_samples_ = 0U;
    }
    ISOL_LOG_INFO("Bulkhead", "%s: statistics reset", cfg_.name.c_str());
  }

  // --------------------------------------------------------------------------
  // Introspection
  // --------------------------------------------------------------------------

  BulkheadStats GetStats() const {
    std::lock_guard<std::mutex> lk(mtx_);
    BulkheadStats s;
    s.name = cfg_.name;
    s.active_count = active_;
    s.queued_count = static_cast<uint32_t>(queue_.size());
    s.total_executed = total_executed_;
    s.total_failed = total_failed_;
    s.total_rejected = total_rejected_;
    s.total_timeout = total_timeout_;
    s.average_execution_time_ms =
        total_executed_ > 0U ? exec_time_sum_ms_ / static_cast<double>(total_executed_) : 0.0;
    s.average_wait_time_ms =
        wait_samples_ > 0U ? wait_time_sum_ms_ / static_cast<double>(wait_samples_) : 0.0;
    s.max_concurrent = cfg_.max_concurrent;
    s.max_queue_size = cfg_.max_queue_size;
    return s;
  }

  const BulkheadConfig& Config() const noexcept { return cfg_; }
  const std::string& Name() const noexcept { return cfg_.name; }

  bool IsDraining() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return draining_;
  }

 private:
  struct Queued {
    uint64_t id;
    std::shared_ptr<Work> work;
    SteadyClock::time_point enqueued_at;
    std::optional<TimerTaskId> timer;
  };

  struct Snapshot {
    uint32_t active;
    uint32_t queued;
    bool became_saturated;
  };

  /// Post an admitted task (slot already counted in active_) to a worker.
  void Dispatch(std::shared_ptr<Work> w) {
    while (w != nullptr) {
      auto posted = executor_.Post([this, w]() { RunAdmitted(w); });
      if (ISOL_LIKELY(posted)) {
        return;
      }

      // Executor refused: give the slot back and keep draining the queue.
      std::shared_ptr<Work> next;
      {
        std::lock_guard<std::mutex> lk(mtx_);
        --active_;
        ++finishing_;
        next = AdmitNextLocked(nullptr);
      }
      ISOL_SCOPE_EXIT(FinishSettling());
      const ErrorCode code = FromExecutorError(posted.get_error());
      ISOL_LOG_ERROR("Bulkhead", "%s: executor refused task (%s)", cfg_.name.c_str(),
                     ErrorCodeName(code));
      w->reject(code, cfg_.name);
      w = std::move(next);
    }
  }

  /// Worker-side: run, book-keep, hand the slot on, then settle the caller.
  void RunAdmitted(const std::shared_ptr<Work>& w) {
    const SteadyClock::time_point start = SteadyClock::now();
    const bool ok = w->run();
    const double exec_ms = ElapsedMs(start, SteadyClock::now());

    std::shared_ptr<Work> next;
    double wait_ms = -1.0;
    Snapshot snap;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      --active_;
      ++total_executed_;
      if (!ok) {
        ++total_failed_;
      }
      exec_time_sum_ms_ += exec_ms;
      ++finishing_;
      next = AdmitNextLocked(&wait_ms);
      snap = SnapshotLocked();
    }
    ISOL_SCOPE_EXIT(FinishSettling());

    EmitCounter(metrics_, "bulkhead.executed", cfg_.name);
    if (!ok) {
      EmitCounter(metrics_, "bulkhead.error", cfg_.name);
    }
    EmitHistogram(metrics_, "bulkhead.execution_time_ms", cfg_.name, exec_ms);
    if (wait_ms >= 0.0) {
      EmitHistogram(metrics_, "bulkhead.wait_time_ms", cfg_.name, wait_ms);
    }
    EmitLoad(snap);

    if (next != nullptr) {
      Dispatch(std::move(next));
    }
    w->settle();
  }

  /// Pop the oldest queued task into a free slot, if both exist.
  std::shared_ptr<Work> AdmitNextLocked(double* wait_ms) {
    if (queue_.empty() || active_ >= cfg_.max_concurrent) {
      return nullptr;
    }
    Queued q = std::move(queue_.front());
    queue_.pop_front();
    CancelTimerLocked(q);
    ++active_;
    const double waited = ElapsedMs(q.enqueued_at, SteadyClock::now());
    wait_time_sum_ms_ += waited;
    ++wait_samples_;
    if (wait_ms != nullptr) {
      *wait_ms = waited;
    }
    return std::move(q.work);
  }

  void OnQueueTimeout(uint64_t id) {
    std::shared_ptr<Work> expired;
    Snapshot snap;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      auto it = queue_.begin();
      while (it != queue_.end() && it->id != id) {
        ++it;
      }
      if (it == queue_.end()) {
        return;  // granted or drained first
      }
      expired = std::move(it->work);
      queue_.erase(it);
      ++total_timeout_;
      snap = SnapshotLocked();
    }
    ISOL_LOG_WARN("Bulkhead", "%s: task timed out after %lldms in queue", cfg_.name.c_str(),
                  static_cast<long long>(cfg_.queue_timeout.count()));
    EmitCounter(metrics_, "bulkhead.timeout", cfg_.name);
    EmitLoad(snap);
    expired->reject(ErrorCode::kQueueTimeout, cfg_.name);
  }

  /// Last touch of `this` by a completion path; may resolve pending drains.
  void FinishSettling() {
    std::vector<std::promise<void>> resolved;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      --finishing_;
      if (!drain_waiters_.empty() && QuiescentLocked()) {
        resolved.swap(drain_waiters_);
        draining_ = false;
        saturated_ = false;
        ISOL_LOG_INFO("Bulkhead", "%s: drained", cfg_.name.c_str());
      }
    }
    for (auto& p : resolved) {
      p.set_value();
    }
  }

  void CancelTimerLocked(const Queued& q) {
    if (q.timer.has_value() && !timers_.Cancel(*q.timer)) {
      ISOL_LOG_DEBUG("Bulkhead", "%s: queue timeout already firing", cfg_.name.c_str());
    }
  }

  bool QuiescentLocked() const noexcept {
    return active_ == 0U && queue_.empty() && finishing_ == 0U;
  }

  Snapshot SnapshotLocked() {
    Snapshot snap;
    snap.active = active_;
    snap.queued = static_cast<uint32_t>(queue_.size());
    const bool saturated = static_cast<uint64_t>(snap.active) + snap.queued >=
                           static_cast<uint64_t>(cfg_.max_concurrent) + cfg_.max_queue_size;
    snap.became_saturated = saturated && !saturated_;
    saturated_ = saturated;
    return snap;
  }

  void EmitLoad(const Snapshot& snap) noexcept {
    if (snap.became_saturated) {
      ISOL_LOG_WARN("Bulkhead", "%s: saturated (%u active, %u queued)", cfg_.name.c_str(),
                    snap.active, snap.queued);
    }
    EmitGauge(metrics_, "bulkhead.active", cfg_.name, static_cast<double>(snap.active));
    EmitGauge(metrics_, "bulkhead.queued", cfg_.name, static_cast<double>(snap.queued));
  }

  const BulkheadConfig cfg_;
  TaskExecutor& executor_;
  TimerScheduler& timers_;
  MetricsSink& metrics_;

  mutable std::mutex mtx_;
  std::deque<Queued> queue_;
  uint64_t next_entry_id_{1U};
  uint32_t active_{0U};
  uint32_t finishing_{0U};  ///< Completion paths that still touch `this`.
  bool draining_{false};
  bool saturated_{false};
  std::vector<std::promise<void>> drain_waiters_;

  uint64_t total_executed_{0U};
  uint64_t total_failed_{0U};
  uint64_t total_rejected_{0U};
  uint64_t total_timeout_{0U};
  double exec_time_sum_ms_{0.0};
  double wait_time_sum_ms_{0.0};
  uint64_t wait_samples_{0U};

  CallbackGate gate_;
};

}  // namespace isol

#endif  // ISOL_BULKHEAD_HPP_
