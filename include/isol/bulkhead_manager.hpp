/**
 * @file bulkhead_manager.hpp
 * @brief Process-wide registry composing named Bulkheads with global
 *        resource-class Semaphores.
 *
 * Execute(name, task, {semaphores}) flow:
 *
 *   acquire sem[0] -> acquire sem[1] -> ... -> Bulkhead(name).Submit
 *        |                 |                         |
 *        +--- fail: release held in reverse, reject  |
 *                                                    v
 *                      settle / reject: release every held permit in
 *                      reverse order, then deliver the outcome
 *
 * Every step is asynchronous; the calling thread never waits. One
 * BulkheadManager is constructed at startup and passed by reference to
 * whoever needs it.
 *
 * Bulkheads are created lazily on first use with the configuration that
 * is current at that moment, and are never removed. Semaphores are fixed
 * at construction.
 */

#ifndef ISOL_BULKHEAD_MANAGER_HPP_
#define ISOL_BULKHEAD_MANAGER_HPP_

#include "isol/bulkhead.hpp"
#include "isol/completion.hpp"
#include "isol/error.hpp"
#include "isol/executor.hpp"
#include "isol/log.hpp"
#include "isol/manager_config.hpp"
#include "isol/metrics.hpp"
#include "isol/semaphore.hpp"
#include "isol/timer.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace isol {

struct ExecuteOptions {
  /// Global semaphores to hold while the task is admitted, in acquire order.
  std::vector<std::string> semaphores;
  /// Per-semaphore acquire timeout; negative means the manager default.
  std::chrono::milliseconds semaphore_timeout{-1};
};

struct AllStats {
  std::map<std::string, BulkheadStats> bulkheads;
  std::map<std::string, SemaphoreStats> semaphores;
};

struct HealthSummary {
  uint32_t total_bulkheads{0U};
  uint32_t total_semaphores{0U};
  std::vector<std::string> saturated;
  uint64_t queued_tasks{0U};
  uint64_t active_tasks{0U};
};

namespace detail {

/**
 * @brief Acquires a list of semaphores one after another, then submits
 *        the work to a bulkhead with permit release attached to
 *        settlement.
 *
 * Holds itself alive through the callbacks it registers.
 */
class PermitChain final : public std::enable_shared_from_this<PermitChain> {
 public:
  PermitChain(Bulkhead& bulkhead, std::vector<Semaphore*> sems,
              std::chrono::milliseconds timeout, Work work)
      : bulkhead_(bulkhead), sems_(std::move(sems)), timeout_(timeout), work_(std::move(work)) {}

  PermitChain(const PermitChain&) = delete;
  PermitChain& operator=(const PermitChain&) = delete;

  void Next() {
    if (held_ == sems_.size()) {
      Admit();
      return;
    }
    Semaphore* sem = sems_[held_];
    auto self = shared_from_this();
    sem->AcquireAsync(timeout_, [self, sem](expected<void, ErrorCode> r) {
      if (!r) {
        self->ReleaseHeld();
        self->work_.reject(r.get_error(), sem->Name());
        return;
      }
      ++self->held_;
      self->Next();
    });
  }

 private:
  void Admit() {
    auto self = shared_from_this();
    Work wrapped;
    wrapped.run = [self]() { return self->work_.run(); };
    wrapped.settle = [self]() {
      self->ReleaseHeld();
      self->work_.settle();
    };
    wrapped.reject = [self](ErrorCode code, const std::string& resource) {
      self->ReleaseHeld();
      self->work_.reject(code, resource);
    };
    bulkhead_.Submit(std::move(wrapped));
  }

  /// Reverse acquisition order. Runs at most once per chain.
  void ReleaseHeld() {
    while (held_ > 0U) {
      --held_;
      sems_[held_]->Release();
    }
  }

  Bulkhead& bulkhead_;
  const std::vector<Semaphore*> sems_;
  const std::chrono::milliseconds timeout_;
  Work work_;
  size_t held_{0U};
};

}  // namespace detail

// ============================================================================
// BulkheadManager
// ============================================================================

class BulkheadManager final {
 public:
  explicit BulkheadManager(ManagerConfig cfg = ManagerConfig::Builtin(),
                           MetricsSink& metrics = NullMetricsSink::Instance())
      : config_(std::move(cfg)),
        metrics_(metrics),
        executor_(config_.Executor()),
        timers_(config_.timer_capacity) {
    auto started = timers_.Start();
    if (!started) {
      ISOL_LOG_ERROR("Manager", "timer scheduler failed to start");
    }
    for (const auto& kv : config_.semaphores) {
      semaphores_.emplace(kv.first,
                          std::make_unique<Semaphore>(kv.first, kv.second, timers_, metrics_));
    }
    ISOL_LOG_INFO("Manager", "initialized: enabled=%d, %zu semaphores, %zu config overrides",
                  config_.enabled ? 1 : 0, semaphores_.size(), config_.overrides.size());
  }

  /**
   * @brief Refuses new work, then cancels waiters and drains bulkheads
   *        until nothing is running, queued or waiting for a permit.
   */
  ~BulkheadManager() {
    shutting_down_.store(true, std::memory_order_release);
    while (true) {
      for (auto& kv : semaphores_) {
        kv.second->CancelWaiters();
      }
      DrainAll();
      if (Quiescent()) {
        break;
      }
    }
    timers_.Stop();
    executor_.Shutdown();
    ISOL_LOG_INFO("Manager", "shut down");
  }

  BulkheadManager(const BulkheadManager&) = delete;
  BulkheadManager& operator=(const BulkheadManager&) = delete;
  BulkheadManager(BulkheadManager&&) = delete;
  BulkheadManager& operator=(BulkheadManager&&) = delete;

  // --------------------------------------------------------------------------
  // Registry
  // --------------------------------------------------------------------------

  /**
   * @brief Existing bulkhead for @p name, or a new one configured from the
   *        most specific override (exact, then namespace prefix, then
   *        defaults).
   */
  Bulkhead& GetBulkhead(const std::string& name) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = bulkheads_.find(name);
    if (it != bulkheads_.end()) {
      return *it->second;
    }
    auto bh = std::make_unique<Bulkhead>(config_.Resolve(name), executor_, timers_, metrics_);
    Bulkhead& ref = *bh;
    bulkheads_.emplace(name, std::move(bh));
    return ref;
  }

  /** @brief Pre-registered semaphore, or nullptr if @p name is unknown. */
  Semaphore* GetSemaphore(const std::string& name) const {
    auto it = semaphores_.find(name);
    return (it != semaphores_.end()) ? it->second.get() : nullptr;
  }

  // --------------------------------------------------------------------------
  // Execution
  // --------------------------------------------------------------------------

  /**
   * @brief Run @p task under bulkhead @p name, holding the semaphores
   *        listed in @p opts while it is admitted.
   *
   * Unknown semaphore names are skipped with a warning. The returned future
   * yields the task's value or exception, or an IsolationError when a
   * permit or slot was not granted.
   */
  template <typename F>
  auto Execute(const std::string& name, F&& task, const ExecuteOptions& opts = ExecuteOptions{}) {
    auto state = MakeTaskState(std::forward<F>(task));
    auto fut = state->GetFuture();

    if (shutting_down_.load(std::memory_order_acquire)) {
      state->Fail(ErrorCode::kShutdown, "BulkheadManager");
      return fut;
    }
    if (!config_.enabled) {
      RunUnmanaged(MakeWork(state));
      return fut;
    }

    Bulkhead& bulkhead = GetBulkhead(name);
    std::vector<Semaphore*> sems;
    sems.reserve(opts.semaphores.size());
    for (const auto& sem_name : opts.semaphores) {
      Semaphore* sem = GetSemaphore(sem_name);
      if (sem == nullptr) {
        ISOL_LOG_WARN("Manager", "%s: unknown semaphore '%s' skipped", name.c_str(),
                      sem_name.c_str());
        continue;
      }
      sems.push_back(sem);
    }
    const std::chrono::milliseconds timeout =
        (opts.semaphore_timeout.count() < 0) ? config_.semaphore_timeout : opts.semaphore_timeout;

    if (sems.empty()) {
      bulkhead.Submit(MakeWork(state));
    } else {
      auto chain = std::make_shared<detail::PermitChain>(bulkhead, std::move(sems), timeout,
                                                         MakeWork(state));
      chain->Next();
    }
    return fut;
  }

  template <typename F>
  auto ExecuteCpuIntensive(const std::string& name, F&& task) {
    ExecuteOptions opts;
    opts.semaphores.emplace_back(kCpuIntensiveSemaphore);
    return Execute(name, std::forward<F>(task), opts);
  }

  template <typename F>
  auto ExecuteMemoryIntensive(const std::string& name, F&& task) {
    ExecuteOptions opts;
    opts.semaphores.emplace_back(kMemoryIntensiveSemaphore);
    return Execute(name, std::forward<F>(task), opts);
  }

  /// Bulkhead "ai.<provider>" plus the global AI request semaphore.
  template <typename F>
  auto ExecuteAiTask(const std::string& provider, F&& task) {
    ExecuteOptions opts;
    opts.semaphores.emplace_back(kAiRequestsSemaphore);
    return Execute("ai." + provider, std::forward<F>(task), opts);
  }

  // --------------------------------------------------------------------------
  // Read Model
  // --------------------------------------------------------------------------

  AllStats GetAllStats() const {
    AllStats all;
    for (Bulkhead* bh : SnapshotBulkheads()) {
      all.bulkheads.emplace(bh->Name(), bh->GetStats());
    }
    for (const auto& kv : semaphores_) {
      all.semaphores.emplace(kv.first, kv.second->GetStats());
    }
    return all;
  }

  HealthSummary GetHealthSummary() const {
    HealthSummary h;
    const std::vector<Bulkhead*> bulkheads = SnapshotBulkheads();
    h.total_bulkheads = static_cast<uint32_t>(bulkheads.size());
    h.total_semaphores = static_cast<uint32_t>(semaphores_.size());
    for (Bulkhead* bh : bulkheads) {
      const BulkheadStats s = bh->GetStats();
      h.active_tasks += s.active_count;
      h.queued_tasks += s.queued_count;
      if (s.Saturated()) {
        h.saturated.push_back(s.name);
      }
    }
    return h;
  }

  // --------------------------------------------------------------------------
  // Configuration and Lifecycle
  // --------------------------------------------------------------------------

  /**
   * @brief Merge @p patch into the override for @p name (exact name or
   *        namespace prefix ending in '.').
   *
   * Only bulkheads created afterwards see the change.
   */
  void UpdateConfig(const std::string& name, const BulkheadConfigPatch& patch) {
    bool exists = false;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      config_.overrides[name].MergeFrom(patch);
      exists = bulkheads_.find(name) != bulkheads_.end();
    }
    ISOL_LOG_INFO("Manager", "config override updated for %s", name.c_str());
    if (exists) {
      ISOL_LOG_INFO("Manager", "%s already exists and keeps its current limits", name.c_str());
    }
  }

  /// @return false if no bulkhead named @p name has been created.
  bool Reset(const std::string& name) {
    Bulkhead* bh = nullptr;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      auto it = bulkheads_.find(name);
      if (it != bulkheads_.end()) {
        bh = it->second.get();
      }
    }
    if (bh == nullptr) {
      ISOL_LOG_DEBUG("Manager", "reset: no bulkhead %s", name.c_str());
      return false;
    }
    bh->Reset();
    return true;
  }

  void ResetAll() {
    for (Bulkhead* bh : SnapshotBulkheads()) {
      bh->Reset();
    }
  }

  /**
   * @brief Drain every registered bulkhead and block until all are
   *        quiescent. Must not be called from inside a task.
   */
  void DrainAll() {
    const std::vector<Bulkhead*> bulkheads = SnapshotBulkheads();
    ISOL_LOG_INFO("Manager", "draining %zu bulkheads", bulkheads.size());
    std::vector<std::future<void>> pending;
    pending.reserve(bulkheads.size());
    for (Bulkhead* bh : bulkheads) {
      pending.push_back(bh->Drain());
    }
    for (auto& f : pending) {
      f.wait();
    }
    ISOL_LOG_INFO("Manager", "all bulkheads drained");
  }

  bool Enabled() const noexcept { return config_.enabled; }

  /// Copy of the current configuration, including runtime updates.
  ManagerConfig CurrentConfig() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return config_;
  }

 private:
  /// Disabled mode: straight to a worker, no limits, no semaphores.
  void RunUnmanaged(Work work) {
    auto w = std::make_shared<Work>(std::move(work));
    auto posted = executor_.Post([w]() {
      if (!w->run()) {
        ISOL_LOG_DEBUG("Manager", "unmanaged task failed");
      }
      w->settle();
    });
    if (!posted) {
      w->reject(FromExecutorError(posted.get_error()), "executor");
    }
  }

  std::vector<Bulkhead*> SnapshotBulkheads() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<Bulkhead*> out;
    out.reserve(bulkheads_.size());
    for (const auto& kv : bulkheads_) {
      out.push_back(kv.second.get());
    }
    return out;
  }

  bool Quiescent() const {
    for (const auto& kv : semaphores_) {
      if (kv.second->GetStats().waiting_count > 0U) {
        return false;
      }
    }
    for (Bulkhead* bh : SnapshotBulkheads()) {
      const BulkheadStats s = bh->GetStats();
      if (s.active_count > 0U || s.queued_count > 0U) {
        return false;
      }
    }
    return true;
  }

  // Declaration order matters: destroyed bottom-up, bulkheads first.
  ManagerConfig config_;  ///< overrides guarded by mtx_ after construction.
  MetricsSink& metrics_;
  TaskExecutor executor_;
  TimerScheduler timers_;
  std::map<std::string, std::unique_ptr<Semaphore>> semaphores_;

  mutable std::mutex mtx_;
  std::map<std::string, std::unique_ptr<Bulkhead>> bulkheads_;
  std::atomic<bool> shutting_down_{false};
};

}  // namespace isol

#endif  // ISOL_BULKHEAD_MANAGER_HPP_
