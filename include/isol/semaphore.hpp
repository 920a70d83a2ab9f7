/**
 * @file semaphore.hpp
 * @brief Named counting semaphore with FIFO waiters and acquire timeouts.
 *
 * Acquisition never blocks the calling thread: AcquireAsync() invokes a
 * callback on grant or timeout, Acquire() returns a std::future<void>.
 * Release() hands a freed permit directly to the oldest waiter, so a
 * newcomer can never overtake a queued caller.
 *
 * A waiter's timeout is a one-shot TimerScheduler callback. Grant and
 * timeout race on removal of the waiter from the queue under the instance
 * mutex; whichever removes it settles it, the other finds nothing.
 *
 * Lock order: instance mutex -> scheduler mutex. Callbacks are always
 * invoked with no semaphore lock held.
 */

#ifndef ISOL_SEMAPHORE_HPP_
#define ISOL_SEMAPHORE_HPP_

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
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace isol {

/// Wait forever: no timeout timer is armed.
static constexpr std::chrono::milliseconds kNoTimeout{0};

struct SemaphoreStats {
  std::string name;
  uint32_t total_permits{0U};
  uint32_t available_permits{0U};
  uint32_t waiting_count{0U};
  uint64_t total_acquired{0U};
  uint64_t total_released{0U};
  uint64_t total_timeout{0U};
};

// ============================================================================
// Semaphore
// ============================================================================

class Semaphore final {
 public:
  /// Receives success on grant, ErrorCode::kSemaphoreTimeout or kShutdown.
  using AcquireCallback = std::function<void(expected<void, ErrorCode>)>;

  /**
   * @param name     Resource name, reported in errors, stats and logs.
   * @param permits  Fixed pool size.
   * @param timers   Started scheduler that fires acquire timeouts.
   * @param metrics  Sink for semaphore.* metrics.
   */
  Semaphore(std::string name, uint32_t permits, TimerScheduler& timers,
            MetricsSink& metrics = NullMetricsSink::Instance())
      : name_(std::move(name)),
        total_(permits),
        available_(permits),
        timers_(timers),
        metrics_(metrics) {
    ISOL_LOG_INFO("Semaphore", "created %s with %u permits", name_.c_str(), total_);
  }

  /** @brief Fails every waiter with kShutdown; in-flight timeouts are fenced. */
  ~Semaphore() {
    CancelWaiters();
    gate_.Close();
  }

  Semaphore(const Semaphore&) = delete;
  Semaphore& operator=(const Semaphore&) = delete;
  Semaphore(Semaphore&&) = delete;
  Semaphore& operator=(Semaphore&&) = delete;

  // --------------------------------------------------------------------------
  // Acquisition
  // --------------------------------------------------------------------------

  /**
   * @brief Take a permit only if one is free and nobody is waiting.
   */
  bool TryAcquire() {
    uint32_t available = 0U;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (available_ == 0U || !waiters_.empty()) {
        return false;
      }
      --available_;
      ++total_acquired_;
      available = available_;
    }
    EmitAcquired(available);
    return true;
  }

  /**
   * @brief Request a permit; @p cb runs exactly once.
   *
   * Granted immediately (on the calling thread) when a permit is free.
   * Otherwise the caller joins the FIFO wait queue and @p cb runs on the
   * releasing thread or, on timeout, on the scheduler thread.
   *
   * @param timeout  kNoTimeout (or negative) waits forever.
   */
  void AcquireAsync(std::chrono::milliseconds timeout, AcquireCallback cb) {
    std::unique_lock<std::mutex> lk(mtx_);
    if (available_ > 0U && waiters_.empty()) {
      --available_;
      ++total_acquired_;
      const uint32_t available = available_;
      lk.unlock();
      EmitAcquired(available);
      cb(expected<void, ErrorCode>::success());
      return;
    }

    const uint64_t id = next_waiter_id_++;
    waiters_.push_back(Waiter{id, std::move(cb), std::nullopt});
    if (timeout.count() <= 0) {
      return;
    }

    auto armed = timers_.Schedule(timeout, gate_.Wrap([this, id]() { OnAcquireTimeout(id); }));
    if (armed) {
      waiters_.back().timer = armed.value();
      return;
    }

    // No timer slot: nothing would ever expire this waiter, fail it now.
    AcquireCallback failed = std::move(waiters_.back().cb);
    waiters_.pop_back();
    ++total_timeout_;
    lk.unlock();
    ISOL_LOG_WARN("Semaphore", "%s: cannot arm acquire timeout, failing waiter", name_.c_str());
    EmitCounter(metrics_, "semaphore.timeout", name_);
    failed(expected<void, ErrorCode>::error(ErrorCode::kSemaphoreTimeout));
  }

  /**
   * @brief Future form of AcquireAsync().
   *
   * The future throws IsolationError on timeout or shutdown. Once it is
   * ready the caller owns a permit and must Release() it.
   */
  std::future<void> Acquire(std::chrono::milliseconds timeout = kNoTimeout) {
    auto promise = std::make_shared<std::promise<void>>();
    std::future<void> fut = promise->get_future();
    const std::string& name = name_;
    AcquireAsync(timeout, [promise, name](expected<void, ErrorCode> r) {
      if (r) {
        promise->set_value();
      } else {
        promise->set_exception(std::make_exception_ptr(IsolationError(r.get_error(), name)));
      }
    });
    return fut;
  }

  /**
   * @brief Return a permit: grant it to the oldest waiter, else pool it.
   *
   * Releasing more permits than were acquired is a caller bug; the extra
   * release is logged and ignored so available never exceeds total.
   */
  void Release() {
    std::unique_lock<std::mutex> lk(mtx_);
    if (waiters_.empty()) {
      if (available_ >= total_) {
        lk.unlock();
        ISOL_LOG_ERROR("Semaphore", "%s: release without matching acquire ignored",
                       name_.c_str());
        return;
      }
      ++available_;
      ++total_released_;
      const uint32_t available = available_;
      lk.unlock();
      EmitGauge(metrics_, "semaphore.available", name_, static_cast<double>(available));
      return;
    }

    Waiter next = std::move(waiters_.front());
    waiters_.pop_front();
    ++total_released_;
    ++total_acquired_;
    if (next.timer.has_value() && !timers_.Cancel(*next.timer)) {
      // Timeout is firing concurrently; it will find the waiter gone.
      ISOL_LOG_DEBUG("Semaphore", "%s: grant won race against timeout", name_.c_str());
    }
    const uint32_t available = available_;
    lk.unlock();
    EmitAcquired(available);
    next.cb(expected<void, ErrorCode>::success());
  }

  /**
   * @brief Scoped acquisition: acquire, run @p fn, release on every exit.
   *
   * Blocks the calling thread while waiting. @p fn's result or exception
   * propagates unchanged; a timeout throws IsolationError without running
   * @p fn. Callers that must not block use WithPermitAsync(), or
   * BulkheadManager::Execute() with the semaphore named in its options.
   */
  template <typename F>
  std::invoke_result_t<F&> WithPermit(F&& fn, std::chrono::milliseconds timeout = kNoTimeout);

  /**
   * @brief Non-blocking WithPermit(): acquire, run @p fn on @p executor,
   *        release, then settle the returned future.
   *
   * The permit is back in the pool before the future becomes ready. A
   * timeout or shutdown settles the future with IsolationError and @p fn
   * never runs; so does an executor that refuses the job, after the
   * permit was returned. The semaphore must outlive the posted job.
   */
  template <typename F>
  auto WithPermitAsync(TaskExecutor& executor, F&& fn,
                       std::chrono::milliseconds timeout = kNoTimeout);

  /**
   * @brief Fail every queued waiter with ErrorCode::kShutdown.
   */
  void CancelWaiters() {
    std::deque<Waiter> dropped;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      dropped.swap(waiters_);
      for (auto& w : dropped) {
        if (w.timer.has_value() && !timers_.Cancel(*w.timer)) {
          ISOL_LOG_DEBUG("Semaphore", "%s: timeout already firing on cancel", name_.c_str());
        }
      }
    }
    if (!dropped.empty()) {
      ISOL_LOG_INFO("Semaphore", "%s: cancelled %zu waiters", name_.c_str(), dropped.size());
    }
    for (auto& w : dropped) {
      w.cb(expected<void, ErrorCode>::error(ErrorCode::kShutdown));
    }
  }

  // --------------------------------------------------------------------------
  // Introspection
  // --------------------------------------------------------------------------

  SemaphoreStats GetStats() const {
    std::lock_guard<std::mutex> lk(mtx_);
    SemaphoreStats s;
    s.name = name_;
    s.total_permits = total_;
    s.available_permits = available_;
    s.waiting_count = static_cast<uint32_t>(waiters_.size());
    s.total_acquired = total_acquired_;
    s.total_released = total_released_;
    s.total_timeout = total_timeout_;
    return s;
  }

  const std::string& Name() const noexcept { return name_; }
  uint32_t TotalPermits() const noexcept { return total_; }

 private:
  struct Waiter {
    uint64_t id;
    AcquireCallback cb;
    std::optional<TimerTaskId> timer;
  };

  void OnAcquireTimeout(uint64_t id) {
    AcquireCallback expired;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      auto it = waiters_.begin();
      while (it != waiters_.end() && it->id != id) {
        ++it;
      }
      if (it == waiters_.end()) {
        return;
      }
      expired = std::move(it->cb);
      waiters_.erase(it);
      ++total_timeout_;
    }
    ISOL_LOG_WARN("Semaphore", "%s: acquire timed out", name_.c_str());
    EmitCounter(metrics_, "semaphore.timeout", name_);
    expired(expected<void, ErrorCode>::error(ErrorCode::kSemaphoreTimeout));
  }

  void EmitAcquired(uint32_t available) noexcept {
    EmitCounter(metrics_, "semaphore.acquired", name_);
    EmitGauge(metrics_, "semaphore.available", name_, static_cast<double>(available));
  }

  const std::string name_;
  const uint32_t total_;

  mutable std::mutex mtx_;
  uint32_t available_;
  std::deque<Waiter> waiters_;
  uint64_t next_waiter_id_{1U};
  uint64_t total_acquired_{0U};
  uint64_t total_released_{0U};
  uint64_t total_timeout_{0U};

  TimerScheduler& timers_;
  MetricsSink& metrics_;
  CallbackGate gate_;
};

// ============================================================================
// PermitGuard
// ============================================================================

/**
 * @brief RAII owner of one already-acquired permit. Move-only.
 *
 * @code
 *   sem.Acquire().get();
 *   isol::PermitGuard guard(sem, std::adopt_lock);
 *   DoWork();  // permit returned even if this throws
 * @endcode
 */
class PermitGuard final {
 public:
  PermitGuard(Semaphore& sem, std::adopt_lock_t) noexcept : sem_(&sem) {}

  PermitGuard(PermitGuard&& other) noexcept : sem_(other.sem_) { other.sem_ = nullptr; }

  PermitGuard(const PermitGuard&) = delete;
  PermitGuard& operator=(const PermitGuard&) = delete;
  PermitGuard& operator=(PermitGuard&&) = delete;

  ~PermitGuard() {
    if (sem_ != nullptr) {
      sem_->Release();
    }
  }

 private:
  Semaphore* sem_;
};

template <typename F>
std::invoke_result_t<F&> Semaphore::WithPermit(F&& fn, std::chrono::milliseconds timeout) {
  Acquire(timeout).get();
  PermitGuard guard(*this, std::adopt_lock);
  return fn();
}

template <typename F>
auto Semaphore::WithPermitAsync(TaskExecutor& executor, F&& fn,
                                std::chrono::milliseconds timeout) {
  auto state = MakeTaskState(std::forward<F>(fn));
  auto fut = state->GetFuture();
  TaskExecutor* exec = &executor;
  AcquireAsync(timeout, [this, exec, state](expected<void, ErrorCode> granted) {
    if (!granted) {
      state->Fail(granted.get_error(), name_);
      return;
    }
    auto posted = exec->Post([this, state]() {
      state->Run();
      Release();
      state->Settle();
    });
    if (ISOL_UNLIKELY(!posted)) {
      Release();
      const ErrorCode code = FromExecutorError(posted.get_error());
      ISOL_LOG_ERROR("Semaphore", "%s: executor refused permit holder (%s)", name_.c_str(),
                     ErrorCodeName(code));
      state->Fail(code, name_);
    }
  });
  return fut;
}

}  // namespace isol

#endif  // ISOL_SEMAPHORE_HPP_
