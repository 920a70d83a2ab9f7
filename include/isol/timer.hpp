/**
 * @file timer.hpp
 * @brief Header-only one-shot deadline scheduler.
 *
 * A single background thread sleeps until the earliest pending deadline
 * and fires its callback. Used for bulkhead queue timeouts and semaphore
 * acquire timeouts, both of which are armed at enqueue time and cancelled
 * when a grant wins the race.
 *
 * Callbacks run on the scheduler thread, never under the scheduler lock,
 * so a callback may call Schedule() or Cancel() itself.
 * All public methods are thread-safe.
 */

#ifndef ISOL_TIMER_HPP_
#define ISOL_TIMER_HPP_

#include "isol/platform.hpp"
#include "isol/vocabulary.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace isol {

static constexpr uint32_t kDefaultTimerCapacity = 65536U;

// ============================================================================
// TimerScheduler
// ============================================================================

/**
 * @brief Capacity-bounded scheduler of one-shot deadline callbacks.
 *
 * Typical usage:
 *
 *   isol::TimerScheduler timers;
 *   timers.Start();
 *   auto id = timers.Schedule(std::chrono::milliseconds(100), [] { ... });
 *   timers.Cancel(id.value());  // kNotFound if it already fired
 *   timers.Stop();
 *
 * Non-copyable, non-movable.
 */
class TimerScheduler final {
 public:
  using Callback = std::function<void()>;

  /**
   * @param max_tasks  Maximum number of pending (armed, not yet fired)
   *                   callbacks.
   */
  explicit TimerScheduler(uint32_t max_tasks = kDefaultTimerCapacity)
      : max_tasks_(max_tasks) {}

  /** @brief Stops the scheduler thread. Pending callbacks never fire. */
  ~TimerScheduler() { Stop(); }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;
  TimerScheduler(TimerScheduler&&) = delete;
  TimerScheduler& operator=(TimerScheduler&&) = delete;

  // --------------------------------------------------------------------------
  // Task Management
  // --------------------------------------------------------------------------

  /**
   * @brief Arm a one-shot callback that fires after @p delay.
   *
   * @return TimerTaskId on success, or TimerError on failure:
   *         - kInvalidDelay if delay is negative or fn is empty.
   *         - kSlotsFull    if max_tasks callbacks are already pending.
   */
  expected<TimerTaskId, TimerError> Schedule(std::chrono::milliseconds delay,
                                             Callback fn) {
    if (delay.count() < 0 || !fn) {
      return expected<TimerTaskId, TimerError>::error(TimerError::kInvalidDelay);
    }

    const SteadyClock::time_point deadline = SteadyClock::now() + delay;
    uint64_t id = 0U;
    bool new_head = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (index_.size() >= max_tasks_) {
        return expected<TimerTaskId, TimerError>::error(TimerError::kSlotsFull);
      }
      id = next_id_++;
      auto it = pending_.emplace(Key{deadline, id}, std::move(fn)).first;
      index_.emplace(id, deadline);
      new_head = (it == pending_.begin());
    }
    if (new_head) {
      cv_.notify_one();
    }
    return expected<TimerTaskId, TimerError>::success(TimerTaskId(id));
  }

  /**
   * @brief Disarm a pending callback.
   *
   * @return Success, or TimerError::kNotFound if the callback already fired
   *         (or is firing right now) or the id is unknown.
   */
  expected<void, TimerError> Cancel(TimerTaskId task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(task_id.value());
    if (it == index_.end()) {
      return expected<void, TimerError>::error(TimerError::kNotFound);
    }
    pending_.erase(Key{it->second, it->first});
    index_.erase(it);
    return expected<void, TimerError>::success();
  }

  // --------------------------------------------------------------------------
  // Scheduler Lifecycle
  // --------------------------------------------------------------------------

  /**
   * @brief Start the background scheduler thread.
   *
   * @return Success, or TimerError::kAlreadyRunning if already started.
   */
  expected<void, TimerError> Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    running_ = true;
    worker_ = std::thread(&TimerScheduler::ScheduleLoop, this);
    return expected<void, TimerError>::success();
  }

  /**
   * @brief Stop the scheduler thread (blocks until the thread exits).
   *
   * Safe to call even if the scheduler is not running. Must not be called
   * from inside a timer callback.
   */
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  bool IsRunning() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
  }

  /** @brief Number of armed callbacks that have not fired yet. */
  uint32_t TaskCount() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(index_.size());
  }

 private:
  /// Deadline first, id second: equal deadlines fire in arming order.
  using Key = std::pair<SteadyClock::time_point, uint64_t>;

  /**
   * @brief Main loop executed by the background scheduler thread.
   *
   * Sleeps until the earliest deadline (or until a new earlier deadline
   * is armed), detaches the due entry from the tables, and runs it with
   * the lock released.
   */
  void ScheduleLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
      if (pending_.empty()) {
        cv_.wait(lock);
        continue;
      }

      auto head = pending_.begin();
      const SteadyClock::time_point deadline = head->first.first;
      if (SteadyClock::now() < deadline) {
        cv_.wait_until(lock, deadline);
        continue;
      }

      Callback fn = std::move(head->second);
      index_.erase(head->first.second);
      pending_.erase(head);

      lock.unlock();
      fn();
      lock.lock();
    }
  }

  const uint32_t max_tasks_;
  uint64_t next_id_ = 1;                                  ///< Guarded by mutex_.
  bool running_ = false;                                  ///< Guarded by mutex_.
  std::map<Key, Callback> pending_;                       ///< Ordered by deadline.
  std::unordered_map<uint64_t, SteadyClock::time_point> index_;  ///< id -> deadline.
  std::thread worker_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

}  // namespace isol

#endif  // ISOL_TIMER_HPP_
