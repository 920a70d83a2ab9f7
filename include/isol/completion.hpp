/**
 * @file completion.hpp
 * @brief Single-settlement plumbing between callers, queues and workers.
 *
 * - SettleOnce    : atomic first-claim flag; exactly one settle path wins
 * - CallbackGate  : liveness gate for timer callbacks that capture `this`
 * - Work          : type-erased admitted unit (run / settle / reject)
 * - TaskState<R>  : owns the caller's task and std::promise<R>
 */

#ifndef ISOL_COMPLETION_HPP_
#define ISOL_COMPLETION_HPP_

#include "isol/error.hpp"
#include "isol/platform.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace isol {

// ============================================================================
// SettleOnce
// ============================================================================

/**
 * @brief First caller of TryClaim() wins; every later call returns false.
 *
 * Guards a completion handle that can be reached from two racing paths
 * (grant vs. timeout, grant vs. drain).
 */
class SettleOnce final {
 public:
  SettleOnce() noexcept = default;
  SettleOnce(const SettleOnce&) = delete;
  SettleOnce& operator=(const SettleOnce&) = delete;

  bool TryClaim() noexcept { return !claimed_.exchange(true, std::memory_order_acq_rel); }

  bool IsClaimed() const noexcept { return claimed_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> claimed_{false};
};

// ============================================================================
// CallbackGate
// ============================================================================

/**
 * @brief Liveness gate for callbacks handed to another thread.
 *
 * Wrap() returns a callable that runs the wrapped function only while the
 * gate is open, holding the gate lock for the duration. Close() blocks
 * until an in-flight wrapped call returns, after which no wrapped call
 * runs. The owner closes the gate in its destructor before any member it
 * touches from callbacks is destroyed.
 */
class CallbackGate final {
 public:
  CallbackGate() : state_(std::make_shared<State>()) {}
  ~CallbackGate() { Close(); }

  CallbackGate(const CallbackGate&) = delete;
  CallbackGate& operator=(const CallbackGate&) = delete;

  template <typename F>
  std::function<void()> Wrap(F fn) const {
    std::shared_ptr<State> state = state_;
    return [state, fn]() mutable {
      std::lock_guard<std::mutex> lk(state->mtx);
      if (state->open) {
        fn();
      }
    };
  }

  void Close() noexcept {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->open = false;
  }

 private:
  struct State {
    std::mutex mtx;
    bool open = true;
  };

  std::shared_ptr<State> state_;
};

// ============================================================================
// Work
// ============================================================================

/**
 * @brief Admitted unit of work as seen by a Bulkhead.
 *
 * Exactly one of the following sequences happens for every Work:
 *   run() then settle()   : granted a slot and executed on a worker
 *   reject(code, name)    : refused, timed out, or dropped by a drain
 *
 * run() returns false when the task itself failed. settle() is invoked
 * after the bulkhead has finished its bookkeeping for the task.
 */
struct Work {
  std::function<bool()> run;
  std::function<void()> settle;
  std::function<void(ErrorCode, const std::string&)> reject;
};

namespace detail {

/// Captured result of a task: a value (or nothing, for void) or an exception.
template <typename R>
struct Outcome {
  std::optional<R> value;
  std::exception_ptr error;

  template <typename F>
  void Capture(F& fn) {
    value.emplace(fn());
  }

  void Deliver(std::promise<R>& promise) {
    if (error) {
      promise.set_exception(error);
    } else {
      promise.set_value(std::move(*value));
    }
  }
};

template <>
struct Outcome<void> {
  std::exception_ptr error;

  template <typename F>
  void Capture(F& fn) {
    fn();
  }

  void Deliver(std::promise<void>& promise) {
    if (error) {
      promise.set_exception(error);
    } else {
      promise.set_value();
    }
  }
};

}  // namespace detail

// ============================================================================
// TaskState<R, F>
// ============================================================================

/**
 * @brief Caller-side state of one Execute() call: task, outcome, promise.
 *
 * Shared between the queue entry, the worker job and the timeout callback;
 * SettleOnce makes sure the promise is satisfied exactly once.
 */
template <typename R, typename F>
class TaskState final {
  static_assert(!std::is_reference<R>::value, "tasks must return by value");

 public:
  template <typename G>
  explicit TaskState(G&& fn) : fn_(std::forward<G>(fn)) {}

  TaskState(const TaskState&) = delete;
  TaskState& operator=(const TaskState&) = delete;

  std::future<R> GetFuture() { return promise_.get_future(); }

  /// Invoke the task, capturing its value or exception. False on failure.
  bool Run() noexcept {
    try {
      outcome_.Capture(fn_);
      return true;
    } catch (...) {
      outcome_.error = std::current_exception();
      return false;
    }
  }

  /// Publish the captured outcome to the caller.
  void Settle() {
    if (settled_.TryClaim()) {
      outcome_.Deliver(promise_);
    }
  }

  /// Settle with an admission error; the task never ran.
  void Fail(ErrorCode code, const std::string& resource) {
    if (settled_.TryClaim()) {
      promise_.set_exception(std::make_exception_ptr(IsolationError(code, resource)));
    }
  }

  bool IsSettled() const noexcept { return settled_.IsClaimed(); }

 private:
  F fn_;
  detail::Outcome<R> outcome_;
  std::promise<R> promise_;
  SettleOnce settled_;
};

/**
 * @brief Create the shared TaskState for @p fn and return it with its future.
 */
template <typename F, typename R = std::invoke_result_t<std::decay_t<F>&>>
std::shared_ptr<TaskState<R, std::decay_t<F>>> MakeTaskState(F&& fn) {
  return std::make_shared<TaskState<R, std::decay_t<F>>>(std::forward<F>(fn));
}

/**
 * @brief Adapt a TaskState into the type-erased Work a Bulkhead admits.
 */
template <typename State>
Work MakeWork(const std::shared_ptr<State>& state) {
  Work work;
  work.run = [state]() { return state->Run(); };
  work.settle = [state]() { state->Settle(); };
  work.reject = [state](ErrorCode code, const std::string& resource) { state->Fail(code, resource); };
  return work;
}

}  // namespace isol

#endif  // ISOL_COMPLETION_HPP_
