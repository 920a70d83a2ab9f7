/**
 * @file error.hpp
 * @brief Admission error taxonomy shared by Semaphore, Bulkhead and
 *        BulkheadManager.
 *
 * Callback-style APIs report an ErrorCode through expected<>. Future-style
 * APIs deliver an IsolationError through std::future::get(). A failure
 * raised by the wrapped task itself is never converted: the caller gets
 * the task's original exception.
 */

#ifndef ISOL_ERROR_HPP_
#define ISOL_ERROR_HPP_

#include "isol/vocabulary.hpp"

#include <cstdint>

#include <stdexcept>
#include <string>

namespace isol {

enum class ErrorCode : uint8_t {
  kQueueFull = 0,     ///< Bulkhead queue at capacity, rejected on admission.
  kQueueTimeout,      ///< Waited in a bulkhead queue past queue_timeout.
  kSemaphoreTimeout,  ///< Permit not granted within the acquire timeout.
  kDraining,          ///< Bulkhead is draining, queued work is not started.
  kShutdown,          ///< Executor or semaphore torn down before settlement.
  kNoWorker,          ///< Executor could not start a thread to run the task.
};

inline const char* ErrorCodeName(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kQueueFull:
      return "QueueFull";
    case ErrorCode::kQueueTimeout:
      return "QueueTimeout";
    case ErrorCode::kSemaphoreTimeout:
      return "SemaphoreTimeout";
    case ErrorCode::kDraining:
      return "Draining";
    case ErrorCode::kShutdown:
      return "Shutdown";
    case ErrorCode::kNoWorker:
      return "NoWorker";
  }
  return "Unknown";
}

/// Admission error reported when TaskExecutor::Post() refuses a job.
inline ErrorCode FromExecutorError(ExecutorError err) noexcept {
  return (err == ExecutorError::kNoWorker) ? ErrorCode::kNoWorker : ErrorCode::kShutdown;
}

/**
 * @brief Exception carried by futures returned from Execute()/Acquire().
 *
 * resource() names the bulkhead or semaphore that refused the work.
 */
class IsolationError : public std::runtime_error {
 public:
  IsolationError(ErrorCode code, const std::string& resource)
      : std::runtime_error(Describe(code, resource)), code_(code), resource_(resource) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& resource() const noexcept { return resource_; }

 private:
  static std::string Describe(ErrorCode code, const std::string& resource) {
    switch (code) {
      case ErrorCode::kQueueFull:
        return "Bulkhead " + resource + " queue is full";
      case ErrorCode::kQueueTimeout:
        return "Task timed out in bulkhead " + resource + " queue";
      case ErrorCode::kSemaphoreTimeout:
        return "Semaphore " + resource + " acquisition timed out";
      case ErrorCode::kDraining:
        return "Bulkhead " + resource + " is draining";
      case ErrorCode::kShutdown:
        return resource + " is shut down";
      case ErrorCode::kNoWorker:
        return "No worker thread available for " + resource;
    }
    return resource + ": unknown isolation error";
  }

  ErrorCode code_;
  std::string resource_;
};

}  // namespace isol

#endif  // ISOL_ERROR_HPP_
