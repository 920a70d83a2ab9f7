/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and assertion macros.
 */

#ifndef ISOL_PLATFORM_HPP_
#define ISOL_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <chrono>

namespace isol {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define ISOL_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define ISOL_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define ISOL_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Cache Line Size
// ============================================================================

static constexpr size_t kCacheLineSize = 64;

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define ISOL_LIKELY(x) __builtin_expect(!!(x), 1)
#define ISOL_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define ISOL_LIKELY(x) (x)
#define ISOL_UNLIKELY(x) (x)
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "ISOL_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define ISOL_ASSERT(cond) ((void)0)
#else
#define ISOL_ASSERT(cond) \
  ((cond) ? ((void)0) : ::isol::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Macro Helpers
// ============================================================================

#define ISOL_CONCAT_IMPL(a, b) a##b
#define ISOL_CONCAT(a, b) ISOL_CONCAT_IMPL(a, b)

// ============================================================================
// Monotonic Clock
// ============================================================================

/// Monotonic clock used for every deadline, wait and execution measurement.
using SteadyClock = std::chrono::steady_clock;

/** @brief Current monotonic time in microseconds. */
inline uint64_t SteadyNowUs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          SteadyClock::now().time_since_epoch())
          .count());
}

/** @brief Elapsed milliseconds (fractional) between two steady timestamps. */
inline double ElapsedMs(SteadyClock::time_point from,
                        SteadyClock::time_point to) noexcept {
  return std::chrono::duration<double, std::milli>(to - from).count();
}

}  // namespace isol

#endif  // ISOL_PLATFORM_HPP_
