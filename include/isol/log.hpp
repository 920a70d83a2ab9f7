/**
 * @file log.hpp
 * @brief Synchronous printf-style logger with category tags.
 *
 * Output format (stderr):
 *   [2026-10-19 12:00:00.123] [INFO] [Bulkhead] message (bulkhead.hpp:42)
 *
 * Two filters apply:
 *   - ISOL_LOG_MIN_LEVEL : compile-time floor (0=DEBUG .. 4=FATAL, 5=OFF)
 *   - SetLevel()         : runtime threshold
 *
 * Lines from concurrent threads never interleave (one write per line under
 * a mutex). FATAL flushes and aborts.
 */

#ifndef ISOL_LOG_HPP_
#define ISOL_LOG_HPP_

#include "isol/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>

#include <sys/time.h>

#ifndef ISOL_LOG_MIN_LEVEL
#ifdef NDEBUG
#define ISOL_LOG_MIN_LEVEL 1
#else
#define ISOL_LOG_MIN_LEVEL 0
#endif
#endif

namespace isol {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

struct LogContext {
  std::atomic<Level> level{
#ifdef NDEBUG
      Level::kInfo
#else
      Level::kDebug
#endif
  };
  std::atomic<bool> initialized{false};
  std::mutex write_mtx;
  FILE* sink = stderr;
};

inline LogContext& Context() noexcept {
  static LogContext ctx;
  return ctx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "OFF";
  }
}

inline const char* Basename(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/' || *p == '\\') {
      base = p + 1;
    }
  }
  return base;
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::Context().level.store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::Context().level.load(std::memory_order_relaxed);
}

/**
 * @brief Mark the logger initialized. Logging works without Init();
 *        Init() only records that the process opted in explicitly.
 */
inline void Init(Level level = GetLevel()) noexcept {
  SetLevel(level);
  detail::Context().initialized.store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  auto& ctx = detail::Context();
  {
    std::lock_guard<std::mutex> lk(ctx.write_mtx);
    (void)std::fflush(ctx.sink);
  }
  ctx.initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::Context().initialized.load(std::memory_order_acquire);
}

// ============================================================================
// Write Path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (level < GetLevel() || level == Level::kOff) {
    return;
  }

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  struct timeval tv;
  (void)::gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  time_t secs = tv.tv_sec;
  (void)::localtime_r(&secs, &tm_buf);
  char ts[32];
  (void)std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);

  auto& ctx = detail::Context();
  std::lock_guard<std::mutex> lk(ctx.write_mtx);
  (void)std::fprintf(ctx.sink, "[%s.%03d] [%s] [%s] %s (%s:%d)\n", ts,
                     static_cast<int>(tv.tv_usec / 1000), detail::LevelTag(level),
                     category, msg, detail::Basename(file), line);
  if (level >= Level::kError) {
    (void)std::fflush(ctx.sink);
  }
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace isol

// ============================================================================
// Macros
// ============================================================================

#define ISOL_LOG_DEBUG(cat, fmt, ...)                                      \
  do {                                                                     \
    if (ISOL_LOG_MIN_LEVEL <= 0) {                                         \
      ::isol::log::LogWrite(::isol::log::Level::kDebug, cat, __FILE__,     \
                            __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                      \
  } while (0)

#define ISOL_LOG_INFO(cat, fmt, ...)                                       \
  do {                                                                     \
    if (ISOL_LOG_MIN_LEVEL <= 1) {                                         \
      ::isol::log::LogWrite(::isol::log::Level::kInfo, cat, __FILE__,      \
                            __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                      \
  } while (0)

#define ISOL_LOG_WARN(cat, fmt, ...)                                       \
  do {                                                                     \
    if (ISOL_LOG_MIN_LEVEL <= 2) {                                         \
      ::isol::log::LogWrite(::isol::log::Level::kWarn, cat, __FILE__,      \
                            __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                      \
  } while (0)

#define ISOL_LOG_ERROR(cat, fmt, ...)                                      \
  do {                                                                     \
    if (ISOL_LOG_MIN_LEVEL <= 3) {                                         \
      ::isol::log::LogWrite(::isol::log::Level::kError, cat, __FILE__,     \
                            __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                      \
  } while (0)

#define ISOL_LOG_FATAL(cat, fmt, ...)                                      \
  do {                                                                     \
    ::isol::log::LogWrite(::isol::log::Level::kFatal, cat, __FILE__,       \
                          __LINE__, fmt, ##__VA_ARGS__);                   \
    std::abort();                                                          \
  } while (0)

#endif  // ISOL_LOG_HPP_
