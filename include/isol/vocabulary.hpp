/**
 * @file vocabulary.hpp
 * @brief Core vocabulary types shared by every isol header.
 *
 * - expected<V, E>   : value-or-error return type (no exceptions required)
 * - NewType<T, Tag>  : strong typedef for ids that must not be mixed
 * - ScopeGuard       : run a cleanup action on every scope exit
 * - Error enums      : ConfigError, TimerError, ExecutorError
 */

#ifndef ISOL_VOCABULARY_HPP_
#define ISOL_VOCABULARY_HPP_

#include "isol/platform.hpp"

#include <cstdint>

#include <functional>
#include <new>
#include <type_traits>
#include <utility>

namespace isol {

// ============================================================================
// Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

enum class TimerError : uint8_t {
  kInvalidDelay = 0,
  kSlotsFull,
  kNotFound,
  kNotRunning,
  kAlreadyRunning,
};

enum class ExecutorError : uint8_t {
  kShutdown = 0,
  kEmptyJob,
  kNoWorker,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Constructed only through the success() / error() factories so the
 * intent is explicit at every return site.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) {
    expected r;
    r.Construct(val);
    return r;
  }

  static expected success(V&& val) {
    expected r;
    r.Construct(std::move(val));
    return r;
  }

  static expected error(E err) noexcept {
    expected r;
    r.err_ = err;
    return r;
  }

  expected(const expected& other) : err_(other.err_) {
    if (other.has_value_) {
      Construct(other.Ref());
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : err_(other.err_) {
    if (other.has_value_) {
      Construct(std::move(other.Ref()));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) {
        Construct(other.Ref());
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) {
        Construct(std::move(other.Ref()));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    ISOL_ASSERT(has_value_);
    return Ref();
  }

  const V& value() const& {
    ISOL_ASSERT(has_value_);
    return Ref();
  }

  V&& value() && {
    ISOL_ASSERT(has_value_);
    return std::move(Ref());
  }

  V value_or(const V& fallback) const { return has_value_ ? Ref() : fallback; }

  E get_error() const noexcept {
    ISOL_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept = default;

  template <typename U>
  void Construct(U&& val) {
    ::new (static_cast<void*>(storage_)) V(std::forward<U>(val));
    has_value_ = true;
  }

  void Destroy() noexcept {
    if (has_value_) {
      Ref().~V();
      has_value_ = false;
    }
  }

  V& Ref() noexcept { return *std::launder(reinterpret_cast<V*>(storage_)); }
  const V& Ref() const noexcept { return *std::launder(reinterpret_cast<const V*>(storage_)); }

  alignas(V) unsigned char storage_[sizeof(V)];
  E err_{};
  bool has_value_ = false;
};

/**
 * @brief expected<void, E>: success carries no payload.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected r;
    r.has_value_ = true;
    return r;
  }

  static expected error(E err) noexcept {
    expected r;
    r.err_ = err;
    return r;
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    ISOL_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept = default;

  E err_{};
  bool has_value_ = false;
};

// ============================================================================
// NewType<T, Tag>
// ============================================================================

/**
 * @brief Strong typedef: two NewTypes over the same T do not convert.
 */
template <typename T, typename Tag>
class NewType final {
 public:
  constexpr NewType() noexcept : val_{} {}
  constexpr explicit NewType(T v) noexcept : val_(v) {}

  constexpr T value() const noexcept { return val_; }

  constexpr bool operator==(const NewType& rhs) const noexcept { return val_ == rhs.val_; }
  constexpr bool operator!=(const NewType& rhs) const noexcept { return val_ != rhs.val_; }
  constexpr bool operator<(const NewType& rhs) const noexcept { return val_ < rhs.val_; }

 private:
  T val_;
};

struct TimerTaskIdTag {};
using TimerTaskId = NewType<uint64_t, TimerTaskIdTag>;

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs the stored cleanup when the guard leaves scope, unless
 *        release() was called first. Move-only.
 */
class ScopeGuard final {
 public:
  explicit ScopeGuard(std::function<void()> cleanup) noexcept
      : cleanup_(std::move(cleanup)), active_(static_cast<bool>(cleanup_)) {}

  ScopeGuard(ScopeGuard&& other) noexcept
      : cleanup_(std::move(other.cleanup_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() {
    if (active_) {
      cleanup_();
    }
  }

  void release() noexcept { active_ = false; }

 private:
  std::function<void()> cleanup_;
  bool active_;
};

#define ISOL_SCOPE_EXIT(...)                                  \
  ::isol::ScopeGuard ISOL_CONCAT(isol_scope_exit_, __LINE__)( \
      [&]() { __VA_ARGS__; })

}  // namespace isol

#endif  // ISOL_VOCABULARY_HPP_
