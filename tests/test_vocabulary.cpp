/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp and error.hpp
 */

#include "isol/error.hpp"
#include "isol/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>

// ============================================================================
// expected<V, E>
// ============================================================================

TEST_CASE("expected success path", "[vocabulary][expected]") {
  auto r = isol::expected<int, isol::ConfigError>::success(42);
  REQUIRE(r.has_value());
  REQUIRE(static_cast<bool>(r));
  REQUIRE(r.value() == 42);
}

TEST_CASE("expected error path", "[vocabulary][expected]") {
  auto r = isol::expected<int, isol::ConfigError>::error(isol::ConfigError::kFileNotFound);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == isol::ConfigError::kFileNotFound);
  REQUIRE(r.value_or(99) == 99);
}

TEST_CASE("expected void specialization", "[vocabulary][expected]") {
  auto ok = isol::expected<void, isol::TimerError>::success();
  REQUIRE(ok.has_value());

  auto err = isol::expected<void, isol::TimerError>::error(isol::TimerError::kSlotsFull);
  REQUIRE(!err.has_value());
  REQUIRE(err.get_error() == isol::TimerError::kSlotsFull);
}

TEST_CASE("expected holds non-trivial values across copy and move", "[vocabulary][expected]") {
  auto r1 = isol::expected<std::string, isol::ConfigError>::success(std::string("bulkhead"));
  auto r2 = r1;
  REQUIRE(r2.value() == "bulkhead");

  auto r3 = std::move(r1);
  REQUIRE(r3.value() == "bulkhead");

  r2 = isol::expected<std::string, isol::ConfigError>::error(isol::ConfigError::kParseError);
  REQUIRE(!r2.has_value());
  r2 = r3;
  REQUIRE(r2.value() == "bulkhead");
}

// ============================================================================
// NewType / ScopeGuard
// ============================================================================

TEST_CASE("NewType compares by value", "[vocabulary][newtype]") {
  isol::TimerTaskId a(3U);
  isol::TimerTaskId b(3U);
  isol::TimerTaskId c(4U);
  REQUIRE(a == b);
  REQUIRE(a != c);
  REQUIRE(a < c);
  REQUIRE(c.value() == 4U);
}

TEST_CASE("ScopeGuard runs on scope exit unless released", "[vocabulary][scope_guard]") {
  int hits = 0;
  {
    isol::ScopeGuard g([&hits] { ++hits; });
  }
  REQUIRE(hits == 1);
  {
    isol::ScopeGuard g([&hits] { ++hits; });
    g.release();
  }
  REQUIRE(hits == 1);
  {
    ISOL_SCOPE_EXIT(hits += 10);
  }
  REQUIRE(hits == 11);
}

// ============================================================================
// ErrorCode / IsolationError
// ============================================================================

TEST_CASE("IsolationError carries code and resource", "[vocabulary][error]") {
  isol::IsolationError e(isol::ErrorCode::kQueueFull, "ai.claude");
  REQUIRE(e.code() == isol::ErrorCode::kQueueFull);
  REQUIRE(e.resource() == "ai.claude");
  REQUIRE(std::string(e.what()) == "Bulkhead ai.claude queue is full");

  isol::IsolationError t(isol::ErrorCode::kSemaphoreTimeout, "global.cpu_intensive");
  REQUIRE(std::string(t.what()).find("global.cpu_intensive") != std::string::npos);
}

TEST_CASE("ErrorCodeName covers every code", "[vocabulary][error]") {
  REQUIRE(std::string(isol::ErrorCodeName(isol::ErrorCode::kQueueFull)) == "QueueFull");
  REQUIRE(std::string(isol::ErrorCodeName(isol::ErrorCode::kQueueTimeout)) == "QueueTimeout");
  REQUIRE(std::string(isol::ErrorCodeName(isol::ErrorCode::kSemaphoreTimeout)) ==
          "SemaphoreTimeout");
  REQUIRE(std::string(isol::ErrorCodeName(isol::ErrorCode::kDraining)) == "Draining");
  REQUIRE(std::string(isol::ErrorCodeName(isol::ErrorCode::kShutdown)) == "Shutdown");
  REQUIRE(std::string(isol::ErrorCodeName(isol::ErrorCode::kNoWorker)) == "NoWorker");
}

TEST_CASE("FromExecutorError maps executor refusals", "[vocabulary][error]") {
  REQUIRE(isol::FromExecutorError(isol::ExecutorError::kNoWorker) == isol::ErrorCode::kNoWorker);
  REQUIRE(isol::FromExecutorError(isol::ExecutorError::kShutdown) == isol::ErrorCode::kShutdown);
}
