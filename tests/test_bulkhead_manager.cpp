/**
 * @file test_bulkhead_manager.cpp
 * @brief Tests for bulkhead_manager.hpp: registry, semaphore composition,
 *        read model and lifecycle.
 */

#include "isol/bulkhead_manager.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

/// Small, fast configuration for tests.
isol::ManagerConfig TestConfig() {
  isol::ManagerConfig cfg;
  cfg.defaults.max_concurrent = 2U;
  cfg.defaults.max_queue_size = 2U;
  cfg.defaults.queue_timeout = 5000ms;
  cfg.overrides["ai."] = isol::MakePatch(3U, 4U, 5000);
  cfg.overrides["ai.slow"] = isol::MakePatch(1U, 1U, 5000);
  cfg.semaphores[isol::kCpuIntensiveSemaphore] = 1U;
  cfg.semaphores[isol::kMemoryIntensiveSemaphore] = 2U;
  cfg.semaphores[isol::kAiRequestsSemaphore] = 2U;
  cfg.semaphores["pool.a"] = 1U;
  cfg.semaphores["pool.b"] = 1U;
  cfg.semaphore_timeout = 2000ms;
  return cfg;
}

template <typename T>
isol::ErrorCode CodeOf(std::future<T>& f) {
  try {
    f.get();
  } catch (const isol::IsolationError& e) {
    return e.code();
  }
  throw std::logic_error("future did not fail with IsolationError");
}

uint32_t Available(isol::BulkheadManager& mgr, const std::string& sem) {
  return mgr.GetSemaphore(sem)->GetStats().available_permits;
}

}  // namespace

// ============================================================================
// Registry
// ============================================================================

TEST_CASE("manager - GetBulkhead creates once and caches", "[manager]") {
  isol::BulkheadManager mgr(TestConfig());
  isol::Bulkhead& a = mgr.GetBulkhead("db.read");
  isol::Bulkhead& b = mgr.GetBulkhead("db.read");
  REQUIRE(&a == &b);
  REQUIRE(mgr.GetHealthSummary().total_bulkheads == 1U);
}

TEST_CASE("manager - bulkhead config resolves exact, prefix, default", "[manager]") {
  isol::BulkheadManager mgr(TestConfig());

  const auto& exact = mgr.GetBulkhead("ai.slow").Config();
  REQUIRE(exact.max_concurrent == 1U);
  REQUIRE(exact.max_queue_size == 1U);

  const auto& prefixed = mgr.GetBulkhead("ai.openai").Config();
  REQUIRE(prefixed.max_concurrent == 3U);
  REQUIRE(prefixed.max_queue_size == 4U);

  const auto& fallback = mgr.GetBulkhead("container.create").Config();
  REQUIRE(fallback.max_concurrent == 2U);
  REQUIRE(fallback.max_queue_size == 2U);
  REQUIRE(fallback.name == "container.create");
}

TEST_CASE("manager - GetSemaphore returns nullptr for unknown names", "[manager]") {
  isol::BulkheadManager mgr(TestConfig());
  REQUIRE(mgr.GetSemaphore(isol::kCpuIntensiveSemaphore) != nullptr);
  REQUIRE(mgr.GetSemaphore("global.gpu") == nullptr);
  REQUIRE(mgr.GetHealthSummary().total_semaphores == 5U);
}

TEST_CASE("manager - builtin configuration registers the global pools", "[manager]") {
  isol::BulkheadManager mgr;
  REQUIRE(mgr.GetSemaphore(isol::kCpuIntensiveSemaphore)->TotalPermits() == 5U);
  REQUIRE(mgr.GetSemaphore(isol::kMemoryIntensiveSemaphore)->TotalPermits() == 3U);
  REQUIRE(mgr.GetSemaphore(isol::kAiRequestsSemaphore)->TotalPermits() == 30U);
  REQUIRE(mgr.GetBulkhead("ai.deepseek").Config().queue_timeout == 90000ms);
  REQUIRE(mgr.GetBulkhead("container.stop").Config().max_concurrent == 5U);
}

// ============================================================================
// Execute with semaphores
// ============================================================================

TEST_CASE("manager - Execute returns the task value", "[manager]") {
  isol::BulkheadManager mgr(TestConfig());
  auto f = mgr.Execute("file.scan", [] { return 11; });
  REQUIRE(f.get() == 11);
  REQUIRE(mgr.GetAllStats().bulkheads.at("file.scan").total_executed == 1U);
}

TEST_CASE("manager - permit is held while the task runs and restored after", "[manager]") {
  isol::BulkheadManager mgr(TestConfig());
  isol_test::Gate gate;
  std::atomic<bool> started{false};

  isol::ExecuteOptions opts;
  opts.semaphores = {"pool.a"};
  auto f = mgr.Execute("svc", [&] {
    started = true;
    gate.Wait();
  }, opts);

  REQUIRE(isol_test::WaitUntil([&] { return started.load(); }));
  REQUIRE(Available(mgr, "pool.a") == 0U);
  gate.Open();
  f.get();
  REQUIRE(Available(mgr, "pool.a") == 1U);
}

TEST_CASE("manager - permit restored when the task throws", "[manager]") {
  isol::BulkheadManager mgr(TestConfig());
  isol::ExecuteOptions opts;
  opts.semaphores = {isol::kMemoryIntensiveSemaphore};

  auto f = mgr.Execute("svc", []() -> int { throw std::runtime_error("oom"); }, opts);
  REQUIRE_THROWS_AS(f.get(), std::runtime_error);
  REQUIRE(Available(mgr, isol::kMemoryIntensiveSemaphore) == 2U);
}

TEST_CASE("manager - permits restored when the bulkhead rejects", "[manager]") {
  isol::BulkheadManager mgr(TestConfig());
  isol_test::Gate gate;
  isol::ExecuteOptions opts;
  opts.semaphores = {isol::kMemoryIntensiveSemaphore};

  // ai.slow admits one running and one queued task.
  auto running = mgr.Execute("ai.slow", [&] { gate.Wait(); });
  auto queued = mgr.Execute("ai.slow", [] {});
  REQUIRE(isol_test::WaitUntil(
      [&] { return mgr.GetBulkhead("ai.slow").GetStats().queued_count == 1U; }));

  auto rejected = mgr.Execute("ai.slow", [] {}, opts);
  REQUIRE(CodeOf(rejected) == isol::ErrorCode::kQueueFull);
  REQUIRE(Available(mgr, isol::kMemoryIntensiveSemaphore) == 2U);

  gate.Open();
  running.get();
  queued.get();
}

TEST_CASE("manager - semaphores acquired in order, released on later failure", "[manager]") {
  isol::BulkheadManager mgr(TestConfig());
  isol::Semaphore* b = mgr.GetSemaphore("pool.b");
  b->Acquire().get();  // exhaust pool.b

  isol::ExecuteOptions opts;
  opts.semaphores = {"pool.a", "pool.b"};
  opts.semaphore_timeout = 30ms;
  std::atomic<bool> ran{false};
  auto f = mgr.Execute("svc", [&] { ran = true; }, opts);

  REQUIRE(f.wait_for(5s) == std::future_status::ready);
  try {
    f.get();
    FAIL("expected SemaphoreTimeout");
  } catch (const isol::IsolationError& e) {
    REQUIRE(e.code() == isol::ErrorCode::kSemaphoreTimeout);
    REQUIRE(e.resource() == "pool.b");
  }
  REQUIRE_FALSE(ran.load());
  REQUIRE(Available(mgr, "pool.a") == 1U);
  REQUIRE(b->GetStats().total_timeout == 1U);
  b->Release();
}

TEST_CASE("manager - waiting for a permit does not block the caller", "[manager]") {
  isol::BulkheadManager mgr(TestConfig());
  isol_test::Gate gate;

  auto first = mgr.ExecuteCpuIntensive("svc", [&] { gate.Wait(); });
  REQUIRE(isol_test::WaitUntil([&] { return Available(mgr, isol::kCpuIntensiveSemaphore) == 0U; }));

  const auto start = std::chrono::steady_clock::now();
  auto second = mgr.ExecuteCpuIntensive("svc", [] { return 2; });
  REQUIRE(std::chrono::steady_clock::now() - start < 500ms);
  REQUIRE(second.wait_for(0ms) != std::future_status::ready);
  REQUIRE(mgr.GetSemaphore(isol::kCpuIntensiveSemaphore)->GetStats().waiting_count == 1U);

  gate.Open();
  first.get();
  REQUIRE(second.get() == 2);
  REQUIRE(Available(mgr, isol::kCpuIntensiveSemaphore) == 1U);
}

TEST_CASE("manager - unknown semaphore names are skipped", "[manager]") {
  isol::BulkheadManager mgr(TestConfig());
  isol::ExecuteOptions opts;
  opts.semaphores = {"global.gpu", "pool.a"};
  auto f = mgr.Execute("svc", [] { return 1; }, opts);
  REQUIRE(f.get() == 1);
  REQUIRE(Available(mgr, "pool.a") == 1U);
}

TEST_CASE("manager - ExecuteAiTask uses the provider bulkhead and AI pool", "[manager]") {
  isol::BulkheadManager mgr(TestConfig());
  isol_test::Gate gate;
  std::atomic<bool> started{false};

  auto f = mgr.ExecuteAiTask("claude", [&] {
    started = true;
    gate.Wait();
    return std::string("answer");
  });
  REQUIRE(isol_test::WaitUntil([&] { return started.load(); }));
  REQUIRE(Available(mgr, isol::kAiRequestsSemaphore) == 1U);
  REQUIRE(mgr.GetBulkhead("ai.claude").GetStats().active_count == 1U);

  gate.Open();
  REQUIRE(f.get() == "answer");
  REQUIRE(Available(mgr, isol::kAiRequestsSemaphore) == 2U);
}

TEST_CASE("manager - ExecuteMemoryIntensive holds the memory pool", "[manager]") {
  isol::BulkheadManager mgr(TestConfig());
  uint32_t seen = 99U;
  auto f = mgr.ExecuteMemoryIntensive("file.analyze", [&] {
    seen = mgr.GetSemaphore(isol::kMemoryIntensiveSemaphore)->GetStats().available_permits;
  });
  f.get();
  REQUIRE(seen == 1U);
  REQUIRE(Available(mgr, isol::kMemoryIntensiveSemaphore) == 2U);
}

// ============================================================================
// Read model
// ============================================================================

TEST_CASE("manager - health summary lists exactly the saturated bulkheads", "[manager]") {
  isol::BulkheadManager mgr(TestConfig());
  isol_test::Gate gate;

  // ai.slow: 1 running + 1 queued = saturated.
  auto r1 = mgr.Execute("ai.slow", [&] { gate.Wait(); });
  auto r2 = mgr.Execute("ai.slow", [&] { gate.Wait(); });
  // db.read: 1 of 2 + 2 capacity used, not saturated.
  auto r3 = mgr.Execute("db.read", [&] { gate.Wait(); });
  REQUIRE(isol_test::WaitUntil(
      [&] { return mgr.GetBulkhead("db.read").GetStats().active_count == 1U; }));

  auto h = mgr.GetHealthSummary();
  REQUIRE(h.total_bulkheads == 2U);
  REQUIRE(h.saturated == std::vector<std::string>{"ai.slow"});
  REQUIRE(h.active_tasks == 2U);
  REQUIRE(h.queued_tasks == 1U);

  gate.Open();
  r1.get();
  r2.get();
  r3.get();
  REQUIRE(mgr.GetHealthSummary().saturated.empty());
}

TEST_CASE("manager - GetAllStats covers bulkheads and semaphores", "[manager]") {
  isol::BulkheadManager mgr(TestConfig());
  mgr.Execute("a.one", [] {}).get();
  mgr.Execute("b.two", [] {}).get();

  auto all = mgr.GetAllStats();
  REQUIRE(all.bulkheads.size() == 2U);
  REQUIRE(all.bulkheads.at("a.one").total_executed == 1U);
  REQUIRE(all.semaphores.size() == 5U);
  REQUIRE(all.semaphores.at("pool.a").total_permits == 1U);
}

// ============================================================================
// Configuration and lifecycle
// ============================================================================

TEST_CASE("manager - UpdateConfig affects only bulkheads created later", "[manager]") {
  isol::BulkheadManager mgr(TestConfig());
  isol::Bulkhead& before = mgr.GetBulkhead("container.create");

  isol::BulkheadConfigPatch patch;
  patch.max_concurrent = 7U;
  mgr.UpdateConfig("container.create", patch);
  mgr.UpdateConfig("container.", isol::MakePatch(4U, 9U, 1000));

  REQUIRE(before.Config().max_concurrent == 2U);
  REQUIRE(mgr.GetBulkhead("container.create").Config().max_concurrent == 2U);

  // New instances see the merged overrides.
  REQUIRE(mgr.GetBulkhead("container.stop").Config().max_concurrent == 4U);
  auto cfg = mgr.CurrentConfig();
  auto resolved = cfg.Resolve("container.create");
  REQUIRE(resolved.max_concurrent == 7U);
  REQUIRE(resolved.max_queue_size == 9U);
}

TEST_CASE("manager - Reset and ResetAll zero counters", "[manager]") {
  isol::BulkheadManager mgr(TestConfig());
  mgr.Execute("a.one", [] {}).get();
  mgr.Execute("b.two", [] {}).get();

  REQUIRE(mgr.Reset("a.one"));
  REQUIRE_FALSE(mgr.Reset("never.created"));
  REQUIRE(mgr.GetBulkhead("a.one").GetStats().total_executed == 0U);
  REQUIRE(mgr.GetBulkhead("b.two").GetStats().total_executed == 1U);

  mgr.ResetAll();
  REQUIRE(mgr.GetBulkhead("b.two").GetStats().total_executed == 0U);
}

TEST_CASE("manager - DrainAll waits for running tasks everywhere", "[manager]") {
  isol::BulkheadManager mgr(TestConfig());
  std::atomic<int> finished{0};
  auto slow = [&] {
    std::this_thread::sleep_for(40ms);
    ++finished;
  };
  auto f1 = mgr.Execute("a.one", slow);
  auto f2 = mgr.Execute("b.two", slow);

  mgr.DrainAll();
  REQUIRE(finished.load() == 2);
  auto h = mgr.GetHealthSummary();
  REQUIRE(h.active_tasks == 0U);
  REQUIRE(h.queued_tasks == 0U);
  f1.get();
  f2.get();
}

TEST_CASE("manager - disabled manager runs tasks without admission control", "[manager]") {
  isol::ManagerConfig cfg = TestConfig();
  cfg.enabled = false;
  isol::BulkheadManager mgr(cfg);

  isol::ExecuteOptions opts;
  opts.semaphores = {"pool.a"};
  auto f = mgr.Execute("svc", [] { return 3; }, opts);
  REQUIRE(f.get() == 3);
  REQUIRE(mgr.GetHealthSummary().total_bulkheads == 0U);
  REQUIRE(mgr.GetSemaphore("pool.a")->GetStats().total_acquired == 0U);
}

TEST_CASE("manager - no worker thread fails the task and returns its permits", "[manager]") {
  isol::ManagerConfig cfg = TestConfig();
  cfg.executor_min_workers = 0U;
  cfg.executor_max_workers = 2U;
  cfg.executor_thread_factory = isol_test::LimitedThreadFactory(0U);
  isol::BulkheadManager mgr(cfg);

  isol::ExecuteOptions opts;
  opts.semaphores = {"pool.a", "pool.b"};
  bool ran = false;
  auto f = mgr.Execute("svc", [&] { ran = true; }, opts);
  REQUIRE(CodeOf(f) == isol::ErrorCode::kNoWorker);
  REQUIRE_FALSE(ran);
  REQUIRE(mgr.GetSemaphore("pool.a")->GetStats().available_permits == 1U);
  REQUIRE(mgr.GetSemaphore("pool.b")->GetStats().available_permits == 1U);
  REQUIRE(mgr.GetHealthSummary().active_tasks == 0U);
}

TEST_CASE("manager - disabled manager reports kNoWorker from the executor", "[manager]") {
  isol::ManagerConfig cfg = TestConfig();
  cfg.enabled = false;
  cfg.executor_min_workers = 0U;
  cfg.executor_max_workers = 2U;
  cfg.executor_thread_factory = isol_test::LimitedThreadFactory(0U);
  isol::BulkheadManager mgr(cfg);

  auto f = mgr.Execute("svc", [] { return 3; });
  REQUIRE(CodeOf(f) == isol::ErrorCode::kNoWorker);
}

TEST_CASE("manager - destructor settles every outstanding future", "[manager]") {
  std::vector<std::future<int>> futures;
  {
    isol::BulkheadManager mgr(TestConfig());
    isol::ExecuteOptions opts;
    opts.semaphores = {isol::kCpuIntensiveSemaphore};
    for (int i = 0; i < 6; ++i) {
      futures.push_back(mgr.Execute("svc", [i] {
        std::this_thread::sleep_for(5ms);
        return i;
      }, opts));
    }
  }
  for (auto& f : futures) {
    REQUIRE(f.wait_for(0ms) == std::future_status::ready);
    try {
      f.get();
    } catch (const isol::IsolationError& e) {
      const bool expected_code = e.code() == isol::ErrorCode::kShutdown ||
                                 e.code() == isol::ErrorCode::kDraining ||
                                 e.code() == isol::ErrorCode::kQueueFull;
      REQUIRE(expected_code);
    }
  }
}
