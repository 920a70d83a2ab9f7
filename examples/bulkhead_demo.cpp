/**
 * @file bulkhead_demo.cpp
 * @brief End-to-end BulkheadManager usage.
 *
 * Demonstrates:
 *   - Loading limits from a config file when a backend is compiled in
 *   - Running AI, container and file tasks under their bulkheads
 *   - Holding global semaphores while a task is admitted
 *   - Handling queue-full rejections and task exceptions from futures
 *   - Printing the health summary, then draining before exit
 *
 * Usage: bulkhead_demo [config.ini|config.json|config.yaml]
 */

#include "isol/bulkhead_manager.hpp"
#include "isol/config.hpp"
#include "isol/log.hpp"
#include "isol/manager_config.hpp"

#include <cstdint>
#include <cstdio>

#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

isol::ManagerConfig LoadConfig(int argc, char** argv) {
  isol::ManagerConfig mc = isol::ManagerConfig::Builtin();
  // Small limits so rejections show up in a short run.
  mc.overrides["ai.claude"] = isol::MakePatch(2U, 2U, 1000);

  if (argc < 2) {
    return mc;
  }
#ifdef ISOL_CONFIG_HAS_BACKEND
  isol::MultiConfig cfg;
  auto loaded = cfg.LoadFile(argv[1]);
  if (!loaded) {
    ISOL_LOG_ERROR("demo", "cannot load %s (error %u), using built-in limits", argv[1],
                   static_cast<unsigned>(loaded.get_error()));
    return mc;
  }
  auto applied = isol::LoadManagerConfig(cfg, &mc);
  if (!applied) {
    ISOL_LOG_ERROR("demo", "invalid settings in %s, using built-in limits", argv[1]);
    return isol::ManagerConfig::Builtin();
  }
  ISOL_LOG_INFO("demo", "loaded %u entries from %s", cfg.EntryCount(), argv[1]);
#else
  ISOL_LOG_WARN("demo", "no config backend compiled in, ignoring %s", argv[1]);
#endif
  return mc;
}

void PrintHealth(const isol::BulkheadManager& mgr) {
  const isol::HealthSummary h = mgr.GetHealthSummary();
  std::printf("bulkheads=%u semaphores=%u active=%llu queued=%llu saturated=%zu\n",
              h.total_bulkheads, h.total_semaphores,
              static_cast<unsigned long long>(h.active_tasks),
              static_cast<unsigned long long>(h.queued_tasks), h.saturated.size());
  for (const auto& name : h.saturated) {
    std::printf("  saturated: %s\n", name.c_str());
  }
}

}  // namespace

int main(int argc, char** argv) {
  isol::log::Init(isol::log::Level::kInfo);

  isol::BulkheadManager mgr(LoadConfig(argc, argv));

  // -- AI requests: burst beyond capacity ------------------------------------
  std::vector<std::future<std::string>> answers;
  for (int i = 0; i < 6; ++i) {
    answers.push_back(mgr.ExecuteAiTask("claude", [i] {
      std::this_thread::sleep_for(50ms);
      return "reply #" + std::to_string(i);
    }));
  }

  // -- Container work holding the container pool ------------------------------
  isol::ExecuteOptions container_opts;
  container_opts.semaphores = {isol::kContainerSemaphore, isol::kCpuIntensiveSemaphore};
  auto container = mgr.Execute("container.execute", [] {
    std::this_thread::sleep_for(20ms);
    return 0;
  }, container_opts);

  // -- A failing file analysis ------------------------------------------------
  auto analysis = mgr.ExecuteMemoryIntensive("file.analyze", []() -> uint64_t {
    throw std::runtime_error("unsupported archive");
  });

  PrintHealth(mgr);

  for (auto& f : answers) {
    try {
      std::printf("ai: %s\n", f.get().c_str());
    } catch (const isol::IsolationError& e) {
      std::printf("ai: refused (%s): %s\n", isol::ErrorCodeName(e.code()), e.what());
    }
  }
  std::printf("container exit code: %d\n", container.get());
  try {
    analysis.get();
  } catch (const std::runtime_error& e) {
    std::printf("analysis failed: %s\n", e.what());
  }

  const isol::AllStats all = mgr.GetAllStats();
  for (const auto& kv : all.bulkheads) {
    const isol::BulkheadStats& s = kv.second;
    std::printf("%-18s executed=%llu failed=%llu rejected=%llu timeout=%llu avg_exec=%.1fms\n",
                kv.first.c_str(), static_cast<unsigned long long>(s.total_executed),
                static_cast<unsigned long long>(s.total_failed),
                static_cast<unsigned long long>(s.total_rejected),
                static_cast<unsigned long long>(s.total_timeout), s.average_execution_time_ms);
  }

  mgr.DrainAll();
  PrintHealth(mgr);
  isol::log::Shutdown();
  return 0;
}
