/**
 * @file manager_config.hpp
 * @brief BulkheadManager configuration model, built-in defaults, and the
 *        mapping from a ConfigStore onto it.
 *
 * Bulkhead settings resolve, most specific last:
 *   defaults -> longest matching namespace prefix ("ai.") -> exact name
 *
 * Config file layout (INI shown; JSON/YAML use the same section names):
 *
 *   [manager]
 *   enabled = true
 *   semaphore_timeout_ms = 10000
 *   max_workers = 256
 *
 *   [defaults]
 *   max_concurrent = 10
 *   max_queue_size = 50
 *   queue_timeout_ms = 30000
 *
 *   [bulkhead:ai.]          ; namespace prefix
 *   max_concurrent = 20
 *
 *   [bulkhead:ai.claude]    ; exact service
 *   queue_timeout_ms = 60000
 *
 *   [semaphores]
 *   global.cpu_intensive = 5
 */

#ifndef ISOL_MANAGER_CONFIG_HPP_
#define ISOL_MANAGER_CONFIG_HPP_

#include "isol/bulkhead.hpp"
#include "isol/config.hpp"
#include "isol/executor.hpp"
#include "isol/log.hpp"
#include "isol/timer.hpp"
#include "isol/vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <limits>
#include <map>
#include <optional>
#include <string>

namespace isol {

static constexpr const char* kCpuIntensiveSemaphore = "global.cpu_intensive";
static constexpr const char* kMemoryIntensiveSemaphore = "global.memory_intensive";
static constexpr const char* kNetworkIoSemaphore = "global.network_io";
static constexpr const char* kDiskIoSemaphore = "global.disk_io";
static constexpr const char* kAiRequestsSemaphore = "ai.total_requests";
static constexpr const char* kContainerSemaphore = "container.total";

// ============================================================================
// BulkheadConfigPatch
// ============================================================================

/**
 * @brief Partial BulkheadConfig: only the fields that are set override.
 */
struct BulkheadConfigPatch {
  std::optional<uint32_t> max_concurrent;
  std::optional<uint32_t> max_queue_size;
  std::optional<std::chrono::milliseconds> queue_timeout;

  /// Fields set in @p other win over fields already set here.
  void MergeFrom(const BulkheadConfigPatch& other) {
    if (other.max_concurrent.has_value()) {
      max_concurrent = other.max_concurrent;
    }
    if (other.max_queue_size.has_value()) {
      max_queue_size = other.max_queue_size;
    }
    if (other.queue_timeout.has_value()) {
      queue_timeout = other.queue_timeout;
    }
  }

  void ApplyTo(BulkheadConfig* cfg) const {
    if (max_concurrent.has_value()) {
      cfg->max_concurrent = *max_concurrent;
    }
    if (max_queue_size.has_value()) {
      cfg->max_queue_size = *max_queue_size;
    }
    if (queue_timeout.has_value()) {
      cfg->queue_timeout = *queue_timeout;
    }
  }

  bool Empty() const noexcept {
    return !max_concurrent.has_value() && !max_queue_size.has_value() &&
           !queue_timeout.has_value();
  }
};

inline BulkheadConfigPatch MakePatch(uint32_t max_concurrent, uint32_t max_queue_size,
                                     int64_t queue_timeout_ms) {
  BulkheadConfigPatch p;
  p.max_concurrent = max_concurrent;
  p.max_queue_size = max_queue_size;
  p.queue_timeout = std::chrono::milliseconds(queue_timeout_ms);
  return p;
}

// ============================================================================
// ManagerConfig
// ============================================================================

struct ManagerConfig {
  /// When false, Execute() runs tasks on the executor with no admission control.
  bool enabled{true};
  BulkheadConfig defaults;
  /// Keyed by exact service name, or by a namespace prefix ending in '.'.
  std::map<std::string, BulkheadConfigPatch> overrides;
  /// Pre-registered global semaphores: name -> permits.
  std::map<std::string, uint32_t> semaphores;
  /// Per-semaphore acquire timeout used when ExecuteOptions does not set one.
  std::chrono::milliseconds semaphore_timeout{10000};
  uint32_t executor_min_workers{kDefaultMinWorkers};
  uint32_t executor_max_workers{kDefaultMaxWorkers};
  /// Passed to ExecutorConfig::thread_factory; empty uses std::thread.
  ExecutorConfig::ThreadFactory executor_thread_factory;
  uint32_t timer_capacity{kDefaultTimerCapacity};

  /**
   * @brief The shipped defaults: namespace tiers, known services and the
   *        global resource-class semaphores.
   */
  static ManagerConfig Builtin() {
    ManagerConfig c;
    c.defaults.max_concurrent = 10U;
    c.defaults.max_queue_size = 50U;
    c.defaults.queue_timeout = std::chrono::milliseconds(30000);

    c.overrides["ai."] = MakePatch(20U, 100U, 60000);
    c.overrides["container."] = MakePatch(5U, 20U, 120000);
    c.overrides["file."] = MakePatch(10U, 40U, 60000);
    c.overrides["db."] = MakePatch(15U, 50U, 15000);

    c.overrides["ai.claude"] = MakePatch(20U, 100U, 60000);
    c.overrides["ai.openai"] = MakePatch(20U, 100U, 60000);
    c.overrides["ai.deepseek"] = MakePatch(10U, 50U, 90000);
    c.overrides["container.create"] = MakePatch(5U, 20U, 120000);
    c.overrides["container.execute"] = MakePatch(10U, 30U, 30000);
    c.overrides["file.upload"] = MakePatch(15U, 50U, 60000);
    c.overrides["file.analyze"] = MakePatch(10U, 40U, 45000);
    c.overrides["api.metasploit"] = MakePatch(5U, 20U, 90000);
    c.overrides["db.read"] = MakePatch(30U, 100U, 10000);
    c.overrides["db.write"] = MakePatch(15U, 50U, 15000);

    c.semaphores[kCpuIntensiveSemaphore] = 5U;
    c.semaphores[kMemoryIntensiveSemaphore] = 3U;
    c.semaphores[kNetworkIoSemaphore] = 50U;
    c.semaphores[kDiskIoSemaphore] = 20U;
    c.semaphores[kAiRequestsSemaphore] = 30U;
    c.semaphores[kContainerSemaphore] = 10U;
    return c;
  }

  /**
   * @brief Effective BulkheadConfig for service @p name.
   */
  BulkheadConfig Resolve(const std::string& name) const {
    BulkheadConfig cfg = defaults;
    cfg.name = name;

    // Longest namespace prefix wins among prefixes.
    const BulkheadConfigPatch* best_prefix = nullptr;
    size_t best_len = 0U;
    for (const auto& kv : overrides) {
      const std::string& key = kv.first;
      if (key.empty() || key.back() != '.' || key.size() <= best_len) {
        continue;
      }
      if (name.size() > key.size() && name.compare(0, key.size(), key) == 0) {
        best_prefix = &kv.second;
        best_len = key.size();
      }
    }
    if (best_prefix != nullptr) {
      best_prefix->ApplyTo(&cfg);
    }

    auto exact = overrides.find(name);
    if (exact != overrides.end()) {
      exact->second.ApplyTo(&cfg);
    }
    return cfg;
  }

  ExecutorConfig Executor() const {
    ExecutorConfig e;
    e.min_workers = executor_min_workers;
    e.max_workers = executor_max_workers;
    e.thread_factory = executor_thread_factory;
    return e;
  }
};

// ============================================================================
// LoadManagerConfig
// ============================================================================

namespace detail {

static constexpr const char* kBulkheadSectionPrefix = "bulkhead:";

inline expected<uint32_t, ConfigError> ParseCount(const ConfigStore::Entry& e) {
  auto v = ConfigStore::ParseInt(e.value);
  if (!v.has_value() || *v < 0 || *v > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
    ISOL_LOG_ERROR("Config", "[%s] %s: expected a non-negative integer, got '%s'",
                   e.section.c_str(), e.key.c_str(), e.value.c_str());
    return expected<uint32_t, ConfigError>::error(ConfigError::kParseError);
  }
  return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(*v));
}

inline expected<std::chrono::milliseconds, ConfigError> ParseMillis(const ConfigStore::Entry& e) {
  auto v = ConfigStore::ParseInt(e.value);
  if (!v.has_value()) {
    ISOL_LOG_ERROR("Config", "[%s] %s: expected milliseconds, got '%s'", e.section.c_str(),
                   e.key.c_str(), e.value.c_str());
    return expected<std::chrono::milliseconds, ConfigError>::error(ConfigError::kParseError);
  }
  return expected<std::chrono::milliseconds, ConfigError>::success(
      std::chrono::milliseconds(*v));
}

/// Apply one bulkhead-shaped key to @p patch. Unknown keys are warned about.
inline expected<void, ConfigError> ApplyBulkheadKey(const ConfigStore::Entry& e,
                                                    BulkheadConfigPatch* patch) {
  if (CaseEqual(e.key, "max_concurrent")) {
    auto v = ParseCount(e);
    if (!v) {
      return expected<void, ConfigError>::error(v.get_error());
    }
    patch->max_concurrent = v.value();
  } else if (CaseEqual(e.key, "max_queue_size")) {
    auto v = ParseCount(e);
    if (!v) {
      return expected<void, ConfigError>::error(v.get_error());
    }
    patch->max_queue_size = v.value();
  } else if (CaseEqual(e.key, "queue_timeout_ms")) {
    auto v = ParseMillis(e);
    if (!v) {
      return expected<void, ConfigError>::error(v.get_error());
    }
    patch->queue_timeout = v.value();
  } else {
    ISOL_LOG_WARN("Config", "[%s] unknown key '%s' ignored", e.section.c_str(), e.key.c_str());
  }
  return expected<void, ConfigError>::success();
}

inline expected<void, ConfigError> ApplyManagerKey(const ConfigStore::Entry& e,
                                                   ManagerConfig* out) {
  if (CaseEqual(e.key, "enabled")) {
    out->enabled = ConfigStore::ParseBool(e.value);
  } else if (CaseEqual(e.key, "semaphore_timeout_ms")) {
    auto v = ParseMillis(e);
    if (!v) {
      return expected<void, ConfigError>::error(v.get_error());
    }
    out->semaphore_timeout = v.value();
  } else if (CaseEqual(e.key, "max_workers")) {
    auto v = ParseCount(e);
    if (!v) {
      return expected<void, ConfigError>::error(v.get_error());
    }
    if (v.value() == 0U) {
      ISOL_LOG_ERROR("Config", "[manager] max_workers must be positive");
      return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
    }
    out->executor_max_workers = v.value();
  } else if (CaseEqual(e.key, "min_workers")) {
    auto v = ParseCount(e);
    if (!v) {
      return expected<void, ConfigError>::error(v.get_error());
    }
    out->executor_min_workers = v.value();
  } else {
    ISOL_LOG_WARN("Config", "[manager] unknown key '%s' ignored", e.key.c_str());
  }
  return expected<void, ConfigError>::success();
}

}  // namespace detail

/**
 * @brief Overlay the values found in @p store onto @p out.
 *
 * Keys absent from the store keep the value already in @p out, so the
 * usual call site starts from ManagerConfig::Builtin(). On error @p out
 * may be partially updated.
 *
 * @return ConfigError::kParseError for a malformed number,
 *         ConfigError::kInvalidValue for an out-of-range setting.
 */
inline expected<void, ConfigError> LoadManagerConfig(const ConfigStore& store,
                                                     ManagerConfig* out) {
  ISOL_ASSERT(out != nullptr);
  const std::string bulkhead_prefix = detail::kBulkheadSectionPrefix;
  expected<void, ConfigError> status = expected<void, ConfigError>::success();

  store.ForEachEntry([&](const ConfigStore::Entry& e) {
    if (!status) {
      return;
    }
    if (detail::CaseEqual(e.section, "manager")) {
      status = detail::ApplyManagerKey(e, out);
    } else if (detail::CaseEqual(e.section, "defaults")) {
      BulkheadConfigPatch patch;
      status = detail::ApplyBulkheadKey(e, &patch);
      if (status) {
        patch.ApplyTo(&out->defaults);
      }
    } else if (e.section.size() > bulkhead_prefix.size() &&
               detail::CaseEqual(e.section.substr(0, bulkhead_prefix.size()), bulkhead_prefix)) {
      BulkheadConfigPatch patch;
      status = detail::ApplyBulkheadKey(e, &patch);
      if (status) {
        out->overrides[e.section.substr(bulkhead_prefix.size())].MergeFrom(patch);
      }
    } else if (detail::CaseEqual(e.section, "semaphores")) {
      auto permits = detail::ParseCount(e);
      if (!permits) {
        status = expected<void, ConfigError>::error(permits.get_error());
      } else {
        out->semaphores[e.key] = permits.value();
      }
    } else {
      ISOL_LOG_DEBUG("Config", "section [%s] not used by the manager", e.section.c_str());
    }
  });

  if (status) {
    ISOL_LOG_INFO("Config", "manager config loaded: %zu overrides, %zu semaphores",
                  out->overrides.size(), out->semaphores.size());
  }
  return status;
}

}  // namespace isol

#endif  // ISOL_MANAGER_CONFIG_HPP_
