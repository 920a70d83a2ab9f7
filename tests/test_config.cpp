/**
 * @file test_config.cpp
 * @brief Tests for config.hpp and manager_config.hpp.
 */

#include "isol/config.hpp"
#include "isol/manager_config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdio>
#include <string>

using namespace std::chrono_literals;

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("config - ConfigStore Set and typed getters", "[config]") {
  isol::ConfigStore store;
  store.Set("manager", "enabled", "yes");
  store.Set("defaults", "max_concurrent", "12");
  store.Set("defaults", "label", "bulk");

  REQUIRE(store.EntryCount() == 3U);
  REQUIRE(store.GetBool("manager", "enabled"));
  REQUIRE(store.GetInt("defaults", "max_concurrent") == 12);
  REQUIRE(store.GetString("defaults", "label") == "bulk");
  REQUIRE(store.GetString("defaults", "missing", "fallback") == "fallback");
  REQUIRE(store.GetInt("defaults", "label", -1) == -1);
  REQUIRE_FALSE(store.FindInt("defaults", "label").has_value());
}

TEST_CASE("config - lookups ignore ASCII case and Set overwrites", "[config]") {
  isol::ConfigStore store;
  store.Set("Defaults", "Max_Queue_Size", "10");
  store.Set("defaults", "max_queue_size", "20");

  REQUIRE(store.EntryCount() == 1U);
  REQUIRE(store.GetInt("DEFAULTS", "MAX_QUEUE_SIZE") == 20);
  REQUIRE(store.HasSection("defaults"));
  REQUIRE(store.HasKey("defaults", "max_queue_size"));
  REQUIRE_FALSE(store.HasKey("defaults", "max_concurrent"));

  store.Clear();
  REQUIRE(store.EntryCount() == 0U);
}

TEST_CASE("config - ParseInt is strict", "[config]") {
  REQUIRE(isol::ConfigStore::ParseInt("42") == 42);
  REQUIRE(isol::ConfigStore::ParseInt("-7") == -7);
  REQUIRE_FALSE(isol::ConfigStore::ParseInt("").has_value());
  REQUIRE_FALSE(isol::ConfigStore::ParseInt("12ms").has_value());
  REQUIRE_FALSE(isol::ConfigStore::ParseInt("abc").has_value());
  REQUIRE_FALSE(isol::ConfigStore::ParseInt("99999999999999999999999").has_value());
}

TEST_CASE("config - ParseBool accepts the usual spellings", "[config]") {
  REQUIRE(isol::ConfigStore::ParseBool("TRUE"));
  REQUIRE(isol::ConfigStore::ParseBool("1"));
  REQUIRE(isol::ConfigStore::ParseBool("on"));
  REQUIRE_FALSE(isol::ConfigStore::ParseBool("false"));
  REQUIRE_FALSE(isol::ConfigStore::ParseBool("0"));
  REQUIRE_FALSE(isol::ConfigStore::ParseBool(""));
}

// ============================================================================
// ManagerConfig
// ============================================================================

TEST_CASE("config - Builtin carries the shipped tables", "[config][manager]") {
  const isol::ManagerConfig c = isol::ManagerConfig::Builtin();
  REQUIRE(c.enabled);
  REQUIRE(c.defaults.max_concurrent == 10U);
  REQUIRE(c.defaults.max_queue_size == 50U);
  REQUIRE(c.defaults.queue_timeout == 30000ms);
  REQUIRE(c.semaphore_timeout == 10000ms);
  REQUIRE(c.semaphores.size() == 6U);
  REQUIRE(c.semaphores.at(isol::kNetworkIoSemaphore) == 50U);
  REQUIRE(c.semaphores.at(isol::kContainerSemaphore) == 10U);
}

TEST_CASE("config - Resolve prefers exact over prefix over defaults", "[config][manager]") {
  const isol::ManagerConfig c = isol::ManagerConfig::Builtin();

  auto db_read = c.Resolve("db.read");
  REQUIRE(db_read.name == "db.read");
  REQUIRE(db_read.max_concurrent == 30U);
  REQUIRE(db_read.queue_timeout == 10000ms);

  auto db_other = c.Resolve("db.migrate");
  REQUIRE(db_other.max_concurrent == 15U);
  REQUIRE(db_other.queue_timeout == 15000ms);

  auto unknown = c.Resolve("billing.invoice");
  REQUIRE(unknown.max_concurrent == 10U);
  REQUIRE(unknown.max_queue_size == 50U);
}

TEST_CASE("config - Resolve uses the longest matching prefix", "[config][manager]") {
  isol::ManagerConfig c;
  c.overrides["ai."] = isol::MakePatch(20U, 100U, 60000);
  c.overrides["ai.local."] = isol::MakePatch(2U, 4U, 5000);

  REQUIRE(c.Resolve("ai.local.llama").max_concurrent == 2U);
  REQUIRE(c.Resolve("ai.remote").max_concurrent == 20U);
  // A prefix never matches the bare namespace itself.
  REQUIRE(c.Resolve("ai.").max_concurrent == c.defaults.max_concurrent);
}

TEST_CASE("config - patch fields override independently", "[config][manager]") {
  isol::ManagerConfig c;
  isol::BulkheadConfigPatch prefix;
  prefix.max_queue_size = 7U;
  isol::BulkheadConfigPatch exact;
  exact.queue_timeout = 250ms;
  c.overrides["svc."] = prefix;
  c.overrides["svc.a"] = exact;

  auto r = c.Resolve("svc.a");
  REQUIRE(r.max_concurrent == c.defaults.max_concurrent);
  REQUIRE(r.max_queue_size == 7U);
  REQUIRE(r.queue_timeout == 250ms);
  REQUIRE(isol::BulkheadConfigPatch{}.Empty());
  REQUIRE_FALSE(exact.Empty());
}

// ============================================================================
// LoadManagerConfig
// ============================================================================

TEST_CASE("config - LoadManagerConfig overlays store values", "[config][manager]") {
  isol::ConfigStore store;
  store.Set("manager", "enabled", "false");
  store.Set("manager", "semaphore_timeout_ms", "2500");
  store.Set("manager", "max_workers", "16");
  store.Set("defaults", "max_concurrent", "4");
  store.Set("bulkhead:ai.", "max_concurrent", "8");
  store.Set("bulkhead:ai.claude", "queue_timeout_ms", "1000");
  store.Set("semaphores", "global.gpu", "2");
  store.Set("logging", "level", "debug");

  isol::ManagerConfig c = isol::ManagerConfig::Builtin();
  auto r = isol::LoadManagerConfig(store, &c);
  REQUIRE(r.has_value());

  REQUIRE_FALSE(c.enabled);
  REQUIRE(c.semaphore_timeout == 2500ms);
  REQUIRE(c.executor_max_workers == 16U);
  REQUIRE(c.defaults.max_concurrent == 4U);
  REQUIRE(c.defaults.max_queue_size == 50U);
  REQUIRE(c.semaphores.at("global.gpu") == 2U);
  REQUIRE(c.semaphores.at(isol::kCpuIntensiveSemaphore) == 5U);

  // Merged into the built-in ai.claude entry: timeout replaced, limits kept.
  auto claude = c.Resolve("ai.claude");
  REQUIRE(claude.queue_timeout == 1000ms);
  REQUIRE(claude.max_concurrent == 20U);
  REQUIRE(c.Resolve("ai.mistral").max_concurrent == 8U);
}

TEST_CASE("config - LoadManagerConfig rejects malformed numbers", "[config][manager]") {
  isol::ConfigStore store;
  store.Set("defaults", "max_queue_size", "lots");
  isol::ManagerConfig c;
  auto r = isol::LoadManagerConfig(store, &c);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == isol::ConfigError::kParseError);

  isol::ConfigStore negative;
  negative.Set("semaphores", "global.cpu_intensive", "-1");
  REQUIRE(isol::LoadManagerConfig(negative, &c).get_error() == isol::ConfigError::kParseError);
}

TEST_CASE("config - zero max_workers is an invalid value", "[config][manager]") {
  isol::ConfigStore store;
  store.Set("manager", "max_workers", "0");
  isol::ManagerConfig c;
  auto r = isol::LoadManagerConfig(store, &c);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == isol::ConfigError::kInvalidValue);
}

TEST_CASE("config - unknown keys are ignored", "[config][manager]") {
  isol::ConfigStore store;
  store.Set("defaults", "max_burst", "3");
  store.Set("manager", "color", "blue");
  isol::ManagerConfig c;
  REQUIRE(isol::LoadManagerConfig(store, &c).has_value());
  REQUIRE(c.defaults.max_concurrent == 10U);
}

// ============================================================================
// INI Backend
// ============================================================================

#ifdef ISOL_CONFIG_INI_ENABLED

TEST_CASE("config - INI buffer feeds the manager config", "[config][ini]") {
  const char* ini_data =
      "[manager]\n"
      "semaphore_timeout_ms = 3000\n"
      "[bulkhead:file.upload]\n"
      "max_concurrent = 3\n"
      "max_queue_size = 6\n"
      "[semaphores]\n"
      "global.disk_io = 4\n";

  isol::IniConfig cfg;
  REQUIRE(cfg.LoadBuffer(ini_data, isol::ConfigFormat::kIni).has_value());
  REQUIRE(cfg.GetInt("bulkhead:file.upload", "max_concurrent") == 3);

  isol::ManagerConfig c = isol::ManagerConfig::Builtin();
  REQUIRE(isol::LoadManagerConfig(cfg, &c).has_value());
  REQUIRE(c.semaphore_timeout == 3000ms);
  REQUIRE(c.Resolve("file.upload").max_queue_size == 6U);
  REQUIRE(c.semaphores.at(isol::kDiskIoSemaphore) == 4U);
}

TEST_CASE("config - INI LoadFile reports a missing file", "[config][ini]") {
  isol::IniConfig cfg;
  auto r = cfg.LoadFile("/nonexistent/isolation.ini");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == isol::ConfigError::kFileNotFound);
}

TEST_CASE("config - INI LoadFile reads from disk", "[config][ini]") {
  const char* path = "/tmp/isol_test_config.ini";
  std::FILE* fp = std::fopen(path, "w");
  REQUIRE(fp != nullptr);
  std::fputs("[defaults]\nmax_concurrent = 6\n", fp);
  std::fclose(fp);

  isol::IniConfig cfg;
  REQUIRE(cfg.LoadFile(path).has_value());
  REQUIRE(cfg.GetInt("defaults", "max_concurrent") == 6);
  std::remove(path);
}

TEST_CASE("config - JSON format unsupported by an INI-only config", "[config][ini]") {
  isol::IniConfig cfg;
  auto r = cfg.LoadBuffer("{}", isol::ConfigFormat::kJson);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == isol::ConfigError::kFormatNotSupported);
}

#endif  // ISOL_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend
// ============================================================================

#ifdef ISOL_CONFIG_JSON_ENABLED

TEST_CASE("config - JSON buffer is flattened one level", "[config][json]") {
  const char* json_data = R"({
    "manager": {"enabled": true, "max_workers": 32},
    "bulkhead:db.write": {"max_concurrent": 3, "queue_timeout_ms": 500},
    "semaphores": {"global.network_io": 12}
  })";

  isol::JsonConfig cfg;
  REQUIRE(cfg.LoadBuffer(json_data, isol::ConfigFormat::kJson).has_value());
  REQUIRE(cfg.GetBool("manager", "enabled"));
  REQUIRE(cfg.GetInt("manager", "max_workers") == 32);

  isol::ManagerConfig c = isol::ManagerConfig::Builtin();
  REQUIRE(isol::LoadManagerConfig(cfg, &c).has_value());
  REQUIRE(c.executor_max_workers == 32U);
  REQUIRE(c.Resolve("db.write").max_concurrent == 3U);
  REQUIRE(c.Resolve("db.write").queue_timeout == 500ms);
  REQUIRE(c.semaphores.at(isol::kNetworkIoSemaphore) == 12U);
}

TEST_CASE("config - malformed JSON is a parse error", "[config][json]") {
  isol::JsonConfig cfg;
  auto r = cfg.LoadBuffer("{\"manager\": ", isol::ConfigFormat::kJson);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == isol::ConfigError::kParseError);
}

#endif  // ISOL_CONFIG_JSON_ENABLED

// ============================================================================
// YAML Backend
// ============================================================================

#ifdef ISOL_CONFIG_YAML_ENABLED

TEST_CASE("config - YAML buffer feeds the manager config", "[config][yaml]") {
  const char* yaml_data =
      "defaults:\n"
      "  max_queue_size: 25\n"
      "semaphores:\n"
      "  ai.total_requests: 8\n";

  isol::YamlConfig cfg;
  REQUIRE(cfg.LoadBuffer(yaml_data, isol::ConfigFormat::kYaml).has_value());

  isol::ManagerConfig c = isol::ManagerConfig::Builtin();
  REQUIRE(isol::LoadManagerConfig(cfg, &c).has_value());
  REQUIRE(c.defaults.max_queue_size == 25U);
  REQUIRE(c.semaphores.at(isol::kAiRequestsSemaphore) == 8U);
}

#endif  // ISOL_CONFIG_YAML_ENABLED
