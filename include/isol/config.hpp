/**
 * @file config.hpp
 * @brief Multi-format configuration reader feeding ManagerConfig.
 *
 * Design:
 *   - Tag dispatch: IniBackend / JsonBackend / YamlBackend type tags
 *   - ConfigParser<Backend> specialization per format
 *   - Config<Backends...> composes the enabled formats at compile time
 *   - ConfigStore holds the flattened "section + key = value" model
 *
 * Backends are CMake opt-in:
 *   - IniBackend  : inih          (ISOL_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (ISOL_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML        (ISOL_CONFIG_YAML_ENABLED)
 *
 * JSON and YAML documents are flattened one level deep: a top-level object
 * becomes a section, its scalar members become keys.
 *
 * @code
 *   isol::MultiConfig cfg;
 *   if (cfg.LoadFile("isolation.ini")) {
 *     isol::ManagerConfig mc = isol::ManagerConfig::Builtin();
 *     isol::LoadManagerConfig(cfg, &mc);
 *   }
 * @endcode
 */

#ifndef ISOL_CONFIG_HPP_
#define ISOL_CONFIG_HPP_

#include "isol/platform.hpp"
#include "isol/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <cerrno>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

#ifdef ISOL_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef ISOL_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef ISOL_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace isol {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

inline bool CaseEqual(const std::string& a, const std::string& b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (AsciiLower(a[i]) != AsciiLower(b[i])) {
      return false;
    }
  }
  return true;
}

}  // namespace detail

// ============================================================================
// Backend Tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "cfg") ||
           detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

/**
 * @brief Flat, insertion-ordered section/key/value table.
 *
 * Section and key lookups are ASCII case-insensitive. Setting an existing
 * section/key pair overwrites its value in place.
 */
class ConfigStore {
 public:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  // --- Typed Getters ---

  std::string GetString(const std::string& section, const std::string& key,
                        const std::string& default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int64_t GetInt(const std::string& section, const std::string& key,
                 int64_t default_val = 0) const {
    auto v = FindInt(section, key);
    return v.has_value() ? *v : default_val;
  }

  bool GetBool(const std::string& section, const std::string& key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value) : default_val;
  }

  // --- Optional Getters ---

  /// Empty when the key is missing or the value is not a whole integer.
  std::optional<int64_t> FindInt(const std::string& section, const std::string& key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) {
      return std::nullopt;
    }
    return ParseInt(e->value);
  }

  // --- Query ---

  bool HasSection(const std::string& section) const {
    for (const auto& e : entries_) {
      if (detail::CaseEqual(e.section, section)) {
        return true;
      }
    }
    return false;
  }

  bool HasKey(const std::string& section, const std::string& key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return static_cast<uint32_t>(entries_.size()); }

  /// Visit every entry in insertion order.
  template <typename Fn>
  void ForEachEntry(Fn&& fn) const {
    for (const auto& e : entries_) {
      fn(e);
    }
  }

  /// Insert or overwrite one value (programmatic configuration, tests).
  void Set(const std::string& section, const std::string& key, const std::string& value) {
    for (auto& e : entries_) {
      if (detail::CaseEqual(e.section, section) && detail::CaseEqual(e.key, key)) {
        e.value = value;
        return;
      }
    }
    entries_.push_back(Entry{section, key, value});
  }

  void Clear() noexcept { entries_.clear(); }

  static std::optional<int64_t> ParseInt(const std::string& text) noexcept {
    if (text.empty()) {
      return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const long long val = std::strtoll(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || errno == ERANGE) {
      return std::nullopt;
    }
    return static_cast<int64_t>(val);
  }

  static bool ParseBool(const std::string& str) noexcept {
    return detail::CaseEqual(str, "true") || detail::CaseEqual(str, "1") ||
           detail::CaseEqual(str, "yes") || detail::CaseEqual(str, "on");
  }

 protected:
  const Entry* FindEntry(const std::string& section, const std::string& key) const {
    for (const auto& e : entries_) {
      if (detail::CaseEqual(e.section, section) && detail::CaseEqual(e.key, key)) {
        return &e;
      }
    }
    return nullptr;
  }

  static expected<std::string, ConfigError> ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
      return expected<std::string, ConfigError>::error(ConfigError::kFileNotFound);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return expected<std::string, ConfigError>::success(ss.str());
  }

  static std::string GetExtension(const std::string& path) {
    const size_t dot = path.find_last_of('.');
    const size_t slash = path.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
      return std::string();
    }
    return path.substr(dot + 1);
  }

  std::vector<Entry> entries_;

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Format compiled out: report kFormatNotSupported. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef ISOL_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const std::string& path) {
    const int result = ini_parse(path.c_str(), Handler, &store);
    if (result == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (result != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const std::string& data) {
    if (ini_parse_string(data.c_str(), Handler, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name, const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    s->Set(section != nullptr ? section : "", name != nullptr ? name : "",
           value != nullptr ? value : "");
    return 1;
  }
};
#endif

#ifdef ISOL_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const std::string& path) {
    auto text = ConfigStore::ReadFile(path);
    if (!text) {
      return expected<void, ConfigError>::error(text.get_error());
    }
    return ParseBuffer(store, text.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const std::string& data) {
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          store.Set(it.key(), kit.key(), ToStr(*kit));
        }
      } else {
        store.Set("", it.key(), ToStr(*it));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) {
      return n.get<std::string>();
    }
    if (n.is_boolean()) {
      return n.get<bool>() ? "true" : "false";
    }
    return n.dump();
  }
};
#endif

#ifdef ISOL_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const std::string& path) {
    auto text = ConfigStore::ReadFile(path);
    if (!text) {
      return expected<void, ConfigError>::error(text.get_error());
    }
    return ParseBuffer(store, text.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const std::string& data) {
    fkyaml::node root;
    try {
      root = fkyaml::node::deserialize(data);
    } catch (const fkyaml::exception&) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      const auto section = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          store.Set(section, kit.key().get_value<std::string>(), ToStr(*kit));
        }
      } else {
        store.Set("", section, ToStr(node));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const fkyaml::node& n) {
    if (n.is_string()) {
      return n.get_value<std::string>();
    }
    if (n.is_boolean()) {
      return n.get_value<bool>() ? "true" : "false";
    }
    if (n.is_integer()) {
      return std::to_string(n.get_value<int64_t>());
    }
    if (n.is_float_number()) {
      return std::to_string(n.get_value<double>());
    }
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(const std::string& path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    if (format == ConfigFormat::kAuto) {
      format = DetectFormat(path);
    }
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const std::string& data, ConfigFormat format) {
    return DispatchBuffer<Backends...>(data, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const std::string& path, ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseFile(*this, path);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchFile<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const std::string& data, ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchBuffer<Rest...>(data, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const std::string& path) const {
    const std::string ext = GetExtension(path);
    if (ext.empty()) {
      return Head::kFormat;
    }
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const std::string& ext) const noexcept {
    if (First::MatchesExtension(ext)) {
      return First::kFormat;
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DetectExt<Rest...>(ext);
    }
    return Head::kFormat;
  }
};

// ============================================================================
// Convenience Aliases
// ============================================================================

#if defined(ISOL_CONFIG_INI_ENABLED) || defined(ISOL_CONFIG_JSON_ENABLED) || \
    defined(ISOL_CONFIG_YAML_ENABLED)
#define ISOL_CONFIG_HAS_BACKEND 1

using MultiConfig = Config<
#ifdef ISOL_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(ISOL_CONFIG_INI_ENABLED) && \
    (defined(ISOL_CONFIG_JSON_ENABLED) || defined(ISOL_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef ISOL_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(ISOL_CONFIG_JSON_ENABLED) && defined(ISOL_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef ISOL_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#endif

#ifdef ISOL_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef ISOL_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef ISOL_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace isol

#endif  // ISOL_CONFIG_HPP_
