/**
 * @file config.hpp
 * @brief Settings store fed from the environment and configuration files.
 *
 * Every source is flattened into "section + key = value" entries. A later
 * load overrides an earlier one key by key, so loading the environment
 * first and a properties file second gives the file precedence.
 *
 * Backends (tag dispatch on file extension):
 *   - PropertiesBackend : built in          (.properties, .env)
 *   - JsonBackend       : nlohmann/json     (FORGE_CONFIG_JSON_ENABLED)
 *   - IniBackend        : inih              (FORGE_CONFIG_INI_ENABLED)
 *
 * Usage:
 * @code
 *   forge::Settings cfg;
 *   cfg.MergeEnvironment(environ);
 *   cfg.LoadFile("dev/env.properties");
 *   auto port = cfg.GetStrict("", "PORT");
 *   if (!port) FORGE_LOG_FATAL("Main", "PORT is not configured");
 * @endcode
 */

#ifndef FORGE_CONFIG_HPP_
#define FORGE_CONFIG_HPP_

#include "forge/platform.hpp"
#include "forge/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>

#ifdef FORGE_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef FORGE_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

namespace forge {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kProperties,
  kIni,
  kJson,
};

#ifndef FORGE_CONFIG_MAX_FILE_SIZE
#define FORGE_CONFIG_MAX_FILE_SIZE 8192U
#endif

namespace detail {

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct PropertiesBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kProperties;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "properties") || detail::CaseEqual(ext, "env");
  }
};

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "cfg");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  // --- Typed getters ---

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    auto v = FindInt(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  /// Port number clamped to [0, 65535].
  uint16_t GetPort(const char* section, const char* key,
                   uint16_t default_val = 0) const {
    auto v = FindInt(section, key);
    if (!v.has_value()) return default_val;
    if (v.value() < 0) return 0;
    if (v.value() > 65535) return 65535;
    return static_cast<uint16_t>(v.value());
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value) : default_val;
  }

  // --- Optional getters ---

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    long val = std::strtol(e->value, &end, 10);
    if (end == e->value) return {};
    return static_cast<int32_t>(val);
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    return ParseBool(e->value);
  }

  /// Value of a setting that must be present.
  expected<const char*, ConfigError> GetStrict(const char* section,
                                               const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) {
      return expected<const char*, ConfigError>::error(ConfigError::kKeyNotFound);
    }
    return expected<const char*, ConfigError>::success(e->value);
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

  // --- Sources ---

  /**
   * @brief Merge NAME=value pairs (as in `environ`) into section "".
   * @param envp NULL-terminated array; may itself be nullptr.
   */
  expected<void, ConfigError> MergeEnvironment(const char* const* envp) {
    if (envp == nullptr) return expected<void, ConfigError>::success();
    for (; *envp != nullptr; ++envp) {
      const char* eq = std::strchr(*envp, '=');
      if (eq == nullptr || eq == *envp) continue;
      char key[kMaxKeyLen];
      uint32_t len = static_cast<uint32_t>(eq - *envp);
      if (len >= kMaxKeyLen) continue;
      std::memcpy(key, *envp, len);
      key[len] = '\0';
      if (!AddEntry("", key, eq + 1)) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

  /// Set a single value, overriding any earlier one.
  bool Set(const char* section, const char* key, const char* value) {
    return AddEntry(section, key, value);
  }

 protected:
  static constexpr uint32_t kMaxEntries = 256;
  static constexpr uint32_t kMaxKeyLen = 64;
  static constexpr uint32_t kMaxValueLen = 256;

  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  bool AddEntry(const char* section, const char* key, const char* value) {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
        SafeCopy(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries) return false;
    Entry& e = entries_[count_];
    SafeCopy(e.section, section, kMaxKeyLen);
    SafeCopy(e.key, key, kMaxKeyLen);
    SafeCopy(e.value, value, kMaxValueLen);
    ++count_;
    return true;
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    FORGE_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  static expected<uint32_t, ConfigError> ReadFileToBuffer(const char* path,
                                                          char* buf,
                                                          uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    size_t bytes = std::fread(buf, 1, buf_size - 1U, f);
    bool truncated = (bytes == buf_size - 1U) && std::fgetc(f) != EOF;
    std::fclose(f);
    if (truncated) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    }
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(bytes));
  }

  static void SafeCopy(char* dst, const char* src, uint32_t dst_size) noexcept {
    if (src == nullptr) {
      dst[0] = '\0';
      return;
    }
    uint32_t i = 0;
    while (i < (dst_size - 1U) && src[i] != '\0') {
      dst[i] = src[i];
      ++i;
    }
    dst[i] = '\0';
  }

  static bool ParseBool(const char* str) noexcept {
    return detail::CaseEqual(str, "true") || detail::CaseEqual(str, "1") ||
           detail::CaseEqual(str, "yes") || detail::CaseEqual(str, "on");
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
      if (*p == '/') dot = nullptr;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  template <typename>
  friend struct ConfigParser;

 private:
  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

// --- Properties ---

/**
 * Line-oriented `key=value` / `key: value` / `key value` format.
 * `#` and `!` start comments, a trailing backslash continues the logical
 * line, and `\t \n \r \\ \= \:` are unescaped. Entries go to section "".
 */
template <>
struct ConfigParser<PropertiesBackend> {
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    std::string line;
    uint32_t pos = 0;
    while (pos < size) {
      line.clear();
      pos = ReadLogicalLine(data, size, pos, line);
      auto r = ParseLine(store, line);
      if (!r) return r;
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool IsBlank(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\f';
  }

  /// Join physical lines ending in an odd number of backslashes.
  static uint32_t ReadLogicalLine(const char* data, uint32_t size, uint32_t pos,
                                  std::string& out) {
    bool continued = true;
    while (continued && pos < size) {
      continued = false;
      while (pos < size && IsBlank(data[pos])) ++pos;
      uint32_t start = pos;
      while (pos < size && data[pos] != '\n' && data[pos] != '\r') ++pos;
      uint32_t end = pos;
      if (pos < size && data[pos] == '\r') ++pos;
      if (pos < size && data[pos] == '\n') ++pos;

      uint32_t slashes = 0;
      while (end - slashes > start && data[end - slashes - 1U] == '\\') ++slashes;
      if ((slashes % 2U) == 1U) {
        continued = true;
        --end;
      }
      out.append(data + start, end - start);
    }
    return pos;
  }

  static expected<void, ConfigError> ParseLine(ConfigStore& store,
                                               const std::string& line) {
    size_t i = 0;
    while (i < line.size() && IsBlank(line[i])) ++i;
    if (i == line.size() || line[i] == '#' || line[i] == '!') {
      return expected<void, ConfigError>::success();
    }

    std::string key;
    bool escaped = false;
    for (; i < line.size(); ++i) {
      char c = line[i];
      if (escaped) {
        key.push_back(Unescape(c));
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '=' || c == ':' || IsBlank(c)) {
        break;
      } else {
        key.push_back(c);
      }
    }

    while (i < line.size() && IsBlank(line[i])) ++i;
    if (i < line.size() && (line[i] == '=' || line[i] == ':')) ++i;
    while (i < line.size() && IsBlank(line[i])) ++i;

    std::string value;
    escaped = false;
    for (; i < line.size(); ++i) {
      char c = line[i];
      if (escaped) {
        value.push_back(Unescape(c));
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else {
        value.push_back(c);
      }
    }

    if (key.empty() || key.size() >= ConfigStore::kMaxKeyLen) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!store.AddEntry("", key.c_str(), value.c_str())) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

  static char Unescape(char c) noexcept {
    switch (c) {
      case 't': return '\t';
      case 'n': return '\n';
      case 'r': return '\r';
      case 'f': return '\f';
      default:  return c;
    }
  }
};

// --- INI ---

#ifdef FORGE_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    int result = ini_parse_string(data, Handler, &store);
    if (result != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    return s->AddEntry(section != nullptr ? section : "",
                       name != nullptr ? name : "",
                       value != nullptr ? value : "")
               ? 1
               : 0;
  }
};
#endif

// --- JSON ---

#ifdef FORGE_CONFIG_JSON_ENABLED
/**
 * Top-level objects become sections; top-level scalars go to section "".
 */
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          if (!Add(store, it.key(), kit.key(), *kit)) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!Add(store, std::string(), it.key(), *it)) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Add(ConfigStore& store, const std::string& section,
                  const std::string& key, const nlohmann::json& n) {
    std::string text;
    if (n.is_string()) {
      text = n.get<std::string>();
    } else if (n.is_boolean()) {
      text = n.get<bool>() ? "true" : "false";
    } else {
      text = n.dump();
    }
    return store.AddEntry(section.c_str(), key.c_str(), text.c_str());
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

  expected<void, ConfigError> LoadFile(const char* path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    FORGE_ASSERT(path != nullptr);
    char buf[FORGE_CONFIG_MAX_FILE_SIZE];
    auto r = ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r) return expected<void, ConfigError>::error(r.get_error());
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return Dispatch<Backends...>(buf, r.value(), format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    FORGE_ASSERT(data != nullptr);
    return Dispatch<Backends...>(data, size, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> Dispatch(const char* data, uint32_t size,
                                       ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return Dispatch<Rest...>(data, size, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }

  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

// ============================================================================
// Settings - every backend compiled into this build
// ============================================================================

using Settings = Config<PropertiesBackend
#ifdef FORGE_CONFIG_JSON_ENABLED
                        ,
                        JsonBackend
#endif
#ifdef FORGE_CONFIG_INI_ENABLED
                        ,
                        IniBackend
#endif
                        >;

}  // namespace forge

#endif  // FORGE_CONFIG_HPP_
