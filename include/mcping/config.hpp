/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file config.hpp
 * @brief Probe settings: INI file (inih) layered under command-line flags.
 *
 * INI support is compiled in when the build defines
 * MCPING_CONFIG_INI_ENABLED; otherwise LoadFile() reports
 * ConfigError::kFormatNotSupported.
 *
 * @code
 *   [probe]
 *   group = ff12::1
 *   port = 3000
 *   interval_ms = 1000
 *   [server]
 *   reply = echo
 *   [log]
 *   level = info
 * @endcode
 */

#ifndef MCPING_CONFIG_HPP_
#define MCPING_CONFIG_HPP_

#include "mcping/log.hpp"
#include "mcping/platform.hpp"
#include "mcping/server.hpp"
#include "mcping/vocabulary.hpp"
#include "mcping/worker_pool.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#ifdef MCPING_CONFIG_INI_ENABLED
#include <ini.h>
#endif

namespace mcping {

// ============================================================================
// ConfigStore - Flat section/key/value storage
// ============================================================================

class ConfigStore {
 public:
  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value) : default_val;
  }

  bool HasSection(const char* section) const {
    MCPING_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (StrCaseEqual(entries_[i].section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

  /** @brief Insert or overwrite. @return false when the store is full. */
  bool AddEntry(const char* section, const char* key, const char* value) {
    for (uint32_t i = 0; i < count_; ++i) {
      if (StrCaseEqual(entries_[i].section, section) &&
          StrCaseEqual(entries_[i].key, key)) {
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

  static bool ParseBool(const char* str) noexcept {
    if (str == nullptr) return false;
    return StrCaseEqual(str, "true") || StrCaseEqual(str, "1") ||
           StrCaseEqual(str, "yes") || StrCaseEqual(str, "on");
  }

 protected:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kMaxKeyLen = 64;
  static constexpr uint32_t kMaxValueLen = 256;

  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  const Entry* FindEntry(const char* section, const char* key) const {
    MCPING_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (StrCaseEqual(entries_[i].section, section) &&
          StrCaseEqual(entries_[i].key, key))
        return &entries_[i];
    }
    return nullptr;
  }

  static bool StrCaseEqual(const char* a, const char* b) noexcept {
    while (*a != '\0' && *b != '\0') {
      char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
      char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
      if (la != lb) return false;
      ++a; ++b;
    }
    return *a == *b;
  }

  static void SafeCopy(char* dst, const char* src, uint32_t dst_size) noexcept {
    if (src == nullptr) { dst[0] = '\0'; return; }
    uint32_t i = 0;
    while (i < (dst_size - 1U) && src[i] != '\0') { dst[i] = src[i]; ++i; }
    dst[i] = '\0';
  }
};

// ============================================================================
// IniConfig - ConfigStore filled by inih
// ============================================================================

class IniConfig final : public ConfigStore {
 public:
#ifdef MCPING_CONFIG_INI_ENABLED
  expected<void, ConfigError> LoadFile(const char* path) {
    MCPING_ASSERT(path != nullptr);
    int result = ini_parse(path, Handler, this);
    if (result == -1)
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (result != 0) {
      MCPING_LOG_ERROR("config", "%s: parse error at line %d", path, result);
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  expected<void, ConfigError> LoadBuffer(const char* data) {
    MCPING_ASSERT(data != nullptr);
    int result = ini_parse_string(data, Handler, this);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }
#else
  expected<void, ConfigError> LoadFile(const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  expected<void, ConfigError> LoadBuffer(const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
#endif

 private:
#ifdef MCPING_CONFIG_INI_ENABLED
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<IniConfig*>(user);
    return s->AddEntry(section ? section : "", name ? name : "",
                       value ? value : "") ? 1 : 0;
  }
#endif
};

// ============================================================================
// ProbeConfig
// ============================================================================

enum class Role : uint8_t { kClient = 0, kServer };

static constexpr const char kDefaultGroup[] =
    "ff12c909:3199:e8ba:6f6f:7d23:e6ae:d85d";
static constexpr uint16_t kDefaultPort = 3000U;

struct ProbeConfig {
  Role role{Role::kClient};
  std::string group{kDefaultGroup};
  uint16_t port{kDefaultPort};
  uint32_t interval_ms{1000U};
  int32_t timeout_ms{500};
  std::string ifname;  ///< Empty = system-selected.
  uint64_t count{0U};
  uint32_t report_ms{5000U};

  ReplyMode reply_mode{ReplyMode::kEcho};
  bool loopback{true};
  uint32_t workers{2U};
  uint32_t queue_depth{1024U};

  log::Level log_level{log::Level::kInfo};
  std::string config_path;
  bool show_help{false};
};

namespace detail {

/** Strict decimal parse: digits only, no sign, no trailing garbage. */
inline bool ParseUnsigned(const char* text, uint64_t max, uint64_t& out) {
  if (text == nullptr || *text < '0' || *text > '9') return false;
  char* end = nullptr;
  errno = 0;
  const unsigned long long v = std::strtoull(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0' || v > max) return false;
  out = static_cast<uint64_t>(v);
  return true;
}

template <typename T>
inline expected<void, ConfigError> AssignUnsigned(const char* what,
                                                  const char* text,
                                                  uint64_t max, T& out) {
  uint64_t v = 0;
  if (!ParseUnsigned(text, max, v)) {
    MCPING_LOG_ERROR("config", "invalid value for %s: '%s'", what,
                     text != nullptr ? text : "");
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  out = static_cast<T>(v);
  return expected<void, ConfigError>::success();
}

}  // namespace detail

// ============================================================================
// INI -> ProbeConfig
// ============================================================================

/**
 * @brief Copy recognised keys from @p store into @p cfg.
 *
 * Missing keys keep the current value.
 */
inline expected<void, ConfigError> ApplyConfigStore(const ConfigStore& store,
                                                    ProbeConfig& cfg) {
#define MCPING_CFG_TRY(expr)                \
  do {                                      \
    auto r_ = (expr);                       \
    if (!r_.has_value()) return r_;         \
  } while (0)

  if (store.HasKey("probe", "group"))
    cfg.group = store.GetString("probe", "group");
  if (store.HasKey("probe", "ifname"))
    cfg.ifname = store.GetString("probe", "ifname");
  if (store.HasKey("probe", "port"))
    MCPING_CFG_TRY(detail::AssignUnsigned(
        "probe.port", store.GetString("probe", "port"), 65535U, cfg.port));
  if (store.HasKey("probe", "interval_ms"))
    MCPING_CFG_TRY(detail::AssignUnsigned(
        "probe.interval_ms", store.GetString("probe", "interval_ms"),
        UINT32_MAX, cfg.interval_ms));
  if (store.HasKey("probe", "timeout_ms"))
    MCPING_CFG_TRY(detail::AssignUnsigned(
        "probe.timeout_ms", store.GetString("probe", "timeout_ms"),
        INT32_MAX, cfg.timeout_ms));
  if (store.HasKey("probe", "count"))
    MCPING_CFG_TRY(detail::AssignUnsigned(
        "probe.count", store.GetString("probe", "count"), UINT64_MAX,
        cfg.count));
  if (store.HasKey("probe", "report_ms"))
    MCPING_CFG_TRY(detail::AssignUnsigned(
        "probe.report_ms", store.GetString("probe", "report_ms"),
        UINT32_MAX, cfg.report_ms));

  if (store.HasKey("server", "reply") &&
      !ParseReplyMode(store.GetString("server", "reply"), cfg.reply_mode)) {
    MCPING_LOG_ERROR("config", "invalid value for server.reply: '%s'",
                     store.GetString("server", "reply"));
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  cfg.loopback = store.GetBool("server", "loopback", cfg.loopback);
  if (store.HasKey("server", "workers"))
    MCPING_CFG_TRY(detail::AssignUnsigned("server.workers",
                                          store.GetString("server", "workers"),
                                          UINT32_MAX, cfg.workers));
  if (store.HasKey("server", "queue_depth"))
    MCPING_CFG_TRY(detail::AssignUnsigned(
        "server.queue_depth", store.GetString("server", "queue_depth"),
        UINT32_MAX, cfg.queue_depth));

  if (store.HasKey("log", "level") &&
      !log::ParseLevel(store.GetString("log", "level"), cfg.log_level)) {
    MCPING_LOG_ERROR("config", "invalid value for log.level: '%s'",
                     store.GetString("log", "level"));
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }

#undef MCPING_CFG_TRY
  return expected<void, ConfigError>::success();
}

inline expected<void, ConfigError> LoadConfigFile(const char* path,
                                                  ProbeConfig& cfg) {
  IniConfig ini;
  auto r = ini.LoadFile(path);
  if (!r.has_value()) {
    MCPING_LOG_ERROR("config", "cannot load '%s': %s", path,
                     ToString(r.get_error()));
    return r;
  }
  cfg.config_path = path;
  return ApplyConfigStore(ini, cfg);
}

// ============================================================================
// Command line
// ============================================================================

/** @return The value of -f/--config, or nullptr. */
inline const char* FindConfigPath(int argc, char* argv[]) noexcept {
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::strcmp(argv[i], "-f") == 0 ||
        std::strcmp(argv[i], "--config") == 0) {
      return argv[i + 1];
    }
  }
  return nullptr;
}

/**
 * @brief Apply flags over @p cfg (which may already hold file values).
 */
inline expected<void, ConfigError> ParseCommandLine(int argc, char* argv[],
                                                    ProbeConfig& cfg) {
  auto is = [](const char* arg, const char* s, const char* l) {
    return std::strcmp(arg, s) == 0 || std::strcmp(arg, l) == 0;
  };

  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    const char* next = (i + 1 < argc) ? argv[i + 1] : nullptr;

    if (is(arg, "-h", "--help")) {
      cfg.show_help = true;
      continue;
    }
    if (is(arg, "-s", "--server")) {
      cfg.role = Role::kServer;
      continue;
    }
    if (is(arg, "-v", "--verbose")) {
      cfg.log_level = log::Level::kDebug;
      continue;
    }
    if (std::strcmp(arg, "--no-loop") == 0) {
      cfg.loopback = false;
      continue;
    }

    const bool takes_value =
        is(arg, "-a", "--maddr") || is(arg, "-p", "--port") ||
        is(arg, "-n", "--interval") || is(arg, "-t", "--timeout") ||
        is(arg, "-I", "--ifname") || is(arg, "-c", "--count") ||
        is(arg, "-r", "--report") || is(arg, "-m", "--reply") ||
        is(arg, "-f", "--config");
    if (!takes_value) {
      MCPING_LOG_ERROR("config", "unknown option '%s'", arg);
      return expected<void, ConfigError>::error(ConfigError::kUnknownOption);
    }
    if (next == nullptr) {
      MCPING_LOG_ERROR("config", "option '%s' needs a value", arg);
      return expected<void, ConfigError>::error(ConfigError::kMissingValue);
    }
    ++i;

    expected<void, ConfigError> r = expected<void, ConfigError>::success();
    if (is(arg, "-a", "--maddr")) {
      cfg.group = next;
    } else if (is(arg, "-I", "--ifname")) {
      cfg.ifname = next;
    } else if (is(arg, "-f", "--config")) {
      cfg.config_path = next;
    } else if (is(arg, "-p", "--port")) {
      r = detail::AssignUnsigned("--port", next, 65535U, cfg.port);
    } else if (is(arg, "-n", "--interval")) {
      r = detail::AssignUnsigned("--interval", next, UINT32_MAX,
                                 cfg.interval_ms);
    } else if (is(arg, "-t", "--timeout")) {
      r = detail::AssignUnsigned("--timeout", next, INT32_MAX, cfg.timeout_ms);
    } else if (is(arg, "-c", "--count")) {
      r = detail::AssignUnsigned("--count", next, UINT64_MAX, cfg.count);
    } else if (is(arg, "-r", "--report")) {
      r = detail::AssignUnsigned("--report", next, UINT32_MAX, cfg.report_ms);
    } else if (!ParseReplyMode(next, cfg.reply_mode)) {
      MCPING_LOG_ERROR("config", "invalid value for --reply: '%s'", next);
      r = expected<void, ConfigError>::error(ConfigError::kInvalidValue);
    }
    if (!r.has_value()) {
      return r;
    }
  }
  return expected<void, ConfigError>::success();
}

/** @brief Reject settings that would spin or never fire. */
inline expected<void, ConfigError> Validate(const ProbeConfig& cfg) {
  const char* bad = nullptr;
  if (cfg.interval_ms == 0U) {
    bad = "interval_ms";
  } else if (cfg.timeout_ms <= 0) {
    bad = "timeout_ms";
  } else if (cfg.report_ms == 0U) {
    bad = "report_ms";
  } else if (cfg.workers == 0U) {
    bad = "workers";
  } else if (cfg.queue_depth == 0U) {
    bad = "queue_depth";
  } else if (cfg.group.empty()) {
    bad = "group";
  }
  if (bad != nullptr) {
    MCPING_LOG_ERROR("config", "%s must be non-zero", bad);
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  if (cfg.workers > kMaxWorkerNum) {
    MCPING_LOG_ERROR("config", "workers must be at most %u",
                     static_cast<unsigned>(kMaxWorkerNum));
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  if (cfg.queue_depth > kMaxWorkerQueueDepth) {
    MCPING_LOG_ERROR("config", "queue_depth must be at most %u",
                     static_cast<unsigned>(kMaxWorkerQueueDepth));
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  return expected<void, ConfigError>::success();
}

inline void PrintUsage(const char* prog, FILE* out) {
  (void)std::fprintf(
      out,
      "Usage: %s [options]\n"
      "  -s, --server              run as server (default: client)\n"
      "  -a, --maddr <addr>        multicast group (default %s)\n"
      "  -p, --port <n>            UDP port (default %u)\n"
      "  -n, --interval <ms>       probe interval (default 1000)\n"
      "  -t, --timeout <ms>        receive wait (default 500)\n"
      "  -I, --ifname <name|idx>   outgoing/joining interface\n"
      "  -c, --count <n>           stop after n probes (default 0 = forever)\n"
      "  -r, --report <ms>         report interval (default 5000)\n"
      "  -m, --reply <mode>        server reply: echo|fixed|sequence\n"
      "      --no-loop             disable multicast loopback (server)\n"
      "  -f, --config <file.ini>   load settings before flags\n"
      "  -v, --verbose             debug logging\n"
      "  -h, --help                this text\n",
      prog, kDefaultGroup, static_cast<unsigned>(kDefaultPort));
}

}  // namespace mcping

#endif  // MCPING_CONFIG_HPP_
