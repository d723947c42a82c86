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
 * @file log.hpp
 * @brief Lightweight synchronous logger with printf-style macros.
 *
 * Each record is formatted into a stack buffer and emitted with a single
 * fprintf(stderr) call, so lines from concurrent threads do not interleave.
 *
 * Output format (release):
 *   [2026-01-01 12:00:00.123] [INFO] [client] sent probe 3
 * Debug builds append "(file:line)".
 *
 * Two filters apply:
 *   - MCPING_LOG_MIN_LEVEL (compile time, 0=DEBUG .. 3=ERROR)
 *   - log::SetLevel()      (run time)
 */

#ifndef MCPING_LOG_HPP_
#define MCPING_LOG_HPP_

#include "mcping/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#if defined(MCPING_PLATFORM_LINUX) || defined(MCPING_PLATFORM_MACOS)
#include <time.h>
#endif

#ifndef MCPING_LOG_MIN_LEVEL
#define MCPING_LOG_MIN_LEVEL 0
#endif

#ifndef MCPING_LOG_LINE_SIZE
#define MCPING_LOG_LINE_SIZE 512U
#endif

namespace mcping {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo,
  kWarn,
  kError,
  kFatal,
  kOff,
};

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    case Level::kOff:   return "OFF";
  }
  return "?";
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

inline void FormatTimestamp(char* buf, size_t size) noexcept {
#if defined(MCPING_PLATFORM_LINUX) || defined(MCPING_PLATFORM_MACOS)
  struct timespec ts;
  ::clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_buf;
  ::localtime_r(&ts.tv_sec, &tm_buf);
  char date[32];
  (void)std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf, size, "%s.%03ld", date, ts.tv_nsec / 1000000L);
#else
  (void)std::snprintf(buf, size, "-");
#endif
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/** @brief Mark the logger as initialized and optionally set the level. */
inline void Init(Level level = GetLevel()) noexcept {
  SetLevel(level);
  detail::InitializedRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

/**
 * @brief Parse a level name (case-insensitive, e.g. "info", "WARN").
 * @return true and writes @p out when the name is recognised.
 */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  char lower[8] = {};
  size_t i = 0;
  for (; name[i] != '\0' && i < sizeof(lower) - 1U; ++i) {
    char c = name[i];
    lower[i] = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
  }
  if (name[i] != '\0') return false;

  if (std::strcmp(lower, "debug") == 0) { out = Level::kDebug; return true; }
  if (std::strcmp(lower, "info") == 0)  { out = Level::kInfo;  return true; }
  if (std::strcmp(lower, "warn") == 0 ||
      std::strcmp(lower, "warning") == 0) { out = Level::kWarn; return true; }
  if (std::strcmp(lower, "error") == 0) { out = Level::kError; return true; }
  if (std::strcmp(lower, "fatal") == 0) { out = Level::kFatal; return true; }
  if (std::strcmp(lower, "off") == 0)   { out = Level::kOff;   return true; }
  return false;
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) <
      static_cast<uint8_t>(detail::LogLevelRef().load(
          std::memory_order_relaxed))) {
    return;
  }

  char msg[MCPING_LOG_LINE_SIZE];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char ts[48];
  detail::FormatTimestamp(ts, sizeof(ts));

#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
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
}  // namespace mcping

// ============================================================================
// Macros
// ============================================================================

#define MCPING_LOG_DEBUG(cat, fmt, ...)                                    \
  do {                                                                     \
    if (MCPING_LOG_MIN_LEVEL <= 0) {                                       \
      ::mcping::log::LogWrite(::mcping::log::Level::kDebug, cat, __FILE__, \
                              __LINE__, fmt, ##__VA_ARGS__);               \
    }                                                                      \
  } while (0)

#define MCPING_LOG_INFO(cat, fmt, ...)                                    \
  do {                                                                    \
    if (MCPING_LOG_MIN_LEVEL <= 1) {                                      \
      ::mcping::log::LogWrite(::mcping::log::Level::kInfo, cat, __FILE__, \
                              __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                     \
  } while (0)

#define MCPING_LOG_WARN(cat, fmt, ...)                                    \
  do {                                                                    \
    if (MCPING_LOG_MIN_LEVEL <= 2) {                                      \
      ::mcping::log::LogWrite(::mcping::log::Level::kWarn, cat, __FILE__, \
                              __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                     \
  } while (0)

#define MCPING_LOG_ERROR(cat, fmt, ...)                                    \
  do {                                                                     \
    if (MCPING_LOG_MIN_LEVEL <= 3) {                                       \
      ::mcping::log::LogWrite(::mcping::log::Level::kError, cat, __FILE__, \
                              __LINE__, fmt, ##__VA_ARGS__);               \
    }                                                                      \
  } while (0)

#endif  // MCPING_LOG_HPP_
