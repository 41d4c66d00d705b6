/**
 * @file log.hpp
 * @brief Leveled printf-style logging to stderr.
 *
 * Each record is formatted into a stack buffer and written with a single
 * fwrite, so lines from concurrent threads do not interleave.
 *
 * Usage:
 * @code
 *   forge::log::SetLevel(forge::log::Level::kInfo);
 *   FORGE_LOG_INFO("Supervisor", "reset ok, %u components", count);
 * @endcode
 */

#ifndef FORGE_LOG_HPP_
#define FORGE_LOG_HPP_

#include "forge/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>

#include <strings.h>
#include <sys/time.h>

namespace forge {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo,
  kWarn,
  kError,
  kFatal,
  kOff
};

#ifndef FORGE_LOG_LINE_SIZE
#define FORGE_LOG_LINE_SIZE 512U
#endif

namespace detail {

#ifdef NDEBUG
inline constexpr Level kDefaultLevel = Level::kInfo;
#else
inline constexpr Level kDefaultLevel = Level::kDebug;
#endif

inline std::atomic<uint8_t>& LevelRef() noexcept {
  static std::atomic<uint8_t> level{static_cast<uint8_t>(kDefaultLevel)};
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline const char* LevelName(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "OFF";
  }
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::LevelRef().store(static_cast<uint8_t>(level),
                           std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::LevelRef().load(std::memory_order_relaxed));
}

inline bool IsEnabled(Level level) noexcept {
  return level != Level::kOff &&
         static_cast<uint8_t>(level) >=
             detail::LevelRef().load(std::memory_order_relaxed);
}

/// Marks the logger ready. Logging works without it; programs call it once
/// at startup so that buffered stderr is switched to line buffering.
inline void Init() noexcept {
  (void)std::setvbuf(stderr, nullptr, _IOLBF, 0);
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
 * @brief Parse a level name ("debug", "INFO", "warn", ...).
 * @return The parsed level, or @p fallback when @p name is unknown.
 */
inline Level ParseLevel(const char* name, Level fallback = Level::kInfo) noexcept {
  if (name == nullptr) return fallback;
  static constexpr const char* kNames[] = {"debug", "info", "warn",
                                           "error", "fatal", "off"};
  for (uint8_t i = 0; i < 6U; ++i) {
    if (::strcasecmp(name, kNames[i]) == 0) return static_cast<Level>(i);
  }
  if (::strcasecmp(name, "warning") == 0) return Level::kWarn;
  return fallback;
}

inline void LogWrite(Level level, const char* tag, const char* file, int line,
                     const char* fmt, ...) FORGE_PRINTF_LIKE(5, 6);

inline void LogWrite(Level level, const char* tag, const char* file, int line,
                     const char* fmt, ...) {
  // kFatal is written and aborts at every level, kOff included.
  if (level != Level::kFatal && !IsEnabled(level)) return;

  char buf[FORGE_LOG_LINE_SIZE];
  struct timeval tv;
  ::gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  time_t secs = tv.tv_sec;
  ::localtime_r(&secs, &tm_buf);

  int n = std::snprintf(buf, sizeof(buf),
                        "[%04d-%02d-%02d %02d:%02d:%02d.%03ld] [%s] [%s] ",
                        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1,
                        tm_buf.tm_mday, tm_buf.tm_hour, tm_buf.tm_min,
                        tm_buf.tm_sec, static_cast<long>(tv.tv_usec / 1000),
                        detail::LevelName(level), tag != nullptr ? tag : "-");
  if (n < 0) return;
  size_t len = (static_cast<size_t>(n) < sizeof(buf)) ? static_cast<size_t>(n)
                                                       : sizeof(buf) - 1U;

  va_list args;
  va_start(args, fmt);
  int m = std::vsnprintf(buf + len, sizeof(buf) - len, fmt, args);
  va_end(args);
  if (m > 0) {
    len += static_cast<size_t>(m);
    if (len > sizeof(buf) - 2U) len = sizeof(buf) - 2U;
  }

  if (level >= Level::kError && file != nullptr) {
    int k = std::snprintf(buf + len, sizeof(buf) - len, " (%s:%d)", file, line);
    if (k > 0) {
      len += static_cast<size_t>(k);
      if (len > sizeof(buf) - 2U) len = sizeof(buf) - 2U;
    }
  }

  buf[len++] = '\n';
  (void)std::fwrite(buf, 1, len, stderr);

  if (level == Level::kFatal) {
    (void)std::fflush(stderr);
    std::abort();
  }
}

}  // namespace log
}  // namespace forge

// ============================================================================
// Logging macros
// ============================================================================

#define FORGE_LOG_DEBUG(tag, ...) \
  ::forge::log::LogWrite(::forge::log::Level::kDebug, tag, __FILE__, __LINE__, __VA_ARGS__)
#define FORGE_LOG_INFO(tag, ...) \
  ::forge::log::LogWrite(::forge::log::Level::kInfo, tag, __FILE__, __LINE__, __VA_ARGS__)
#define FORGE_LOG_WARN(tag, ...) \
  ::forge::log::LogWrite(::forge::log::Level::kWarn, tag, __FILE__, __LINE__, __VA_ARGS__)
#define FORGE_LOG_ERROR(tag, ...) \
  ::forge::log::LogWrite(::forge::log::Level::kError, tag, __FILE__, __LINE__, __VA_ARGS__)
#define FORGE_LOG_FATAL(tag, ...) \
  ::forge::log::LogWrite(::forge::log::Level::kFatal, tag, __FILE__, __LINE__, __VA_ARGS__)

#endif  // FORGE_LOG_HPP_
