/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and assertion macros.
 */

#ifndef FORGE_PLATFORM_HPP_
#define FORGE_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace forge {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define FORGE_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define FORGE_PLATFORM_MACOS 1
#endif

#if defined(FORGE_PLATFORM_LINUX) || defined(FORGE_PLATFORM_MACOS)
#define FORGE_PLATFORM_POSIX 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define FORGE_LIKELY(x) __builtin_expect(!!(x), 1)
#define FORGE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define FORGE_PRINTF_LIKE(fmt_idx, arg_idx) \
  __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define FORGE_LIKELY(x) (x)
#define FORGE_UNLIKELY(x) (x)
#define FORGE_PRINTF_LIKE(fmt_idx, arg_idx)
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "FORGE_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define FORGE_ASSERT(cond) ((void)0)
#else
#define FORGE_ASSERT(cond) \
  ((cond) ? ((void)0) : ::forge::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace forge

#endif  // FORGE_PLATFORM_HPP_
