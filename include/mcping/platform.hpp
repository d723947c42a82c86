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
 * @file platform.hpp
 * @brief Platform detection and assertion macro.
 */

#ifndef MCPING_PLATFORM_HPP_
#define MCPING_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace mcping {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define MCPING_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define MCPING_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define MCPING_PLATFORM_WINDOWS 1
#endif

// POSIX socket layer (socket.hpp and everything built on it) is available on
// Linux/macOS. Windows builds get the address and interface helpers only.
#ifndef MCPING_HAS_NETWORK
#if defined(MCPING_PLATFORM_LINUX) || defined(MCPING_PLATFORM_MACOS)
#define MCPING_HAS_NETWORK 1
#else
#define MCPING_HAS_NETWORK 0
#endif
#endif

// ============================================================================
// Cache Line Size
// ============================================================================

static constexpr size_t kCacheLineSize = 64;

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
  (void)std::fprintf(stderr, "MCPING_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define MCPING_ASSERT(cond) ((void)0)
#else
#define MCPING_ASSERT(cond) \
  ((cond) ? ((void)0) : ::mcping::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace mcping

#endif  // MCPING_PLATFORM_HPP_
