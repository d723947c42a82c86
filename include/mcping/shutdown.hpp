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
 * @file shutdown.hpp
 * @brief Signal-driven shutdown: SIGINT/SIGTERM wake a waiting thread which
 *        then runs the registered stop callbacks in LIFO order.
 */

#ifndef MCPING_SHUTDOWN_HPP_
#define MCPING_SHUTDOWN_HPP_

#include "mcping/platform.hpp"
#include "mcping/vocabulary.hpp"

#if MCPING_HAS_NETWORK

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstdint>

namespace mcping {

// ============================================================================
// ShutdownError
// ============================================================================

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

inline const char* ToString(ShutdownError e) noexcept {
  switch (e) {
    case ShutdownError::kCallbacksFull:
      return "callbacks full";
    case ShutdownError::kPipeCreationFailed:
      return "pipe creation failed";
    case ShutdownError::kSignalInstallFailed:
      return "signal install failed";
    case ShutdownError::kAlreadyInstantiated:
      return "already instantiated";
  }
  return "unknown";
}

/// @brief Stop callback. Receives the signal number (0 for Quit()).
using ShutdownFn = void (*)(int signo, void* ctx);

class ShutdownManager;

namespace detail {

/** Exactly one ShutdownManager may be active per process. */
inline ShutdownManager*& GetShutdownInstance() {
  static ShutdownManager* ptr = nullptr;
  return ptr;
}

}  // namespace detail

// ============================================================================
// ShutdownManager
// ============================================================================

/**
 * @brief Wakes WaitForShutdown() from a signal handler through a pipe.
 *
 * Usage:
 * @code
 *   client.Start();
 *   mcping::ShutdownManager mgr;
 *   mgr.Register(&StopClient, &client);
 *   mgr.InstallSignalHandlers();
 *   std::thread waiter([&] { mgr.WaitForShutdown(); });
 *   client.Wait();
 *   mgr.Quit();
 *   waiter.join();
 * @endcode
 */
class ShutdownManager final {
 public:
  explicit ShutdownManager(uint32_t max_callbacks = kMaxCallbacks) noexcept
      : callback_count_(0U),
        max_callbacks_((max_callbacks <= kMaxCallbacks) ? max_callbacks
                                                        : kMaxCallbacks),
        shutdown_flag_(false),
        valid_(false) {
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;

    if (detail::GetShutdownInstance() != nullptr) {
      return;
    }
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    (void)::fcntl(pipe_fd_[0], F_SETFD, FD_CLOEXEC);
    (void)::fcntl(pipe_fd_[1], F_SETFD, FD_CLOEXEC);
    detail::GetShutdownInstance() = this;
    valid_ = true;
  }

  ~ShutdownManager() {
    if (detail::GetShutdownInstance() == this) {
      detail::GetShutdownInstance() = nullptr;
    }
    if (pipe_fd_[0] >= 0) {
      ::close(pipe_fd_[0]);
    }
    if (pipe_fd_[1] >= 0) {
      ::close(pipe_fd_[1]);
    }
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;
  ShutdownManager(ShutdownManager&&) = delete;
  ShutdownManager& operator=(ShutdownManager&&) = delete;

  /** @brief False for a duplicate instance or when the pipe failed. */
  bool IsValid() const noexcept { return valid_; }

  expected<void, ShutdownError> Register(ShutdownFn fn,
                                         void* ctx = nullptr) noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    if (fn == nullptr || callback_count_ >= max_callbacks_) {
      return expected<void, ShutdownError>::error(ShutdownError::kCallbacksFull);
    }
    callbacks_[callback_count_].fn = fn;
    callbacks_[callback_count_].ctx = ctx;
    ++callback_count_;
    return expected<void, ShutdownError>::success();
  }

  /** @brief sigaction(2) for SIGINT and SIGTERM with SA_RESTART. */
  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }

    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    if (::sigaction(SIGINT, &sa, nullptr) != 0 ||
        ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kSignalInstallFailed);
    }
    return expected<void, ShutdownError>::success();
  }

  /** @brief Trigger shutdown without a signal. Only the first call counts. */
  void Quit(int signo = 0) noexcept {
    bool expected_val = false;
    if (shutdown_flag_.compare_exchange_strong(expected_val, true)) {
      signo_.store(signo, std::memory_order_relaxed);
      Wake();
    }
  }

  /**
   * @brief Block until a signal or Quit(), then run callbacks LIFO.
   */
  void WaitForShutdown() noexcept {
    if (pipe_fd_[0] >= 0) {
      uint8_t buf = 0U;
      while (!shutdown_flag_.load(std::memory_order_acquire)) {
        const ssize_t n = ::read(pipe_fd_[0], &buf, 1);
        if (n == 0 || (n < 0 && errno != EINTR)) {
          break;
        }
      }
    }

    const int signo = signo_.load(std::memory_order_relaxed);
    for (uint32_t i = callback_count_; i > 0U; --i) {
      callbacks_[i - 1U].fn(signo, callbacks_[i - 1U].ctx);
    }
  }

  bool IsShutdownRequested() const noexcept {
    return shutdown_flag_.load(std::memory_order_acquire);
  }

  /** @brief Signal that woke the manager, 0 if Quit() or still waiting. */
  int Signal() const noexcept { return signo_.load(std::memory_order_relaxed); }

 private:
  static constexpr uint32_t kMaxCallbacks = 16U;

  struct Entry {
    ShutdownFn fn{nullptr};
    void* ctx{nullptr};
  };

  void Wake() noexcept {
    if (pipe_fd_[1] >= 0) {
      const uint8_t byte = 1U;
      (void)::write(pipe_fd_[1], &byte, 1);
    }
  }

  /** Async-signal-safe: atomic stores and one write(2). */
  static void SignalHandler(int signo) {
    ShutdownManager* self = detail::GetShutdownInstance();
    if (self != nullptr) {
      bool expected_val = false;
      if (self->shutdown_flag_.compare_exchange_strong(expected_val, true)) {
        self->signo_.store(signo, std::memory_order_relaxed);
      }
      self->Wake();
    }
  }

  Entry callbacks_[kMaxCallbacks];
  uint32_t callback_count_;
  uint32_t max_callbacks_;
  std::atomic<bool> shutdown_flag_;
  int pipe_fd_[2];
  std::atomic<int> signo_{0};
  bool valid_;
};

}  // namespace mcping

#endif  // MCPING_HAS_NETWORK

#endif  // MCPING_SHUTDOWN_HPP_
