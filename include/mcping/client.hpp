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
 * @file client.hpp
 * @brief ProbeClient - periodic multicast probes and reply accounting.
 *
 * Three threads share one Endpoint and one StatsAggregator:
 *   sender   : "PING <seq>" every interval_ms to the group
 *   receiver : counts every datagram per source address
 *   reporter : prints a snapshot every report_interval_ms
 */

#ifndef MCPING_CLIENT_HPP_
#define MCPING_CLIENT_HPP_

#include "mcping/platform.hpp"

#if MCPING_HAS_NETWORK

#include "mcping/endpoint.hpp"
#include "mcping/log.hpp"
#include "mcping/stats.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <thread>

namespace mcping {

struct ClientOptions {
  uint32_t interval_ms{1000U};
  /** Receive poll timeout, also the linger time after a counted run. */
  int32_t timeout_ms{500};
  uint32_t report_interval_ms{5000U};
  /** Stop sending after this many attempts; 0 = unlimited. */
  uint64_t count{0U};
  FILE* out{stdout};
};

/** @return Bytes written, excluding the terminator. */
inline size_t FormatProbe(uint64_t seq, char* out, size_t out_size) noexcept {
  const int n = std::snprintf(out, out_size, "PING %llu",
                              static_cast<unsigned long long>(seq));
  if (n < 0 || out_size == 0U) {
    return 0U;
  }
  return (static_cast<size_t>(n) < out_size) ? static_cast<size_t>(n)
                                             : out_size - 1U;
}

class ProbeClient {
 public:
  ProbeClient(Endpoint& endpoint, const SocketAddress& dest,
              StatsAggregator& stats,
              const ClientOptions& opts = ClientOptions()) noexcept
      : endpoint_(endpoint), dest_(dest), stats_(stats), opts_(opts) {}

  ~ProbeClient() { Stop(); }

  ProbeClient(const ProbeClient&) = delete;
  ProbeClient& operator=(const ProbeClient&) = delete;

  void Start() {
    std::lock_guard<std::mutex> join_lock(join_mtx_);
    if (sender_.joinable()) {
      return;
    }
    {
      std::lock_guard<std::mutex> lk(mtx_);
      stop_.store(false, std::memory_order_release);
      sender_done_ = false;
    }
    MCPING_LOG_DEBUG("client", "sending to %s every %u ms, timeout %d ms",
                    dest_.ToString().c_str(), opts_.interval_ms,
                    opts_.timeout_ms);
    receiver_ = std::thread([this]() { ReceiverLoop(); });
    reporter_ = std::thread([this]() { ReporterLoop(); });
    sender_ = std::thread([this]() { SenderLoop(); });
  }

  /** @brief End all loops and join them. Safe from any thread. */
  void Stop() {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      stop_.store(true, std::memory_order_release);
    }
    cv_.notify_all();

    std::lock_guard<std::mutex> join_lock(join_mtx_);
    if (sender_.joinable()) {
      sender_.join();
    }
    if (receiver_.joinable()) {
      receiver_.join();
    }
    if (reporter_.joinable()) {
      reporter_.join();
    }
  }

  /**
   * @brief Block until the probe count is reached or Stop() is called.
   *
   * After a counted run, late replies are collected for timeout_ms before
   * all loops are stopped.
   */
  void Wait() {
    bool counted = false;
    {
      std::unique_lock<std::mutex> lk(mtx_);
      cv_.wait(lk, [this]() { return sender_done_ || IsStopRequested(); });
      counted = !IsStopRequested();
      if (counted && opts_.timeout_ms > 0) {
        cv_.wait_for(lk, std::chrono::milliseconds(opts_.timeout_ms),
                     [this]() { return IsStopRequested(); });
      }
    }
    Stop();
  }

  /** @brief Print "FINAL: ..." from a snapshot copy. */
  void PrintFinal() const {
    FormatReport(stats_.Snapshot(), "FINAL: ", opts_.out);
  }

  uint64_t Sequence() const noexcept {
    return seq_.load(std::memory_order_relaxed);
  }

  bool IsStopRequested() const noexcept {
    return stop_.load(std::memory_order_acquire);
  }

 private:
  void SenderLoop() {
    char payload[64];
    const auto interval = std::chrono::milliseconds(opts_.interval_ms);
    auto next = std::chrono::steady_clock::now();

    while (!IsStopRequested()) {
      if (opts_.count > 0U &&
          seq_.load(std::memory_order_relaxed) >= opts_.count) {
        break;
      }
      const uint64_t seq = seq_.fetch_add(1U, std::memory_order_relaxed) + 1U;
      const size_t len = FormatProbe(seq, payload, sizeof(payload));
      auto r = endpoint_.Send(payload, len, dest_);
      if (r.has_value()) {
        stats_.RecordSent();
      } else {
        MCPING_LOG_WARN("client", "failed to send ping %llu: %s",
                        static_cast<unsigned long long>(seq),
                        ToString(r.get_error()));
      }

      if (opts_.count > 0U && seq >= opts_.count) {
        break;
      }
      next += interval;
      std::unique_lock<std::mutex> lk(mtx_);
      cv_.wait_until(lk, next, [this]() { return IsStopRequested(); });
    }

    {
      std::lock_guard<std::mutex> lk(mtx_);
      sender_done_ = true;
    }
    cv_.notify_all();
  }

  void ReceiverLoop() {
    char buf[kMaxDatagramSize];
    SocketAddress src;
    const int32_t poll_ms = (opts_.timeout_ms > 0) ? opts_.timeout_ms : 500;

    while (!IsStopRequested()) {
      auto r = endpoint_.Receive(buf, sizeof(buf), src, poll_ms);
      if (!r.has_value()) {
        if (r.get_error() != SocketError::kTimeout) {
          MCPING_LOG_DEBUG("client", "recv error: %s", ToString(r.get_error()));
        }
        continue;
      }
      const std::string peer = src.ToString();
      stats_.RecordReply(peer);
      MCPING_LOG_INFO("client", "got %d bytes from %s", r.value(),
                      peer.c_str());
      MCPING_LOG_DEBUG("client", "payload: %.*s", r.value(), buf);
    }
  }

  void ReporterLoop() {
    const auto period = std::chrono::milliseconds(opts_.report_interval_ms);
    std::unique_lock<std::mutex> lk(mtx_);
    while (!IsStopRequested()) {
      if (cv_.wait_for(lk, period, [this]() { return IsStopRequested(); })) {
        break;
      }
      lk.unlock();
      FormatReport(stats_.Snapshot(), "", opts_.out);
      lk.lock();
    }
  }

  Endpoint& endpoint_;
  SocketAddress dest_;
  StatsAggregator& stats_;
  ClientOptions opts_;

  std::mutex mtx_;
  std::condition_variable cv_;
  std::atomic<bool> stop_{false};
  bool sender_done_{false};  ///< Guarded by mtx_.
  std::atomic<uint64_t> seq_{0U};

  std::mutex join_mtx_;
  std::thread sender_;
  std::thread receiver_;
  std::thread reporter_;
};

}  // namespace mcping

#endif  // MCPING_HAS_NETWORK

#endif  // MCPING_CLIENT_HPP_
