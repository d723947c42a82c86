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
 * @file stats.hpp
 * @brief Probe statistics shared by the client's sender, receiver and
 *        reporter threads.
 *
 * total_sent is a lock-free counter (only the sender writes it).
 * total_received and the per-peer table change together under one mutex so
 * any snapshot satisfies total_received == sum(per_peer). The mutex is held
 * only for the increment, never across I/O.
 */

#ifndef MCPING_STATS_HPP_
#define MCPING_STATS_HPP_

#include "mcping/platform.hpp"

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <map>
#include <mutex>
#include <string>

namespace mcping {

/** @brief Point-in-time copy of the counters. */
struct StatsSnapshot {
  uint64_t total_sent{0U};
  uint64_t total_received{0U};
  std::map<std::string, uint64_t> per_peer;
};

class StatsAggregator {
 public:
  StatsAggregator() = default;

  StatsAggregator(const StatsAggregator&) = delete;
  StatsAggregator& operator=(const StatsAggregator&) = delete;

  /** @brief Count one successfully sent probe. */
  void RecordSent() noexcept {
    total_sent_.fetch_add(1U, std::memory_order_relaxed);
  }

  /** @brief Count one reply attributed to @p peer. */
  void RecordReply(const std::string& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_received_;
    ++per_peer_[peer];
  }

  uint64_t TotalSent() const noexcept {
    return total_sent_.load(std::memory_order_relaxed);
  }

  uint64_t TotalReceived() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_received_;
  }

  StatsSnapshot Snapshot() const {
    StatsSnapshot snap;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      snap.total_received = total_received_;
      snap.per_peer = per_peer_;
    }
    snap.total_sent = total_sent_.load(std::memory_order_relaxed);
    return snap;
  }

  void Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    total_received_ = 0U;
    per_peer_.clear();
    total_sent_.store(0U, std::memory_order_relaxed);
  }

 private:
  alignas(kCacheLineSize) std::atomic<uint64_t> total_sent_{0U};
  mutable std::mutex mutex_;
  uint64_t total_received_{0U};
  std::map<std::string, uint64_t> per_peer_;
};

// ============================================================================
// Report helpers
// ============================================================================

/** @brief received / max(sent, 1) * 100. */
inline double SuccessRate(const StatsSnapshot& snap) noexcept {
  const uint64_t denom = (snap.total_sent == 0U) ? 1U : snap.total_sent;
  return static_cast<double>(snap.total_received) * 100.0 /
         static_cast<double>(denom);
}

/**
 * @brief A peer's replies as a share of all probes sent.
 *
 * Several peers can answer the same probe, so shares may sum past 100%.
 */
inline double PeerShare(const StatsSnapshot& snap, uint64_t replies) noexcept {
  const uint64_t denom = (snap.total_sent == 0U) ? 1U : snap.total_sent;
  return static_cast<double>(replies) * 100.0 / static_cast<double>(denom);
}

/**
 * @brief Print the summary line and one line per peer.
 *
 *   <prefix>sent=10 recv=9 success=90.00%
 *     peer [fe80::1]:3000 replies=9 share=90.00%
 */
inline void FormatReport(const StatsSnapshot& snap, const char* prefix,
                         FILE* out) {
  (void)std::fprintf(out, "%ssent=%llu recv=%llu success=%.2f%%\n",
                     (prefix != nullptr) ? prefix : "",
                     static_cast<unsigned long long>(snap.total_sent),
                     static_cast<unsigned long long>(snap.total_received),
                     SuccessRate(snap));
  for (const auto& kv : snap.per_peer) {
    (void)std::fprintf(out, "  peer %s replies=%llu share=%.2f%%\n",
                       kv.first.c_str(),
                       static_cast<unsigned long long>(kv.second),
                       PeerShare(snap, kv.second));
  }
  (void)std::fflush(out);
}

}  // namespace mcping

#endif  // MCPING_STATS_HPP_
