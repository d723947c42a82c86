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
 * @file server.hpp
 * @brief ProbeServer - answers every multicast probe with a unicast reply.
 *
 * Listening -> Replying -> Listening. The receive thread never sends; replies
 * are handed to a bounded WorkerPool whose threads send them back to the
 * exact source address. A full pool drops the reply and counts it.
 *
 * Usage:
 *   auto ep = mcping::Endpoint::BindServer(3000, group, iface);
 *   mcping::ProbeServer server(ep.value());
 *   server.Start();
 *   ...
 *   server.Stop();
 */

#ifndef MCPING_SERVER_HPP_
#define MCPING_SERVER_HPP_

#include "mcping/platform.hpp"

#include <cstdint>
#include <cstring>

namespace mcping {

// ============================================================================
// ReplyMode
// ============================================================================

enum class ReplyMode : uint8_t {
  kEcho = 0,  ///< "ACK:" + original payload
  kFixed,     ///< "ACK"
  kSequence   ///< "RESPONSE:<n>", n counts replies from 1
};

inline const char* ToString(ReplyMode m) noexcept {
  switch (m) {
    case ReplyMode::kEcho:
      return "echo";
    case ReplyMode::kFixed:
      return "fixed";
    case ReplyMode::kSequence:
      return "sequence";
  }
  return "unknown";
}

/** @return false if @p name is not one of echo, fixed, sequence. */
inline bool ParseReplyMode(const char* name, ReplyMode& out) noexcept {
  if (name == nullptr) {
    return false;
  }
  if (std::strcmp(name, "echo") == 0) {
    out = ReplyMode::kEcho;
  } else if (std::strcmp(name, "fixed") == 0) {
    out = ReplyMode::kFixed;
  } else if (std::strcmp(name, "sequence") == 0) {
    out = ReplyMode::kSequence;
  } else {
    return false;
  }
  return true;
}

}  // namespace mcping

#if MCPING_HAS_NETWORK

#include "mcping/endpoint.hpp"
#include "mcping/log.hpp"
#include "mcping/worker_pool.hpp"

#include <atomic>
#include <cstdio>
#include <string>
#include <thread>

namespace mcping {

static constexpr char kEchoPrefix[] = "ACK:";
static constexpr size_t kEchoPrefixLen = sizeof(kEchoPrefix) - 1U;
static constexpr size_t kMaxReplySize = kMaxDatagramSize + kEchoPrefixLen;

/**
 * @brief Render the reply for one received payload.
 *
 * @param seq Reply counter value, used by kSequence only.
 * @return Number of bytes written to @p out (never more than @p out_size).
 */
inline size_t BuildReply(ReplyMode mode, const char* payload, size_t len,
                         uint64_t seq, char* out, size_t out_size) noexcept {
  switch (mode) {
    case ReplyMode::kFixed: {
      const size_t n = (out_size < 3U) ? out_size : 3U;
      std::memcpy(out, "ACK", n);
      return n;
    }
    case ReplyMode::kSequence: {
      const int n = std::snprintf(out, out_size, "RESPONSE:%llu",
                                  static_cast<unsigned long long>(seq));
      if (n < 0) {
        return 0U;
      }
      return (static_cast<size_t>(n) < out_size) ? static_cast<size_t>(n)
                                                 : out_size - 1U;
    }
    case ReplyMode::kEcho:
    default:
      break;
  }
  if (out_size < kEchoPrefixLen) {
    return 0U;
  }
  std::memcpy(out, kEchoPrefix, kEchoPrefixLen);
  const size_t room = out_size - kEchoPrefixLen;
  const size_t body = (len < room) ? len : room;
  if (body > 0U) {
    std::memcpy(out + kEchoPrefixLen, payload, body);
  }
  return kEchoPrefixLen + body;
}

// ============================================================================
// Options / Stats
// ============================================================================

struct ServerOptions {
  ReplyMode reply_mode{ReplyMode::kEcho};
  /** Receive poll interval; bounds how long Stop() waits for the loop. */
  int32_t poll_ms{200};
  uint32_t reply_workers{2U};
  uint32_t reply_queue_depth{kDefaultWorkerQueueDepth};
};

struct ServerStats {
  uint64_t received{0U};
  uint64_t replies_sent{0U};
  uint64_t reply_failures{0U};
  uint64_t replies_dropped{0U};
  uint64_t recv_errors{0U};
};

// ============================================================================
// ProbeServer
// ============================================================================

class ProbeServer {
 public:
  explicit ProbeServer(Endpoint& endpoint,
                       const ServerOptions& opts = ServerOptions()) noexcept
      : endpoint_(endpoint),
        opts_(opts),
        pool_(MakePoolConfig(opts), &ProbeServer::SendReply, this) {}

  ~ProbeServer() { Stop(); }

  ProbeServer(const ProbeServer&) = delete;
  ProbeServer& operator=(const ProbeServer&) = delete;

  /**
   * @brief Serve on the calling thread until Stop().
   *
   * Pending replies are drained before returning.
   */
  void Run() {
    running_.store(true, std::memory_order_release);
    pool_.Start();

    char buf[kMaxDatagramSize];
    SocketAddress src;
    while (!stop_.load(std::memory_order_acquire)) {
      auto r = endpoint_.Receive(buf, sizeof(buf), src, opts_.poll_ms);
      if (!r.has_value()) {
        if (r.get_error() != SocketError::kTimeout) {
          recv_errors_.fetch_add(1U, std::memory_order_relaxed);
          MCPING_LOG_WARN("server", "receive failed: %s",
                          ToString(r.get_error()));
        }
        continue;
      }
      HandleDatagram(buf, static_cast<size_t>(r.value()), src);
    }

    pool_.Shutdown();
    running_.store(false, std::memory_order_release);
  }

  /** @brief Run() on an owned thread. */
  void Start() {
    if (thread_.joinable()) {
      return;
    }
    stop_.store(false, std::memory_order_release);
    thread_ = std::thread([this]() { Run(); });
  }

  /** @brief Ask the loop to exit; joins the owned thread if any. */
  void Stop() {
    stop_.store(true, std::memory_order_release);
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
      thread_.join();
    }
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  ServerStats GetStats() const noexcept {
    ServerStats s;
    s.received = received_.load(std::memory_order_relaxed);
    s.replies_sent = replies_sent_.load(std::memory_order_relaxed);
    s.reply_failures = reply_failures_.load(std::memory_order_relaxed);
    s.replies_dropped = pool_.GetStats().rejected;
    s.recv_errors = recv_errors_.load(std::memory_order_relaxed);
    return s;
  }

 private:
  struct ReplyJob {
    SocketAddress dest;
    uint32_t len{0U};
    char data[kMaxReplySize];
  };

  static WorkerPoolConfig MakePoolConfig(const ServerOptions& opts) noexcept {
    WorkerPoolConfig cfg;
    cfg.worker_num = opts.reply_workers;
    cfg.queue_depth = opts.reply_queue_depth;
    return cfg;
  }

  void HandleDatagram(const char* buf, size_t len, const SocketAddress& src) {
    received_.fetch_add(1U, std::memory_order_relaxed);
    const std::string peer = src.ToString();
    MCPING_LOG_INFO("server", "received %zu bytes from %s", len,
                    peer.c_str());

    ReplyJob job;
    job.dest = src;
    job.len = static_cast<uint32_t>(BuildReply(
        opts_.reply_mode, buf, len, ++reply_seq_, job.data, sizeof(job.data)));

    if (!pool_.Submit(static_cast<ReplyJob&&>(job))) {
      MCPING_LOG_WARN("server", "reply queue full, dropped reply to %s",
                      peer.c_str());
    }
  }

  static void SendReply(ReplyJob& job, void* ctx) {
    auto* self = static_cast<ProbeServer*>(ctx);
    auto r = self->endpoint_.Send(job.data, job.len, job.dest);
    if (r.has_value()) {
      self->replies_sent_.fetch_add(1U, std::memory_order_relaxed);
      return;
    }
    self->reply_failures_.fetch_add(1U, std::memory_order_relaxed);
    MCPING_LOG_WARN("server", "failed to send reply to %s: %s",
                    job.dest.ToString().c_str(), ToString(r.get_error()));
  }

  Endpoint& endpoint_;
  ServerOptions opts_;
  WorkerPool<ReplyJob> pool_;
  std::thread thread_;

  std::atomic<bool> stop_{false};
  std::atomic<bool> running_{false};
  uint64_t reply_seq_{0U};  ///< Receive thread only.

  std::atomic<uint64_t> received_{0U};
  std::atomic<uint64_t> replies_sent_{0U};
  std::atomic<uint64_t> reply_failures_{0U};
  std::atomic<uint64_t> recv_errors_{0U};
};

}  // namespace mcping

#endif  // MCPING_HAS_NETWORK

#endif  // MCPING_SERVER_HPP_
