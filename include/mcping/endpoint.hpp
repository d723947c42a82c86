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
 * @file endpoint.hpp
 * @brief Bound IPv6 datagram endpoint used by the probe server and client.
 *
 * An Endpoint owns exactly one UDP socket for the life of the process:
 *   - BindServer(): wildcard + fixed port, address/port reuse, joined to one
 *     multicast group on one interface.
 *   - BindClient(): wildcard + ephemeral port, optional outbound multicast
 *     interface.
 *   - BindUnicast(): wildcard + given port, no group membership.
 *
 * Send() and Receive() only issue syscalls on the descriptor and never touch
 * member state, so a sender thread and a receiver thread may share one
 * Endpoint without extra locking.
 */

#ifndef MCPING_ENDPOINT_HPP_
#define MCPING_ENDPOINT_HPP_

#include "mcping/address.hpp"
#include "mcping/log.hpp"
#include "mcping/socket.hpp"

#if MCPING_HAS_NETWORK

#include <cerrno>
#include <cstring>

namespace mcping {

/** @brief Largest UDP payload the engine reads in one call. */
constexpr size_t kMaxDatagramSize = 1500U;

class Endpoint {
 public:
  Endpoint() noexcept = default;

  ~Endpoint() {
    if (joined_) {
      (void)LeaveGroup();
    }
  }

  Endpoint(Endpoint&& other) noexcept
      : sock_(static_cast<UdpSocket&&>(other.sock_)),
        group_(other.group_),
        iface_(other.iface_),
        joined_(other.joined_) {
    other.joined_ = false;
  }

  Endpoint& operator=(Endpoint&& other) noexcept {
    if (this != &other) {
      if (joined_) {
        (void)LeaveGroup();
      }
      sock_ = static_cast<UdpSocket&&>(other.sock_);
      group_ = other.group_;
      iface_ = other.iface_;
      joined_ = other.joined_;
      other.joined_ = false;
    }
    return *this;
  }

  Endpoint(const Endpoint&) = delete;
  Endpoint& operator=(const Endpoint&) = delete;

  // Factories ---------------------------------------------------------------

  /**
   * @brief Bind the listening endpoint of a probe server.
   *
   * @param port     Fixed port to bind on the IPv6 wildcard address.
   * @param group    Multicast group to join.
   * @param iface    Interface for the membership (default: OS choice).
   * @param loopback Enable IPV6_MULTICAST_LOOP.
   * @return Endpoint, or kInvalidFd / kSetOptFailed / kBindFailed / kJoinFailed.
   */
  static expected<Endpoint, SocketError> BindServer(
      uint16_t port, const GroupAddress& group, InterfaceRef iface,
      bool loopback = true) noexcept {
    auto created = Open();
    if (!created.has_value()) {
      return created;
    }
    Endpoint ep = static_cast<Endpoint&&>(created.value());

    // Several listeners may share the multicast port on one host.
    auto r = ep.sock_.SetReuseAddr(true);
    if (r.has_value()) {
      r = ep.sock_.SetReusePort(true);
    }
    if (!r.has_value()) {
      MCPING_LOG_ERROR("endpoint", "enable address reuse: %s",
                       std::strerror(errno));
      return expected<Endpoint, SocketError>::error(r.get_error());
    }

    r = ep.sock_.Bind(SocketAddress::Any(port));
    if (!r.has_value()) {
      MCPING_LOG_ERROR("endpoint", "bind [::]:%u: %s",
                       static_cast<unsigned>(port), std::strerror(errno));
      return expected<Endpoint, SocketError>::error(r.get_error());
    }

    r = ep.sock_.JoinGroup(group.Raw(), iface.Index());
    if (!r.has_value()) {
      MCPING_LOG_ERROR("endpoint", "join %s on if_index=%u: %s",
                       group.ToString().c_str(), iface.Index(),
                       std::strerror(errno));
      return expected<Endpoint, SocketError>::error(r.get_error());
    }
    ep.group_ = group;
    ep.iface_ = iface;
    ep.joined_ = true;

    r = ep.sock_.SetMulticastLoop(loopback);
    if (!r.has_value()) {
      // Loopback only matters for same-host observation.
      MCPING_LOG_WARN("endpoint", "set multicast loopback: %s",
                      std::strerror(errno));
    }

    MCPING_LOG_INFO("endpoint", "joined %s on port %u (if_index=%u)",
                    group.ToString().c_str(),
                    static_cast<unsigned>(ep.LocalPort()), iface.Index());
    return expected<Endpoint, SocketError>::success(
        static_cast<Endpoint&&>(ep));
  }

  /**
   * @brief Bind a client endpoint on an ephemeral port.
   *
   * A non-default @p iface becomes the outbound multicast interface.
   */
  static expected<Endpoint, SocketError> BindClient(
      InterfaceRef iface = InterfaceRef()) noexcept {
    auto created = Open();
    if (!created.has_value()) {
      return created;
    }
    Endpoint ep = static_cast<Endpoint&&>(created.value());

    auto r = ep.sock_.Bind(SocketAddress::Any(0U));
    if (!r.has_value()) {
      MCPING_LOG_ERROR("endpoint", "bind [::]:0: %s", std::strerror(errno));
      return expected<Endpoint, SocketError>::error(r.get_error());
    }

    if (!iface.IsDefault()) {
      r = ep.sock_.SetMulticastInterface(iface.Index());
      if (!r.has_value()) {
        MCPING_LOG_ERROR("endpoint", "select outbound if_index=%u: %s",
                         iface.Index(), std::strerror(errno));
        return expected<Endpoint, SocketError>::error(SocketError::kBindFailed);
      }
    }
    ep.iface_ = iface;

    MCPING_LOG_DEBUG("endpoint", "client bound to port %u",
                     static_cast<unsigned>(ep.LocalPort()));
    return expected<Endpoint, SocketError>::success(
        static_cast<Endpoint&&>(ep));
  }

  /** @brief Bind the wildcard address on @p port without joining a group. */
  static expected<Endpoint, SocketError> BindUnicast(uint16_t port) noexcept {
    auto created = Open();
    if (!created.has_value()) {
      return created;
    }
    Endpoint ep = static_cast<Endpoint&&>(created.value());

    auto r = ep.sock_.Bind(SocketAddress::Any(port));
    if (!r.has_value()) {
      MCPING_LOG_ERROR("endpoint", "bind [::]:%u: %s",
                       static_cast<unsigned>(port), std::strerror(errno));
      return expected<Endpoint, SocketError>::error(r.get_error());
    }
    return expected<Endpoint, SocketError>::success(
        static_cast<Endpoint&&>(ep));
  }

  // Operations --------------------------------------------------------------

  /** @brief Best-effort, non-blocking datagram send. */
  expected<int32_t, SocketError> Send(const void* data, size_t len,
                                      const SocketAddress& dest) noexcept {
    return sock_.SendTo(data, len, dest);
  }

  /**
   * @brief Receive one datagram, waiting at most @p timeout_ms.
   *
   * @param timeout_ms Negative waits without bound.
   * @return Payload length; kTimeout when nothing arrived, kRecvFailed on
   *         I/O failure.
   */
  expected<int32_t, SocketError> Receive(void* buf, size_t len,
                                         SocketAddress& src,
                                         int32_t timeout_ms) noexcept {
    auto ready = sock_.WaitReadable(timeout_ms);
    if (!ready.has_value()) {
      return expected<int32_t, SocketError>::error(ready.get_error());
    }
    auto n = sock_.RecvFrom(buf, len, src);
    if (!n.has_value() && n.get_error() == SocketError::kWouldBlock) {
      return expected<int32_t, SocketError>::error(SocketError::kTimeout);
    }
    return n;
  }

  /** @brief Drop the group membership taken by BindServer(). */
  expected<void, SocketError> LeaveGroup() noexcept {
    if (!joined_) {
      return expected<void, SocketError>::success();
    }
    joined_ = false;
    auto r = sock_.LeaveGroup(group_.Raw(), iface_.Index());
    if (!r.has_value() && r.get_error() != SocketError::kInvalidFd) {
      MCPING_LOG_WARN("endpoint", "leave %s: %s", group_.ToString().c_str(),
                      std::strerror(errno));
    }
    return r;
  }

  /** @brief Locally bound port, 0 if unknown. */
  uint16_t LocalPort() const noexcept {
    auto addr = sock_.LocalAddress();
    return addr.has_value() ? addr.value().Port() : 0U;
  }

  bool IsJoined() const noexcept { return joined_; }
  const GroupAddress& Group() const noexcept { return group_; }
  InterfaceRef Interface() const noexcept { return iface_; }
  int32_t Fd() const noexcept { return sock_.Fd(); }
  bool IsValid() const noexcept { return sock_.IsValid(); }

 private:
  static expected<Endpoint, SocketError> Open() noexcept {
    auto s = UdpSocket::Create();
    if (!s.has_value()) {
      MCPING_LOG_ERROR("endpoint", "socket(AF_INET6): %s",
                       std::strerror(errno));
      return expected<Endpoint, SocketError>::error(s.get_error());
    }
    Endpoint ep;
    ep.sock_ = static_cast<UdpSocket&&>(s.value());
    return expected<Endpoint, SocketError>::success(
        static_cast<Endpoint&&>(ep));
  }

  UdpSocket sock_;
  GroupAddress group_;
  InterfaceRef iface_;
  bool joined_{false};
};

}  // namespace mcping

#endif  // MCPING_HAS_NETWORK

#endif  // MCPING_ENDPOINT_HPP_
