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
 * @file socket.hpp
 * @brief POSIX IPv6 UDP socket RAII abstractions.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 * Provides SocketAddress as a thin wrapper around sockaddr_in6 and UdpSocket
 * with RAII fd ownership plus the IPv6 multicast socket options the probe
 * engine needs. All errors are returned via mcping::expected<V,E>.
 */

#ifndef MCPING_SOCKET_HPP_
#define MCPING_SOCKET_HPP_

#include "mcping/platform.hpp"
#include "mcping/vocabulary.hpp"

#if MCPING_HAS_NETWORK

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

namespace mcping {

// ============================================================================
// SocketError
// ============================================================================

enum class SocketError : uint8_t {
  kInvalidFd = 0,
  kInvalidAddress,
  kBindFailed,
  kJoinFailed,
  kLeaveFailed,
  kSetOptFailed,
  kSendFailed,
  kRecvFailed,
  kTimeout,    ///< Receive wait elapsed with no datagram.
  kWouldBlock  ///< EAGAIN/EWOULDBLOCK, caller may retry.
};

inline const char* ToString(SocketError e) noexcept {
  switch (e) {
    case SocketError::kInvalidFd:      return "invalid socket";
    case SocketError::kInvalidAddress: return "invalid address";
    case SocketError::kBindFailed:     return "bind failed";
    case SocketError::kJoinFailed:     return "multicast join failed";
    case SocketError::kLeaveFailed:    return "multicast leave failed";
    case SocketError::kSetOptFailed:   return "setsockopt failed";
    case SocketError::kSendFailed:     return "send failed";
    case SocketError::kRecvFailed:     return "receive failed";
    case SocketError::kTimeout:        return "timeout";
    case SocketError::kWouldBlock:     return "would block";
  }
  return "unknown";
}

// ============================================================================
// SocketAddress
// ============================================================================

/** Max length of "[addr%scope]:port" text, including the terminator. */
constexpr size_t kSocketAddressStrLen = INET6_ADDRSTRLEN + 16U;

/**
 * @brief Simple wrapper for sockaddr_in6.
 */
class SocketAddress {
 public:
  SocketAddress() noexcept {
    std::memset(&addr_, 0, sizeof(addr_));
    addr_.sin6_family = AF_INET6;
  }

  /**
   * @brief Create an IPv6 socket address from text and port.
   *
   * @param ip       IPv6 text (e.g. "::1", "ff12::1")
   * @param port     Port number in host byte order
   * @param scope_id Interface index for scoped addresses (0 = none)
   * @return SocketAddress on success; kInvalidAddress on bad ip
   */
  static expected<SocketAddress, SocketError> FromIpv6(
      const char* ip, uint16_t port, uint32_t scope_id = 0U) noexcept {
    SocketAddress sa;
    sa.addr_.sin6_port = htons(port);
    sa.addr_.sin6_scope_id = scope_id;
    if (ip == nullptr || ::inet_pton(AF_INET6, ip, &sa.addr_.sin6_addr) != 1) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }
    return expected<SocketAddress, SocketError>::success(sa);
  }

  /** @brief Build from an already-parsed in6_addr. */
  static SocketAddress FromIn6(const in6_addr& ip, uint16_t port,
                               uint32_t scope_id = 0U) noexcept {
    SocketAddress sa;
    sa.addr_.sin6_addr = ip;
    sa.addr_.sin6_port = htons(port);
    sa.addr_.sin6_scope_id = scope_id;
    return sa;
  }

  /** @brief Wildcard address ("::") on @p port. */
  static SocketAddress Any(uint16_t port) noexcept {
    return FromIn6(in6addr_any, port);
  }

  /** @brief Loopback address ("::1") on @p port. */
  static SocketAddress Loopback(uint16_t port) noexcept {
    return FromIn6(in6addr_loopback, port);
  }

  /** @brief Raw pointer to the underlying sockaddr structure. */
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  const sockaddr* Raw() const noexcept {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }

  /** @brief Mutable raw pointer (used internally by RecvFrom). */
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  sockaddr* RawMut() noexcept { return reinterpret_cast<sockaddr*>(&addr_); }

  /** @brief Size of the underlying sockaddr_in6 structure. */
  socklen_t Size() const noexcept {
    return static_cast<socklen_t>(sizeof(addr_));
  }

  uint16_t Port() const noexcept { return ntohs(addr_.sin6_port); }
  uint32_t ScopeId() const noexcept { return addr_.sin6_scope_id; }
  const in6_addr& Ip() const noexcept { return addr_.sin6_addr; }

  bool IsMulticast() const noexcept {
    return IN6_IS_ADDR_MULTICAST(&addr_.sin6_addr) != 0;
  }

  /**
   * @brief Write only the address part ("fe80::1") into @p buf.
   * @return false if the address cannot be rendered.
   */
  bool IpToString(char* buf, size_t size) const noexcept {
    return ::inet_ntop(AF_INET6, &addr_.sin6_addr, buf,
                       static_cast<socklen_t>(size)) != nullptr;
  }

  /** @brief "[addr]:port" text form, used as peer identity. */
  std::string ToString() const {
    char ip[INET6_ADDRSTRLEN];
    if (!IpToString(ip, sizeof(ip))) {
      return std::string("[?]:") + std::to_string(Port());
    }
    char out[kSocketAddressStrLen];
    (void)std::snprintf(out, sizeof(out), "[%s]:%u", ip,
                        static_cast<unsigned>(Port()));
    return std::string(out);
  }

  bool operator==(const SocketAddress& other) const noexcept {
    return addr_.sin6_port == other.addr_.sin6_port &&
           addr_.sin6_scope_id == other.addr_.sin6_scope_id &&
           std::memcmp(&addr_.sin6_addr, &other.addr_.sin6_addr,
                       sizeof(in6_addr)) == 0;
  }

  bool operator!=(const SocketAddress& other) const noexcept {
    return !(*this == other);
  }

 private:
  sockaddr_in6 addr_;
};

// ============================================================================
// UdpSocket
// ============================================================================

/**
 * @brief RAII IPv6 UDP datagram socket.
 *
 * Owns a file descriptor. Movable but not copyable. SendTo and RecvFrom only
 * touch the descriptor, so one thread may send while another receives.
 */
class UdpSocket {
 public:
  UdpSocket() noexcept : fd_(-1) {}

  ~UdpSocket() { Close(); }

  // Move-only ---------------------------------------------------------------
  UdpSocket(UdpSocket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

  UdpSocket& operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  // Factory -----------------------------------------------------------------

  /**
   * @brief Create an AF_INET6 / SOCK_DGRAM socket.
   * @return UdpSocket on success, SocketError::kInvalidFd on failure.
   */
  static expected<UdpSocket, SocketError> Create() noexcept {
    int32_t fd = ::socket(AF_INET6, SOCK_DGRAM, 0);
    if (fd < 0) {
      return expected<UdpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    (void)::fcntl(fd, F_SETFD, FD_CLOEXEC);
    return expected<UdpSocket, SocketError>::success(UdpSocket(fd));
  }

  // Operations --------------------------------------------------------------

  expected<void, SocketError> Bind(const SocketAddress& addr) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::bind(fd_, addr.Raw(), addr.Size()) < 0) {
      return expected<void, SocketError>::error(SocketError::kBindFailed);
    }
    return expected<void, SocketError>::success();
  }

  /** @brief Non-blocking sendto; a full socket buffer yields kWouldBlock. */
  expected<int32_t, SocketError> SendTo(const void* data, size_t len,
                                        const SocketAddress& dest) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    auto n = ::sendto(fd_, data, len, MSG_DONTWAIT, dest.Raw(), dest.Size());
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return expected<int32_t, SocketError>::error(SocketError::kWouldBlock);
      }
      return expected<int32_t, SocketError>::error(SocketError::kSendFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  expected<int32_t, SocketError> RecvFrom(void* buf, size_t len,
                                          SocketAddress& src) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    socklen_t addr_len = src.Size();
    auto n = ::recvfrom(fd_, buf, len, MSG_DONTWAIT, src.RawMut(), &addr_len);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return expected<int32_t, SocketError>::error(SocketError::kWouldBlock);
      }
      return expected<int32_t, SocketError>::error(SocketError::kRecvFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  /**
   * @brief Wait until a datagram is readable.
   * @param timeout_ms Max wait in milliseconds; negative waits forever.
   * @return success when readable; kTimeout on expiry or EINTR.
   */
  expected<void, SocketError> WaitReadable(int32_t timeout_ms) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int32_t rc = ::poll(&pfd, 1, timeout_ms < 0 ? -1 : timeout_ms);
    if (rc == 0 || (rc < 0 && errno == EINTR)) {
      return expected<void, SocketError>::error(SocketError::kTimeout);
    }
    if (rc < 0 || (pfd.revents & (POLLERR | POLLNVAL)) != 0) {
      return expected<void, SocketError>::error(SocketError::kRecvFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<void, SocketError> SetReuseAddr(bool enable) noexcept {
    return SetIntOpt(SOL_SOCKET, SO_REUSEADDR, enable ? 1 : 0);
  }

  expected<void, SocketError> SetReusePort(bool enable) noexcept {
#ifdef SO_REUSEPORT
    return SetIntOpt(SOL_SOCKET, SO_REUSEPORT, enable ? 1 : 0);
#else
    (void)enable;
    return expected<void, SocketError>::success();
#endif
  }

  /** @brief IPV6_JOIN_GROUP on interface @p if_index (0 = system choice). */
  expected<void, SocketError> JoinGroup(const in6_addr& group,
                                        uint32_t if_index) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    struct ipv6_mreq mreq;
    std::memset(&mreq, 0, sizeof(mreq));
    mreq.ipv6mr_multiaddr = group;
    mreq.ipv6mr_interface = if_index;
    if (::setsockopt(fd_, IPPROTO_IPV6, IPV6_JOIN_GROUP, &mreq,
                     static_cast<socklen_t>(sizeof(mreq))) < 0) {
      return expected<void, SocketError>::error(SocketError::kJoinFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<void, SocketError> LeaveGroup(const in6_addr& group,
                                         uint32_t if_index) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    struct ipv6_mreq mreq;
    std::memset(&mreq, 0, sizeof(mreq));
    mreq.ipv6mr_multiaddr = group;
    mreq.ipv6mr_interface = if_index;
    if (::setsockopt(fd_, IPPROTO_IPV6, IPV6_LEAVE_GROUP, &mreq,
                     static_cast<socklen_t>(sizeof(mreq))) < 0) {
      return expected<void, SocketError>::error(SocketError::kLeaveFailed);
    }
    return expected<void, SocketError>::success();
  }

  /** @brief Select the outbound interface for multicast sends. */
  expected<void, SocketError> SetMulticastInterface(uint32_t if_index) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::setsockopt(fd_, IPPROTO_IPV6, IPV6_MULTICAST_IF, &if_index,
                     static_cast<socklen_t>(sizeof(if_index))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<void, SocketError> SetMulticastLoop(bool enable) noexcept {
    // IPV6_MULTICAST_LOOP takes an unsigned int on Linux and macOS.
    uint32_t opt = enable ? 1U : 0U;
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::setsockopt(fd_, IPPROTO_IPV6, IPV6_MULTICAST_LOOP, &opt,
                     static_cast<socklen_t>(sizeof(opt))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  /** @brief Address the socket is bound to (getsockname). */
  expected<SocketAddress, SocketError> LocalAddress() const noexcept {
    if (fd_ < 0) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidFd);
    }
    SocketAddress sa;
    socklen_t len = sa.Size();
    if (::getsockname(fd_, sa.RawMut(), &len) < 0) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidFd);
    }
    return expected<SocketAddress, SocketError>::success(sa);
  }

  /** @brief Close the socket. Idempotent. */
  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  /** @brief Return the raw file descriptor. */
  int32_t Fd() const noexcept { return fd_; }

  /** @brief Check whether the socket holds a valid file descriptor. */
  bool IsValid() const noexcept { return fd_ >= 0; }

 private:
  explicit UdpSocket(int32_t fd) noexcept : fd_(fd) {}

  expected<void, SocketError> SetIntOpt(int32_t level, int32_t name,
                                        int32_t value) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::setsockopt(fd_, level, name, &value,
                     static_cast<socklen_t>(sizeof(value))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  int32_t fd_;
};

}  // namespace mcping

#endif  // MCPING_HAS_NETWORK

#endif  // MCPING_SOCKET_HPP_
