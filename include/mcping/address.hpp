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
 * @file address.hpp
 * @brief IPv6 multicast group parsing and network interface resolution.
 *
 * ParseMulticastAddress() accepts canonical IPv6 text and also recovers
 * input whose hextet separators were dropped (e.g. "ff12c909:3199:...")
 * by splitting over-long segments into 4-character chunks.
 *
 * ResolveInterface() maps an interface name or literal index to an
 * InterfaceRef. Name lookup goes through an InterfaceResolver so the
 * platform facility (if_nametoindex on POSIX, the IP Helper API on
 * Windows) can be swapped, e.g. in tests.
 */

#ifndef MCPING_ADDRESS_HPP_
#define MCPING_ADDRESS_HPP_

#include "mcping/log.hpp"
#include "mcping/platform.hpp"
#include "mcping/vocabulary.hpp"

#if defined(MCPING_PLATFORM_WINDOWS)
#include <winsock2.h>
#include <ws2tcpip.h>
#include <iphlpapi.h>
#include <netioapi.h>
#else
#include <arpa/inet.h>
#include <net/if.h>
#include <netinet/in.h>
#endif

#include <cstdint>
#include <cstring>
#include <string>

namespace mcping {

// ============================================================================
// AddressError
// ============================================================================

enum class AddressError : uint8_t {
  kInvalidAddress = 0,
  kNotMulticast,
  kInterfaceNotFound,
};

inline const char* ToString(AddressError e) noexcept {
  switch (e) {
    case AddressError::kInvalidAddress:    return "invalid IPv6 address";
    case AddressError::kNotMulticast:      return "not an IPv6 multicast address";
    case AddressError::kInterfaceNotFound: return "interface not found";
  }
  return "unknown";
}

// ============================================================================
// GroupAddress
// ============================================================================

/**
 * @brief A parsed IPv6 multicast group (ff00::/8).
 *
 * Only ParseMulticastAddress() produces non-default instances.
 */
class GroupAddress {
 public:
  GroupAddress() noexcept { std::memset(&addr_, 0, sizeof(addr_)); }

  const in6_addr& Raw() const noexcept { return addr_; }

  /** @brief Canonical text form (RFC 5952, as produced by inet_ntop). */
  std::string ToString() const {
    char buf[INET6_ADDRSTRLEN];
    if (::inet_ntop(AF_INET6, &addr_, buf, sizeof(buf)) == nullptr) {
      return std::string();
    }
    return std::string(buf);
  }

  bool operator==(const GroupAddress& other) const noexcept {
    return std::memcmp(&addr_, &other.addr_, sizeof(addr_)) == 0;
  }
  bool operator!=(const GroupAddress& other) const noexcept {
    return !(*this == other);
  }

 private:
  friend inline expected<GroupAddress, AddressError> ParseMulticastAddress(
      const char* text);

  explicit GroupAddress(const in6_addr& addr) noexcept : addr_(addr) {}

  in6_addr addr_;
};

// ============================================================================
// Parsing
// ============================================================================

/**
 * @brief Split every ':'-delimited segment longer than 4 characters into
 *        4-character chunks.
 *
 * "ff12c909:3199" -> "ff12:c909:3199". Segments of 4 or fewer characters
 * (including the empty segments of "::") are kept as-is.
 */
inline std::string RepairAddressText(const char* text) {
  std::string out;
  if (text == nullptr) return out;

  const char* seg = text;
  while (true) {
    const char* end = std::strchr(seg, ':');
    size_t len = (end != nullptr) ? static_cast<size_t>(end - seg)
                                  : std::strlen(seg);
    if (len <= 4U) {
      out.append(seg, len);
    } else {
      for (size_t i = 0; i < len; i += 4U) {
        if (i > 0U) out.push_back(':');
        out.append(seg + i, (len - i < 4U) ? (len - i) : 4U);
      }
    }
    if (end == nullptr) break;
    out.push_back(':');
    seg = end + 1;
  }
  return out;
}

/**
 * @brief Parse IPv6 multicast group text.
 *
 * Tries a direct parse first, then the RepairAddressText() form. A recovered
 * address is reported at INFO; a failed recovery is reported at ERROR with
 * both the original and the attempted text.
 *
 * @return GroupAddress, or kInvalidAddress / kNotMulticast.
 */
inline expected<GroupAddress, AddressError> ParseMulticastAddress(
    const char* text) {
  if (text == nullptr || text[0] == '\0') {
    return expected<GroupAddress, AddressError>::error(
        AddressError::kInvalidAddress);
  }

  in6_addr addr;
  if (::inet_pton(AF_INET6, text, &addr) != 1) {
    std::string fixed = RepairAddressText(text);
    if (::inet_pton(AF_INET6, fixed.c_str(), &addr) != 1) {
      MCPING_LOG_ERROR("address", "failed to parse IPv6 address '%s', tried '%s'",
                       text, fixed.c_str());
      return expected<GroupAddress, AddressError>::error(
          AddressError::kInvalidAddress);
    }
    MCPING_LOG_INFO("address", "fixed multicast address from '%s' -> '%s'",
                    text, fixed.c_str());
  }

  if (!IN6_IS_ADDR_MULTICAST(&addr)) {
    MCPING_LOG_ERROR("address", "'%s' is not in ff00::/8", text);
    return expected<GroupAddress, AddressError>::error(
        AddressError::kNotMulticast);
  }
  return expected<GroupAddress, AddressError>::success(GroupAddress(addr));
}

// ============================================================================
// InterfaceRef
// ============================================================================

/** @brief Network interface index; 0 lets the OS choose. */
class InterfaceRef {
 public:
  InterfaceRef() noexcept : index_(0U) {}
  explicit InterfaceRef(uint32_t index) noexcept : index_(index) {}

  static InterfaceRef Default() noexcept { return InterfaceRef(); }

  uint32_t Index() const noexcept { return index_; }
  bool IsDefault() const noexcept { return index_ == 0U; }

  bool operator==(const InterfaceRef& other) const noexcept {
    return index_ == other.index_;
  }

 private:
  uint32_t index_;
};

// ============================================================================
// InterfaceResolver
// ============================================================================

/**
 * @brief Interface name -> index lookup.
 *
 * Implementations return 0 when the name is unknown.
 */
class InterfaceResolver {
 public:
  virtual ~InterfaceResolver() = default;
  virtual uint32_t NameToIndex(const char* name) const noexcept = 0;
};

#if defined(MCPING_PLATFORM_WINDOWS)

/** @brief IP Helper API lookup (links iphlpapi). */
class WindowsInterfaceResolver final : public InterfaceResolver {
 public:
  uint32_t NameToIndex(const char* name) const noexcept override {
    NET_LUID luid;
    if (ConvertInterfaceNameToLuidA(name, &luid) != NO_ERROR) {
      return 0U;
    }
    NET_IFINDEX index = 0;
    if (ConvertInterfaceLuidToIndex(&luid, &index) != NO_ERROR) {
      return 0U;
    }
    return static_cast<uint32_t>(index);
  }
};

inline const InterfaceResolver& DefaultInterfaceResolver() noexcept {
  static const WindowsInterfaceResolver resolver;
  return resolver;
}

#else

/** @brief if_nametoindex(3) lookup. */
class PosixInterfaceResolver final : public InterfaceResolver {
 public:
  uint32_t NameToIndex(const char* name) const noexcept override {
    return static_cast<uint32_t>(::if_nametoindex(name));
  }
};

inline const InterfaceResolver& DefaultInterfaceResolver() noexcept {
  static const PosixInterfaceResolver resolver;
  return resolver;
}

#endif

namespace detail {

/** @brief Parse an all-decimal uint32_t; false on any other input. */
inline bool ParseIndex(const char* text, uint32_t& out) noexcept {
  if (text == nullptr || text[0] == '\0') return false;
  uint64_t value = 0U;
  for (const char* p = text; *p != '\0'; ++p) {
    if (*p < '0' || *p > '9') return false;
    value = value * 10U + static_cast<uint64_t>(*p - '0');
    if (value > UINT32_MAX) return false;
  }
  out = static_cast<uint32_t>(value);
  return true;
}

inline bool IsAllDigits(const char* text) noexcept {
  if (text == nullptr || text[0] == '\0') return false;
  for (const char* p = text; *p != '\0'; ++p) {
    if (*p < '0' || *p > '9') return false;
  }
  return true;
}

}  // namespace detail

/**
 * @brief Resolve an interface name or literal index.
 *
 * @param name_or_index nullptr or "" for the default interface (index 0), a
 *        decimal string for a literal index, otherwise an interface name.
 * @param resolver      Name lookup facility.
 * @return InterfaceRef, or kInterfaceNotFound.
 */
inline expected<InterfaceRef, AddressError> ResolveInterface(
    const char* name_or_index,
    const InterfaceResolver& resolver = DefaultInterfaceResolver()) noexcept {
  if (name_or_index == nullptr || name_or_index[0] == '\0') {
    return expected<InterfaceRef, AddressError>::success(InterfaceRef());
  }

  uint32_t index = 0U;
  if (detail::ParseIndex(name_or_index, index)) {
    return expected<InterfaceRef, AddressError>::success(InterfaceRef(index));
  }
  if (detail::IsAllDigits(name_or_index)) {
    MCPING_LOG_ERROR("address", "interface index '%s' out of range",
                     name_or_index);
    return expected<InterfaceRef, AddressError>::error(
        AddressError::kInterfaceNotFound);
  }

  index = resolver.NameToIndex(name_or_index);
  if (index == 0U) {
    MCPING_LOG_ERROR("address",
                     "interface name '%s' not found or cannot be converted to index",
                     name_or_index);
    return expected<InterfaceRef, AddressError>::error(
        AddressError::kInterfaceNotFound);
  }
  return expected<InterfaceRef, AddressError>::success(InterfaceRef(index));
}

}  // namespace mcping

#endif  // MCPING_ADDRESS_HPP_
