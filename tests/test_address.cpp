/**
 * @file test_address.cpp
 * @brief Tests for address.hpp - group parsing, repair and interface lookup.
 */

#include "mcping/address.hpp"

#include <catch2/catch.hpp>

#include <cstring>
#include <string>

namespace {

/** Resolver with a fixed name table, independent of the host. */
class TableResolver final : public mcping::InterfaceResolver {
 public:
  uint32_t NameToIndex(const char* name) const noexcept override {
    if (std::strcmp(name, "eth0") == 0) return 2U;
    if (std::strcmp(name, "wlan0") == 0) return 7U;
    return 0U;
  }
};

}  // namespace

// ============================================================================
// ParseMulticastAddress
// ============================================================================

TEST_CASE("address - well-formed multicast parses", "[address]") {
  auto r = mcping::ParseMulticastAddress("ff02::1");
  REQUIRE(r.has_value());
  REQUIRE(r.value().ToString() == "ff02::1");
}

TEST_CASE("address - canonical text is stable", "[address]") {
  auto a = mcping::ParseMulticastAddress("FF12:0000:0000::0001");
  REQUIRE(a.has_value());
  const std::string text = a.value().ToString();
  REQUIRE(text == "ff12::1");

  auto b = mcping::ParseMulticastAddress(text.c_str());
  REQUIRE(b.has_value());
  REQUIRE(b.value() == a.value());
  REQUIRE(b.value().ToString() == text);
}

TEST_CASE("address - 8-hex-digit segment is repaired", "[address]") {
  auto r = mcping::ParseMulticastAddress(
      "ff12c909:3199:e8ba:6f6f:7d23:e6ae:d85d");
  REQUIRE(r.has_value());
  REQUIRE(r.value().ToString() == "ff12:c909:3199:e8ba:6f6f:7d23:e6ae:d85d");
}

TEST_CASE("address - RepairAddressText splits long segments", "[address]") {
  REQUIRE(mcping::RepairAddressText("ff12c909:3199") == "ff12:c909:3199");
  REQUIRE(mcping::RepairAddressText("abcdef") == "abcd:ef");
  REQUIRE(mcping::RepairAddressText("ff02::1") == "ff02::1");
  REQUIRE(mcping::RepairAddressText("") == "");
  REQUIRE(mcping::RepairAddressText(nullptr) == "");
}

TEST_CASE("address - unrepairable text is invalid", "[address]") {
  auto r = mcping::ParseMulticastAddress("not-an-address");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == mcping::AddressError::kInvalidAddress);

  auto empty = mcping::ParseMulticastAddress("");
  REQUIRE(!empty.has_value());
  REQUIRE(empty.get_error() == mcping::AddressError::kInvalidAddress);
}

TEST_CASE("address - unicast address is rejected", "[address]") {
  auto r = mcping::ParseMulticastAddress("fe80::1");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == mcping::AddressError::kNotMulticast);

  auto lo = mcping::ParseMulticastAddress("::1");
  REQUIRE(!lo.has_value());
  REQUIRE(lo.get_error() == mcping::AddressError::kNotMulticast);
}

// ============================================================================
// ResolveInterface
// ============================================================================

TEST_CASE("address - empty interface is the default", "[address][iface]") {
  auto a = mcping::ResolveInterface(nullptr);
  REQUIRE(a.has_value());
  REQUIRE(a.value().IsDefault());

  auto b = mcping::ResolveInterface("");
  REQUIRE(b.has_value());
  REQUIRE(b.value().Index() == 0U);
}

TEST_CASE("address - numeric interface is taken literally", "[address][iface]") {
  TableResolver table;
  auto r = mcping::ResolveInterface("42", table);
  REQUIRE(r.has_value());
  REQUIRE(r.value().Index() == 42U);

  auto max = mcping::ResolveInterface("4294967295", table);
  REQUIRE(max.has_value());
  REQUIRE(max.value().Index() == 4294967295U);
}

TEST_CASE("address - out-of-range index fails", "[address][iface]") {
  auto r = mcping::ResolveInterface("4294967296");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == mcping::AddressError::kInterfaceNotFound);
}

TEST_CASE("address - names go through the resolver", "[address][iface]") {
  TableResolver table;
  auto eth = mcping::ResolveInterface("eth0", table);
  REQUIRE(eth.has_value());
  REQUIRE(eth.value() == mcping::InterfaceRef(2U));

  auto missing = mcping::ResolveInterface("bogus0", table);
  REQUIRE(!missing.has_value());
  REQUIRE(missing.get_error() == mcping::AddressError::kInterfaceNotFound);
}

TEST_CASE("address - platform resolver rejects unknown names",
          "[address][iface]") {
  auto r = mcping::ResolveInterface("mcping-no-such-if0");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == mcping::AddressError::kInterfaceNotFound);
}

TEST_CASE("address - platform resolver finds loopback", "[address][iface]") {
  auto r = mcping::ResolveInterface("lo");
  if (!r.has_value()) {
    WARN("no interface named 'lo' on this host");
    return;
  }
  REQUIRE(r.value().Index() > 0U);
}
